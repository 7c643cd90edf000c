#pragma once

#include "src/server/config.h"

#include <memory>
#include <stdexcept>
#include <string>

namespace zxcompile {

class JobSetupError : public std::runtime_error {
public:
    explicit JobSetupError(const std::string& message) : std::runtime_error(message) {}
};

// One compilation's files: a private directory holding the source and, once
// the compiler has run, the artifact. The directory and everything in it is
// removed when the Job is destroyed.
class Job {
public:
    static constexpr char kBaseName[] = "source";

    // Throws JobSetupError if the directory or source file cannot be written.
    static std::unique_ptr<Job> Create(const CompilerConfig& config, const std::string& source);

    ~Job();

    Job(const Job&) = delete;
    Job& operator=(const Job&) = delete;

    const std::string& Directory() const { return directory_; }
    const std::string& InputPath() const { return input_path_; }
    const std::string& OutputPath() const { return output_path_; }

private:
    Job(std::string directory, std::string input_path, std::string output_path);

    std::string directory_;
    std::string input_path_;
    std::string output_path_;
};

} // namespace zxcompile
