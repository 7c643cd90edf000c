#include "src/server/job.h"
#include "src/server/process.h"

#include <utility>

namespace zxcompile {

std::unique_ptr<Job> Job::Create(const CompilerConfig& config, const std::string& source) {
    std::string directory = Process::CreateTempDirectory(config.work_root);
    if (directory.empty()) {
        throw JobSetupError("cannot create job directory under " + config.work_root);
    }

    std::string base = directory + "/" + kBaseName;
    std::unique_ptr<Job> job(new Job(directory, base + config.input_extension,
                                     base + config.output_extension));

    // From here the destructor cleans up the directory if writing fails.
    if (!Process::WriteFile(job->InputPath(), source)) {
        throw JobSetupError("cannot write job input " + job->InputPath());
    }
    return job;
}

Job::Job(std::string directory, std::string input_path, std::string output_path)
    : directory_(std::move(directory)),
      input_path_(std::move(input_path)),
      output_path_(std::move(output_path)) {}

Job::~Job() {
    // Takes the source and any artifact with it; failures are logged inside.
    Process::RemoveDirectory(directory_);
}

} // namespace zxcompile
