#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace zxcompile {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

struct RateLimitConfig {
    int per_minute = 10;
    int per_hour = 100;
    std::chrono::seconds minute_lockout{60};
    std::chrono::seconds hour_lockout{300};
};

struct MonitorConfig {
    std::chrono::seconds sweep_interval{2};
    // Must exceed the per-job timeout: the monitor is the second line of defense.
    std::chrono::seconds max_age{8};
    std::chrono::milliseconds termination_grace{500};
    bool orphan_scan = true;
};

struct CompilerConfig {
    std::string executable = "zxbc";
    std::vector<std::string> flags = {"-taB"};
    std::string input_extension = ".bas";
    std::string output_extension = ".tap";
    std::string work_root = "/tmp";
    std::chrono::seconds job_timeout{5};
    std::chrono::milliseconds termination_grace{500};
    std::size_t max_captured_output = 64 * 1024;
};

struct ServiceConfig {
    std::string listen_address = "0.0.0.0:50051";
    std::string log_level = "info";
    int max_concurrent_jobs = 10;
    std::size_t max_source_bytes = 64 * 1024;

    CompilerConfig compiler;
    MonitorConfig monitor;
    RateLimitConfig rate_limit;

    using EnvLookup = std::function<const char*(const char*)>;

    // Builds a config from defaults overridden by ZXCOMPILE_* variables.
    // Throws ConfigError on malformed or inconsistent values.
    static ServiceConfig FromEnvironment(const EnvLookup& lookup = nullptr);

    void Validate() const;
};

} // namespace zxcompile
