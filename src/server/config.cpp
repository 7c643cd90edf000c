#include "src/server/config.h"

#include <cstdlib>
#include <limits>
#include <sstream>

namespace zxcompile {

namespace {

constexpr char kPrefix[] = "ZXCOMPILE_";

// Upper bound for every duration setting; keeps millisecond arithmetic in range.
constexpr std::chrono::hours kMaxDuration{24};

class EnvReader {
public:
    explicit EnvReader(const ServiceConfig::EnvLookup& lookup) : lookup_(lookup) {}

    const char* Raw(const std::string& name) const {
        std::string key = std::string(kPrefix) + name;
        if (lookup_) return lookup_(key.c_str());
        return std::getenv(key.c_str());
    }

    void String(const std::string& name, std::string& target) const {
        const char* value = Raw(name);
        if (value) target = value;
    }

    void Long(const std::string& name, long& target) const {
        const char* value = Raw(name);
        if (!value) return;
        std::string text(value);
        std::size_t consumed = 0;
        try {
            target = std::stol(text, &consumed);
        } catch (const std::exception&) {
            throw ConfigError(std::string(kPrefix) + name + " is not a number: '" + text + "'");
        }
        if (consumed != text.size()) {
            throw ConfigError(std::string(kPrefix) + name + " is not a number: '" + text + "'");
        }
    }

    void Int(const std::string& name, int& target) const {
        long value = target;
        Long(name, value);
        if (value > std::numeric_limits<int>::max() || value < std::numeric_limits<int>::min()) {
            throw ConfigError(std::string(kPrefix) + name + " is out of range: " + std::to_string(value));
        }
        target = static_cast<int>(value);
    }

    void Size(const std::string& name, std::size_t& target) const {
        long value = static_cast<long>(target);
        Long(name, value);
        if (value < 0) throw ConfigError(std::string(kPrefix) + name + " must not be negative");
        target = static_cast<std::size_t>(value);
    }

    template <typename Duration>
    void Ticks(const std::string& name, Duration& target) const {
        long value = static_cast<long>(target.count());
        Long(name, value);
        if (value > std::chrono::duration_cast<Duration>(kMaxDuration).count()) {
            throw ConfigError(std::string(kPrefix) + name + " is too large: " + std::to_string(value) +
                              " (limit is 24 hours)");
        }
        target = Duration(value);
    }

    void Bool(const std::string& name, bool& target) const {
        const char* value = Raw(name);
        if (!value) return;
        std::string text(value);
        if (text == "1" || text == "true" || text == "yes" || text == "on") {
            target = true;
        } else if (text == "0" || text == "false" || text == "no" || text == "off") {
            target = false;
        } else {
            throw ConfigError(std::string(kPrefix) + name + " is not a boolean: '" + text + "'");
        }
    }

    void Words(const std::string& name, std::vector<std::string>& target) const {
        const char* value = Raw(name);
        if (!value) return;
        target.clear();
        std::istringstream in(value);
        std::string word;
        while (in >> word) target.push_back(word);
    }

private:
    const ServiceConfig::EnvLookup& lookup_;
};

} // namespace

ServiceConfig ServiceConfig::FromEnvironment(const EnvLookup& lookup) {
    ServiceConfig config;
    EnvReader env(lookup);

    env.String("LISTEN_ADDRESS", config.listen_address);
    env.String("LOG_LEVEL", config.log_level);
    env.Int("MAX_CONCURRENT_JOBS", config.max_concurrent_jobs);
    env.Size("MAX_SOURCE_BYTES", config.max_source_bytes);

    env.String("COMPILER", config.compiler.executable);
    env.Words("COMPILER_FLAGS", config.compiler.flags);
    env.String("WORK_DIR", config.compiler.work_root);
    env.Ticks("JOB_TIMEOUT_SECONDS", config.compiler.job_timeout);
    env.Ticks("TERMINATION_GRACE_MS", config.compiler.termination_grace);

    config.monitor.termination_grace = config.compiler.termination_grace;
    env.Ticks("MONITOR_INTERVAL_SECONDS", config.monitor.sweep_interval);
    env.Ticks("MONITOR_MAX_AGE_SECONDS", config.monitor.max_age);
    env.Bool("ORPHAN_SCAN", config.monitor.orphan_scan);

    env.Int("RATE_PER_MINUTE", config.rate_limit.per_minute);
    env.Int("RATE_PER_HOUR", config.rate_limit.per_hour);
    env.Ticks("MINUTE_LOCKOUT_SECONDS", config.rate_limit.minute_lockout);
    env.Ticks("HOUR_LOCKOUT_SECONDS", config.rate_limit.hour_lockout);

    config.Validate();
    return config;
}

void ServiceConfig::Validate() const {
    if (listen_address.empty()) throw ConfigError("listen address must not be empty");
    if (compiler.executable.empty()) throw ConfigError("compiler executable must not be empty");
    if (compiler.work_root.empty()) throw ConfigError("work directory must not be empty");
    if (max_concurrent_jobs <= 0) throw ConfigError("max concurrent jobs must be positive");
    if (max_source_bytes == 0) throw ConfigError("max source bytes must be positive");
    if (compiler.job_timeout.count() <= 0) throw ConfigError("job timeout must be positive");
    if (compiler.termination_grace.count() < 0) throw ConfigError("termination grace must not be negative");
    if (monitor.sweep_interval.count() <= 0) throw ConfigError("monitor interval must be positive");
    if (monitor.max_age <= compiler.job_timeout) {
        throw ConfigError("monitor max age (" + std::to_string(monitor.max_age.count()) +
                          "s) must exceed the job timeout (" +
                          std::to_string(compiler.job_timeout.count()) + "s)");
    }
    if (rate_limit.per_minute <= 0 || rate_limit.per_hour <= 0) {
        throw ConfigError("rate limits must be positive");
    }
    if (rate_limit.minute_lockout.count() <= 0 || rate_limit.hour_lockout.count() <= 0) {
        throw ConfigError("lockout durations must be positive");
    }
}

} // namespace zxcompile
