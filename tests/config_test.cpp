#include "src/server/config.h"

#include <gtest/gtest.h>

#include <map>
#include <string>

namespace zxcompile {
namespace {

class ConfigTest : public ::testing::Test {
protected:
    ServiceConfig Load() {
        return ServiceConfig::FromEnvironment([this](const char* name) -> const char* {
            auto it = env_.find(name);
            return it == env_.end() ? nullptr : it->second.c_str();
        });
    }

    std::map<std::string, std::string> env_;
};

TEST_F(ConfigTest, DefaultsMatchServicePolicy) {
    ServiceConfig config = Load();
    EXPECT_EQ(config.listen_address, "0.0.0.0:50051");
    EXPECT_EQ(config.compiler.executable, "zxbc");
    EXPECT_EQ(config.compiler.flags, std::vector<std::string>({"-taB"}));
    EXPECT_EQ(config.compiler.job_timeout, std::chrono::seconds(5));
    EXPECT_EQ(config.monitor.sweep_interval, std::chrono::seconds(2));
    EXPECT_EQ(config.monitor.max_age, std::chrono::seconds(8));
    EXPECT_TRUE(config.monitor.orphan_scan);
    EXPECT_EQ(config.rate_limit.per_minute, 10);
    EXPECT_EQ(config.rate_limit.per_hour, 100);
    EXPECT_EQ(config.rate_limit.minute_lockout, std::chrono::seconds(60));
    EXPECT_EQ(config.rate_limit.hour_lockout, std::chrono::seconds(300));
}

TEST_F(ConfigTest, EnvironmentOverridesDefaults) {
    env_["ZXCOMPILE_COMPILER"] = "/opt/zxbasic/zxbc";
    env_["ZXCOMPILE_COMPILER_FLAGS"] = "-t  -a -B";
    env_["ZXCOMPILE_JOB_TIMEOUT_SECONDS"] = "3";
    env_["ZXCOMPILE_TERMINATION_GRACE_MS"] = "250";
    env_["ZXCOMPILE_MONITOR_MAX_AGE_SECONDS"] = "6";
    env_["ZXCOMPILE_ORPHAN_SCAN"] = "off";
    env_["ZXCOMPILE_RATE_PER_MINUTE"] = "5";
    env_["ZXCOMPILE_HOUR_LOCKOUT_SECONDS"] = "900";

    ServiceConfig config = Load();
    EXPECT_EQ(config.compiler.executable, "/opt/zxbasic/zxbc");
    EXPECT_EQ(config.compiler.flags, std::vector<std::string>({"-t", "-a", "-B"}));
    EXPECT_EQ(config.compiler.job_timeout, std::chrono::seconds(3));
    EXPECT_EQ(config.compiler.termination_grace, std::chrono::milliseconds(250));
    EXPECT_EQ(config.monitor.termination_grace, std::chrono::milliseconds(250));
    EXPECT_EQ(config.monitor.max_age, std::chrono::seconds(6));
    EXPECT_FALSE(config.monitor.orphan_scan);
    EXPECT_EQ(config.rate_limit.per_minute, 5);
    EXPECT_EQ(config.rate_limit.hour_lockout, std::chrono::seconds(900));
}

TEST_F(ConfigTest, MalformedNumberIsRejected) {
    env_["ZXCOMPILE_JOB_TIMEOUT_SECONDS"] = "5s";
    EXPECT_THROW(Load(), ConfigError);
}

TEST_F(ConfigTest, MalformedBooleanIsRejected) {
    env_["ZXCOMPILE_ORPHAN_SCAN"] = "maybe";
    EXPECT_THROW(Load(), ConfigError);
}

TEST_F(ConfigTest, MonitorAgeMustExceedJobTimeout) {
    env_["ZXCOMPILE_JOB_TIMEOUT_SECONDS"] = "8";
    EXPECT_THROW(Load(), ConfigError);

    env_["ZXCOMPILE_MONITOR_MAX_AGE_SECONDS"] = "9";
    EXPECT_NO_THROW(Load());
}

TEST_F(ConfigTest, NonPositiveLimitsAreRejected) {
    env_["ZXCOMPILE_RATE_PER_HOUR"] = "0";
    EXPECT_THROW(Load(), ConfigError);
}

TEST_F(ConfigTest, IntegerBeyondIntRangeIsRejected) {
    // 2^32 + 10 would wrap to 10 if narrowed.
    env_["ZXCOMPILE_RATE_PER_MINUTE"] = "4294967306";
    EXPECT_THROW(Load(), ConfigError);
}

TEST_F(ConfigTest, DurationsAreCappedAtOneDay) {
    env_["ZXCOMPILE_JOB_TIMEOUT_SECONDS"] = "9300000000000000";
    env_["ZXCOMPILE_MONITOR_MAX_AGE_SECONDS"] = "9300000000000001";
    EXPECT_THROW(Load(), ConfigError);

    env_["ZXCOMPILE_JOB_TIMEOUT_SECONDS"] = "86400";
    env_["ZXCOMPILE_MONITOR_MAX_AGE_SECONDS"] = "86401";
    EXPECT_THROW(Load(), ConfigError);

    env_["ZXCOMPILE_MONITOR_MAX_AGE_SECONDS"] = "86400";
    env_["ZXCOMPILE_JOB_TIMEOUT_SECONDS"] = "86399";
    ServiceConfig config = Load();
    EXPECT_GT(std::chrono::duration_cast<std::chrono::milliseconds>(config.compiler.job_timeout).count(), 0);
}

TEST_F(ConfigTest, GraceInMillisecondsIsCappedAtOneDay) {
    env_["ZXCOMPILE_TERMINATION_GRACE_MS"] = "86400001";
    EXPECT_THROW(Load(), ConfigError);
}

TEST(ServiceConfigValidate, RejectsEmptyCompiler) {
    ServiceConfig config;
    config.compiler.executable.clear();
    EXPECT_THROW(config.Validate(), ConfigError);
}

} // namespace
} // namespace zxcompile
