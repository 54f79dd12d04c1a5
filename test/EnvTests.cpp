#include <gtest/gtest.h>
#include "ADL/Env.hpp"
#include <map>
#include <string>

using namespace ADL;

class EnvTest : public ::testing::Test {
protected:
    std::map<std::string, std::string> vars_ = {
        {"HOME", "/home/dev"},
        {"PATH", "/usr/local/bin:/usr/bin"},
        {"TERM", "xterm-256color"},
        {"DEVELOPER_DIR", "/Applications/Xcode.app/Contents/Developer"},
        {"AWS_SECRET_ACCESS_KEY", "do-not-forward"},
        {"EDITOR", "vim"},
    };
};

TEST_F(EnvTest, ForwardsOnlyAllowListedVariables) {
    auto env = Env::fromVars(vars_);
    ASSERT_TRUE(env.has_value());

    auto explicitVars = env->explicitEnv();
    std::map<std::string, std::string> expected = {
        {"HOME", "/home/dev"},
        {"PATH", "/usr/local/bin:/usr/bin"},
        {"TERM", "xterm-256color"},
        {"DEVELOPER_DIR", "/Applications/Xcode.app/Contents/Developer"},
    };
    EXPECT_EQ(explicitVars, expected);
    EXPECT_EQ(explicitVars.count("AWS_SECRET_ACCESS_KEY"), 0u);
    EXPECT_EQ(explicitVars.count("EDITOR"), 0u);
}

TEST_F(EnvTest, MissingHomeIsAnError) {
    vars_.erase("HOME");
    auto env = Env::fromVars(vars_);
    ASSERT_FALSE(env.has_value());
    EXPECT_EQ(env.error().name(), "HOME");
    EXPECT_EQ(env.error().report().render(),
              "error: Failed to initialize environment\n"
              "    Environment variable `HOME` is not set");
}

TEST_F(EnvTest, MissingPathIsAnError) {
    vars_.erase("PATH");
    auto env = Env::fromVars(vars_);
    ASSERT_FALSE(env.has_value());
    EXPECT_EQ(env.error().name(), "PATH");
}

TEST_F(EnvTest, WithVarAndPrependToPath) {
    auto env = Env::fromVars(vars_);
    ASSERT_TRUE(env.has_value());
    env->withVar("RUST_BACKTRACE", "1").withVar("TERM", "dumb");
    env->prependToPath("/opt/ios-deploy/bin");

    auto explicitVars = env->explicitEnv();
    EXPECT_EQ(explicitVars.at("RUST_BACKTRACE"), "1");
    EXPECT_EQ(explicitVars.at("TERM"), "dumb");
    EXPECT_EQ(explicitVars.at("PATH"), "/opt/ios-deploy/bin:/usr/local/bin:/usr/bin");
    EXPECT_EQ(env->path(), "/opt/ios-deploy/bin:/usr/local/bin:/usr/bin");
}

TEST_F(EnvTest, ExplicitEnvIsRecomputedEachCall) {
    auto env = Env::fromVars(vars_);
    ASSERT_TRUE(env.has_value());
    auto before = env->explicitEnv();
    env->withVar("LANG", "en_US.UTF-8");
    auto after = env->explicitEnv();
    EXPECT_EQ(before.count("LANG"), 0u);
    EXPECT_EQ(after.at("LANG"), "en_US.UTF-8");
}
