#include "shoal_server/options.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <unistd.h>
#include <vector>

using namespace shoal_server;
using namespace shoal::cluster;

namespace {

constexpr const char* MANAGED_VARS[] = {"PORT", "WORKER_COUNT", "DISPATCH_TIMEOUT_MS",
                                        "RESTART_POLICY", "BALANCING", "SHOAL_TEST_QUOTED",
                                        "SHOAL_TEST_EXPORTED", "SHOAL_TEST_COMMENT"};

class OptionsTest : public ::testing::Test {
protected:
    void SetUp() override { clear_env(); }

    void TearDown() override {
        clear_env();
        if (!env_path_.empty()) {
            std::remove(env_path_.c_str());
        }
    }

    static void clear_env() {
        for (const char* name : MANAGED_VARS) {
            ::unsetenv(name);
        }
    }

    options parse(std::vector<std::string> args) {
        args.insert(args.begin(), "shoal_server");
        std::vector<char*> argv;
        for (auto& a : args) {
            argv.push_back(a.data());
        }
        return parse_args(static_cast<int>(argv.size()), argv.data());
    }

    std::string write_env_file(const std::string& content) {
        env_path_ = "shoal_options_test_" + std::to_string(::getpid()) + ".env";
        std::ofstream out(env_path_);
        out << content;
        return env_path_;
    }

    std::string env_path_;
};

} // namespace

TEST_F(OptionsTest, ParsesFlags) {
    auto opts = parse({"-p", "8080", "--workers", "3", "--dispatch-timeout-ms", "250",
                       "--restart", "none", "--balance", "consistent-hash", "--env-file", "x.env"});
    EXPECT_EQ(opts.port, "8080");
    EXPECT_EQ(opts.workers, "3");
    EXPECT_EQ(opts.dispatch_timeout_ms, "250");
    EXPECT_EQ(opts.restart, "none");
    EXPECT_EQ(opts.balance, "consistent-hash");
    EXPECT_EQ(opts.env_file, "x.env");
}

TEST_F(OptionsTest, UnknownArgumentExits) {
    EXPECT_EXIT(parse({"--bogus"}), ::testing::ExitedWithCode(1), "Unknown argument");
}

TEST_F(OptionsTest, HelpExitsCleanly) {
    EXPECT_EXIT(parse({"--help"}), ::testing::ExitedWithCode(0), "");
}

TEST_F(OptionsTest, DefaultsWithoutFlagsOrEnvironment) {
    auto config = resolve_config(options{});
    ASSERT_TRUE(config.has_value()) << config.error();
    EXPECT_EQ(config->port, 4000);
    EXPECT_EQ(config->worker_count, default_worker_count());
    EXPECT_EQ(config->dispatch_timeout, std::chrono::milliseconds(5000));
    EXPECT_EQ(config->supervision.policy, restart_policy::restart);
    EXPECT_EQ(config->balance, balancing::round_robin);
}

TEST_F(OptionsTest, EnvironmentFillsUnsetFlags) {
    ::setenv("PORT", "5000", 1);
    ::setenv("WORKER_COUNT", "2", 1);
    ::setenv("RESTART_POLICY", "fail-fast", 1);

    options opts;
    opts.port = "6000";
    auto config = resolve_config(opts);
    ASSERT_TRUE(config.has_value()) << config.error();
    EXPECT_EQ(config->port, 6000);
    EXPECT_EQ(config->worker_count, 2U);
    EXPECT_EQ(config->supervision.policy, restart_policy::fail_fast);
}

TEST_F(OptionsTest, RejectsInvalidValues) {
    options bad_port;
    bad_port.port = "0";
    EXPECT_FALSE(resolve_config(bad_port).has_value());

    bad_port.port = "70000";
    EXPECT_FALSE(resolve_config(bad_port).has_value());

    options bad_workers;
    bad_workers.workers = "-1";
    EXPECT_FALSE(resolve_config(bad_workers).has_value());

    options overflow;
    overflow.port = "65535";
    overflow.workers = "1";
    EXPECT_FALSE(resolve_config(overflow).has_value());

    options bad_timeout;
    bad_timeout.dispatch_timeout_ms = "0";
    EXPECT_FALSE(resolve_config(bad_timeout).has_value());

    options bad_restart;
    bad_restart.restart = "sometimes";
    EXPECT_FALSE(resolve_config(bad_restart).has_value());

    options bad_balance;
    bad_balance.balance = "random";
    auto res = resolve_config(bad_balance);
    ASSERT_FALSE(res.has_value());
    EXPECT_NE(res.error().find("random"), std::string::npos);
}

TEST_F(OptionsTest, LoadEnvFile) {
    ::setenv("PORT", "7000", 1);
    auto path = write_env_file("# comment\n"
                               "\n"
                               "PORT=9000\n"
                               "WORKER_COUNT = 4\n"
                               "SHOAL_TEST_QUOTED=\"a b\"\n"
                               "export SHOAL_TEST_EXPORTED='x'\n"
                               "SHOAL_TEST_COMMENT=value # trailing\n"
                               "not a variable\n");

    auto loaded = load_env_file(path);
    ASSERT_TRUE(loaded.has_value()) << loaded.error();
    EXPECT_EQ(*loaded, 4U);

    EXPECT_STREQ(std::getenv("PORT"), "7000");
    EXPECT_STREQ(std::getenv("WORKER_COUNT"), "4");
    EXPECT_STREQ(std::getenv("SHOAL_TEST_QUOTED"), "a b");
    EXPECT_STREQ(std::getenv("SHOAL_TEST_EXPORTED"), "x");
    EXPECT_STREQ(std::getenv("SHOAL_TEST_COMMENT"), "value");
}

TEST_F(OptionsTest, MissingEnvFile) {
    auto loaded = load_env_file("/nonexistent/shoal.env");
    ASSERT_FALSE(loaded.has_value());
    EXPECT_NE(loaded.error().find("cannot open"), std::string::npos);
}
