/**
 * @file test_config.cpp
 * @brief Unit tests for command line and environment configuration
 */

#include <gtest/gtest.h>
#include "config.hpp"

#include <cstdlib>
#include <map>
#include <string>
#include <vector>

using config::app_config;
using config::parse_args;

class ConfigTest : public ::testing::Test {
protected:
    // Helper to build argc/argv from a list of arguments
    app_config parse(std::vector<std::string> args) {
        storage_ = std::move(args);
        storage_.insert(storage_.begin(), "soundtouch-proxy");
        argv_.clear();
        for(auto& arg : storage_)
            argv_.push_back(arg.data());
        argv_.push_back(nullptr);

        return parse_args(static_cast<int>(storage_.size()), argv_.data(),
            [this](const char* name) -> const char* {
                auto it = env_.find(name);
                return (it != env_.end()) ? it->second.c_str() : nullptr;
            });
    }

    std::map<std::string, std::string> env_;

private:
    std::vector<std::string> storage_;
    std::vector<char*> argv_;
};

TEST_F(ConfigTest, Defaults) {
    app_config cfg = parse({});

    EXPECT_TRUE(cfg.error.empty());
    EXPECT_FALSE(cfg.help);
    EXPECT_FALSE(cfg.device_ip.has_value());
    EXPECT_EQ(cfg.port, 8000);
    EXPECT_TRUE(cfg.web_root.empty());
}

TEST_F(ConfigTest, PositionalDeviceAndPort) {
    app_config cfg = parse({"192.168.1.20", "--port", "9000"});

    EXPECT_TRUE(cfg.error.empty());
    EXPECT_EQ(cfg.device_ip, "192.168.1.20");
    EXPECT_EQ(cfg.port, 9000);
}

TEST_F(ConfigTest, ShortPortOptionAndWebRoot) {
    app_config cfg = parse({"-p", "8080", "--web-root", "/srv/soundtouch"});

    EXPECT_TRUE(cfg.error.empty());
    EXPECT_EQ(cfg.port, 8080);
    EXPECT_EQ(cfg.web_root, "/srv/soundtouch");
}

TEST_F(ConfigTest, EnvironmentIsUsed) {
    env_["SOUNDTOUCH_DEVICE_IP"] = "10.0.0.7";
    env_["SOUNDTOUCH_PORT"] = "8123";
    env_["SOUNDTOUCH_WEB_ROOT"] = "/var/www";

    app_config cfg = parse({});

    EXPECT_TRUE(cfg.error.empty());
    EXPECT_EQ(cfg.device_ip, "10.0.0.7");
    EXPECT_EQ(cfg.port, 8123);
    EXPECT_EQ(cfg.web_root, "/var/www");
}

TEST_F(ConfigTest, CommandLineBeatsEnvironment) {
    env_["SOUNDTOUCH_DEVICE_IP"] = "10.0.0.7";
    env_["SOUNDTOUCH_PORT"] = "8123";

    app_config cfg = parse({"10.0.0.8", "-p", "8124"});

    EXPECT_EQ(cfg.device_ip, "10.0.0.8");
    EXPECT_EQ(cfg.port, 8124);
}

TEST_F(ConfigTest, EmptyEnvironmentValuesAreIgnored) {
    env_["SOUNDTOUCH_DEVICE_IP"] = "";
    env_["SOUNDTOUCH_PORT"] = "";

    app_config cfg = parse({});

    EXPECT_TRUE(cfg.error.empty());
    EXPECT_FALSE(cfg.device_ip.has_value());
    EXPECT_EQ(cfg.port, 8000);
}

TEST_F(ConfigTest, InvalidPortsAreErrors) {
    EXPECT_FALSE(parse({"--port", "abc"}).error.empty());
    EXPECT_FALSE(parse({"--port", "0"}).error.empty());
    EXPECT_FALSE(parse({"--port", "65536"}).error.empty());
    EXPECT_FALSE(parse({"--port", "80x"}).error.empty());
    EXPECT_FALSE(parse({"--port"}).error.empty());

    env_["SOUNDTOUCH_PORT"] = "-1";
    EXPECT_FALSE(parse({}).error.empty());
}

TEST_F(ConfigTest, UnknownOptionAndExtraArgument) {
    EXPECT_FALSE(parse({"--verbose"}).error.empty());
    EXPECT_FALSE(parse({"10.0.0.1", "10.0.0.2"}).error.empty());
}

TEST_F(ConfigTest, Help) {
    EXPECT_TRUE(parse({"-h"}).help);
    EXPECT_TRUE(parse({"10.0.0.1", "--help"}).help);
}

TEST(ConfigEnvironmentTest, ReadsProcessEnvironment) {
    ::setenv("SOUNDTOUCH_PORT", "8321", 1);
    ::setenv("SOUNDTOUCH_DEVICE_IP", "10.1.2.3", 1);

    char program[] = "soundtouch-proxy";
    char* argv[] = {program, nullptr};
    app_config cfg = parse_args(1, argv);

    ::unsetenv("SOUNDTOUCH_PORT");
    ::unsetenv("SOUNDTOUCH_DEVICE_IP");

    EXPECT_TRUE(cfg.error.empty());
    EXPECT_EQ(cfg.port, 8321);
    EXPECT_EQ(cfg.device_ip, "10.1.2.3");
}
