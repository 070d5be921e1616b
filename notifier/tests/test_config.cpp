#include <gtest/gtest.h>
#include "config.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace {

const char* kManagedVars[] = {
    "ENV_FILE", "POLL_INTERVAL_SECONDS", "PRIME_ON_START", "GITHUB_TOKEN", "GITHUB_TOKEN_FILE",
    "GITHUB_API_URL", "GITHUB_PER_PAGE", "PRINTER_DEVICE", "PRINTER_WIDTH", "HEALTH_PORT",
    "NOTIFIER_TEST_FROM_FILE", "NOTIFIER_TEST_QUOTED", "NOTIFIER_TEST_KEEP",
};

std::string write_temp_file(const std::string& name, const std::string& content) {
    std::string path = ::testing::TempDir() + name;
    std::ofstream out(path);
    out << content;
    return path;
}

} // namespace

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        for (const char* name : kManagedVars) {
            unsetenv(name);
        }
    }
};

TEST_F(ConfigTest, DefaultsAreValid) {
    setenv("ENV_FILE", "/nonexistent/.env", 1);

    Config config = Config::from_env();

    EXPECT_EQ(config.service_name, "notifier");
    EXPECT_EQ(config.poll_interval_seconds, 60);
    EXPECT_TRUE(config.prime_on_start);
    EXPECT_TRUE(config.github_token.empty());
    EXPECT_EQ(config.github_api_url, "https://api.github.com");
    EXPECT_EQ(config.printer_width, 32);
    EXPECT_NO_THROW(config.validate());
}

TEST_F(ConfigTest, ReadsEnvironment) {
    setenv("ENV_FILE", "/nonexistent/.env", 1);
    setenv("POLL_INTERVAL_SECONDS", "15", 1);
    setenv("PRIME_ON_START", "false", 1);
    setenv("GITHUB_TOKEN", "ghp_env", 1);
    setenv("PRINTER_DEVICE", "/dev/rfcomm0", 1);
    setenv("PRINTER_WIDTH", "48", 1);
    setenv("HEALTH_PORT", "0", 1);

    Config config = Config::from_env();

    EXPECT_EQ(config.poll_interval_seconds, 15);
    EXPECT_FALSE(config.prime_on_start);
    EXPECT_EQ(config.github_token, "ghp_env");
    EXPECT_EQ(config.printer_device, "/dev/rfcomm0");
    EXPECT_EQ(config.printer_width, 48);
    EXPECT_EQ(config.health_port, 0);
}

TEST_F(ConfigTest, TokenFileTakesPrecedence) {
    std::string path = write_temp_file("notifier_token", "ghp_from_file\nsecond line\n");
    setenv("ENV_FILE", "/nonexistent/.env", 1);
    setenv("GITHUB_TOKEN_FILE", path.c_str(), 1);
    setenv("GITHUB_TOKEN", "ghp_env", 1);

    EXPECT_EQ(Config::from_env().github_token, "ghp_from_file");
    std::remove(path.c_str());
}

TEST_F(ConfigTest, EnvFileDoesNotOverrideEnvironment) {
    std::string path = write_temp_file("notifier_env",
        "# comment\n"
        "\n"
        "NOTIFIER_TEST_FROM_FILE=file-value\n"
        "export NOTIFIER_TEST_QUOTED=\"quoted value\"\n"
        "NOTIFIER_TEST_KEEP=from-file\n"
        "not a pair\n");
    setenv("NOTIFIER_TEST_KEEP", "from-env", 1);

    EXPECT_EQ(load_env_file(path), 2);
    EXPECT_STREQ(std::getenv("NOTIFIER_TEST_FROM_FILE"), "file-value");
    EXPECT_STREQ(std::getenv("NOTIFIER_TEST_QUOTED"), "quoted value");
    EXPECT_STREQ(std::getenv("NOTIFIER_TEST_KEEP"), "from-env");
    std::remove(path.c_str());
}

TEST_F(ConfigTest, MissingEnvFileIsReported) {
    EXPECT_EQ(load_env_file("/nonexistent/.env"), -1);
}

TEST_F(ConfigTest, EnvFileSuppliesToken) {
    std::string path = write_temp_file("notifier_env_token", "GITHUB_TOKEN=ghp_dotenv\n");
    setenv("ENV_FILE", path.c_str(), 1);

    EXPECT_EQ(Config::from_env().github_token, "ghp_dotenv");
    std::remove(path.c_str());
}

TEST_F(ConfigTest, ValidateRejectsBadValues) {
    Config config;
    config.poll_interval_seconds = 0;
    EXPECT_THROW(config.validate(), std::runtime_error);

    config = Config{};
    config.github_per_page = 101;
    EXPECT_THROW(config.validate(), std::runtime_error);

    config = Config{};
    config.github_timeout_ms = 0;
    EXPECT_THROW(config.validate(), std::runtime_error);

    config = Config{};
    config.printer_width = 8;
    EXPECT_THROW(config.validate(), std::runtime_error);

    config = Config{};
    config.health_port = 70000;
    EXPECT_THROW(config.validate(), std::runtime_error);
}
