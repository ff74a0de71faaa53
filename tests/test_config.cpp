#include <gtest/gtest.h>
#include "../src/config.hpp"
#include "../src/exception.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path conf_path;

    void SetUp() override {
        reset_config();
        conf_path = fs::absolute(std::string("tmp_") + ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".conf");
    }

    void TearDown() override {
        fs::remove(conf_path);
        reset_config();
    }

    void write_conf(const std::string& content) {
        std::ofstream f(conf_path);
        f << content;
    }
};

TEST_F(ConfigTest, Defaults) {
    EXPECT_EQ(get_registry_url(Ecosystem::PYTHON), "https://pypi.org");
    EXPECT_EQ(get_registry_url(Ecosystem::NODE), "https://registry.npmjs.org");
    EXPECT_EQ(get_jobs(), 8);
    EXPECT_EQ(get_request_timeout(), 5);
    EXPECT_EQ(get_max_retries(), 2);
    EXPECT_TRUE(get_extra_paid_packages(Ecosystem::PYTHON).empty());
    EXPECT_EQ(CONFIG_FILE, CONFIG_DIR / "depsize.conf");
}

TEST_F(ConfigTest, LoadsSettingsFile) {
    write_conf(
        "# mirror settings\n"
        "pypi_url = https://pypi.internal.example/\n"
        "npm_url=https://npm.internal.example\n"
        "jobs = 3\n"
        "timeout = 12\n"
        "retries = 4\n"
        "\n"
        "paid.python = Acme_Tools, acme.sdk\n"
        "paid.node = @acme/core\n");
    load_config(conf_path, true);

    EXPECT_EQ(get_registry_url(Ecosystem::PYTHON), "https://pypi.internal.example");
    EXPECT_EQ(get_registry_url(Ecosystem::NODE), "https://npm.internal.example");
    EXPECT_EQ(get_jobs(), 3);
    EXPECT_EQ(get_request_timeout(), 12);
    EXPECT_EQ(get_max_retries(), 4);
    EXPECT_EQ(get_extra_paid_packages(Ecosystem::PYTHON), (std::vector<std::string>{"acme-tools", "acme-sdk"}));
    EXPECT_EQ(get_extra_paid_packages(Ecosystem::NODE), (std::vector<std::string>{"@acme/core"}));
    EXPECT_TRUE(is_paid_package("acme-tools", Ecosystem::PYTHON));
    EXPECT_FALSE(is_paid_package("acme-tools", Ecosystem::NODE));
}

TEST_F(ConfigTest, UnknownKeysAndMalformedLinesAreSkipped) {
    write_conf("colour = blue\nthis line has no separator\njobs = 2\n");
    EXPECT_NO_THROW(load_config(conf_path));
    EXPECT_EQ(get_jobs(), 2);
}

TEST_F(ConfigTest, MissingFile) {
    EXPECT_NO_THROW(load_config("/nonexistent/depsize.conf"));
    EXPECT_THROW(load_config("/nonexistent/depsize.conf", true), DepsizeException);
}

TEST_F(ConfigTest, InvalidNumbersThrow) {
    write_conf("jobs = many\n");
    EXPECT_THROW(load_config(conf_path), DepsizeException);

    write_conf("timeout = 0\n");
    EXPECT_THROW(load_config(conf_path), DepsizeException);

    write_conf("retries = 3x\n");
    EXPECT_THROW(load_config(conf_path), DepsizeException);

    EXPECT_THROW(set_jobs(0), DepsizeException);
}

TEST_F(ConfigTest, AuditCommandTemplate) {
    auto python_cmd = get_audit_command(Ecosystem::PYTHON, "flask");
    EXPECT_EQ(python_cmd, (std::vector<std::string>{"safety", "check", "--bare", "--dependency", "flask"}));

    write_conf("node_audit_command = auditor --pkg={name} --json\n");
    load_config(conf_path);
    EXPECT_EQ(get_audit_command(Ecosystem::NODE, "lodash"),
              (std::vector<std::string>{"auditor", "--pkg=lodash", "--json"}));

    set_audit_command(Ecosystem::NODE, "");
    EXPECT_TRUE(get_audit_command(Ecosystem::NODE, "lodash").empty());
}

TEST_F(ConfigTest, ResetRestoresDefaults) {
    set_jobs(32);
    set_registry_url(Ecosystem::NODE, "http://localhost:4873");
    reset_config();
    EXPECT_EQ(get_jobs(), 8);
    EXPECT_EQ(get_registry_url(Ecosystem::NODE), "https://registry.npmjs.org");
}
