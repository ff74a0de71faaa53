#include <gtest/gtest.h>
#include "../src/localization.hpp"
#include "../src/report.hpp"
#include "../src/utils.hpp"

#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

class ReportTest : public ::testing::Test {
protected:
    AnalysisReport report;

    void SetUp() override {
        init_localization();

        PackageInfo flask;
        flask.name = "flask";
        flask.version = "2.0.1";
        flask.size = 95000;
        flask.description = "A micro web framework";
        flask.latest_version = "3.0.0";
        flask.vulnerabilities = "No known vulnerabilities";

        PackageInfo paid;
        paid.name = "enterprise-pkg";
        paid.is_paid = true;

        report.ecosystem = Ecosystem::PYTHON;
        report.packages = {flask, paid};
        report.estimate = {104952600, 42032600, 15761000};
    }
};

TEST_F(ReportTest, JsonLayout) {
    auto doc = report_to_json(report);

    EXPECT_EQ(doc["ecosystem"], "python");
    ASSERT_EQ(doc["packages"].size(), 2u);

    const auto& first = doc["packages"][0];
    EXPECT_EQ(first["name"], "flask");
    EXPECT_EQ(first["size"], 95000);
    EXPECT_EQ(first["is_paid"], false);
    EXPECT_EQ(first["version"], "2.0.1");
    EXPECT_EQ(first["latest_version"], "3.0.0");

    const auto& second = doc["packages"][1];
    EXPECT_EQ(second["is_paid"], true);
    EXPECT_EQ(second["size"], 0);
    EXPECT_EQ(second["description"], std::string(NO_DESCRIPTION));
    EXPECT_EQ(second["latest_version"], std::string(UNAVAILABLE));
    EXPECT_EQ(second["vulnerabilities"], std::string(UNAVAILABLE));

    EXPECT_EQ(doc["docker_sizes"]["full"], 104952600u);
    EXPECT_EQ(doc["docker_sizes"]["slim"], 42032600u);
    EXPECT_EQ(doc["docker_sizes"]["alpine"], 15761000u);
    EXPECT_TRUE(doc["conflicts"].is_array());
    EXPECT_TRUE(doc["conflicts"].empty());

    // Keys keep their declaration order.
    std::vector<std::string> keys;
    for (const auto& item : doc.items()) keys.push_back(item.key());
    EXPECT_EQ(keys, (std::vector<std::string>{"ecosystem", "packages", "docker_sizes", "conflicts"}));
}

TEST_F(ReportTest, ConflictsSerialized) {
    report.conflicts.push_back({"django", "3.2.0", "4.0.0"});
    auto doc = report_to_json(report);
    ASSERT_EQ(doc["conflicts"].size(), 1u);
    EXPECT_EQ(doc["conflicts"][0]["name"], "django");
    EXPECT_EQ(doc["conflicts"][0]["first_version"], "3.2.0");
    EXPECT_EQ(doc["conflicts"][0]["conflicting_version"], "4.0.0");
}

TEST_F(ReportTest, WriteReportCreatesParentDirectories) {
    fs::path out_dir = fs::absolute("tmp_report_out_write");
    fs::remove_all(out_dir);
    fs::path out = out_dir / "nested" / "analysis_output.json";

    write_report(report, out);
    ASSERT_TRUE(fs::exists(out));

    auto parsed = nlohmann::ordered_json::parse(read_file_to_string(out));
    EXPECT_EQ(parsed, report_to_json(report));

    fs::remove_all(out_dir);
}

TEST_F(ReportTest, SummaryWithoutConflicts) {
    std::ostringstream out;
    print_summary(report, out);
    const std::string text = out.str();

    EXPECT_NE(text.find(get_string("info.dependency_overview")), std::string::npos);
    EXPECT_NE(text.find("flask"), std::string::npos);
    EXPECT_NE(text.find("95000"), std::string::npos);
    EXPECT_NE(text.find("104952600"), std::string::npos);
    EXPECT_NE(text.find(get_string("info.no_conflicts")), std::string::npos);
}

TEST_F(ReportTest, SummaryListsConflicts) {
    report.conflicts.push_back({"django", "3.2.0", "4.0.0"});
    std::ostringstream out;
    print_summary(report, out);

    EXPECT_NE(out.str().find(string_format("info.conflict_line", "django", "3.2.0", "4.0.0")), std::string::npos);
    EXPECT_EQ(out.str().find(get_string("info.no_conflicts")), std::string::npos);
}
