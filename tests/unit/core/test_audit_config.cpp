/**
 * @file test_audit_config.cpp
 * @brief Unit tests for AuditConfig loading and validation
 */

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "test_helpers.hpp"
#include "upifinder/core/AuditConfig.hpp"

using namespace UPIFINDER;

// Test: Defaults are valid
TEST(AuditConfigTest, DefaultsAreValid)
{
    AuditConfig config;
    EXPECT_TRUE(isOk(ValidateAuditConfig(config)));
    EXPECT_EQ(config.group_by, "upi");
    EXPECT_FALSE(config.concurrency.has_value());
}

// Test: JSON keys present are copied, others keep the base value
TEST(AuditConfigTest, FromJSONCopiesPresentKeys)
{
    nlohmann::json j = {
        {"paths", nlohmann::json::array({"/data/a", "/data/b"})},
        {"upi", "XYZ"},
        {"period_days", 7},
        {"min_duration_s", 60},
        {"all_gaps", true},
        {"group_by", "source"},
        {"concurrency", 4},
    };
    AuditConfig base;
    base.format = "csv";

    auto result = AuditConfigFromJSON(j, base);
    ASSERT_TRUE(isOk(result)) << getError(result).message;
    const AuditConfig &config = getValue(result);
    EXPECT_EQ(config.paths, (std::vector<std::string>{"/data/a", "/data/b"}));
    EXPECT_EQ(config.upi, "XYZ");
    EXPECT_EQ(config.period_days, 7);
    EXPECT_EQ(config.min_duration_s, 60);
    EXPECT_TRUE(config.all_gaps);
    EXPECT_FALSE(config.keep_invalid);
    EXPECT_EQ(config.group_by, "source");
    EXPECT_EQ(config.format, "csv");
    ASSERT_TRUE(config.concurrency.has_value());
    EXPECT_EQ(*config.concurrency, 4u);
}

// Test: Wrongly typed values are configuration errors
TEST(AuditConfigTest, FromJSONRejectsWrongTypes)
{
    auto result = AuditConfigFromJSON(nlohmann::json{{"period_days", "seven"}});
    ASSERT_FALSE(isOk(result));
    EXPECT_EQ(getError(result).code, Error::INVALID_CONFIG);

    auto notObject = AuditConfigFromJSON(nlohmann::json::array());
    EXPECT_FALSE(isOk(notObject));
}

// Test: Loading from a file
TEST(AuditConfigTest, LoadFromFile)
{
    test::TempDir dir;
    std::string path = dir.WriteText("config.json", R"({"start": "2018-06-01", "end": "2018-06-08", "format": "json"})");

    auto result = LoadAuditConfigFromFile(path);
    ASSERT_TRUE(isOk(result)) << getError(result).message;
    EXPECT_EQ(getValue(result).start, "2018-06-01");
    EXPECT_EQ(getValue(result).format, "json");
    EXPECT_TRUE(isOk(ValidateAuditConfig(getValue(result))));
}

// Test: Missing and malformed files
TEST(AuditConfigTest, LoadFromFileErrors)
{
    test::TempDir dir;
    auto missing = LoadAuditConfigFromFile((dir.Path() / "none.json").string());
    ASSERT_FALSE(isOk(missing));
    EXPECT_EQ(getError(missing).code, Error::NOT_FOUND);

    std::string broken = dir.WriteText("broken.json", "{\"upi\": ");
    auto parsed = LoadAuditConfigFromFile(broken);
    ASSERT_FALSE(isOk(parsed));
    EXPECT_EQ(getError(parsed).code, Error::INVALID_CONFIG);
}

// Test: start + end + period is rejected
TEST(AuditConfigTest, ValidateRejectsStartEndAndPeriod)
{
    AuditConfig config;
    config.start = "2018-06-01";
    config.end = "2018-06-08";
    config.period_days = 3;
    auto status = ValidateAuditConfig(config);
    ASSERT_FALSE(isOk(status));
    EXPECT_EQ(getError(status).code, Error::INVALID_CONFIG);

    config.period_days = 0;
    EXPECT_TRUE(isOk(ValidateAuditConfig(config)));
}

// Test: Unknown group-by, format, zero concurrency and reversed dates
TEST(AuditConfigTest, ValidateRejectsBadValues)
{
    AuditConfig group;
    group.group_by = "instrument";
    EXPECT_FALSE(isOk(ValidateAuditConfig(group)));

    AuditConfig format;
    format.format = "xml";
    auto status = ValidateAuditConfig(format);
    ASSERT_FALSE(isOk(status));
    EXPECT_EQ(getError(status).code, Error::INVALID_FORMAT);

    AuditConfig jobs;
    jobs.concurrency = 0u;
    EXPECT_FALSE(isOk(ValidateAuditConfig(jobs)));

    AuditConfig dates;
    dates.start = "2018-06-08";
    dates.end = "2018-06-01";
    EXPECT_FALSE(isOk(ValidateAuditConfig(dates)));

    AuditConfig badDate;
    badDate.start = "06/01/2018";
    EXPECT_FALSE(isOk(ValidateAuditConfig(badDate)));
}

// Test: Selectors parse case-insensitively
TEST(AuditConfigTest, ParseSelectors)
{
    EXPECT_TRUE(getValue(ParseOutputFormat("")) == OutputFormat::Default);
    EXPECT_TRUE(getValue(ParseOutputFormat("CSV")) == OutputFormat::CSV);
    EXPECT_TRUE(getValue(ParseOutputFormat("summary")) == OutputFormat::Summary);
    EXPECT_TRUE(getValue(ParseGroupBy("Source")) == GroupBy::Source);
    EXPECT_TRUE(getValue(ParseGroupBy("")) == GroupBy::UPI);
}
