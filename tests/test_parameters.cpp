#include "parameters.hpp"

#include <gtest/gtest.h>
#include <limits>
#include <map>
#include <string>

using namespace forklift;

TEST(Parameters, Defaults)
{
    auto parameters = ParseForkliftParameters({});
    ASSERT_TRUE(parameters.has_value()) << parameters.error().error_message;
    EXPECT_EQ(parameters->driver.driver_type, DriverType::ForkManager);
    EXPECT_EQ(parameters->driver.max_workers, 10);
    EXPECT_DOUBLE_EQ(parameters->driver.wait_sleep, 1.0);
    EXPECT_EQ(parameters->batch_size, 1);
}

TEST(Parameters, AllOptions)
{
    auto parameters = ParseForkliftParameters({
        { "class", "::Parallel::ForkManager" },
        { "max_workers", "5" },
        { "wait_sleep", "0.5" },
        { "batch_size", "3" },
    });
    ASSERT_TRUE(parameters.has_value()) << parameters.error().error_message;
    EXPECT_EQ(parameters->driver.driver_type, DriverType::ForkManager);
    EXPECT_EQ(parameters->driver.max_workers, 5);
    EXPECT_DOUBLE_EQ(parameters->driver.wait_sleep, 0.5);
    EXPECT_EQ(parameters->batch_size, 3);
}

TEST(Parameters, ZeroIsAllowed)
{
    auto parameters = ParseForkliftParameters({ { "max_workers", "0" }, { "wait_sleep", "0" } });
    ASSERT_TRUE(parameters.has_value()) << parameters.error().error_message;
    EXPECT_EQ(parameters->driver.max_workers, 0);
    EXPECT_DOUBLE_EQ(parameters->driver.wait_sleep, 0.0);
}

TEST(Parameters, DriverNames)
{
    for (auto name : { "ForkManager", "::Parallel::ForkManager", "fork_manager" }) {
        auto driver_type = ParseDriverType(name);
        ASSERT_TRUE(driver_type.has_value()) << name;
        EXPECT_EQ(*driver_type, DriverType::ForkManager);
    }
    for (auto name : { "Inline", "inline" }) {
        auto driver_type = ParseDriverType(name);
        ASSERT_TRUE(driver_type.has_value()) << name;
        EXPECT_EQ(*driver_type, DriverType::Inline);
    }
    EXPECT_STREQ(ToString(DriverType::ForkManager), "ForkManager");
    EXPECT_EQ(ParseDriverType(ToString(DriverType::Inline)), DriverType::Inline);
    auto unknown = ParseDriverType("::Parallel::Prefork");
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().error_type, ForkliftErrorType::ConfigError);
}

TEST(Parameters, Rejected)
{
    std::map<std::string, std::string> const invalid_options[] = {
        { { "max_workers", "-1" } },
        { { "max_workers", "five" } },
        { { "max_workers", "5 " } },
        { { "wait_sleep", "-0.1" } },
        { { "wait_sleep", "inf" } },
        { { "wait_sleep", "" } },
        { { "batch_size", "0" } },
        { { "batch_size", "-2" } },
        { { "class", "Nope" } },
        { { "max_worker", "5" } },
    };
    for (auto const& options : invalid_options) {
        auto parameters = ParseForkliftParameters(options);
        ASSERT_FALSE(parameters.has_value()) << options.begin()->first << "="
                                             << options.begin()->second;
        EXPECT_EQ(parameters.error().error_type, ForkliftErrorType::ConfigError);
    }
}

TEST(Parameters, ValidateInCode)
{
    DriverParameters driver { .max_workers = -3 };
    EXPECT_FALSE(Validate(driver).has_value());
    driver = DriverParameters { .wait_sleep = std::numeric_limits<double>::quiet_NaN() };
    EXPECT_FALSE(Validate(driver).has_value());
    EXPECT_TRUE(Validate(DriverParameters {}).has_value());
    EXPECT_FALSE(Validate(ForkliftParameters { .batch_size = 0 }).has_value());
}
