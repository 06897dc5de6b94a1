/**
 * @file test_hub_error.cpp
 * @brief HubError structure, retry classification and suggested recovery.
 */
#include "hbl_hub.hpp"
#include "test_patterns.h"

#include <gtest/gtest.h>

using namespace hublink::hub;
using namespace hublink::tests;

class HubErrorTest : public PureApiTest
{
};

TEST_F(HubErrorTest, CarriesStructuredContext)
{
    HubError error(ErrorCategory::Connection, "connect", "hub 'Den' unreachable",
                   "Connection refused", 3);
    EXPECT_STREQ(error.what(), "hub 'Den' unreachable");
    EXPECT_EQ(error.category(), ErrorCategory::Connection);
    EXPECT_EQ(error.operation(), "connect");
    EXPECT_EQ(error.cause(), "Connection refused");
    EXPECT_EQ(error.attempts(), 3);
    EXPECT_FALSE(error.cause_category().has_value());
}

TEST_F(HubErrorTest, IsCatchableAsRuntimeError)
{
    try
    {
        throw HubError(ErrorCategory::Queue, "enqueue", "command queue is full");
    }
    catch (const std::runtime_error &e)
    {
        EXPECT_STREQ(e.what(), "command queue is full");
    }
}

TEST_F(HubErrorTest, RetryableCategories)
{
    EXPECT_TRUE(HubError(ErrorCategory::Discovery, "op", "m").retryable());
    EXPECT_TRUE(HubError(ErrorCategory::Connection, "op", "m").retryable());
    EXPECT_TRUE(HubError(ErrorCategory::Command, "op", "m").retryable());
    EXPECT_TRUE(HubError(ErrorCategory::Queue, "op", "m").retryable());
    EXPECT_FALSE(HubError(ErrorCategory::Cache, "op", "m").retryable());
    EXPECT_FALSE(HubError(ErrorCategory::Storage, "op", "m").retryable());
    EXPECT_FALSE(HubError(ErrorCategory::Validation, "op", "m").retryable());
}

TEST_F(HubErrorTest, RecoveryActionPerCategory)
{
    EXPECT_EQ(recovery_action(HubError(ErrorCategory::Discovery, "op", "m")),
              RecoveryAction::Retry);
    EXPECT_EQ(recovery_action(HubError(ErrorCategory::Connection, "op", "m")),
              RecoveryAction::Reconnect);
    EXPECT_EQ(recovery_action(HubError(ErrorCategory::Command, "op", "m")),
              RecoveryAction::Retry);
    EXPECT_EQ(recovery_action(HubError(ErrorCategory::Queue, "op", "m")), RecoveryAction::Retry);
    EXPECT_EQ(recovery_action(HubError(ErrorCategory::Cache, "op", "m")),
              RecoveryAction::ClearCache);
    EXPECT_EQ(recovery_action(HubError(ErrorCategory::Storage, "op", "m")),
              RecoveryAction::ClearCache);
    EXPECT_EQ(recovery_action(HubError(ErrorCategory::Validation, "op", "m")),
              RecoveryAction::Manual);
}

TEST_F(HubErrorTest, CommandFailedByConnectionSuggestsReconnect)
{
    HubError error(ErrorCategory::Command, "execute_command", "failed after 3 attempts",
                   "lost connection to hub", 3);
    error.caused_by(ErrorCategory::Connection);
    EXPECT_EQ(error.cause_category(), ErrorCategory::Connection);
    EXPECT_EQ(recovery_action(error), RecoveryAction::Reconnect);
}

TEST_F(HubErrorTest, DescribeListsEveryField)
{
    HubError error(ErrorCategory::Command, "execute_command", "command 'PowerOn' failed",
                   "timeout", 2);
    error.caused_by(ErrorCategory::Command);
    const std::string text = error.describe();
    EXPECT_NE(text.find("Command error in 'execute_command': command 'PowerOn' failed"),
              std::string::npos)
        << text;
    EXPECT_NE(text.find("attempts: 2"), std::string::npos) << text;
    EXPECT_NE(text.find("cause: timeout"), std::string::npos) << text;
    EXPECT_NE(text.find("suggested action: retry"), std::string::npos) << text;
}

TEST_F(HubErrorTest, DescribeOmitsEmptyFields)
{
    const std::string text = HubError(ErrorCategory::Validation, "load_config", "bad").describe();
    EXPECT_EQ(text.find("attempts:"), std::string::npos) << text;
    EXPECT_EQ(text.find("cause:"), std::string::npos) << text;
    EXPECT_NE(text.find("suggested action: manual"), std::string::npos) << text;
}
