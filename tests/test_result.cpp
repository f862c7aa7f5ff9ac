// =============================================================================
// SimPilot - Result Type Unit Tests
// =============================================================================

#include <gtest/gtest.h>
#include "result.hpp"

using namespace simpilot;

// =============================================================================
// Test: Basic Ok/Err Creation
// =============================================================================

TEST(ResultTest, OkCreation) {
    Result<int> result = 42;

    EXPECT_TRUE(result.is_ok());
    EXPECT_FALSE(result.is_err());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrCreation) {
    Result<int> result = AutomationError(ErrorKind::NoSuchElement, "gone", nullptr, 404);

    EXPECT_FALSE(result.is_ok());
    EXPECT_TRUE(result.is_err());
    EXPECT_EQ(result.error().kind, ErrorKind::NoSuchElement);
    EXPECT_EQ(result.error().message, "gone");
    EXPECT_EQ(result.error().http_status, 404);
}

TEST(ResultTest, BoolConversion) {
    Result<int> ok = 1;
    Result<int> err = AutomationError(ErrorKind::Timeout, "slow");

    EXPECT_TRUE(static_cast<bool>(ok));
    EXPECT_FALSE(static_cast<bool>(err));
}

// =============================================================================
// Test: Value Access
// =============================================================================

TEST(ResultTest, ValueOnErrorThrows) {
    Result<std::string> result = AutomationError(ErrorKind::InvalidArgument, "bad");
    EXPECT_THROW(result.value(), std::logic_error);
}

TEST(ResultTest, ErrorOnOkThrows) {
    Result<std::string> result = std::string("hello");
    EXPECT_EQ(result.value(), "hello");
    EXPECT_THROW(result.error(), std::logic_error);
}

TEST(ResultTest, ValueOr) {
    Result<int> ok = 5;
    Result<int> err = AutomationError(ErrorKind::Timeout, "slow");

    EXPECT_EQ(ok.value_or(0), 5);
    EXPECT_EQ(err.value_or(-1), -1);
}

TEST(ResultTest, MoveOutOfRvalue) {
    Result<std::vector<int>> r = std::vector<int>{1, 2, 3};
    std::vector<int> v = std::move(r).value();
    EXPECT_EQ(v.size(), 3u);
}

// =============================================================================
// Test: Result<void>
// =============================================================================

TEST(ResultTest, VoidOk) {
    Result<void> r = Ok();
    EXPECT_TRUE(r.is_ok());
    EXPECT_THROW(r.error(), std::logic_error);
}

TEST(ResultTest, VoidErr) {
    Result<void> r = AutomationError(ErrorKind::SessionExpired, "expired");
    EXPECT_TRUE(r.is_err());
    EXPECT_TRUE(r.error().is(ErrorKind::SessionExpired));
}

TEST(ResultTest, CustomErrorType) {
    Result<int, DeviceError> r = DeviceError("simctl boot failed", 149, "Unable to boot");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().exit_code, 149);
}

// =============================================================================
// Test: Error payloads
// =============================================================================

TEST(ErrorTest, KindNames) {
    EXPECT_STREQ(errorKindName(ErrorKind::NoSuchElement), "NoSuchElement");
    EXPECT_STREQ(errorKindName(ErrorKind::SessionExpired), "SessionExpired");
    EXPECT_STREQ(errorKindName(ErrorKind::ConnectionRefused), "ConnectionRefused");
    EXPECT_STREQ(errorKindName(ErrorKind::DeviceManagementError), "DeviceManagementError");
}

TEST(ErrorTest, ToJsonOmitsEmptyFields) {
    AutomationError plain(ErrorKind::Timeout, "slow");
    auto j = plain.toJson();
    EXPECT_EQ(j["kind"], "Timeout");
    EXPECT_EQ(j["message"], "slow");
    EXPECT_FALSE(j.contains("raw"));
    EXPECT_FALSE(j.contains("http_status"));

    AutomationError rich(ErrorKind::UnknownAgentError, "boom", nlohmann::json{{"x", 1}}, 500);
    auto r = rich.toJson();
    EXPECT_EQ(r["raw"]["x"], 1);
    EXPECT_EQ(r["http_status"], 500);
}

TEST(ErrorTest, DeviceErrorConverts) {
    DeviceError de("simctl shutdown failed", 1, "No devices are booted.");
    AutomationError ae = de.toAutomationError();

    EXPECT_EQ(ae.kind, ErrorKind::DeviceManagementError);
    EXPECT_EQ(ae.message, "simctl shutdown failed");
    EXPECT_EQ(ae.raw["exit_code"], 1);
    EXPECT_EQ(ae.raw["stderr"], "No devices are booted.");
}
