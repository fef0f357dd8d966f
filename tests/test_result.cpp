#include <memory>
#include <string>

#include "gtest/gtest.h"
#include "wire_cpp/error.hpp"
#include "wire_cpp/result.hpp"

using wire_cpp::Error;
using wire_cpp::Result;
using wire_cpp::Status;

TEST(ResultTest, OkAndHasValue) {
    auto r = Result<int>::ok(42);
    EXPECT_TRUE(r.has_value());
    EXPECT_FALSE(r.has_error());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r.value(), 42);
}

TEST(ResultTest, ErrorAndHasError) {
    Error err{Error::Code::ConnectionFailed, "fail"};
    auto r = Result<int>::err(err);
    EXPECT_TRUE(r.has_error());
    EXPECT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "fail");
    EXPECT_EQ(r.error().code, Error::Code::ConnectionFailed);
}

TEST(ResultTest, ErrFromCodeAndMessage) {
    auto r = Result<int>::err(Error::Code::HeaderTimeout, "slow");
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::HeaderTimeout);
    EXPECT_EQ(r.error().message, "slow");
}

TEST(ResultTest, ValuePointerMatchesActiveAlternative) {
    auto ok = Result<int>::ok(7);
    ASSERT_NE(ok.value_ptr(), nullptr);
    EXPECT_EQ(*ok.value_ptr(), 7);
    EXPECT_EQ(ok.error_ptr(), nullptr);

    auto bad = Result<int>::err(Error::Code::SendFailed, "broken pipe");
    EXPECT_EQ(bad.value_ptr(), nullptr);
    ASSERT_NE(bad.error_ptr(), nullptr);
    EXPECT_EQ(bad.error_ptr()->code, Error::Code::SendFailed);
}

TEST(ResultTest, MoveOnlyValueCanBeTakenOut) {
    auto r = Result<std::unique_ptr<int>>::ok(std::make_unique<int>(5));
    auto p = std::move(r).value();
    ASSERT_TRUE(p);
    EXPECT_EQ(*p, 5);
}

TEST(ResultTest, ForwardErrorKeepsCodeAndMessage) {
    auto r = Result<int>::err(Error::Code::ResolveFailed, "no such host");
    auto s = std::move(r).forward_error<std::string>();
    ASSERT_TRUE(s.has_error());
    EXPECT_EQ(s.error().code, Error::Code::ResolveFailed);
    EXPECT_EQ(s.error().message, "no such host");
}

TEST(ResultTest, StatusOk) {
    auto s = Status::ok();
    EXPECT_TRUE(s.has_value());
}

TEST(ErrorTest, CodeNamesAreStable) {
    EXPECT_STREQ(wire_cpp::to_string(Error::Code::MissingSniHost),
                 "MissingSniHost");
    EXPECT_STREQ(wire_cpp::to_string(Error::Code::UnsupportedFraming),
                 "UnsupportedFraming");
}
