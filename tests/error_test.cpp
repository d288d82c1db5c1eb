#include <string>

#include <gtest/gtest.h>
#include <boost/asio/error.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/error_code.hpp>

#include "error.h"

namespace nett
{

TEST(ErrorTest, CategoryNameAndMessages)
{
    const boost::system::error_code ec = errc::kStreamClosed;
    EXPECT_STREQ(ec.category().name(), "nett");
    EXPECT_EQ(ec.message(), "stream closed");
    EXPECT_EQ(make_error_code(errc::kTemporaryFailure).message(), "temporary failure");
    EXPECT_EQ(make_error_code(errc::kMessageTooLarge).message(), "message too large");
    EXPECT_EQ(nett_category().message(999), "unknown nett error");
}

TEST(ErrorTest, TransientErrors)
{
    EXPECT_EQ(classify_error(errc::kTemporaryFailure), error_kind::kTransient);
    EXPECT_EQ(classify_error(boost::asio::error::would_block), error_kind::kTransient);
    EXPECT_EQ(classify_error(boost::asio::error::try_again), error_kind::kTransient);
    EXPECT_EQ(classify_error(boost::asio::error::interrupted), error_kind::kTransient);
}

TEST(ErrorTest, ClosedErrors)
{
    EXPECT_EQ(classify_error(boost::asio::error::eof), error_kind::kClosed);
    EXPECT_EQ(classify_error(errc::kStreamClosed), error_kind::kClosed);
    EXPECT_EQ(classify_error(boost::asio::error::bad_descriptor), error_kind::kClosed);
    EXPECT_EQ(classify_error(boost::asio::error::operation_aborted), error_kind::kClosed);
}

TEST(ErrorTest, OtherErrors)
{
    EXPECT_EQ(classify_error(boost::asio::error::connection_reset), error_kind::kOther);
    EXPECT_EQ(classify_error(boost::asio::error::broken_pipe), error_kind::kOther);
    EXPECT_EQ(classify_error(errc::kMessageTooLarge), error_kind::kOther);
    EXPECT_EQ(classify_error(boost::system::errc::make_error_code(boost::system::errc::permission_denied)), error_kind::kOther);
}

TEST(ErrorTest, EmptyCodeIsOther) { EXPECT_EQ(classify_error(boost::system::error_code{}), error_kind::kOther); }

TEST(ErrorTest, KindNames)
{
    EXPECT_STREQ(error_kind_name(error_kind::kTransient), "transient");
    EXPECT_STREQ(error_kind_name(error_kind::kClosed), "closed");
    EXPECT_STREQ(error_kind_name(error_kind::kOther), "other");
}

}    // namespace nett
