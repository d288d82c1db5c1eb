#include <array>
#include <chrono>
#include <string>
#include <thread>
#include <vector>
#include <cstdint>

#include <gtest/gtest.h>
#include <boost/asio/error.hpp>
#include <boost/system/error_code.hpp>

#include "error.h"
#include "test_util.h"
#include "pipe_stream.h"

namespace nett
{

TEST(PipeStreamTest, BytesFlowBothWays)
{
    auto [a, b] = make_pipe_pair("test");
    boost::system::error_code ec;

    EXPECT_EQ(a->write(test::to_bytes("hello"), ec), 5U);
    ASSERT_FALSE(ec);
    std::array<std::uint8_t, 16> buf{};
    const auto n = b->read_some(buf, ec);
    ASSERT_FALSE(ec);
    EXPECT_EQ(std::string(buf.begin(), buf.begin() + n), "hello");

    b->write(test::to_bytes("back"), ec);
    ASSERT_FALSE(ec);
    const auto m = a->read_some(buf, ec);
    ASSERT_FALSE(ec);
    EXPECT_EQ(std::string(buf.begin(), buf.begin() + m), "back");
}

TEST(PipeStreamTest, Endpoints)
{
    auto [a, b] = make_pipe_pair("test");
    EXPECT_EQ(a->local_endpoint(), "test/a");
    EXPECT_EQ(a->remote_endpoint(), "test/a-peer");
    EXPECT_EQ(b->local_endpoint(), "test/b");
}

TEST(PipeStreamTest, CloseUnblocksReader)
{
    auto [a, b] = make_pipe_pair();
    boost::system::error_code read_ec;
    std::thread reader(
        [&read_ec, stream = a]()
        {
            std::array<std::uint8_t, 4> buf{};
            stream->read_some(buf, read_ec);
        });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    a->close();
    reader.join();
    EXPECT_EQ(read_ec, errc::kStreamClosed);
    EXPECT_FALSE(a->is_open());
    EXPECT_TRUE(b->is_open());
}

TEST(PipeStreamTest, PeerDrainsThenSeesEof)
{
    auto [a, b] = make_pipe_pair();
    boost::system::error_code ec;
    a->write(test::to_bytes("xy"), ec);
    a->close();

    std::array<std::uint8_t, 1> buf{};
    EXPECT_EQ(b->read_some(buf, ec), 1U);
    EXPECT_FALSE(ec);
    EXPECT_EQ(b->read_some(buf, ec), 1U);
    EXPECT_FALSE(ec);
    EXPECT_EQ(b->read_some(buf, ec), 0U);
    EXPECT_EQ(ec, boost::asio::error::eof);
}

TEST(PipeStreamTest, WriteAfterClose)
{
    auto [a, b] = make_pipe_pair();
    boost::system::error_code ec;
    a->close();
    a->close();

    a->write(test::to_bytes("x"), ec);
    EXPECT_EQ(ec, errc::kStreamClosed);
    EXPECT_EQ(classify_error(ec), error_kind::kClosed);

    b->write(test::to_bytes("x"), ec);
    EXPECT_EQ(ec, boost::asio::error::broken_pipe);
}

}    // namespace nett
