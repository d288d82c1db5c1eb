#include <atomic>
#include <chrono>
#include <thread>
#include <vector>
#include <cstddef>
#include <unordered_set>

#include <gtest/gtest.h>
#include <boost/asio/post.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/error_code.hpp>

#include "test_util.h"
#include "context_pool.h"

namespace nett
{

TEST(ContextPoolTest, ZeroSizeRejected)
{
    boost::system::error_code ec;
    io_context_pool pool(0, ec);
    EXPECT_EQ(ec, boost::system::errc::invalid_argument);
    EXPECT_EQ(pool.size(), 0U);
}

TEST(ContextPoolTest, SingleContextWorks)
{
    boost::system::error_code ec;
    io_context_pool pool(1, ec);
    EXPECT_FALSE(ec);

    auto& ctx1 = pool.get_io_context();
    auto& ctx2 = pool.get_io_context();
    EXPECT_EQ(&ctx1, &ctx2);

    pool.stop();
}

TEST(ContextPoolTest, MultipleContextsRoundRobin)
{
    boost::system::error_code ec;
    io_context_pool pool(3, ec);
    EXPECT_FALSE(ec);

    std::vector<boost::asio::io_context*> contexts;
    for (int i = 0; i < 6; ++i)
    {
        contexts.push_back(&pool.get_io_context());
    }

    EXPECT_EQ(contexts[0], contexts[3]);
    EXPECT_EQ(contexts[1], contexts[4]);
    EXPECT_EQ(contexts[2], contexts[5]);

    const std::unordered_set<boost::asio::io_context*> unique_contexts(contexts.begin(), contexts.begin() + 3);
    EXPECT_EQ(unique_contexts.size(), 3U);

    pool.stop();
}

TEST(ContextPoolTest, StopMultipleTimes)
{
    boost::system::error_code ec;
    io_context_pool pool(2, ec);
    EXPECT_FALSE(ec);

    pool.stop();
    pool.stop();
}

TEST(ContextPoolTest, StartRunsPostedWork)
{
    boost::system::error_code ec;
    io_context_pool pool(2, ec);
    ASSERT_FALSE(ec);
    pool.start();
    pool.start();

    std::atomic<int> ran{0};
    for (int i = 0; i < 8; ++i)
    {
        boost::asio::post(pool.get_executor(), [&ran]() { ++ran; });
    }
    EXPECT_TRUE(test::wait_for([&ran]() { return ran.load() == 8; }));

    pool.stop();
    pool.join();
}

TEST(ContextPoolTest, RunAndStop)
{
    boost::system::error_code ec;
    io_context_pool pool(2, ec);
    EXPECT_FALSE(ec);

    std::thread stopper(
        [&pool]()
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            pool.stop();
        });

    pool.run();
    stopper.join();
}

TEST(ContextPoolTest, StopFromPoolThread)
{
    boost::system::error_code ec;
    io_context_pool pool(1, ec);
    ASSERT_FALSE(ec);

    boost::asio::post(pool.get_executor(), [&pool]() { pool.stop(); });
    pool.run();
}

}    // namespace nett
