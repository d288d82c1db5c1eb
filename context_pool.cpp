#include <mutex>
#include <memory>
#include <thread>
#include <vector>
#include <cstddef>

#include <boost/system/error_code.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include "log.h"
#include "context_pool.h"

namespace nett
{

io_context_pool::io_context_pool(std::size_t pool_size, boost::system::error_code& ec)
{
    if (pool_size == 0)
    {
        ec = boost::system::errc::make_error_code(boost::system::errc::invalid_argument);
        LOG_ERROR("io context pool size cannot be 0");
        return;
    }

    for (std::size_t i = 0; i < pool_size; ++i)
    {
        auto ctx = std::make_shared<boost::asio::io_context>(1);
        io_contexts_.push_back(ctx);
        work_guards_.push_back(std::make_shared<work_guard>(ctx->get_executor()));
    }
}

io_context_pool::~io_context_pool()
{
    stop();
    join();
}

void io_context_pool::run()
{
    start();
    join();
}

void io_context_pool::start()
{
    const std::lock_guard<std::mutex> lock(threads_mutex_);
    if (!threads_.empty())
    {
        return;
    }

    threads_.reserve(io_contexts_.size());
    for (auto& io_context : io_contexts_)
    {
        threads_.emplace_back([io_context]() { io_context->run(); });
    }

    LOG_INFO("io context pool running with {} threads", threads_.size());
}

void io_context_pool::join()
{
    std::vector<std::thread> threads;
    {
        const std::lock_guard<std::mutex> lock(threads_mutex_);
        threads.swap(threads_);
    }

    for (auto& t : threads)
    {
        if (t.joinable() && t.get_id() != std::this_thread::get_id())
        {
            t.join();
        }
        else if (t.joinable())
        {
            t.detach();
        }
    }
}

void io_context_pool::stop()
{
    LOG_DEBUG("io context pool stopping all contexts");
    work_guards_.clear();
    for (auto& ctx : io_contexts_)
    {
        ctx->stop();
    }
}

boost::asio::io_context& io_context_pool::get_io_context()
{
    const std::size_t index = next_io_context_.fetch_add(1, std::memory_order_relaxed) % io_contexts_.size();
    return *io_contexts_[index];
}

}    // namespace nett
