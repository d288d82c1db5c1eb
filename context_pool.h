#ifndef NETT_CONTEXT_POOL_H
#define NETT_CONTEXT_POOL_H

#include <mutex>
#include <atomic>
#include <memory>
#include <thread>
#include <vector>
#include <cstddef>

#include <boost/asio/io_context.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/system/error_code.hpp>

namespace nett
{

// Fixed set of io_contexts, one thread each. Connections use it as the
// executor for asynchronous sends and close notifications.
class io_context_pool
{
   public:
    io_context_pool(std::size_t pool_size, boost::system::error_code& ec);
    ~io_context_pool();

    io_context_pool(const io_context_pool&) = delete;
    io_context_pool& operator=(const io_context_pool&) = delete;

    // Runs every context on its own thread and blocks until they return.
    void run();
    // Same as run() without blocking; join() waits for the threads.
    void start();
    void join();
    void stop();

    [[nodiscard]] boost::asio::io_context& get_io_context();
    [[nodiscard]] boost::asio::any_io_executor get_executor() { return get_io_context().get_executor(); }
    [[nodiscard]] std::size_t size() const { return io_contexts_.size(); }

   private:
    using work_guard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

    std::atomic<std::size_t> next_io_context_{0};
    std::vector<std::shared_ptr<boost::asio::io_context>> io_contexts_;
    std::vector<std::shared_ptr<work_guard>> work_guards_;
    std::mutex threads_mutex_;
    std::vector<std::thread> threads_;
};

}    // namespace nett

#endif
