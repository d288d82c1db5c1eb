#ifndef NETT_CONNECTION_H
#define NETT_CONNECTION_H

#include <span>
#include <mutex>
#include <memory>
#include <thread>
#include <vector>
#include <cstdint>
#include <utility>
#include <functional>

#include <boost/asio/any_io_executor.hpp>
#include <boost/system/error_code.hpp>

#include "framer.h"
#include "wait_group.h"
#include "log_context.h"
#include "duplex_stream.h"

namespace nett
{

class connection;

using data_handler = std::function<void(connection&, std::span<const std::uint8_t>)>;
using error_handler = std::function<void(connection&, const boost::system::error_code&)>;
using closed_handler = std::function<void(connection&)>;

// Handlers installed by wrap() before the reader thread starts.
struct connection_handlers
{
    data_handler on_data;
    error_handler on_err;
    closed_handler on_closed;
};

namespace detail
{

// Callback holder that never has an empty target: assigning an empty
// function installs a no-op instead.
template <typename Signature>
class handler_slot
{
   public:
    using function_type = std::function<Signature>;

    handler_slot() : fn_(noop()) {}

    // Returns the replaced handler so the caller can destroy it outside
    // any lock.
    function_type exchange(function_type fn) { return std::exchange(fn_, fn ? std::move(fn) : noop()); }

    [[nodiscard]] function_type get() const { return fn_; }

   private:
    static function_type noop()
    {
        return [](auto&&...) {};
    }

    function_type fn_;
};

}    // namespace detail

struct connection_stats
{
    std::uint64_t tx_bytes = 0;
    std::uint64_t rx_bytes = 0;
    std::uint64_t messages_sent = 0;
    std::uint64_t messages_received = 0;
};

// Event-driven facade over a duplex_stream.
//
// A dedicated reader thread calls the framer in a loop and hands every
// decoded message to the data handler. Read errors are sorted by
// duplex_stream::classify(): transient ones are retried, closed ones end
// the loop quietly, anything else goes to the error handler and ends the
// loop. However the loop ends, the stream is closed and the closed
// handler is posted to the executor exactly once.
//
// send_async() and the closed notification run on the executor passed to
// wrap(); it has to keep running until close() has returned.
class connection : public std::enable_shared_from_this<connection>
{
   public:
    // Starts the reader thread and returns without waiting for it.
    // Throws std::invalid_argument for a null stream or an empty framer.
    [[nodiscard]] static std::shared_ptr<connection> wrap(std::shared_ptr<duplex_stream> stream,
                                                          framer read_fn,
                                                          boost::asio::any_io_executor executor,
                                                          connection_handlers handlers = {});

    ~connection();

    connection(const connection&) = delete;
    connection& operator=(const connection&) = delete;

    [[nodiscard]] const std::shared_ptr<duplex_stream>& raw() const { return stream_; }

    void on_data(data_handler handler);
    void on_err(error_handler handler);
    void on_closed(closed_handler handler);

    // Transient write errors count as success. Any other error closes the
    // stream and is returned; no handler is invoked.
    boost::system::error_code send(std::span<const std::uint8_t> data);

    // Like send() but on the executor; failures go to the error handler.
    void send_async(std::vector<std::uint8_t> data);

    // Closes the stream and blocks until the reader thread and every
    // pending send_async() have finished. Safe to call more than once.
    //
    // Inside a handler of this connection the wait is narrowed to what
    // cannot depend on the calling thread:
    //  - on the reader thread (data handler, read error handler) it
    //    returns right after closing the stream;
    //  - on the executor (send_async error handler, closed handler) it
    //    waits for the reader thread only. Queued send_async() tasks run
    //    after the handler returns and fail with a closed stream.
    void close();

    [[nodiscard]] std::uint32_t id() const { return ctx_.conn_id(); }
    [[nodiscard]] const connection_context& context() const { return ctx_; }
    [[nodiscard]] connection_stats stats() const;

   private:
    connection(std::shared_ptr<duplex_stream> stream, framer read_fn, boost::asio::any_io_executor executor);

    void start();
    void read_loop();
    void finish_read();
    void join_reader();

    bool notify_data(std::span<const std::uint8_t> data);
    void notify_err(const boost::system::error_code& ec);
    void notify_closed();

    std::shared_ptr<duplex_stream> stream_;
    framer framer_;
    boost::asio::any_io_executor executor_;

    std::mutex handlers_mutex_;
    detail::handler_slot<void(connection&, std::span<const std::uint8_t>)> data_slot_;
    detail::handler_slot<void(connection&, const boost::system::error_code&)> err_slot_;
    detail::handler_slot<void(connection&)> closed_slot_;

    // Separate groups so a task on the executor never waits for a unit
    // queued behind itself.
    wait_group reader_work_;
    wait_group send_work_;
    std::mutex reader_mutex_;
    std::thread reader_;

    connection_context ctx_;
};

}    // namespace nett

#endif
