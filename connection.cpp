#include <span>
#include <mutex>
#include <atomic>
#include <memory>
#include <thread>
#include <vector>
#include <cstdint>
#include <utility>
#include <expected>
#include <exception>
#include <stdexcept>
#include <system_error>

#include <boost/asio/post.hpp>
#include <boost/system/error_code.hpp>

#include "log.h"
#include "error.h"
#include "connection.h"
#include "scoped_exit.h"

namespace nett
{

namespace
{

std::atomic<std::uint32_t> g_next_conn_id{1};

enum class task_kind : std::uint8_t
{
    kNone,
    kReader,
    kExecutor,
};

// The connection task the current thread is running, if any.
struct running_task
{
    const connection* conn = nullptr;
    task_kind kind = task_kind::kNone;
};

thread_local running_task t_running;

}    // namespace

std::shared_ptr<connection> connection::wrap(std::shared_ptr<duplex_stream> stream,
                                             framer read_fn,
                                             boost::asio::any_io_executor executor,
                                             connection_handlers handlers)
{
    if (stream == nullptr)
    {
        throw std::invalid_argument("connection requires a stream");
    }
    if (!read_fn)
    {
        throw std::invalid_argument("connection requires a framer");
    }

    std::shared_ptr<connection> conn(new connection(std::move(stream), std::move(read_fn), std::move(executor)));
    conn->on_data(std::move(handlers.on_data));
    conn->on_err(std::move(handlers.on_err));
    conn->on_closed(std::move(handlers.on_closed));
    conn->start();
    return conn;
}

connection::connection(std::shared_ptr<duplex_stream> stream, framer read_fn, boost::asio::any_io_executor executor)
    : stream_(std::move(stream)), framer_(std::move(read_fn)), executor_(std::move(executor))
{
    ctx_.conn_id(g_next_conn_id.fetch_add(1, std::memory_order_relaxed));
    ctx_.new_trace_id();
    ctx_.local_endpoint(stream_->local_endpoint());
    ctx_.remote_endpoint(stream_->remote_endpoint());
}

connection::~connection()
{
    const std::lock_guard<std::mutex> lock(reader_mutex_);
    if (!reader_.joinable())
    {
        return;
    }
    // The reader owns a reference, so the last one may be dropped on the
    // reader thread itself.
    if (reader_.get_id() == std::this_thread::get_id())
    {
        reader_.detach();
        return;
    }
    reader_.join();
}

void connection::start()
{
    LOG_CTX_INFO(ctx_, "{} wrapped {}", log_event::kConnInit, ctx_.connection_info());

    reader_work_.add();
    try
    {
        const std::lock_guard<std::mutex> lock(reader_mutex_);
        reader_ = std::thread([self = shared_from_this()]() { self->read_loop(); });
    }
    catch (const std::system_error& e)
    {
        reader_work_.done();
        LOG_CTX_ERROR(ctx_, "{} start reader failed {}", log_event::kConnInit, e.what());
        stream_->close();
        throw;
    }
}

void connection::on_data(data_handler handler)
{
    data_handler previous;
    {
        const std::lock_guard<std::mutex> lock(handlers_mutex_);
        previous = data_slot_.exchange(std::move(handler));
    }
}

void connection::on_err(error_handler handler)
{
    error_handler previous;
    {
        const std::lock_guard<std::mutex> lock(handlers_mutex_);
        previous = err_slot_.exchange(std::move(handler));
    }
}

void connection::on_closed(closed_handler handler)
{
    closed_handler previous;
    {
        const std::lock_guard<std::mutex> lock(handlers_mutex_);
        previous = closed_slot_.exchange(std::move(handler));
    }
}

boost::system::error_code connection::send(std::span<const std::uint8_t> data)
{
    boost::system::error_code ec;
    const std::size_t n = stream_->write(data, ec);
    if (!ec)
    {
        ctx_.record_tx(n);
        LOG_CTX_TRACE(ctx_, "{} sent {} bytes", log_event::kDataSend, n);
        return {};
    }

    const error_kind kind = stream_->classify(ec);
    if (kind == error_kind::kTransient)
    {
        LOG_CTX_DEBUG(ctx_, "{} transient write error ignored {}", log_event::kDataSend, ec.message());
        return {};
    }

    LOG_CTX_WARN(ctx_, "{} send failed {} error {}", log_event::kDataSend, error_kind_name(kind), ec.message());
    stream_->close();
    return ec;
}

void connection::send_async(std::vector<std::uint8_t> data)
{
    send_work_.add();
    auto task = [self = shared_from_this(), data = std::move(data)]()
    {
        const running_task outer = std::exchange(t_running, running_task{.conn = self.get(), .kind = task_kind::kExecutor});
        DEFER(t_running = outer; self->send_work_.done());

        boost::system::error_code ec;
        try
        {
            ec = self->send(data);
        }
        catch (const std::exception& e)
        {
            LOG_CTX_ERROR(self->ctx_, "{} async send threw {}", log_event::kDataSend, e.what());
            return;
        }
        if (ec)
        {
            self->notify_err(ec);
        }
    };

    try
    {
        boost::asio::post(executor_, std::move(task));
    }
    catch (const std::exception& e)
    {
        send_work_.done();
        LOG_CTX_ERROR(ctx_, "{} schedule send failed {}", log_event::kDataSend, e.what());
        throw;
    }
}

void connection::close()
{
    LOG_CTX_DEBUG(ctx_, "{} close requested", log_event::kConnClose);
    stream_->close();

    const bool own_task = t_running.conn == this;
    if (own_task && t_running.kind == task_kind::kReader)
    {
        // The read loop unwinds once the handler returns.
        return;
    }
    // Queued send tasks may sit behind the caller on a single threaded
    // executor, so only outside callers wait for them.
    if (!own_task)
    {
        send_work_.wait();
    }
    reader_work_.wait();
    join_reader();
}

connection_stats connection::stats() const
{
    return connection_stats{
        .tx_bytes = ctx_.tx_bytes(),
        .rx_bytes = ctx_.rx_bytes(),
        .messages_sent = ctx_.messages_sent(),
        .messages_received = ctx_.messages_received(),
    };
}

void connection::read_loop()
{
    t_running = running_task{.conn = this, .kind = task_kind::kReader};
    DEFER(finish_read());

    for (;;)
    {
        std::expected<std::vector<std::uint8_t>, boost::system::error_code> message;
        try
        {
            message = framer_(*stream_);
        }
        catch (const std::exception& e)
        {
            LOG_CTX_ERROR(ctx_, "{} framer threw {}", log_event::kDataRecv, e.what());
            return;
        }

        if (!message)
        {
            const boost::system::error_code& ec = message.error();
            const error_kind kind = stream_->classify(ec);
            if (kind == error_kind::kTransient)
            {
                LOG_CTX_TRACE(ctx_, "{} transient read error ignored {}", log_event::kDataRecv, ec.message());
                continue;
            }
            if (kind == error_kind::kClosed)
            {
                LOG_CTX_DEBUG(ctx_, "{} read stopped {}", log_event::kDataRecv, ec.message());
                return;
            }
            LOG_CTX_WARN(ctx_, "{} read failed {} error {}", log_event::kDataRecv, error_kind_name(kind), ec.message());
            notify_err(ec);
            return;
        }

        if (message->empty())
        {
            continue;
        }

        ctx_.record_rx(message->size());
        LOG_CTX_TRACE(ctx_, "{} received {} bytes", log_event::kDataRecv, message->size());
        if (!notify_data(*message))
        {
            return;
        }
    }
}

void connection::finish_read()
{
    stream_->close();
    LOG_CTX_INFO(ctx_, "{} closed {}", log_event::kConnClose, ctx_.stats_summary());
    boost::asio::post(executor_,
                      [self = shared_from_this()]()
                      {
                          const running_task outer = std::exchange(t_running, running_task{.conn = self.get(), .kind = task_kind::kExecutor});
                          DEFER(t_running = outer);
                          self->notify_closed();
                      });
    reader_work_.done();
    t_running = running_task{};
}

void connection::join_reader()
{
    std::thread reader;
    {
        const std::lock_guard<std::mutex> lock(reader_mutex_);
        if (reader_.joinable() && reader_.get_id() != std::this_thread::get_id())
        {
            reader = std::move(reader_);
        }
    }
    // The read loop has already finished by now; only the thread exit remains.
    if (reader.joinable())
    {
        reader.join();
    }
}

bool connection::notify_data(std::span<const std::uint8_t> data)
{
    data_handler handler;
    {
        const std::lock_guard<std::mutex> lock(handlers_mutex_);
        handler = data_slot_.get();
    }

    try
    {
        handler(*this, data);
    }
    catch (const std::exception& e)
    {
        LOG_CTX_ERROR(ctx_, "{} data handler threw {}", log_event::kHandler, e.what());
        return false;
    }
    return true;
}

void connection::notify_err(const boost::system::error_code& ec)
{
    error_handler handler;
    {
        const std::lock_guard<std::mutex> lock(handlers_mutex_);
        handler = err_slot_.get();
    }

    try
    {
        handler(*this, ec);
    }
    catch (const std::exception& e)
    {
        LOG_CTX_ERROR(ctx_, "{} error handler threw {}", log_event::kHandler, e.what());
    }
}

void connection::notify_closed()
{
    closed_handler handler;
    {
        const std::lock_guard<std::mutex> lock(handlers_mutex_);
        handler = closed_slot_.get();
    }

    try
    {
        handler(*this);
    }
    catch (const std::exception& e)
    {
        LOG_CTX_ERROR(ctx_, "{} closed handler threw {}", log_event::kHandler, e.what());
    }
}

}    // namespace nett
