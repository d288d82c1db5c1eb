#include <span>
#include <mutex>
#include <memory>
#include <string>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <exception>
#include <unordered_map>

#include <boost/asio/post.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/system/error_code.hpp>

#include "log.h"
#include "tcp_stream.h"
#include "echo_server.h"
#include "log_context.h"

namespace nett
{

framer make_framer(const config::framing_t& framing)
{
    if (framing.mode == "chunk")
    {
        return make_chunk_framer(framing.chunk_size);
    }
    return make_line_framer(framing.max_line);
}

echo_server::echo_server(io_context_pool& pool, config cfg)
    : pool_(pool), cfg_(std::move(cfg)), framer_(make_framer(cfg_.framing)), acceptor_(pool.get_io_context())
{
}

void echo_server::start(boost::system::error_code& ec)
{
    const auto address = boost::asio::ip::make_address(cfg_.listen.host, ec);
    if (ec)
    {
        LOG_ERROR("{} invalid listen host {} error {}", log_event::kListen, cfg_.listen.host, ec.message());
        return;
    }

    const boost::asio::ip::tcp::endpoint endpoint(address, cfg_.listen.port);
    ec = acceptor_.open(endpoint.protocol(), ec);
    if (!ec)
    {
        ec = acceptor_.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true), ec);
    }
    if (!ec)
    {
        ec = acceptor_.bind(endpoint, ec);
    }
    if (!ec)
    {
        ec = acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    }
    if (ec)
    {
        LOG_ERROR("{} listen on {}:{} failed error {}", log_event::kListen, cfg_.listen.host, cfg_.listen.port, ec.message());
        return;
    }

    const auto local = acceptor_.local_endpoint(ec);
    if (ec)
    {
        LOG_ERROR("{} query local endpoint failed error {}", log_event::kListen, ec.message());
        return;
    }
    bound_port_.store(local.port(), std::memory_order_release);

    boost::asio::co_spawn(acceptor_.get_executor(), accept_loop(), boost::asio::detached);
}

void echo_server::stop()
{
    if (stopped_.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }
    LOG_INFO("{} echo server stopping", log_event::kListen);

    boost::asio::post(acceptor_.get_executor(),
                      [self = shared_from_this()]()
                      {
                          boost::system::error_code ignore;
                          ignore = self->acceptor_.close(ignore);
                          (void)ignore;
                      });

    std::unordered_map<std::uint32_t, std::shared_ptr<connection>> live;
    {
        const std::lock_guard<std::mutex> lock(connections_mutex_);
        live.swap(connections_);
    }
    for (auto& entry : live)
    {
        entry.second->close();
    }
}

std::size_t echo_server::active_connections() const
{
    const std::lock_guard<std::mutex> lock(connections_mutex_);
    return connections_.size();
}

boost::asio::awaitable<void> echo_server::accept_loop()
{
    auto self = shared_from_this();
    LOG_INFO("{} echo server listening on {}:{}", log_event::kListen, cfg_.listen.host, port());
    for (;;)
    {
        boost::asio::ip::tcp::socket socket(pool_.get_io_context());
        boost::system::error_code ec;
        co_await acceptor_.async_accept(socket, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec)
        {
            if (ec == boost::asio::error::operation_aborted || stopped_.load(std::memory_order_acquire))
            {
                LOG_INFO("{} accept loop stopped", log_event::kListen);
                co_return;
            }
            LOG_WARN("{} accept failed error {}", log_event::kListen, ec.message());
            continue;
        }

        try
        {
            serve(std::move(socket));
        }
        catch (const std::exception& e)
        {
            LOG_ERROR("{} serve client failed {}", log_event::kListen, e.what());
        }
    }
}

void echo_server::serve(boost::asio::ip::tcp::socket socket)
{
    boost::system::error_code ec;
    ec = socket.set_option(boost::asio::ip::tcp::no_delay(true), ec);
    if (ec)
    {
        LOG_DEBUG("{} set no_delay failed error {}", log_event::kListen, ec.message());
    }

    std::weak_ptr<echo_server> weak_self = shared_from_this();
    connection_handlers handlers;
    handlers.on_data = [](connection& conn, std::span<const std::uint8_t> data)
    {
        if (const auto send_ec = conn.send(data); send_ec)
        {
            LOG_CTX_WARN(conn.context(), "{} echo failed error {}", log_event::kDataSend, send_ec.message());
        }
    };
    handlers.on_err = [](connection& conn, const boost::system::error_code& err)
    { LOG_CTX_WARN(conn.context(), "{} connection error {}", log_event::kHandler, err.message()); };
    handlers.on_closed = [weak_self](connection& conn)
    {
        if (auto server = weak_self.lock())
        {
            const std::lock_guard<std::mutex> lock(server->connections_mutex_);
            server->connections_.erase(conn.id());
        }
    };

    auto conn = connection::wrap(std::make_shared<tcp_stream>(std::move(socket)), framer_, pool_.get_executor(), std::move(handlers));

    {
        const std::lock_guard<std::mutex> lock(connections_mutex_);
        // A closed stream means the closed handler already ran or is queued;
        // tracking the connection now would leak it.
        if (!stopped_.load(std::memory_order_acquire) && conn->raw()->is_open())
        {
            connections_.emplace(conn->id(), conn);
            return;
        }
    }
    conn->close();
}

}    // namespace nett
