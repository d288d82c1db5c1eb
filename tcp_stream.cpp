#include <span>
#include <cerrno>
#include <string>
#include <cstddef>
#include <cstdint>
#include <utility>

#include <boost/asio/error.hpp>
#include <boost/asio/write.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/system/error_code.hpp>
#include <sys/socket.h>

#include "log.h"
#include "tcp_stream.h"

namespace nett
{

namespace
{

std::string endpoint_string(const boost::asio::ip::tcp::endpoint& ep)
{
    std::string out = ep.address().to_string();
    out.push_back(':');
    out += std::to_string(ep.port());
    return out;
}

}    // namespace

tcp_stream::tcp_stream(boost::asio::ip::tcp::socket socket) : socket_(std::move(socket))
{
    boost::system::error_code ec;
    const auto local = socket_.local_endpoint(ec);
    if (!ec)
    {
        local_ = endpoint_string(local);
    }
    const auto remote = socket_.remote_endpoint(ec);
    if (!ec)
    {
        remote_ = endpoint_string(remote);
    }
}

tcp_stream::~tcp_stream()
{
    boost::system::error_code ec;
    ec = socket_.close(ec);
    (void)ec;
}

std::size_t tcp_stream::read_some(std::span<std::uint8_t> buffer, boost::system::error_code& ec)
{
    return socket_.read_some(boost::asio::buffer(buffer.data(), buffer.size()), ec);
}

std::size_t tcp_stream::write(std::span<const std::uint8_t> data, boost::system::error_code& ec)
{
    return boost::asio::write(socket_, boost::asio::buffer(data.data(), data.size()), ec);
}

void tcp_stream::close() noexcept
{
    if (closed_.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }

    // Another thread may be blocked in read_some() on this socket, and the
    // socket object is not safe for concurrent use. Only the descriptor is
    // touched here: the blocking recv() behind read_some() returns eof once
    // it is shut down.
    if (::shutdown(socket_.native_handle(), SHUT_RDWR) != 0)
    {
        const boost::system::error_code ec(errno, boost::system::system_category());
        if (ec != boost::asio::error::not_connected)
        {
            LOG_WARN("tcp stream {} shutdown failed error {}", remote_, ec.message());
        }
    }
}

error_kind tcp_stream::classify(const boost::system::error_code& ec) const noexcept
{
    if (closed_.load(std::memory_order_acquire))
    {
        return error_kind::kClosed;
    }
    if (ec == boost::asio::error::shut_down || ec == boost::asio::error::not_connected)
    {
        return error_kind::kClosed;
    }
    return classify_error(ec);
}

}    // namespace nett
