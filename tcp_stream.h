#ifndef NETT_TCP_STREAM_H
#define NETT_TCP_STREAM_H

#include <span>
#include <atomic>
#include <string>
#include <cstddef>
#include <cstdint>

#include <boost/asio/ip/tcp.hpp>
#include <boost/system/error_code.hpp>

#include "duplex_stream.h"

namespace nett
{

// Connected TCP socket driven with blocking calls. close() only shuts the
// socket down so a reader blocked in another thread wakes up with eof;
// the descriptor is released by the destructor.
class tcp_stream : public duplex_stream
{
   public:
    explicit tcp_stream(boost::asio::ip::tcp::socket socket);
    ~tcp_stream() override;

    tcp_stream(const tcp_stream&) = delete;
    tcp_stream& operator=(const tcp_stream&) = delete;

    std::size_t read_some(std::span<std::uint8_t> buffer, boost::system::error_code& ec) override;
    std::size_t write(std::span<const std::uint8_t> data, boost::system::error_code& ec) override;
    void close() noexcept override;

    [[nodiscard]] bool is_open() const noexcept override { return !closed_.load(std::memory_order_acquire); }
    [[nodiscard]] error_kind classify(const boost::system::error_code& ec) const noexcept override;

    [[nodiscard]] std::string local_endpoint() const override { return local_; }
    [[nodiscard]] std::string remote_endpoint() const override { return remote_; }

    [[nodiscard]] boost::asio::ip::tcp::socket& socket() { return socket_; }

   private:
    boost::asio::ip::tcp::socket socket_;
    std::atomic<bool> closed_{false};
    std::string local_;
    std::string remote_;
};

}    // namespace nett

#endif
