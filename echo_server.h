#ifndef NETT_ECHO_SERVER_H
#define NETT_ECHO_SERVER_H

#include <mutex>
#include <atomic>
#include <memory>
#include <cstddef>
#include <cstdint>
#include <unordered_map>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/system/error_code.hpp>

#include "config.h"
#include "framer.h"
#include "connection.h"
#include "context_pool.h"

namespace nett
{

[[nodiscard]] framer make_framer(const config::framing_t& framing);

// Accepts TCP clients and echoes every framed message back to its sender.
class echo_server : public std::enable_shared_from_this<echo_server>
{
   public:
    echo_server(io_context_pool& pool, config cfg);

    // Binds the listen address from the configuration and starts the
    // accept loop on the pool.
    void start(boost::system::error_code& ec);
    // Stops accepting and closes every live connection. Blocks until
    // their reader threads are gone.
    void stop();

    [[nodiscard]] std::uint16_t port() const { return bound_port_.load(std::memory_order_acquire); }
    [[nodiscard]] std::size_t active_connections() const;

   private:
    boost::asio::awaitable<void> accept_loop();
    void serve(boost::asio::ip::tcp::socket socket);

    io_context_pool& pool_;
    config cfg_;
    framer framer_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::atomic<std::uint16_t> bound_port_{0};
    std::atomic<bool> stopped_{false};
    mutable std::mutex connections_mutex_;
    std::unordered_map<std::uint32_t, std::shared_ptr<connection>> connections_;
};

}    // namespace nett

#endif
