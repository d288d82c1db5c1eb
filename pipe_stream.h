#ifndef NETT_PIPE_STREAM_H
#define NETT_PIPE_STREAM_H

#include <span>
#include <deque>
#include <mutex>
#include <memory>
#include <string>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <condition_variable>

#include <boost/system/error_code.hpp>

#include "duplex_stream.h"

namespace nett
{

namespace detail
{

// One direction of a pipe pair.
struct pipe_channel
{
    std::mutex mutex;
    std::condition_variable readable;
    std::deque<std::uint8_t> bytes;
    bool reader_closed = false;
    bool writer_closed = false;
};

}    // namespace detail

// In-memory end of a connected pair created by make_pipe_pair(). Closing
// either end closes both directions: the closed end reads stream_closed,
// its peer reads the remaining buffered bytes and then eof.
class pipe_stream : public duplex_stream
{
   public:
    pipe_stream(std::shared_ptr<detail::pipe_channel> inbound, std::shared_ptr<detail::pipe_channel> outbound, std::string name);
    ~pipe_stream() override;

    pipe_stream(const pipe_stream&) = delete;
    pipe_stream& operator=(const pipe_stream&) = delete;

    std::size_t read_some(std::span<std::uint8_t> buffer, boost::system::error_code& ec) override;
    std::size_t write(std::span<const std::uint8_t> data, boost::system::error_code& ec) override;
    void close() noexcept override;

    [[nodiscard]] bool is_open() const noexcept override;

    [[nodiscard]] std::string local_endpoint() const override { return name_; }
    [[nodiscard]] std::string remote_endpoint() const override { return name_ + "-peer"; }

   private:
    std::shared_ptr<detail::pipe_channel> inbound_;
    std::shared_ptr<detail::pipe_channel> outbound_;
    std::string name_;
};

[[nodiscard]] std::pair<std::shared_ptr<pipe_stream>, std::shared_ptr<pipe_stream>> make_pipe_pair(const std::string& name = "pipe");

}    // namespace nett

#endif
