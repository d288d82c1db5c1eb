#include <span>
#include <mutex>
#include <memory>
#include <string>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <algorithm>

#include <boost/asio/error.hpp>
#include <boost/system/error_code.hpp>

#include "error.h"
#include "pipe_stream.h"

namespace nett
{

pipe_stream::pipe_stream(std::shared_ptr<detail::pipe_channel> inbound, std::shared_ptr<detail::pipe_channel> outbound, std::string name)
    : inbound_(std::move(inbound)), outbound_(std::move(outbound)), name_(std::move(name))
{
}

pipe_stream::~pipe_stream() { close(); }

std::size_t pipe_stream::read_some(std::span<std::uint8_t> buffer, boost::system::error_code& ec)
{
    ec.clear();
    std::unique_lock<std::mutex> lock(inbound_->mutex);
    inbound_->readable.wait(lock, [this]() { return inbound_->reader_closed || inbound_->writer_closed || !inbound_->bytes.empty(); });

    if (inbound_->reader_closed)
    {
        ec = errc::kStreamClosed;
        return 0;
    }
    if (inbound_->bytes.empty())
    {
        ec = boost::asio::error::eof;
        return 0;
    }
    if (buffer.empty())
    {
        return 0;
    }

    const std::size_t n = std::min(buffer.size(), inbound_->bytes.size());
    std::copy_n(inbound_->bytes.begin(), n, buffer.begin());
    inbound_->bytes.erase(inbound_->bytes.begin(), inbound_->bytes.begin() + static_cast<std::ptrdiff_t>(n));
    return n;
}

std::size_t pipe_stream::write(std::span<const std::uint8_t> data, boost::system::error_code& ec)
{
    ec.clear();
    {
        const std::lock_guard<std::mutex> lock(outbound_->mutex);
        if (outbound_->writer_closed)
        {
            ec = errc::kStreamClosed;
            return 0;
        }
        if (outbound_->reader_closed)
        {
            ec = boost::asio::error::broken_pipe;
            return 0;
        }
        outbound_->bytes.insert(outbound_->bytes.end(), data.begin(), data.end());
    }
    outbound_->readable.notify_all();
    return data.size();
}

void pipe_stream::close() noexcept
{
    {
        const std::lock_guard<std::mutex> lock(inbound_->mutex);
        inbound_->reader_closed = true;
    }
    inbound_->readable.notify_all();

    {
        const std::lock_guard<std::mutex> lock(outbound_->mutex);
        outbound_->writer_closed = true;
    }
    outbound_->readable.notify_all();
}

bool pipe_stream::is_open() const noexcept
{
    const std::lock_guard<std::mutex> lock(inbound_->mutex);
    return !inbound_->reader_closed;
}

std::pair<std::shared_ptr<pipe_stream>, std::shared_ptr<pipe_stream>> make_pipe_pair(const std::string& name)
{
    auto a_to_b = std::make_shared<detail::pipe_channel>();
    auto b_to_a = std::make_shared<detail::pipe_channel>();
    auto a = std::make_shared<pipe_stream>(b_to_a, a_to_b, name + "/a");
    auto b = std::make_shared<pipe_stream>(a_to_b, b_to_a, name + "/b");
    return {std::move(a), std::move(b)};
}

}    // namespace nett
