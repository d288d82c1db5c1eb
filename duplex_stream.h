#ifndef NETT_DUPLEX_STREAM_H
#define NETT_DUPLEX_STREAM_H

#include <span>
#include <string>
#include <cstddef>
#include <cstdint>

#include <boost/system/error_code.hpp>

#include "error.h"

namespace nett
{

// Blocking bidirectional byte stream. Implementations wrap sockets,
// in-memory pipes and the like. One reader, any number of writers and
// close() may run concurrently.
class duplex_stream
{
   public:
    virtual ~duplex_stream() = default;

    // Blocks until at least one byte is available. Returns 0 with ec set
    // on failure, including end of stream.
    virtual std::size_t read_some(std::span<std::uint8_t> buffer, boost::system::error_code& ec) = 0;

    // Writes the whole buffer or fails.
    virtual std::size_t write(std::span<const std::uint8_t> data, boost::system::error_code& ec) = 0;

    // Idempotent. Unblocks a pending read_some.
    virtual void close() noexcept = 0;

    [[nodiscard]] virtual bool is_open() const noexcept = 0;

    [[nodiscard]] virtual error_kind classify(const boost::system::error_code& ec) const noexcept { return classify_error(ec); }

    [[nodiscard]] virtual std::string local_endpoint() const { return {}; }
    [[nodiscard]] virtual std::string remote_endpoint() const { return {}; }
};

}    // namespace nett

#endif
