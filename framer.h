#ifndef NETT_FRAMER_H
#define NETT_FRAMER_H

#include <vector>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>

#include <boost/system/error_code.hpp>

#include "duplex_stream.h"

namespace nett
{

// Decodes one complete message from the stream, blocking as long as it
// needs to. Errors from the stream are returned unchanged so the
// connection can classify them.
using framer = std::function<std::expected<std::vector<std::uint8_t>, boost::system::error_code>(duplex_stream&)>;

constexpr std::uint8_t kLineTerminator = '\n';
constexpr std::size_t kDefaultChunkSize = 4096;
constexpr std::size_t kDefaultMaxLineLength = 64 * 1024;

// Reads byte by byte up to and including '\n'. A partial line is dropped
// when the stream fails. There is no length limit.
[[nodiscard]] std::expected<std::vector<std::uint8_t>, boost::system::error_code> read_line(duplex_stream& stream);

// read_line() that gives up with errc::kMessageTooLarge once max_bytes
// have arrived without a terminator. The limit counts the '\n'.
[[nodiscard]] framer make_line_framer(std::size_t max_bytes = kDefaultMaxLineLength);

// Returns whatever a single read of at most max_bytes delivers.
[[nodiscard]] framer make_chunk_framer(std::size_t max_bytes = kDefaultChunkSize);

}    // namespace nett

#endif
