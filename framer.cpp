#include <span>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <expected>
#include <stdexcept>

#include <boost/system/error_code.hpp>

#include "error.h"
#include "framer.h"

namespace nett
{

namespace
{

std::expected<std::vector<std::uint8_t>, boost::system::error_code> read_bounded_line(duplex_stream& stream, const std::size_t max_bytes)
{
    std::vector<std::uint8_t> line;
    std::uint8_t byte = 0;
    for (;;)
    {
        boost::system::error_code ec;
        const std::size_t n = stream.read_some(std::span<std::uint8_t>(&byte, 1), ec);
        if (ec)
        {
            return std::unexpected(ec);
        }
        if (n == 0)
        {
            continue;
        }
        line.push_back(byte);
        if (byte == kLineTerminator)
        {
            return line;
        }
        if (line.size() >= max_bytes)
        {
            return std::unexpected(make_error_code(errc::kMessageTooLarge));
        }
    }
}

}    // namespace

std::expected<std::vector<std::uint8_t>, boost::system::error_code> read_line(duplex_stream& stream)
{
    return read_bounded_line(stream, std::numeric_limits<std::size_t>::max());
}

framer make_line_framer(const std::size_t max_bytes)
{
    if (max_bytes == 0)
    {
        throw std::invalid_argument("line length limit must be positive");
    }

    return [max_bytes](duplex_stream& stream) { return read_bounded_line(stream, max_bytes); };
}

framer make_chunk_framer(const std::size_t max_bytes)
{
    if (max_bytes == 0)
    {
        throw std::invalid_argument("chunk framer size must be positive");
    }

    return [max_bytes](duplex_stream& stream) -> std::expected<std::vector<std::uint8_t>, boost::system::error_code>
    {
        std::vector<std::uint8_t> chunk(max_bytes);
        boost::system::error_code ec;
        const std::size_t n = stream.read_some(chunk, ec);
        if (ec)
        {
            return std::unexpected(ec);
        }
        chunk.resize(n);
        return chunk;
    };
}

}    // namespace nett
