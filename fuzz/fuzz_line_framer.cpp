#include <span>
#include <vector>
#include <cstddef>
#include <cstdint>

#include <boost/system/error_code.hpp>

#include "error.h"
#include "framer.h"
#include "pipe_stream.h"

namespace
{

constexpr std::size_t kFuzzLineLimit = 64;

// Feeds the input through a pipe and returns the bytes consumed as lines.
std::size_t consume_lines(const uint8_t* data, size_t size, const nett::framer& read_fn, const std::size_t limit)
{
    auto [writer, reader] = nett::make_pipe_pair("fuzz");

    boost::system::error_code ec;
    writer->write(std::span<const std::uint8_t>(data, size), ec);
    writer->close();

    std::size_t consumed = 0;
    for (;;)
    {
        const auto line = read_fn(*reader);
        if (!line)
        {
            if (line.error() == nett::errc::kMessageTooLarge && limit == 0)
            {
                __builtin_trap();
            }
            break;
        }
        if (line->empty() || line->back() != nett::kLineTerminator)
        {
            __builtin_trap();
        }
        if (limit != 0 && line->size() > limit)
        {
            __builtin_trap();
        }
        consumed += line->size();
    }
    return consumed;
}

}    // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    const std::size_t unbounded = consume_lines(data, size, nett::read_line, 0);
    const std::size_t bounded = consume_lines(data, size, nett::make_line_framer(kFuzzLineLimit), kFuzzLineLimit);
    if (unbounded > size || bounded > unbounded)
    {
        __builtin_trap();
    }

    return 0;
}
