#ifndef NETT_ERROR_H
#define NETT_ERROR_H

#include <cstdint>
#include <type_traits>

#include <boost/system/error_code.hpp>

namespace nett
{

enum class errc : int
{
    kStreamClosed = 1,
    kTemporaryFailure,
    kMessageTooLarge,
};

// How a read or write failure is treated by a connection.
//   kTransient  retried transparently, never reported
//   kClosed     expected end of the stream, ends the read loop silently
//   kOther      genuine failure, reported to the caller or error handler
enum class error_kind : std::uint8_t
{
    kTransient,
    kClosed,
    kOther,
};

[[nodiscard]] const boost::system::error_category& nett_category() noexcept;

[[nodiscard]] boost::system::error_code make_error_code(errc e) noexcept;

// Default mapping shared by all stream adapters.
[[nodiscard]] error_kind classify_error(const boost::system::error_code& ec) noexcept;

[[nodiscard]] const char* error_kind_name(error_kind kind) noexcept;

}    // namespace nett

namespace boost::system
{
template <>
struct is_error_code_enum<nett::errc> : std::true_type
{
};
}    // namespace boost::system

#endif
