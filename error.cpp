#include <string>

#include <boost/asio/error.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/error_code.hpp>

#include "error.h"

namespace nett
{

namespace
{

class nett_error_category : public boost::system::error_category
{
   public:
    [[nodiscard]] const char* name() const noexcept override { return "nett"; }

    [[nodiscard]] std::string message(int value) const override
    {
        switch (static_cast<errc>(value))
        {
            case errc::kStreamClosed:
                return "stream closed";
            case errc::kTemporaryFailure:
                return "temporary failure";
            case errc::kMessageTooLarge:
                return "message too large";
        }
        return "unknown nett error";
    }
};

}    // namespace

const boost::system::error_category& nett_category() noexcept
{
    static const nett_error_category kCategory;
    return kCategory;
}

boost::system::error_code make_error_code(errc e) noexcept { return {static_cast<int>(e), nett_category()}; }

error_kind classify_error(const boost::system::error_code& ec) noexcept
{
    if (!ec)
    {
        return error_kind::kOther;
    }

    if (ec == errc::kTemporaryFailure || ec == boost::asio::error::would_block || ec == boost::asio::error::try_again ||
        ec == boost::asio::error::interrupted)
    {
        return error_kind::kTransient;
    }

    if (ec == boost::asio::error::eof || ec == errc::kStreamClosed || ec == boost::asio::error::bad_descriptor ||
        ec == boost::asio::error::operation_aborted)
    {
        return error_kind::kClosed;
    }

    return error_kind::kOther;
}

const char* error_kind_name(const error_kind kind) noexcept
{
    switch (kind)
    {
        case error_kind::kTransient:
            return "transient";
        case error_kind::kClosed:
            return "closed";
        case error_kind::kOther:
            return "other";
    }
    return "unknown";
}

}    // namespace nett
