#include <array>
#include <atomic>
#include <chrono>
#include <random>
#include <string>
#include <cstdio>
#include <cstdint>
#include <charconv>
#include <system_error>

#include "log_context.h"

namespace nett
{
namespace
{

void append_uint(std::string& out, const std::uint64_t value)
{
    char buf[24];
    const auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec == std::errc())
    {
        out.append(buf, ptr);
    }
}

// "<bytes>/<messages>" for one direction of the summary.
void append_traffic(std::string& out, const std::uint64_t bytes, const std::uint64_t messages)
{
    out += format_bytes(bytes);
    out.push_back('/');
    append_uint(out, messages);
}

const std::string& or_dash(const std::string& endpoint)
{
    static const std::string kUnknown = "-";
    return endpoint.empty() ? kUnknown : endpoint;
}

}    // namespace

std::string generate_trace_id()
{
    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<std::uint64_t> dist;
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(dist(gen)));
    return std::string(buf, 16);
}

void connection_context::record_tx(const std::uint64_t bytes)
{
    tx_bytes_.fetch_add(bytes, std::memory_order_relaxed);
    messages_sent_.fetch_add(1, std::memory_order_relaxed);
}

void connection_context::record_rx(const std::uint64_t bytes)
{
    rx_bytes_.fetch_add(bytes, std::memory_order_relaxed);
    messages_received_.fetch_add(1, std::memory_order_relaxed);
}

std::string connection_context::prefix() const
{
    std::string out = trace_id_.empty() ? std::string() : "t" + trace_id_ + " ";
    out.push_back('c');
    append_uint(out, conn_id_);
    return out;
}

std::string connection_context::connection_info() const
{
    return or_dash(local_endpoint_) + " <-> " + or_dash(remote_endpoint_);
}

double connection_context::duration_seconds() const
{
    const auto elapsed = std::chrono::steady_clock::now() - start_time_;
    return std::chrono::duration<double>(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed)).count();
}

std::string connection_context::stats_summary() const
{
    std::string out = "tx ";
    append_traffic(out, tx_bytes(), messages_sent());
    out += " rx ";
    append_traffic(out, rx_bytes(), messages_received());

    char duration_buf[32];
    std::snprintf(duration_buf, sizeof(duration_buf), " duration %.2fs", duration_seconds());
    out += duration_buf;
    return out;
}

std::string format_bytes(const std::uint64_t bytes)
{
    static constexpr std::array<const char*, 3> kUnits = {"KB", "MB", "GB"};

    if (bytes < 1024)
    {
        std::string out;
        append_uint(out, bytes);
        out.push_back('B');
        return out;
    }

    auto value = static_cast<double>(bytes) / 1024.0;
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < kUnits.size())
    {
        value /= 1024.0;
        ++unit;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f%s", value, kUnits[unit]);
    return std::string(buf);
}

}    // namespace nett
