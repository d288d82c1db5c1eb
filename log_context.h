#ifndef NETT_LOG_CONTEXT_H
#define NETT_LOG_CONTEXT_H

#include <atomic>
#include <chrono>
#include <string>
#include <cstdint>
#include <utility>

namespace nett
{

namespace log_event
{
constexpr const char* kConnInit = "conn_init";
constexpr const char* kConnClose = "conn_close";
constexpr const char* kDataSend = "data_send";
constexpr const char* kDataRecv = "data_recv";
constexpr const char* kHandler = "handler";
constexpr const char* kListen = "listen";
}    // namespace log_event

[[nodiscard]] std::string generate_trace_id();

// Per-connection identity and traffic counters. The counters are updated
// from the reader thread and from senders concurrently.
class connection_context
{
   public:
    connection_context() = default;
    connection_context(const connection_context&) = delete;
    connection_context& operator=(const connection_context&) = delete;

    [[nodiscard]] const std::string& trace_id() const { return trace_id_; }
    void trace_id(std::string id) { trace_id_ = std::move(id); }
    void new_trace_id() { trace_id_ = generate_trace_id(); }

    [[nodiscard]] std::uint32_t conn_id() const { return conn_id_; }
    void conn_id(const std::uint32_t id) { conn_id_ = id; }

    [[nodiscard]] const std::string& local_endpoint() const { return local_endpoint_; }
    void local_endpoint(std::string ep) { local_endpoint_ = std::move(ep); }

    [[nodiscard]] const std::string& remote_endpoint() const { return remote_endpoint_; }
    void remote_endpoint(std::string ep) { remote_endpoint_ = std::move(ep); }

    [[nodiscard]] std::chrono::steady_clock::time_point start_time() const { return start_time_; }

    // Count one message of the given size sent or received.
    void record_tx(std::uint64_t bytes);
    void record_rx(std::uint64_t bytes);

    [[nodiscard]] std::uint64_t tx_bytes() const { return tx_bytes_.load(std::memory_order_relaxed); }
    [[nodiscard]] std::uint64_t rx_bytes() const { return rx_bytes_.load(std::memory_order_relaxed); }
    [[nodiscard]] std::uint64_t messages_sent() const { return messages_sent_.load(std::memory_order_relaxed); }
    [[nodiscard]] std::uint64_t messages_received() const { return messages_received_.load(std::memory_order_relaxed); }

    // "t<trace> c<id>", used in front of every connection log line.
    [[nodiscard]] std::string prefix() const;
    [[nodiscard]] std::string connection_info() const;
    [[nodiscard]] double duration_seconds() const;
    // "tx <bytes>/<msgs> rx <bytes>/<msgs> duration <s>s", logged on close.
    [[nodiscard]] std::string stats_summary() const;

   private:
    std::string trace_id_;
    std::uint32_t conn_id_ = 0;
    std::string local_endpoint_;
    std::string remote_endpoint_;
    std::chrono::steady_clock::time_point start_time_ = std::chrono::steady_clock::now();
    std::atomic<std::uint64_t> tx_bytes_{0};
    std::atomic<std::uint64_t> rx_bytes_{0};
    std::atomic<std::uint64_t> messages_sent_{0};
    std::atomic<std::uint64_t> messages_received_{0};
};

[[nodiscard]] std::string format_bytes(std::uint64_t bytes);

}    // namespace nett

#endif
