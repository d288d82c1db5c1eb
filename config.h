#ifndef NETT_CONFIG_H
#define NETT_CONFIG_H

#include <string>
#include <cstdint>
#include <optional>
#include <expected>

namespace nett
{

struct config
{
    std::uint32_t workers = 0;

    struct log_t
    {
        std::string level = "info";
        std::string file = "nett.log";
    } log;

    struct listen_t
    {
        std::string host = "127.0.0.1";
        std::uint16_t port = 7070;
    } listen;

    struct framing_t
    {
        std::string mode = "line";
        std::uint32_t chunk_size = 4096;
        // Longest accepted line in line mode, terminator included.
        std::uint32_t max_line = 65536;
    } framing;
};

struct config_error
{
    std::string path = "/";
    std::string reason;
};

// 0 means one worker per hardware thread.
[[nodiscard]] std::uint32_t normalize_workers(std::uint32_t workers);

[[nodiscard]] std::expected<config, config_error> parse_config_text(const std::string& text);
[[nodiscard]] std::expected<config, config_error> parse_config_with_error(const std::string& filename);
[[nodiscard]] std::optional<config> parse_config(const std::string& filename);
[[nodiscard]] std::string dump_config(const config& cfg);
[[nodiscard]] std::string dump_default_config();

}    // namespace nett

#endif
