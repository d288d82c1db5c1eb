#include <limits>
#include <string>
#include <thread>
#include <cerrno>
#include <cstdio>
#include <cstdint>
#include <cstring>
#include <utility>
#include <optional>
#include <expected>

#include "rapidjson/document.h"
#include "rapidjson/error/en.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/prettywriter.h"

#include "config.h"

namespace nett
{

namespace
{

using check_result = std::expected<void, config_error>;

[[nodiscard]] config_error make_config_error(std::string path, std::string reason) { return config_error{std::move(path), std::move(reason)}; }

[[nodiscard]] std::string child_path(const std::string& parent, const char* name)
{
    if (parent == "/")
    {
        return parent + name;
    }
    return parent + "/" + name;
}

[[nodiscard]] check_result read_string(const rapidjson::Value& obj, const char* name, const std::string& path, std::string& out)
{
    const auto it = obj.FindMember(name);
    if (it == obj.MemberEnd())
    {
        return {};
    }
    if (!it->value.IsString())
    {
        return std::unexpected(make_config_error(child_path(path, name), "expected string"));
    }
    out.assign(it->value.GetString(), it->value.GetStringLength());
    return {};
}

template <typename UInt>
[[nodiscard]] check_result read_uint(const rapidjson::Value& obj, const char* name, const std::string& path, UInt& out)
{
    const auto it = obj.FindMember(name);
    if (it == obj.MemberEnd())
    {
        return {};
    }
    if (!it->value.IsUint64())
    {
        return std::unexpected(make_config_error(child_path(path, name), "expected unsigned integer"));
    }
    const std::uint64_t value = it->value.GetUint64();
    if (value > std::numeric_limits<UInt>::max())
    {
        return std::unexpected(make_config_error(child_path(path, name), "value out of range"));
    }
    out = static_cast<UInt>(value);
    return {};
}

[[nodiscard]] std::expected<const rapidjson::Value*, config_error> find_object(const rapidjson::Value& obj, const char* name, const std::string& path)
{
    const auto it = obj.FindMember(name);
    if (it == obj.MemberEnd())
    {
        return nullptr;
    }
    if (!it->value.IsObject())
    {
        return std::unexpected(make_config_error(child_path(path, name), "expected object"));
    }
    return &it->value;
}

[[nodiscard]] check_result read_log(const rapidjson::Value& root, config::log_t& log)
{
    const auto obj = find_object(root, "log", "/");
    if (!obj)
    {
        return std::unexpected(obj.error());
    }
    if (*obj == nullptr)
    {
        return {};
    }
    if (auto r = read_string(**obj, "level", "/log", log.level); !r)
    {
        return r;
    }
    return read_string(**obj, "file", "/log", log.file);
}

[[nodiscard]] check_result read_listen(const rapidjson::Value& root, config::listen_t& listen)
{
    const auto obj = find_object(root, "listen", "/");
    if (!obj)
    {
        return std::unexpected(obj.error());
    }
    if (*obj == nullptr)
    {
        return {};
    }
    if (auto r = read_string(**obj, "host", "/listen", listen.host); !r)
    {
        return r;
    }
    return read_uint(**obj, "port", "/listen", listen.port);
}

[[nodiscard]] check_result read_framing(const rapidjson::Value& root, config::framing_t& framing)
{
    const auto obj = find_object(root, "framing", "/");
    if (!obj)
    {
        return std::unexpected(obj.error());
    }
    if (*obj == nullptr)
    {
        return {};
    }
    if (auto r = read_string(**obj, "mode", "/framing", framing.mode); !r)
    {
        return r;
    }
    if (auto r = read_uint(**obj, "chunk_size", "/framing", framing.chunk_size); !r)
    {
        return r;
    }
    return read_uint(**obj, "max_line", "/framing", framing.max_line);
}

[[nodiscard]] check_result validate_config(const config& cfg)
{
    if (cfg.framing.mode != "line" && cfg.framing.mode != "chunk")
    {
        return std::unexpected(make_config_error("/framing/mode", "must be line or chunk"));
    }
    if (cfg.framing.mode == "chunk" && cfg.framing.chunk_size == 0)
    {
        return std::unexpected(make_config_error("/framing/chunk_size", "must be positive in chunk mode"));
    }
    if (cfg.framing.mode == "line" && cfg.framing.max_line == 0)
    {
        return std::unexpected(make_config_error("/framing/max_line", "must be positive in line mode"));
    }
    if (cfg.listen.host.empty())
    {
        return std::unexpected(make_config_error("/listen/host", "must not be empty"));
    }
    if (cfg.log.file.empty())
    {
        return std::unexpected(make_config_error("/log/file", "must not be empty"));
    }
    return {};
}

[[nodiscard]] std::expected<std::string, config_error> read_file(const std::string& filename)
{
    char buf[64 * 1024];
    std::string result;
    FILE* f = std::fopen(filename.c_str(), "rb");
    if (f == nullptr)
    {
        return std::unexpected(make_config_error("/", std::string("open file failed: ") + std::strerror(errno)));
    }
    for (;;)
    {
        const std::size_t n = std::fread(buf, 1, sizeof buf, f);
        if (n > 0)
        {
            result.append(buf, n);
        }
        if (n < sizeof buf)
        {
            if (std::ferror(f) != 0)
            {
                std::fclose(f);
                return std::unexpected(make_config_error("/", std::string("read file failed: ") + std::strerror(errno)));
            }
            break;
        }
    }
    std::fclose(f);
    return result;
}

}    // namespace

std::uint32_t normalize_workers(const std::uint32_t workers)
{
    if (workers != 0)
    {
        return workers;
    }
    const unsigned hw = std::thread::hardware_concurrency();
    return hw == 0 ? 1U : static_cast<std::uint32_t>(hw);
}

std::expected<config, config_error> parse_config_text(const std::string& text)
{
    rapidjson::Document doc;
    const rapidjson::ParseResult parse_result = doc.Parse(text.data(), text.size());
    if (parse_result.IsError())
    {
        return std::unexpected(make_config_error(
            "/", "json parse error at offset " + std::to_string(parse_result.Offset()) + ": " + rapidjson::GetParseError_En(parse_result.Code())));
    }
    if (!doc.IsObject())
    {
        return std::unexpected(make_config_error("/", "expected object"));
    }

    config cfg;
    if (auto r = read_uint(doc, "workers", "/", cfg.workers); !r)
    {
        return std::unexpected(r.error());
    }
    for (const auto& section : {read_log(doc, cfg.log), read_listen(doc, cfg.listen), read_framing(doc, cfg.framing)})
    {
        if (!section)
        {
            return std::unexpected(section.error());
        }
    }
    if (auto r = validate_config(cfg); !r)
    {
        return std::unexpected(r.error());
    }
    return cfg;
}

std::expected<config, config_error> parse_config_with_error(const std::string& filename)
{
    const auto file_content = read_file(filename);
    if (!file_content)
    {
        return std::unexpected(file_content.error());
    }
    return parse_config_text(*file_content);
}

std::optional<config> parse_config(const std::string& filename)
{
    auto parsed = parse_config_with_error(filename);
    if (!parsed)
    {
        return std::nullopt;
    }
    return std::move(*parsed);
}

std::string dump_config(const config& cfg)
{
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 4);

    writer.StartObject();
    writer.Key("workers");
    writer.Uint(cfg.workers);

    writer.Key("log");
    writer.StartObject();
    writer.Key("level");
    writer.String(cfg.log.level.c_str(), static_cast<rapidjson::SizeType>(cfg.log.level.size()));
    writer.Key("file");
    writer.String(cfg.log.file.c_str(), static_cast<rapidjson::SizeType>(cfg.log.file.size()));
    writer.EndObject();

    writer.Key("listen");
    writer.StartObject();
    writer.Key("host");
    writer.String(cfg.listen.host.c_str(), static_cast<rapidjson::SizeType>(cfg.listen.host.size()));
    writer.Key("port");
    writer.Uint(cfg.listen.port);
    writer.EndObject();

    writer.Key("framing");
    writer.StartObject();
    writer.Key("mode");
    writer.String(cfg.framing.mode.c_str(), static_cast<rapidjson::SizeType>(cfg.framing.mode.size()));
    writer.Key("chunk_size");
    writer.Uint(cfg.framing.chunk_size);
    writer.Key("max_line");
    writer.Uint(cfg.framing.max_line);
    writer.EndObject();

    writer.EndObject();
    return std::string(buffer.GetString(), buffer.GetSize());
}

std::string dump_default_config() { return dump_config(config{}); }

}    // namespace nett
