#include "chunkd/core/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace chunkd {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template<typename T>
Result<void> read_unsigned(const json& doc, const char* key, T& out) {
    auto it = doc.find(key);
    if (it == doc.end()) {
        return Ok();
    }
    if (!it->is_number_unsigned()) {
        return Err<void>(std::string("'") + key + "' must be a non-negative integer");
    }
    const auto value = it->get<std::uint64_t>();
    if (value > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
        return Err<void>(std::string("'") + key + "' is out of range: " + std::to_string(value));
    }
    out = static_cast<T>(value);
    return Ok();
}

Result<void> read_bool(const json& doc, const char* key, bool& out) {
    auto it = doc.find(key);
    if (it == doc.end()) {
        return Ok();
    }
    if (!it->is_boolean()) {
        return Err<void>(std::string("'") + key + "' must be true or false");
    }
    out = it->get<bool>();
    return Ok();
}

Result<void> read_string(const json& doc, const char* key, std::string& out) {
    auto it = doc.find(key);
    if (it == doc.end()) {
        return Ok();
    }
    if (!it->is_string()) {
        return Err<void>(std::string("'") + key + "' must be a string");
    }
    out = it->get<std::string>();
    return Ok();
}

Result<std::uint64_t> parse_number(const std::string& flag, const std::string& text) {
    if (text.empty() || text.front() == '-') {
        return Err<std::uint64_t>(flag + " expects a non-negative integer, got '" + text + "'");
    }
    try {
        std::size_t consumed = 0;
        const auto value = std::stoull(text, &consumed);
        if (consumed != text.size()) {
            return Err<std::uint64_t>(flag + " expects a non-negative integer, got '" + text + "'");
        }
        return Ok(static_cast<std::uint64_t>(value));
    } catch (const std::logic_error&) {
        return Err<std::uint64_t>(flag + " expects a non-negative integer, got '" + text + "'");
    }
}

template<typename T>
Result<T> narrow(const std::string& flag, std::uint64_t value) {
    if (value > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
        return Err<T>(flag + " value out of range: " + std::to_string(value));
    }
    return Ok(static_cast<T>(value));
}

} // namespace

Result<void> ServerConfig::validate() const {
    if (transfer.upload_directory.empty()) {
        return Err<void>(std::string("upload_directory must not be empty"));
    }
    if (transfer.chunk_size == 0) {
        return Err<void>(std::string("chunk_size must be > 0"));
    }
    if (transfer.max_file_size < transfer.chunk_size) {
        return Err<void>(std::string("max_file_size must be >= chunk_size"));
    }
    if (transfer.max_parts == 0) {
        return Err<void>(std::string("max_parts must be > 0"));
    }
    if (transfer.offload_io && transfer.worker_pool_size == 0) {
        return Err<void>(std::string("worker_pool_size must be > 0 when offload_io is enabled"));
    }
    if (http_threads == 0) {
        return Err<void>(std::string("http_threads must be > 0"));
    }
    if (max_pending_connections == 0) {
        return Err<void>(std::string("max_pending_connections must be > 0"));
    }
    if (io_timeout_seconds < 0) {
        return Err<void>(std::string("io_timeout_seconds must be >= 0"));
    }
    if (spdlog::level::from_str(log_level) == spdlog::level::off && log_level != "off") {
        return Err<void>("unknown log_level '" + log_level + "'");
    }
    return Ok();
}

Result<void> load_config_file(const fs::path& path, ServerConfig& config) {
    std::ifstream input(path);
    if (!input) {
        return Err<void>(std::string("Failed to open config file: ") + path.string());
    }

    std::ostringstream text;
    text << input.rdbuf();
    auto doc = json::parse(text.str(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Err<void>(std::string("Config file is not a JSON object: ") + path.string());
    }

    static const std::unordered_set<std::string> known_keys{
        "upload_directory", "chunk_size", "max_file_size", "max_parts", "worker_pool_size",
        "offload_io", "strict_part_order", "host", "port", "http_threads",
        "max_pending_connections", "io_timeout_seconds", "log_level"};
    for (const auto& [key, value] : doc.items()) {
        if (known_keys.count(key) == 0) {
            spdlog::warn("Ignoring unknown config key '{}'", key);
        }
    }

    // Fields land in a copy so that a bad key leaves config untouched
    ServerConfig parsed = config;
    std::string upload_directory = parsed.transfer.upload_directory.string();
    auto io_timeout = static_cast<unsigned int>(parsed.io_timeout_seconds);

    const Result<void> steps[] = {
        read_string(doc, "upload_directory", upload_directory),
        read_unsigned(doc, "chunk_size", parsed.transfer.chunk_size),
        read_unsigned(doc, "max_file_size", parsed.transfer.max_file_size),
        read_unsigned(doc, "max_parts", parsed.transfer.max_parts),
        read_unsigned(doc, "worker_pool_size", parsed.transfer.worker_pool_size),
        read_bool(doc, "offload_io", parsed.transfer.offload_io),
        read_bool(doc, "strict_part_order", parsed.transfer.strict_part_order),
        read_string(doc, "host", parsed.host),
        read_unsigned(doc, "port", parsed.port),
        read_unsigned(doc, "http_threads", parsed.http_threads),
        read_unsigned(doc, "max_pending_connections", parsed.max_pending_connections),
        read_unsigned(doc, "io_timeout_seconds", io_timeout),
        read_string(doc, "log_level", parsed.log_level),
    };
    for (const auto& step : steps) {
        if (step.is_error()) {
            return Err<void>(path.string() + ": " + step.error());
        }
    }
    if (io_timeout > static_cast<unsigned int>(std::numeric_limits<int>::max())) {
        return Err<void>(path.string() + ": 'io_timeout_seconds' is out of range: " + std::to_string(io_timeout));
    }

    parsed.transfer.upload_directory = upload_directory;
    parsed.io_timeout_seconds = static_cast<int>(io_timeout);
    config = std::move(parsed);
    return Ok();
}

Result<void> apply_command_line(int argc, char* argv[], ServerConfig& config, bool& show_help) {
    show_help = false;

    // The file goes first so that explicit flags override it
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                return Err<void>(arg + " requires a value");
            }
            auto loaded = load_config_file(argv[++i], config);
            if (loaded.is_error()) {
                return loaded;
            }
        }
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            show_help = true;
            continue;
        }
        if (arg == "--no-offload") {
            config.transfer.offload_io = false;
            continue;
        }
        if (arg == "--lenient-order") {
            config.transfer.strict_part_order = false;
            continue;
        }

        if (i + 1 >= argc) {
            return Err<void>("Unknown flag or missing value: " + arg);
        }
        const std::string value = argv[++i];

        if (arg == "-c" || arg == "--config") {
            continue;
        }
        if (arg == "-d" || arg == "--dir") {
            config.transfer.upload_directory = value;
            continue;
        }
        if (arg == "--host") {
            config.host = value;
            continue;
        }
        if (arg == "--log-level") {
            config.log_level = value;
            continue;
        }

        auto number = parse_number(arg, value);
        if (number.is_error()) {
            return Err<void>(number.error());
        }
        const auto n = number.value();

        if (arg == "-p" || arg == "--port") {
            if (n > 65535) {
                return Err<void>("Port out of range: " + value);
            }
            config.port = static_cast<std::uint16_t>(n);
        } else if (arg == "--chunk-size") {
            config.transfer.chunk_size = n;
        } else if (arg == "--max-file-size") {
            config.transfer.max_file_size = n;
        } else if (arg == "--max-parts") {
            auto parts = narrow<std::uint32_t>(arg, n);
            if (parts.is_error()) {
                return Err<void>(parts.error());
            }
            config.transfer.max_parts = parts.value();
        } else if (arg == "--workers") {
            auto workers = narrow<std::size_t>(arg, n);
            if (workers.is_error()) {
                return Err<void>(workers.error());
            }
            config.transfer.worker_pool_size = workers.value();
        } else if (arg == "--http-threads") {
            auto threads = narrow<std::size_t>(arg, n);
            if (threads.is_error()) {
                return Err<void>(threads.error());
            }
            config.http_threads = threads.value();
        } else {
            return Err<void>("Unknown flag: " + arg);
        }
    }

    return Ok();
}

std::string usage(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " [options]\n"
        << "  -c, --config <file>      JSON configuration file\n"
        << "  -d, --dir <path>         upload directory (default: uploads)\n"
        << "      --host <address>     bind address (default: 0.0.0.0)\n"
        << "  -p, --port <port>        listen port (default: 8000)\n"
        << "      --chunk-size <n>     bytes per part (default: 1048576)\n"
        << "      --max-file-size <n>  bytes per stored file (default: 104857600)\n"
        << "      --max-parts <n>      max declared total_parts (default: 100)\n"
        << "      --workers <n>        disk I/O worker threads (default: 5)\n"
        << "      --http-threads <n>   request worker threads (default: 8)\n"
        << "      --log-level <lvl>    trace|debug|info|warn|err|critical|off\n"
        << "      --no-offload         run disk I/O on request threads\n"
        << "      --lenient-order      append parts without order checks\n"
        << "  -h, --help               show this help\n";
    return oss.str();
}

} // namespace chunkd
