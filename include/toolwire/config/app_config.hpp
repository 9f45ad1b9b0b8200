#pragma once

#include <toolwire/core/log.hpp>
#include <toolwire/core/version.hpp>
#include <toolwire/mcp/resource_provider.hpp>

#include <optional>
#include <string>
#include <vector>

namespace toolwire {

struct ServerConfig {
    std::string name = "toolwire";
    std::string version = kVersion;
    std::string protocol_version = kDefaultProtocolVersion;
};

struct LoggingConfig {
    LogLevel level = LogLevel::Warn;     // stderr threshold
    bool json = false;                   // JSON lines on stderr
    bool color = false;                  // ANSI colors on stderr
    bool debug = false;                  // RECV/SEND trace to debug_log
    std::string debug_log = "toolwire_debug.log";
};

struct AppConfig {
    ServerConfig server;
    LoggingConfig logging;
    std::vector<ResourceEntry> resources;
    bool test_mode = false;              // print tool count and exit
};

// Command-line flags; unset optionals leave the file/default value alone.
struct CliOptions {
    std::optional<std::string> config_path;
    std::optional<std::string> name;
    std::optional<std::string> version;
    std::optional<std::string> protocol_version;
    std::optional<std::string> debug_log;
    bool debug = false;
    bool json_log = false;
    bool color = false;
    bool test_mode = false;
    bool show_version = false;
    int verbosity = 0;                   // -v info, -vv debug
};

} // namespace toolwire
