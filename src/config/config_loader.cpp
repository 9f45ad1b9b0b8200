#include <toolwire/config/config_loader.hpp>

#include <toolwire/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <stdexcept>
#include <string>
#include <unordered_set>

namespace toolwire {

namespace {

Error MakeConfigError(const std::string& message,
                      std::optional<std::string> path = std::nullopt) {
    return Error{"ConfigLoader", message, std::move(path), ErrorCategory::Config};
}

std::optional<std::string> OptionalString(const YAML::Node& node,
                                          const char* key) {
    if (node[key]) {
        return node[key].as<std::string>();
    }
    return std::nullopt;
}

// Build a ResourceEntry from a parsed YAML node.
Result<ResourceEntry, Error> ParseYamlResource(const YAML::Node& node,
                                               const std::filesystem::path& base_dir) {
    if (!node["uri"]) {
        return Result<ResourceEntry, Error>::Err(
            MakeConfigError("Resource entry missing 'uri' field"));
    }
    if (!node["path"]) {
        return Result<ResourceEntry, Error>::Err(
            MakeConfigError("Resource '" + node["uri"].as<std::string>() +
                            "' missing 'path' field"));
    }

    ResourceEntry entry;
    entry.uri = node["uri"].as<std::string>();
    entry.name = node["name"] ? node["name"].as<std::string>() : entry.uri;
    entry.mime_type = OptionalString(node, "mime_type");
    entry.description = OptionalString(node, "description");

    std::filesystem::path path = node["path"].as<std::string>();
    if (path.is_relative() && !base_dir.empty()) {
        path = base_dir / path;
    }
    entry.path = path.string();

    return Result<ResourceEntry, Error>::Ok(std::move(entry));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    const std::string path_str(file_path);

    YAML::Node root;
    try {
        root = YAML::LoadFile(path_str);
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what()),
                            path_str));
    }

    AppConfig config;
    const auto base_dir = std::filesystem::path(path_str).parent_path();

    try {
        // -- Server --
        if (root["server"]) {
            const auto& server = root["server"];
            if (server["name"]) {
                config.server.name = server["name"].as<std::string>();
            }
            if (server["version"]) {
                config.server.version = server["version"].as<std::string>();
            }
            if (server["protocol_version"]) {
                config.server.protocol_version =
                    server["protocol_version"].as<std::string>();
            }
        }

        // -- Logging --
        if (root["logging"]) {
            const auto& logging = root["logging"];
            if (logging["level"]) {
                const auto level = logging["level"].as<std::string>();
                if (!ParseLogLevel(level, config.logging.level)) {
                    return Result<AppConfig, Error>::Err(
                        MakeConfigError("Unknown log level: " + level, path_str));
                }
            }
            if (logging["json"]) {
                config.logging.json = logging["json"].as<bool>();
            }
            if (logging["color"]) {
                config.logging.color = logging["color"].as<bool>();
            }
            if (logging["debug"]) {
                config.logging.debug = logging["debug"].as<bool>();
            }
            if (logging["debug_log"]) {
                config.logging.debug_log = logging["debug_log"].as<std::string>();
            }
        }

        // -- Resources --
        if (root["resources"]) {
            for (const auto& resource_node : root["resources"]) {
                auto resource_result = ParseYamlResource(resource_node, base_dir);
                if (resource_result.IsErr()) {
                    return Result<AppConfig, Error>::Err(
                        std::move(resource_result).Error());
                }
                config.resources.push_back(std::move(resource_result).Value());
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Invalid config value: " + std::string(e.what()),
                            path_str));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ParseCli
// ---------------------------------------------------------------------------
Result<CliOptions, Error> ParseCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("toolwire", kVersion,
                                     argparse::default_arguments::help);
    CliOptions cli;

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--name")
        .help("Server name reported in the initialize handshake");
    program.add_argument("--server-version")
        .help("Server version reported in the initialize handshake");
    program.add_argument("--protocol-version")
        .help("MCP protocol revision to advertise");
    program.add_argument("--debug")
        .help("Trace every received and sent line to the debug log")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--debug-log")
        .help("Debug log file path");
    program.add_argument("--json-log")
        .help("Write stderr logs as JSON lines")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--color")
        .help("Colorize stderr logs")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--test")
        .help("Print the number of registered tools and exit")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--version")
        .help("Print version and exit")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-v", "--verbose")
        .help("Increase stderr verbosity (-v info, -vv debug)")
        .action([&cli](const auto&) { ++cli.verbosity; })
        .append()
        .default_value(false)
        .implicit_value(true)
        .nargs(0);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        auto error = MakeConfigError("CLI parse error: " + std::string(e.what()));
        error.category = ErrorCategory::Usage;
        return Result<CliOptions, Error>::Err(std::move(error));
    }

    cli.config_path = program.present("--config");
    cli.name = program.present("--name");
    cli.version = program.present("--server-version");
    cli.protocol_version = program.present("--protocol-version");
    cli.debug_log = program.present("--debug-log");
    cli.debug = program.get<bool>("--debug");
    cli.json_log = program.get<bool>("--json-log");
    cli.color = program.get<bool>("--color");
    cli.test_mode = program.get<bool>("--test");
    cli.show_version = program.get<bool>("--version");

    return Result<CliOptions, Error>::Ok(std::move(cli));
}

// ---------------------------------------------------------------------------
// ApplyCliOverrides
// ---------------------------------------------------------------------------
AppConfig ApplyCliOverrides(AppConfig base, const CliOptions& cli) {
    if (cli.name) base.server.name = *cli.name;
    if (cli.version) base.server.version = *cli.version;
    if (cli.protocol_version) base.server.protocol_version = *cli.protocol_version;

    if (cli.debug) base.logging.debug = true;
    if (cli.debug_log) {
        base.logging.debug_log = *cli.debug_log;
        base.logging.debug = true;
    }
    if (cli.json_log) base.logging.json = true;
    if (cli.color) base.logging.color = true;

    if (cli.verbosity >= 2) {
        base.logging.level = LogLevel::Debug;
    } else if (cli.verbosity == 1) {
        base.logging.level = LogLevel::Info;
    }

    base.test_mode = cli.test_mode;
    return base;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.server.name.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing required field: server.name"));
    }
    if (config.server.version.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing required field: server.version"));
    }
    if (config.server.protocol_version.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("Missing required field: server.protocol_version"));
    }
    if (config.logging.debug && config.logging.debug_log.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("Debug logging enabled without a debug_log path"));
    }

    std::unordered_set<std::string> seen;
    for (const auto& resource : config.resources) {
        if (resource.uri.empty()) {
            return Result<void, Error>::Err(MakeConfigError("Resource with empty uri"));
        }
        if (!seen.insert(resource.uri).second) {
            return Result<void, Error>::Err(
                MakeConfigError("Duplicate resource uri: " + resource.uri));
        }
        if (resource.name.empty()) {
            return Result<void, Error>::Err(
                MakeConfigError("Resource '" + resource.uri + "' has an empty name"));
        }
        if (resource.path.empty()) {
            return Result<void, Error>::Err(
                MakeConfigError("Resource '" + resource.uri + "' has an empty path"));
        }
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// ResolveConfig
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ResolveConfig(const CliOptions& cli) {
    AppConfig base;
    if (cli.config_path) {
        auto loaded = LoadFromYaml(*cli.config_path);
        if (loaded.IsErr()) {
            return loaded;
        }
        base = std::move(loaded).Value();
    }

    auto config = ApplyCliOverrides(std::move(base), cli);
    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        return Result<AppConfig, Error>::Err(valid.Error());
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

} // namespace toolwire
