#include <toolwire/config/config_loader.hpp>
#include <toolwire/core/log.hpp>
#include <toolwire/core/version.hpp>
#include <toolwire/mcp/builtin_tools.hpp>
#include <toolwire/mcp/mcp_server.hpp>
#include <toolwire/mcp/resource_provider.hpp>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr int kExitSuccess = 0;

// stderr sink per config; with debug enabled everything is also appended to
// the debug log while stderr keeps its own threshold.
void InitLogging(const toolwire::LoggingConfig& logging) {
    using namespace toolwire;

    const bool use_color = logging.color && std::getenv("NO_COLOR") == nullptr;
    std::unique_ptr<ILogSink> console;
    if (logging.json) {
        console = std::make_unique<JsonSink>(std::cerr);
    } else {
        console = std::make_unique<ConsoleSink>(use_color);
    }

    if (!logging.debug) {
        InitGlobalLogger(std::move(console), logging.level);
        return;
    }

    auto file = std::make_unique<FileSink>(logging.debug_log);
    const bool file_ok = file->IsOpen();
    InitGlobalLogger(
        std::make_unique<TeeSink>(
            std::make_unique<LevelFilterSink>(std::move(console), logging.level),
            std::move(file)),
        LogLevel::Debug);
    if (!file_ok) {
        LogWarn("main", "Cannot open debug log '" + logging.debug_log + "'");
    }
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace toolwire;

    auto cli_result = ParseCli(argc, argv);
    if (cli_result.IsErr()) {
        std::cerr << "Error: " << cli_result.Error() << "\n";
        return cli_result.Error().ExitCode();
    }
    const auto cli = std::move(cli_result).Value();

    if (cli.show_version) {
        std::cout << "toolwire " << kVersion << "\n";
        return kExitSuccess;
    }

    auto config_result = ResolveConfig(cli);
    if (config_result.IsErr()) {
        std::cerr << "Error: " << config_result.Error() << "\n";
        return config_result.Error().ExitCode();
    }
    const auto config = std::move(config_result).Value();

    InitLogging(config.logging);

    ToolRegistry registry;
    try {
        RegisterBuiltinTools(registry);
    } catch (const std::exception& e) {
        LogError("main", std::string("Tool registration failed: ") + e.what());
        return Error{"Registration", e.what(), std::nullopt,
                     ErrorCategory::Internal}.ExitCode();
    }

    if (config.test_mode) {
        std::cout << "[" << config.server.name << "] CLI Test Mode Active. Tools: "
                  << registry.Size() << "\n";
        return kExitSuccess;
    }

    McpServer server(std::move(registry),
                     ServerInfo{config.server.name, config.server.version,
                                config.server.protocol_version});

    if (!config.resources.empty()) {
        auto table = std::make_shared<StaticResourceTable>(config.resources);
        server.SetResourceProvider(
            [table]() { return table->List(); },
            [table](const std::string& uri) { return table->Read(uri); });
    }

    // Blocks until EOF on stdin.
    server.Run();
    return kExitSuccess;
}
