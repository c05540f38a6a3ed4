#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <variant>

#include <CLI/CLI.hpp>

#include <editrpc/config/config_helpers.h>
#include <editrpc/protocol/message_decoder.h>

namespace {

constexpr int kExitDecodeErrors = 2;

bool applyLogLevel(const std::string& log_level) {
    if (log_level == "trace")
        spdlog::set_level(spdlog::level::trace);
    else if (log_level == "debug")
        spdlog::set_level(spdlog::level::debug);
    else if (log_level == "info")
        spdlog::set_level(spdlog::level::info);
    else if (log_level == "warn")
        spdlog::set_level(spdlog::level::warn);
    else if (log_level == "error")
        spdlog::set_level(spdlog::level::err);
    else
        return false;
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"editrpc-decode - decode line-delimited editor RPC messages"};

    std::string input_path;
    std::string strategy_name;
    std::string log_level;
    std::string config_override;
    bool fail_fast = false;

    app.add_option("-i,--input", input_path, "Read messages from file instead of stdin");
    auto* strategy_opt =
        app.add_option("-s,--strategy", strategy_name, "Decode strategy: borrowed|owned|tagged")
            ->check(CLI::IsMember({"borrowed", "owned", "tagged"}));
    auto* log_level_opt =
        app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error)")
            ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error"}));
    app.add_option("-c,--config", config_override, "Config file path");
    app.add_flag("--fail-fast", fail_fast, "Stop at the first line that fails to decode");
    CLI11_PARSE(app, argc, argv);

    const auto config_path = editrpc::config::get_config_path(config_override);

    // Command line wins over environment and config file
    if (log_level_opt->count() == 0) {
        log_level = editrpc::config::resolve_setting("EDITRPC_LOG_LEVEL", config_path, "logging",
                                                     "level", "info");
    }
    if (strategy_opt->count() == 0) {
        strategy_name = editrpc::config::resolve_setting(
            "EDITRPC_DECODE_STRATEGY", config_path, "decoder", "strategy", "borrowed");
    }

    try {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        auto logger = std::make_shared<spdlog::logger>("editrpc-decode", console_sink);
        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
    } catch (const std::exception& e) {
        std::cerr << "Failed to setup logging: " << e.what() << std::endl;
        return 1;
    }

    if (!applyLogLevel(log_level)) {
        spdlog::warn("Unknown log level '{}', using info", log_level);
        spdlog::set_level(spdlog::level::info);
    }

    auto strategy = editrpc::protocol::parseDecodeStrategy(strategy_name);
    if (!strategy) {
        spdlog::error("Unknown decode strategy '{}' (expected borrowed, owned or tagged)",
                      strategy_name);
        return 1;
    }
    spdlog::debug("Config: {}", config_path.string());
    spdlog::debug("Decode strategy: {}", editrpc::protocol::toString(*strategy));

    std::ifstream file;
    if (!input_path.empty()) {
        file.open(input_path);
        if (!file) {
            spdlog::error("Cannot open input '{}'", input_path);
            return 1;
        }
    }
    std::istream& in = input_path.empty() ? std::cin : file;

    std::size_t line_no = 0;
    std::size_t decoded = 0;
    std::size_t failed = 0;
    std::string line;
    while (std::getline(in, line)) {
        ++line_no;
        editrpc::config::trim(line);
        if (line.empty()) {
            continue;
        }

        auto message = editrpc::protocol::decodeMessage(line, *strategy);
        if (!message) {
            ++failed;
            spdlog::warn("line {}: {}", line_no, message.error().message());
            if (fail_fast) {
                break;
            }
            continue;
        }

        ++decoded;
        const auto& msg = message.value();
        auto method =
            std::visit([](const auto& m) { return editrpc::protocol::methodName(m.command); }, msg);
        spdlog::trace("line {}: {} {}", line_no,
                      editrpc::protocol::toString(editrpc::protocol::rpcType(msg)), method);
        std::cout << editrpc::protocol::encodeMessage(msg).dump() << '\n';
    }
    std::cout.flush();

    spdlog::info("Decoded {} message(s), {} error(s)", decoded, failed);
    return failed == 0 ? 0 : kExitDecodeErrors;
}
