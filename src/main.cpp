#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <optional>
#include "engine/config.hpp"
#include "engine/engine.hpp"
#include "util/logger.hpp"

namespace {

struct CliOptions {
    std::string config_path;
    std::optional<execore::Language> language;
    execore::ExecutionMode mode = execore::ExecutionMode::STATELESS;
    std::optional<std::string> session_id;
    std::optional<double> timeout_s;
    bool stream = false;
    std::optional<std::string> log_level;
    std::vector<std::string> files;
};

void print_usage(const char* argv0) {
    fmt::print(stderr,
        "Usage: {} [options] FILE...\n"
        "\n"
        "Runs each FILE ('-' for stdin) and prints one JSON result per file.\n"
        "\n"
        "Options:\n"
        "  --config F          JSON configuration file\n"
        "  --language L        python or javascript (default: from file extension)\n"
        "  --mode M            stateless (default) or session\n"
        "  --session ID        session id for --mode session (default: generated)\n"
        "  --timeout S         per-file timeout in seconds (1-120)\n"
        "  --stream            print output as it is produced\n"
        "  --log-level L       trace, debug, info, warn, error, critical, off\n"
        "  -h, --help          show this help\n",
        argv0);
}

// Returns false on a usage error
bool parse_args(int argc, char** argv, CliOptions& options, std::string& error) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto next_value = [&](std::string& out) {
            if (i + 1 >= argc) {
                error = arg + " requires a value";
                return false;
            }
            out = argv[++i];
            return true;
        };

        std::string value;
        if (arg == "--config") {
            if (!next_value(options.config_path)) return false;
        } else if (arg == "--language") {
            if (!next_value(value)) return false;
            options.language = execore::language_from_string(value);
            if (!options.language) {
                error = "unknown language '" + value + "'";
                return false;
            }
        } else if (arg == "--mode") {
            if (!next_value(value)) return false;
            auto mode = execore::execution_mode_from_string(value);
            if (!mode) {
                error = "unknown mode '" + value + "'";
                return false;
            }
            options.mode = *mode;
        } else if (arg == "--session") {
            if (!next_value(value)) return false;
            options.session_id = value;
        } else if (arg == "--timeout") {
            if (!next_value(value)) return false;
            try {
                options.timeout_s = std::stod(value);
            } catch (const std::exception&) {
                error = "invalid timeout '" + value + "'";
                return false;
            }
        } else if (arg == "--stream") {
            options.stream = true;
        } else if (arg == "--log-level") {
            if (!next_value(value)) return false;
            options.log_level = value;
        } else if (arg == "-h" || arg == "--help") {
            error.clear();
            return false;
        } else if (arg.size() > 1 && arg[0] == '-' && arg != "-") {
            error = "unknown option " + arg;
            return false;
        } else {
            options.files.push_back(arg);
        }
    }

    if (options.files.empty()) {
        error = "no input files";
        return false;
    }
    return true;
}

bool read_source(const std::string& path, std::string& code) {
    std::ostringstream buffer;
    if (path == "-") {
        buffer << std::cin.rdbuf();
    } else {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return false;
        }
        buffer << file.rdbuf();
    }
    code = buffer.str();
    return true;
}

execore::Language language_for(const std::string& path, const std::optional<execore::Language>& forced) {
    if (forced) {
        return *forced;
    }
    auto dot = path.rfind('.');
    if (dot != std::string::npos) {
        std::string ext = path.substr(dot + 1);
        if (ext == "js" || ext == "mjs" || ext == "cjs") {
            return execore::Language::JAVASCRIPT;
        }
    }
    return execore::Language::PYTHON;
}

} // namespace

int main(int argc, char** argv) {
    CliOptions options;
    std::string error;
    if (!parse_args(argc, argv, options, error)) {
        if (!error.empty()) {
            fmt::print(stderr, "execore: {}\n\n", error);
        }
        print_usage(argv[0]);
        return error.empty() ? 0 : 2;
    }

    execore::util::init_logger();

    execore::EngineConfig config;
    if (!options.config_path.empty() &&
        !execore::EngineConfig::load_file(options.config_path, config, error)) {
        spdlog::error("Failed to load configuration: {}", error);
        return 1;
    }
    config.apply_env();
    if (options.log_level) {
        config.log_level = *options.log_level;
    }
    execore::util::set_log_level(config.log_level);

    execore::Engine engine(config);
    engine.start();

    // Every file of a session run shares one id, so state carries over
    std::optional<std::string> session_id = options.session_id;
    if (options.mode == execore::ExecutionMode::SESSION && !session_id) {
        session_id = execore::Engine::generate_session_id();
    }

    int exit_code = 0;
    for (const auto& path : options.files) {
        execore::ExecutionRequest request;
        if (!read_source(path, request.code)) {
            spdlog::error("Cannot read {}", path);
            exit_code = 1;
            continue;
        }
        request.language = language_for(path, options.language);
        request.mode = options.mode;
        request.session_id = session_id;
        request.timeout = options.timeout_s
            ? std::chrono::milliseconds(static_cast<int64_t>(*options.timeout_s * 1000))
            : config.default_timeout;

        execore::ExecutionResult result;
        if (options.stream) {
            result = engine.execute_streaming(request,
                [](execore::OutputKind kind, const std::string& content) {
                    // Streamed to stderr; stdout carries only the JSON results
                    if (kind == execore::OutputKind::STDOUT || kind == execore::OutputKind::STDERR) {
                        std::cerr << content << std::flush;
                    } else if (kind == execore::OutputKind::RESULT) {
                        std::cerr << content << '\n' << std::flush;
                    } else {
                        std::cerr << "[image, " << content.size() << " bytes base64]\n" << std::flush;
                    }
                });
        } else {
            result = engine.execute(request);
        }

        auto j = result.to_json();
        j["file"] = path;
        std::cout << j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;

        if (!result.ok()) {
            exit_code = 1;
        }
    }

    engine.shutdown_all();
    return exit_code;
}
