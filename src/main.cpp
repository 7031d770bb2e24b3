#include "api/scan_api.hpp"
#include "batch/batch_orchestrator.hpp"
#include "batch/document_decoder.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "detection/detection_pipeline.hpp"
#include "detection/pattern_registry.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <format>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace sentinel;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

// Set by SIGINT/SIGTERM; the batch loop stops between documents
std::atomic<bool> g_cancel{false};

void signal_handler(int /*signal*/) {
    g_cancel.store(true, std::memory_order_release);
}

void print_usage() {
    std::cerr <<
        "Usage: sentinel [--config FILE] <command> [options]\n"
        "\n"
        "Commands:\n"
        "  patterns                                   List built-in detectors\n"
        "  scan [--pattern NAME=REGEX]... [FILE|-]    Scan one document (stdin by default)\n"
        "  scan --request FILE                        Scan a JSON request {document, custom_patterns}\n"
        "  batch --out BUNDLE.zip [--pattern NAME=REGEX]... FILE...\n"
        "                                             Scan documents and export a redacted bundle\n";
}

struct CommandLine {
    std::string config_file;
    std::string command;
    CustomPatternList patterns;
    std::string request_file;
    std::string out_file;
    std::vector<std::string> inputs;
};

/**
 * @brief Parse argv; returns nullopt (after printing the reason) on misuse
 */
std::optional<CommandLine> parse_command_line(int argc, char* argv[]) {
    CommandLine cli;
    std::vector<std::string> args(argv + 1, argv + argc);

    auto fail = [](const std::string& message) -> std::optional<CommandLine> {
        std::cerr << "sentinel: " << message << "\n\n";
        print_usage();
        return std::nullopt;
    };

    size_t i = 0;
    while (i < args.size() && args[i].starts_with("--")) {
        if (args[i] == "--config" && i + 1 < args.size()) {
            cli.config_file = args[i + 1];
            i += 2;
        } else if (args[i] == "--help") {
            print_usage();
            return std::nullopt;
        } else {
            return fail(std::format("unknown or incomplete option '{}'", args[i]));
        }
    }
    if (i >= args.size()) return fail("missing command");
    cli.command = args[i++];

    for (; i < args.size(); ++i) {
        const std::string& arg = args[i];
        const bool has_value = i + 1 < args.size();
        if (arg == "--pattern" && has_value) {
            const std::string& spec = args[++i];
            const auto eq = spec.find('=');
            if (eq == std::string::npos || eq == 0) {
                return fail(std::format("--pattern expects NAME=REGEX, got '{}'", spec));
            }
            cli.patterns.emplace_back(spec.substr(0, eq), spec.substr(eq + 1));
        } else if (arg == "--request" && has_value) {
            cli.request_file = args[++i];
        } else if (arg == "--out" && has_value) {
            cli.out_file = args[++i];
        } else if (arg.starts_with("--")) {
            return fail(std::format("unknown or incomplete option '{}'", arg));
        } else {
            cli.inputs.push_back(arg);
        }
    }

    if (cli.command == "patterns") {
        if (!cli.inputs.empty() || !cli.patterns.empty()) return fail("patterns takes no arguments");
    } else if (cli.command == "scan") {
        if (!cli.request_file.empty() && (!cli.inputs.empty() || !cli.patterns.empty())) {
            return fail("scan --request cannot be combined with FILE or --pattern");
        }
        if (cli.inputs.size() > 1) return fail("scan takes at most one FILE");
    } else if (cli.command == "batch") {
        if (cli.out_file.empty()) return fail("batch requires --out BUNDLE.zip");
        if (cli.inputs.empty()) return fail("batch requires at least one FILE");
    } else {
        return fail(std::format("unknown command '{}'", cli.command));
    }
    return cli;
}

Result<std::string> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<std::string>::error(ErrorCategory::UNSUPPORTED_DOCUMENT,
            std::format("cannot open {}", path));
    }
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Result<std::string>::error(ErrorCategory::UNSUPPORTED_DOCUMENT,
            std::format("failed reading {}", path));
    }
    return Result<std::string>::ok(std::move(bytes));
}

std::string read_stdin() {
    std::ostringstream buffer;
    buffer << std::cin.rdbuf();
    return buffer.str();
}

void print_json(const nlohmann::json& value) {
    std::cout << value.dump(2) << '\n';
}

int print_error(ErrorCategory category, const std::string& message) {
    print_json({
        {"error", error_category_to_string(category)},
        {"message", message},
    });
    return category == ErrorCategory::INVALID_PATTERN ||
           category == ErrorCategory::PATTERN_COMPLEXITY_REJECTED ||
           category == ErrorCategory::INVALID_REQUEST ||
           category == ErrorCategory::CONFIG_ERROR
        ? kExitUsage : kExitFailure;
}

// ============================================================================
// Commands
// ============================================================================

int run_patterns() {
    print_json(builtin_catalog_to_json());
    return kExitOk;
}

int run_scan(const CommandLine& cli, const SentinelConfig& config,
             const DetectionPipeline& pipeline) {
    std::string document;
    CustomPatternList custom = cli.patterns;

    if (!cli.request_file.empty()) {
        auto raw = read_file(cli.request_file);
        if (raw.is_error()) return print_error(ErrorCategory::INVALID_REQUEST, raw.error_message());

        auto request = parse_scan_request(raw.value());
        if (request.is_error()) return print_error(request.error_category(), request.error_message());
        document = std::move(request.value().document);
        custom = std::move(request.value().custom_patterns);
    } else {
        const bool from_stdin = cli.inputs.empty() || cli.inputs.front() == "-";
        std::string name = from_stdin ? std::string("<stdin>") : cli.inputs.front();

        std::string bytes;
        if (from_stdin) {
            bytes = read_stdin();
        } else {
            auto raw = read_file(name);
            if (raw.is_error()) return print_error(raw.error_category(), raw.error_message());
            bytes = std::move(raw.value());
        }

        // Single-document scans accept any file name; encoding checks still apply
        auto decoder_config = config.decoder;
        decoder_config.allowed_extensions.clear();
        auto text = DocumentDecoder(decoder_config).decode(name, std::move(bytes));
        if (text.is_error()) return print_error(text.error_category(), text.error_message());
        document = std::move(text.value());
    }

    const auto compiled = pipeline.compile(custom);
    if (!compiled.success) {
        utils::log::warn(std::format("Custom patterns rejected: {}", compiled.error_message()));
        print_json(compile_error_to_json(compiled));
        return kExitUsage;
    }

    auto result = pipeline.scan_compiled(document, compiled.patterns);
    if (result.is_error()) return print_error(result.error_category(), result.error_message());

    print_json(detection_result_to_json(result.value()));
    return kExitOk;
}

int run_batch(const CommandLine& cli, const SentinelConfig& config,
              std::shared_ptr<const DetectionPipeline> pipeline) {
    const auto compiled = pipeline->compile(cli.patterns);
    if (!compiled.success) {
        utils::log::warn(std::format("Custom patterns rejected: {}", compiled.error_message()));
        print_json(compile_error_to_json(compiled));
        return kExitUsage;
    }

    std::vector<DocumentSource> sources;
    sources.reserve(cli.inputs.size());
    for (const auto& path : cli.inputs) {
        sources.push_back(DocumentSource{path, [path]() { return read_file(path); }});
    }

    const BatchOrchestrator orchestrator(pipeline, DocumentDecoder(config.decoder), config.batch);

    auto progress = [](const BatchProgress& p) {
        std::cerr << std::format("[{}/{}] {} {}\n", p.index, p.total,
                                 batch_status_to_string(p.item.status), p.item.name);
    };

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    const auto report = orchestrator.run(sources, compiled.patterns, progress, &g_cancel);

    std::ofstream out(cli.out_file, std::ios::binary | std::ios::trunc);
    if (!out) {
        utils::log::error(std::format("Cannot open {} for writing", cli.out_file));
        return kExitFailure;
    }
    const size_t artifacts = orchestrator.export_bundle(report, out);
    out.close();
    if (!out) {
        utils::log::error(std::format("Failed writing {}", cli.out_file));
        return kExitFailure;
    }
    utils::log::info(std::format("Wrote {} ({} artifacts)", cli.out_file, artifacts));

    print_json(batch_report_to_json(report));
    return report.cancelled ? kExitFailure : kExitOk;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        const auto cli = parse_command_line(argc, argv);
        if (!cli) return kExitUsage;

        SentinelConfig config;
        if (!cli->config_file.empty()) {
            auto loaded = ConfigLoader::load_from_file(cli->config_file);
            if (!loaded.success) {
                utils::log::error(loaded.error_message);
                return print_error(ErrorCategory::CONFIG_ERROR, loaded.error_message);
            }
            config = std::move(loaded.config);
        }
        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }

        utils::log::debug(std::format("PII Sentinel: command '{}', config {}", cli->command,
            cli->config_file.empty() ? std::string("<defaults>") : cli->config_file));

        if (cli->command == "patterns") {
            return run_patterns();
        }

        auto registry = std::make_shared<const PatternRegistry>(config.registry);
        auto pipeline = std::make_shared<const DetectionPipeline>(
            registry, RiskScorer(config.risk), config.pipeline);

        if (cli->command == "scan") {
            return run_scan(*cli, config, *pipeline);
        }
        return run_batch(*cli, config, pipeline);

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return kExitFailure;
    }
}
