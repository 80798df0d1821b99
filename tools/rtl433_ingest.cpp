#include "rtl433/config.hpp"
#include "rtl433/coordinator.hpp"
#include "rtl433/json_export.hpp"
#include "rtl433/log.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Command-line front-end for the ingestion engine: runs rtl_433 under the
// supervisor and prints every device change as one JSON object per line.
// Exit codes:
//   0 -> clean stop (SIGINT/SIGTERM, or --print-config)
//   1 -> the decoder failed for good (lifecycle fault or retries exhausted)
//   2 -> CLI/argument or configuration error

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void handle_stop_signal(int) {
    g_stop_requested = 1;
}

struct ParsedArgs {
    std::optional<std::string> config_path;
    std::optional<int> device_id;
    std::optional<std::string> frequency;
    std::optional<std::string> gain;
    std::vector<int> protocols;
    bool all_protocols = false;
    std::optional<long> timeout_s;
    std::optional<std::string> decoder_path;
    bool print_config = false;
    bool debug = false;
};

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  --config <file.json>    Load settings from a JSON file (flags override it)\n"
              << "  --device <int>          RTL-SDR device index (default 0)\n"
              << "  --frequency <freq>      Centre frequency, e.g. 433.92M (default 433.92M)\n"
              << "  --gain <0-50|auto>      Tuner gain (default 40)\n"
              << "  --protocol <int>        Only decode this rtl_433 protocol (repeatable)\n"
              << "  --all-protocols         Decode every protocol instead of the default set\n"
              << "  --timeout <seconds>     Mark devices unavailable after this much silence (default 3600)\n"
              << "  --decoder <path>        rtl_433 executable (default: rtl_433 from PATH)\n"
              << "  --print-config          Print the effective configuration as JSON and exit\n"
              << "  --debug                 Verbose logging on stderr\n";
}

ParsedArgs parse_args(int argc, char** argv) {
    ParsedArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string cur = argv[i];
        if (cur == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (cur == "--device" && i + 1 < argc) {
            args.device_id = std::stoi(argv[++i]);
        } else if (cur == "--frequency" && i + 1 < argc) {
            args.frequency = argv[++i];
        } else if (cur == "--gain" && i + 1 < argc) {
            args.gain = argv[++i];
        } else if (cur == "--protocol" && i + 1 < argc) {
            args.protocols.push_back(std::stoi(argv[++i]));
        } else if (cur == "--all-protocols") {
            args.all_protocols = true;
        } else if (cur == "--timeout" && i + 1 < argc) {
            args.timeout_s = std::stol(argv[++i]);
        } else if (cur == "--decoder" && i + 1 < argc) {
            args.decoder_path = argv[++i];
        } else if (cur == "--print-config") {
            args.print_config = true;
        } else if (cur == "--debug") {
            args.debug = true;
        } else if (cur == "--help" || cur == "-h") {
            print_usage(argv[0]);
            std::exit(0);
        } else {
            throw std::invalid_argument("Unrecognized option or missing value: " + cur);
        }
    }
    return args;
}

rtl433::IngestConfig build_config(const ParsedArgs& args) {
    rtl433::IngestConfig config;
    if (args.config_path) config = rtl433::load_config_file(*args.config_path);
    if (args.device_id) config.device_id = *args.device_id;
    if (args.frequency) config.frequency = *args.frequency;
    if (args.gain) {
        if (*args.gain == "auto") {
            config.gain.reset();
        } else {
            config.gain = std::stod(*args.gain);
        }
    }
    if (!args.protocols.empty()) config.protocol_filter = {args.protocols.begin(), args.protocols.end()};
    if (args.all_protocols) config.all_protocols = true;
    if (args.timeout_s) config.device_timeout = std::chrono::seconds(*args.timeout_s);
    if (args.decoder_path) config.decoder_path = *args.decoder_path;
    if (args.debug) config.log_level = "debug";
    rtl433::validate(config);
    return config;
}

} // namespace

int main(int argc, char** argv) {
    rtl433::IngestConfig config;
    bool print_config = false;
    try {
        const ParsedArgs parsed = parse_args(argc, argv);
        config = build_config(parsed);
        print_config = parsed.print_config;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_usage(argv[0]);
        return 2;
    }

    if (print_config) {
        std::cout << rtl433::to_json_line(rtl433::config_to_json(config)) << std::endl;
        return 0;
    }

    struct sigaction sa {};
    sa.sa_handler = handle_stop_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    rtl433::Coordinator coordinator;
    // Subscribe first so the Created events of the first readings are not missed.
    rtl433::Subscription feed = coordinator.subscribe();
    try {
        coordinator.start(config);
    } catch (const rtl433::ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    } catch (const rtl433::supervisor::SupervisorError& e) {
        std::cerr << "Error: " << rtl433::supervisor::user_message(e.kind()) << " (" << e.what() << ")\n";
        return 1;
    }

    while (!g_stop_requested) {
        auto event = feed.next_for(std::chrono::milliseconds(200));
        if (event) {
            std::cout << rtl433::to_json_line(rtl433::to_json(*event)) << std::endl;
        } else if (feed.closed()) {
            break;
        }
    }
    coordinator.stop();

    const auto stats = coordinator.stats();
    RTL433_LOGI("main", "lines=%zu accepted=%zu rejected=%zu filtered=%zu events=%zu restarts=%zu", stats.lines,
                stats.accepted, stats.rejected(), stats.filtered, stats.events_published, stats.restarts);

    if (g_stop_requested) return 0;
    if (auto failure = coordinator.last_failure(); failure && failure->terminal) {
        std::cerr << "Error: " << rtl433::supervisor::user_message(failure->kind) << " (" << failure->detail
                  << ")\n";
        return 1;
    }
    return 0;
}
