#include "outbox/config/config.hpp"
#include "outbox/config/contacts.hpp"
#include "outbox/config/settings.hpp"
#include "outbox/events/components.hpp"
#include "outbox/events/event_bus.hpp"
#include "outbox/net/connectivity.hpp"
#include "outbox/net/connectivity_monitor.hpp"
#include "outbox/net/health_probe.hpp"
#include "outbox/net/http_client.hpp"
#include "outbox/queue/codec.hpp"
#include "outbox/queue/history_log.hpp"
#include "outbox/queue/processor.hpp"
#include "outbox/queue/queue_store.hpp"
#include "outbox/storage/dir_lock.hpp"
#include "outbox/storage/kv_store.hpp"
#include "outbox/transfer/http_executor.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace outbox;

namespace {

std::atomic<bool> g_interrupted{false};

void on_signal(int) {
    g_interrupted = true;
}

void print_usage() {
    std::cout <<
        "Usage: outbox [--config FILE] [--data DIR] [--log-level LEVEL] [--verbose] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  configure --user-key KEY --endpoint URL [--check-frequency MS]\n"
        "  enqueue FILE --kind image|video [--to ID,ID...] [--overlays FILE]\n"
        "  pending                 list items waiting for upload\n"
        "  history                 list upload history\n"
        "  clear-history           drop all history entries\n"
        "  health                  probe the configured server\n"
        "  status                  server, link and queue summary\n"
        "  run [--once]            upload until the queue is empty (or Ctrl-C)\n";
}

struct CommandLine {
    std::optional<fs::path> config_path;
    std::optional<fs::path> data_dir;
    std::optional<std::string> log_level;
    bool verbose = false;
    std::string command;
    std::vector<std::string> args;
};

std::optional<CommandLine> parse_command_line(int argc, char* argv[]) {
    CommandLine cli;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (!cli.command.empty()) {
            cli.args.push_back(arg);
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            cli.config_path = fs::path(argv[++i]);
        } else if ((arg == "-d" || arg == "--data") && i + 1 < argc) {
            cli.data_dir = fs::path(argv[++i]);
        } else if (arg == "--log-level" && i + 1 < argc) {
            cli.log_level = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            cli.verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            return std::nullopt;
        } else {
            cli.command = arg;
        }
    }
    if (cli.command.empty()) {
        return std::nullopt;
    }
    return cli;
}

/// Value following `name` in args, if present.
std::optional<std::string> option(const std::vector<std::string>& args, const std::string& name) {
    for (std::size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == name) {
            return args[i + 1];
        }
    }
    return std::nullopt;
}

bool has_flag(const std::vector<std::string>& args, const std::string& name) {
    for (const auto& arg : args) {
        if (arg == name) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> split_csv(const std::string& text) {
    std::vector<std::string> parts;
    std::stringstream stream(text);
    std::string part;
    while (std::getline(stream, part, ',')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

std::string format_time(std::int64_t ms) {
    const std::time_t seconds = static_cast<std::time_t>(ms / 1000);
    std::tm local{};
    localtime_r(&seconds, &local);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
    return buffer;
}

/**
 * Everything a command may need, wired the same way for every command.
 * The queue and the history are loaded by QueueProcessor::load().
 */
struct Runtime {
    explicit Runtime(const config::AppConfig& cfg)
        : app(cfg)
        , kv(cfg.data_dir)
        , store(kv)
        , history_log(kv)
        , settings(kv)
        , contacts(kv)
        , oracle(cfg.connectivity.sysfs_root, cfg.connectivity.metered_interfaces)
        , probe(http, cfg.health.path, cfg.health.timeout)
        , executor(http, cfg.upload.path, cfg.upload.timeout)
        , runner_lock(cfg.data_dir, "runner") {}

    bool load() {
        bool ok = true;
        auto report = [&ok](const Result<void>& result, const char* what) {
            if (result.is_error()) {
                // An unreadable blob starts empty and is replaced on the next write.
                if (result.error().code == ErrorCode::Parse) {
                    spdlog::warn("Ignoring unreadable {}: {}", what, result.error().message);
                    return;
                }
                spdlog::error("Loading {} failed: {}", what, result.error().message);
                ok = false;
            }
        };
        report(settings.load(), "settings");
        // Contacts are cosmetic; missing names fall back to ids.
        auto contacts_loaded = contacts.load();
        if (contacts_loaded.is_error()) {
            spdlog::warn("Contacts unavailable: {}", contacts_loaded.error().message);
        }
        return ok;
    }

    queue::ProcessorOptions processor_options() const {
        queue::ProcessorOptions options;
        options.retry.max_retries = app.processor.max_retries;
        options.process_interval = app.processor.process_interval;
        options.transport_policy = app.processor.require_unmetered
            ? net::TransportPolicy::UnmeteredOnly
            : net::TransportPolicy::Any;
        return options;
    }

    std::string recipient_names(const std::vector<std::string>& ids) const {
        std::string out;
        for (const auto& id : ids) {
            if (!out.empty()) {
                out += ", ";
            }
            out += contacts.display_name(id).value_or(id);
        }
        return out.empty() ? "-" : out;
    }

    config::AppConfig app;
    storage::FileKeyValueStore kv;
    queue::QueueStore store;
    queue::HistoryLog history_log;
    config::KeyValueSettingsProvider settings;
    config::KeyValueContactsDirectory contacts;
    net::BeastHttpClient http;
    net::SysfsConnectivityOracle oracle;
    net::HttpHealthProbe probe;
    transfer::HttpTransferExecutor executor;
    events::EventBus bus;
    // Held by the one process allowed to drain the queue.
    storage::DirectoryLock runner_lock;
};

/**
 * Take the runner lock, retrying for `patience`
 *
 * Other commands hold it for the few milliseconds it takes to load, so a
 * short wait tells those apart from a real `outbox run`.
 */
Result<bool> acquire_runner_lock(storage::DirectoryLock& lock, std::chrono::milliseconds patience) {
    const auto deadline = std::chrono::steady_clock::now() + patience;
    while (true) {
        auto taken = lock.try_lock();
        if (taken.is_error() || taken.value() || std::chrono::steady_clock::now() >= deadline) {
            return taken;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
}

int cmd_configure(Runtime& rt, const std::vector<std::string>& args) {
    config::SettingsUpdate update;
    update.user_api_key = option(args, "--user-key");
    update.api_endpoint = option(args, "--endpoint");
    if (auto frequency = option(args, "--check-frequency")) {
        try {
            update.message_check_frequency_ms = std::stoll(*frequency);
        } catch (const std::exception&) {
            std::cerr << "Invalid --check-frequency: " << *frequency << "\n";
            return 2;
        }
    }
    if (!update.user_api_key && !update.api_endpoint && !update.message_check_frequency_ms) {
        std::cerr << "configure: nothing to change\n";
        return 2;
    }

    auto result = rt.settings.update(update);
    if (result.is_error()) {
        std::cerr << "configure: " << result.error().message << "\n";
        return 1;
    }
    const auto saved = rt.settings.settings();
    std::cout << "Endpoint: " << (saved.api_endpoint.empty() ? "(not set)" : saved.api_endpoint) << "\n"
              << "User key: " << (saved.user_api_key.empty() ? "(not set)" : "configured") << "\n";
    return 0;
}

int cmd_enqueue(queue::QueueProcessor& processor, const std::vector<std::string>& args) {
    if (args.empty() || args.front().rfind("--", 0) == 0) {
        std::cerr << "enqueue: FILE required\n";
        return 2;
    }
    const auto kind_text = option(args, "--kind").value_or("image");
    const auto kind = queue::parse_media_kind(kind_text);
    if (!kind) {
        std::cerr << "enqueue: --kind must be image or video\n";
        return 2;
    }

    std::vector<queue::TextOverlay> overlays;
    if (auto overlay_path = option(args, "--overlays")) {
        std::ifstream input(*overlay_path);
        if (!input) {
            std::cerr << "enqueue: cannot open " << *overlay_path << "\n";
            return 1;
        }
        std::ostringstream buffer;
        buffer << input.rdbuf();
        auto decoded = queue::decode_overlays(buffer.str());
        if (decoded.is_error()) {
            std::cerr << "enqueue: " << decoded.error().message << "\n";
            return 1;
        }
        overlays = std::move(decoded.value());
    }

    std::error_code ec;
    auto absolute = fs::absolute(args.front(), ec);
    const std::string payload = ec ? args.front() : absolute.string();

    auto id = processor.enqueue(payload, *kind, split_csv(option(args, "--to").value_or("")), std::move(overlays));
    if (id.is_error()) {
        std::cerr << "enqueue: " << id.error().message << "\n";
        return 1;
    }
    std::cout << id.value() << "\n";
    return 0;
}

int cmd_pending(Runtime& rt, queue::QueueProcessor& processor) {
    const auto items = processor.pending_uploads();
    if (items.empty()) {
        std::cout << "No pending uploads\n";
        return 0;
    }
    for (const auto& item : items) {
        std::cout << item.id << "  " << format_time(item.timestamp) << "  "
                  << queue::to_string(item.media_kind) << "  retries=" << item.retry_count.value_or(0)
                  << "  to: " << rt.recipient_names(item.recipients) << "\n";
    }
    return 0;
}

int cmd_history(queue::QueueProcessor& processor) {
    const auto entries = processor.upload_history();
    if (entries.empty()) {
        std::cout << "No upload history\n";
        return 0;
    }
    for (const auto& entry : entries) {
        std::cout << entry.id << "  " << format_time(entry.timestamp) << "  "
                  << queue::to_string(entry.media_kind) << "  " << queue::to_string(entry.status);
        if (entry.status == queue::ItemStatus::Uploading && entry.progress) {
            std::cout << " " << *entry.progress << "%";
        }
        if (entry.error) {
            std::cout << "  (" << *entry.error << ")";
        }
        std::cout << "\n";
    }
    return 0;
}

int cmd_health(Runtime& rt) {
    auto endpoint = rt.settings.endpoint_config();
    if (!endpoint) {
        std::cerr << "health: endpoint not configured\n";
        return 1;
    }
    const auto status = rt.probe.check(*endpoint);
    std::cout << (status.available ? "available" : "unavailable") << "  "
              << status.latency.count() << " ms  " << status.detail << "\n";
    return status.available ? 0 : 1;
}

int cmd_status(Runtime& rt, queue::QueueProcessor& processor) {
    const auto link = rt.oracle.current();
    std::cout << "Link:     " << (link.connected ? "online" : "offline");
    if (link.connected) {
        std::cout << " via " << link.interface_name << " (" << net::to_string(link.transport)
                  << (link.metered ? ", metered" : "") << ")";
    }
    std::cout << "\n";

    if (auto endpoint = rt.settings.endpoint_config()) {
        const auto health = rt.probe.check(*endpoint);
        std::cout << "Server:   " << endpoint->base_url << " "
                  << (health.available ? "available" : "unavailable")
                  << " (" << rt.probe.latency().count() << " ms)\n";
    } else {
        std::cout << "Server:   not configured\n";
    }

    std::size_t failed = 0;
    for (const auto& entry : processor.upload_history()) {
        if (entry.status == queue::ItemStatus::Failed) {
            ++failed;
        }
    }
    std::cout << "Queued:   " << rt.store.size() << " (" << processor.pending_uploads().size() << " pending)\n"
              << "Failed:   " << failed << "\n";
    return 0;
}

int cmd_run(Runtime& rt, queue::QueueProcessor& processor, const std::vector<std::string>& args) {
    if (has_flag(args, "--once")) {
        const auto report = processor.drain_once();
        std::cout << queue::to_string(report.outcome) << ": attempted=" << report.attempted
                  << " completed=" << report.completed << " failed=" << report.failed
                  << " retried=" << report.retried << "\n";
        return queue::is_gate_failure(report.outcome) ? 1 : 0;
    }

    net::ConnectivityMonitor monitor(rt.oracle, rt.bus, rt.app.connectivity.poll_interval);
    monitor.start();
    processor.start();

    std::size_t queued = rt.store.size();
    while (!g_interrupted) {
        // `outbox enqueue` from another shell only writes to storage.
        auto refreshed = rt.store.refresh();
        if (refreshed.is_error()) {
            spdlog::debug("Upload queue not re-read: {}", refreshed.error().message);
        }
        const auto now_queued = rt.store.size();
        if (now_queued > queued) {
            processor.trigger(true);
        }
        queued = now_queued;

        if (now_queued == 0 && !processor.is_processing()) {
            spdlog::info("Queue is empty");
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    processor.stop();
    monitor.stop();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    auto cli = parse_command_line(argc, argv);
    if (!cli) {
        print_usage();
        return 2;
    }

    config::AppConfig app;
    if (cli->config_path) {
        auto loaded = config::load_config(*cli->config_path);
        if (loaded.is_error()) {
            std::cerr << loaded.error().message << "\n";
            return 1;
        }
        app = loaded.value();
    }
    if (cli->data_dir) {
        app.data_dir = *cli->data_dir;
    }
    if (cli->log_level) {
        app.log_level = *cli->log_level;
    }

    spdlog::set_level(cli->verbose ? spdlog::level::debug : spdlog::level::from_str(app.log_level));

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    Runtime rt(app);
    if (!rt.load()) {
        return 1;
    }

    const auto& command = cli->command;
    const bool is_run = command == "run";

    // Items marked uploading are only reset when no runner can own them.
    auto runner = acquire_runner_lock(rt.runner_lock, is_run ? std::chrono::milliseconds(2000)
                                                             : std::chrono::milliseconds(0));
    if (runner.is_error()) {
        std::cerr << runner.error().message << "\n";
        return 1;
    }
    if (is_run && !runner.value()) {
        std::cerr << "run: another outbox run is active on " << app.data_dir.string() << "\n";
        return 1;
    }

    auto options = rt.processor_options();
    options.reset_stale_uploads = runner.value();

    events::LoggerComponent logger(rt.bus);
    events::MetricsComponent metrics(rt.bus);
    queue::QueueProcessor processor(rt.store, rt.history_log, rt.oracle, rt.probe, rt.executor,
                                    rt.settings, rt.bus, options);

    auto loaded = processor.load();
    if (loaded.is_error()) {
        // An unreadable blob starts empty and is replaced on the next write.
        if (loaded.error().code != ErrorCode::Parse) {
            spdlog::error("Loading uploads failed: {}", loaded.error().message);
            return 1;
        }
        spdlog::warn("Ignoring unreadable upload data: {}", loaded.error().message);
    }
    if (!is_run) {
        rt.runner_lock.unlock();
    }

    int status = 0;
    if (command == "configure") {
        status = cmd_configure(rt, cli->args);
    } else if (command == "enqueue") {
        status = cmd_enqueue(processor, cli->args);
    } else if (command == "pending") {
        status = cmd_pending(rt, processor);
    } else if (command == "history") {
        status = cmd_history(processor);
    } else if (command == "clear-history") {
        auto cleared = processor.clear_history();
        if (cleared.is_error()) {
            std::cerr << "clear-history: " << cleared.error().message << "\n";
            status = 1;
        } else {
            std::cout << "History cleared\n";
        }
    } else if (command == "health") {
        status = cmd_health(rt);
    } else if (command == "status") {
        status = cmd_status(rt, processor);
    } else if (command == "run") {
        status = cmd_run(rt, processor, cli->args);
        metrics.print_stats();
    } else {
        std::cerr << "Unknown command: " << command << "\n";
        print_usage();
        status = 2;
    }

    return status;
}
