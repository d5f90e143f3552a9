/**
 * @file main.cpp
 * @brief nexus_server: resumable upload service
 *
 * STARTUP ORDER:
 * 1. Config file, then command-line overrides, then logging
 * 2. Database, indexes, owner directory, cloud usage
 * 3. Reconcile the file index and resume interrupted imports
 * 4. Background tasks (janitor, on-demand reconcile, usage flush)
 * 5. HTTP listener
 *
 * SIGNALS:
 * SIGINT / SIGTERM  graceful shutdown
 * SIGHUP            reload owners and reconcile the file index
 */

#include "nexus/auth/owner_directory.hpp"
#include "nexus/cloud/arbiter.hpp"
#include "nexus/cloud/s3_object_store.hpp"
#include "nexus/cloud/usage.hpp"
#include "nexus/core/config.hpp"
#include "nexus/core/periodic_task.hpp"
#include "nexus/events/components.hpp"
#include "nexus/events/event_bus.hpp"
#include "nexus/events/events.hpp"
#include "nexus/network/http_router.hpp"
#include "nexus/network/http_server_asio.hpp"
#include "nexus/server/tus_routes.hpp"
#include "nexus/storage/database.hpp"
#include "nexus/storage/dedup.hpp"
#include "nexus/storage/file_index.hpp"
#include "nexus/storage/reconciler.hpp"
#include "nexus/upload/chunk_writer.hpp"
#include "nexus/upload/finalizer.hpp"
#include "nexus/upload/janitor.hpp"
#include "nexus/upload/service.hpp"
#include "nexus/upload/session_store.hpp"
#include "nexus/upload/storage_strategy.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <csignal>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace asio = boost::asio;
namespace fs = std::filesystem;
using namespace nexus;

namespace {

struct CommandLine {
    fs::path config_path = "nexus.json";
    std::optional<std::uint16_t> port;
    std::optional<fs::path> data_root;
    std::optional<std::size_t> io_threads;
    std::optional<std::string> log_level;
    bool dedup_scan = false;
    bool cloud_usage = false;
    bool help = false;
};

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  --config <file>      JSON configuration (default nexus.json)\n"
              << "  -p, --port <port>    listen port\n"
              << "  -d, --data <dir>     data root\n"
              << "  --threads <n>        I/O threads\n"
              << "  --log-level <level>  trace|debug|info|warn|error\n"
              << "  --dedup-scan         deduplicate the upload tree and exit\n"
              << "  --cloud-usage        print this month's cloud usage and exit\n";
}

CommandLine parse_command_line(int argc, char* argv[]) {
    CommandLine cli;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            cli.config_path = argv[++i];
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            cli.port = static_cast<std::uint16_t>(std::stoi(argv[++i]));
        } else if ((arg == "-d" || arg == "--data") && i + 1 < argc) {
            cli.data_root = fs::path(argv[++i]);
        } else if (arg == "--threads" && i + 1 < argc) {
            cli.io_threads = static_cast<std::size_t>(std::stoul(argv[++i]));
        } else if (arg == "--log-level" && i + 1 < argc) {
            cli.log_level = argv[++i];
        } else if (arg == "--dedup-scan") {
            cli.dedup_scan = true;
        } else if (arg == "--cloud-usage") {
            cli.cloud_usage = true;
        } else if (arg == "-h" || arg == "--help") {
            cli.help = true;
        } else {
            spdlog::warn("Ignoring unknown argument '{}'", arg);
        }
    }
    return cli;
}

void configure_logging(const core::ServerConfig& config) {
    if (!config.log_file.empty()) {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file, false));
        auto logger = std::make_shared<spdlog::logger>("nexus", sinks.begin(), sinks.end());
        spdlog::set_default_logger(logger);
    }
    spdlog::set_level(spdlog::level::from_str(config.log_level));
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
}

void print_cloud_usage(cloud::UsageCounters& usage, const core::CloudConfig& config) {
    const auto snapshot = usage.snapshot();
    auto line = [](const char* label, std::uint64_t used, std::uint64_t limit) {
        const double percent = limit == 0 ? 0.0 : 100.0 * static_cast<double>(used) / static_cast<double>(limit);
        std::cout << "  " << label << ": " << used << " / " << limit
                  << " (" << std::fixed << std::setprecision(2) << percent << "%)\n";
    };
    std::cout << "Cloud usage for " << snapshot.period << "\n";
    line("Class A operations", snapshot.class_a_ops, config.monthly_limit_class_a);
    line("Class B operations", snapshot.class_b_ops, config.monthly_limit_class_b);
    line("Storage bytes     ", snapshot.storage_bytes, config.monthly_limit_bytes);
    std::cout << "  Bytes transited   : " << snapshot.bytes_transited << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    CommandLine cli;
    try {
        cli = parse_command_line(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("Invalid arguments: {}", e.what());
        print_usage(argv[0]);
        return 2;
    }
    if (cli.help) {
        print_usage(argv[0]);
        return 0;
    }

    auto loaded = core::load_config(cli.config_path);
    if (loaded.is_error()) {
        spdlog::error("Configuration error: {}", loaded.error().message);
        return 1;
    }
    core::ServerConfig config = loaded.value();
    if (cli.port) config.port = *cli.port;
    if (cli.data_root) config.data_root = *cli.data_root;
    if (cli.io_threads) config.io_threads = *cli.io_threads;
    if (cli.log_level) config.log_level = *cli.log_level;
    config.resolve_paths();
    configure_logging(config);

    try {
        fs::create_directories(config.upload_root);
        fs::create_directories(config.temp_root);

        events::EventBus bus;
        events::LoggerComponent logger(bus);
        events::MetricsComponent metrics(bus);

        storage::Database db(config.database_path);
        storage::FileIndex index(db);
        storage::Deduplicator dedup(db, bus);
        upload::SessionStore sessions(db);

        auth::JsonOwnerDirectory owners(config.owners_file);
        if (auto reloaded = owners.reload(); reloaded.is_error()) {
            spdlog::warn("No owners loaded: {}", reloaded.error().message);
        }
        auth::StorageLayout layout(config.upload_root);
        auth::EventBusNotifier notifier(bus);

        cloud::UsageCounters usage(config.usage_file);
        if (auto restored = usage.load(); restored.is_error()) {
            spdlog::warn("Starting cloud usage from zero: {}", restored.error().message);
        }

        if (cli.cloud_usage) {
            print_cloud_usage(usage, config.cloud);
            return 0;
        }
        if (cli.dedup_scan) {
            const auto stats = dedup.scan_tree(config.upload_root);
            std::cout << "Scanned " << stats.scanned << " files, deduplicated " << stats.deduplicated
                      << ", saved " << stats.bytes_saved << " bytes, " << stats.failed << " failed\n";
            return stats.failed == 0 ? 0 : 1;
        }

        cloud::Arbiter arbiter(config.cloud, usage);
        std::unique_ptr<cloud::S3ObjectStore> object_store;
        if (config.cloud.configured()) {
            auto created = cloud::S3ObjectStore::create(config.cloud);
            if (created.is_error()) {
                spdlog::warn("Cloud offload disabled: {}", created.error().message);
            } else {
                object_store = std::move(created.value());
                spdlog::info("Cloud offload enabled for uploads above {} bytes", config.cloud.threshold_bytes);
            }
        }

        upload::ChunkWriter writer(config.temp_root);
        upload::StorageBackends backends(writer, bus, object_store.get(),
                                         object_store ? &arbiter : nullptr,
                                         object_store ? &usage : nullptr);
        upload::Finalizer finalizer(sessions, writer, index, dedup, owners, layout, notifier, bus);

        asio::thread_pool workers(config.worker_threads);
        upload::UploadService service(
            sessions, backends, finalizer, owners, bus,
            [&workers](std::function<void()> job) { asio::post(workers, std::move(job)); },
            config.max_upload_bytes);

        upload::Janitor janitor(sessions, backends, bus, config.stale_upload_retention);
        storage::Reconciler reconciler(index, owners, layout, bus);

        reconciler.run();
        service.recover_pending();

        core::PeriodicTask janitor_task(
            "janitor", config.janitor_interval,
            [&](const std::atomic<bool>& stop) {
                // Retry failed imports before anything old enough is swept.
                service.retry_completed();
                janitor.sweep(upload::unix_now(), &stop);
            });
        core::PeriodicTask reconcile_task(
            "reconciler", config.reconcile_interval,
            [&](const std::atomic<bool>& stop) {
                if (auto reloaded = owners.reload(); reloaded.is_error()) {
                    spdlog::warn("Owner reload failed, keeping current list: {}", reloaded.error().message);
                }
                reconciler.run(&stop);
            },
            false);
        core::PeriodicTask usage_task(
            "cloud-usage", config.cloud.usage_flush_interval,
            [&](const std::atomic<bool>&) {
                if (auto flushed = usage.flush(); flushed.is_error()) {
                    spdlog::warn("Cloud usage not saved: {}", flushed.error().message);
                }
            },
            false);

        janitor_task.start();
        reconcile_task.start();
        usage_task.start();

        network::HttpRouter router;
        router.use([](const network::HttpContext& ctx, network::HttpResponse&) {
            spdlog::debug("{} {}", network::HttpMethodUtils::to_string(ctx.request.method), ctx.request.url);
            return true;
        });
        server::TusRoutes routes(service, config.base_path);
        routes.register_routes(router);

        asio::io_context io;
        network::HttpServerAsio http_server(io, config.port, config.max_chunk_bytes);
        http_server.set_handler([&router](const network::HttpRequest& request) {
            return router.handle_request(request);
        });

        std::string shutdown_reason = "normal";
        asio::signal_set signals(io, SIGINT, SIGTERM, SIGHUP);
        std::function<void()> wait_for_signal = [&]() {
            signals.async_wait([&](const boost::system::error_code& ec, int signal) {
                if (ec) {
                    return;
                }
                if (signal == SIGHUP) {
                    spdlog::info("SIGHUP: scheduling reconcile");
                    reconcile_task.trigger();
                    wait_for_signal();
                    return;
                }
                shutdown_reason = signal == SIGINT ? "SIGINT" : "SIGTERM";
                http_server.stop();
                io.stop();
            });
        };
        wait_for_signal();

        bus.emit(events::ServerStartedEvent(http_server.get_port()));

        std::vector<std::thread> io_threads;
        for (std::size_t i = 1; i < config.io_threads; ++i) {
            io_threads.emplace_back([&io]() { io.run(); });
        }
        io.run();
        for (auto& t : io_threads) {
            t.join();
        }

        janitor_task.stop();
        reconcile_task.stop();
        usage_task.stop();
        workers.join();

        if (auto flushed = usage.flush(); flushed.is_error()) {
            spdlog::warn("Cloud usage not saved: {}", flushed.error().message);
        }

        bus.emit(events::ServerShuttingDownEvent(shutdown_reason));
        metrics.print_stats();
    } catch (const std::exception& e) {
        spdlog::critical("Fatal: {}", e.what());
        return 1;
    }
    return 0;
}
