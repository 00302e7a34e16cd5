#include <asio.hpp>
#include <cpptrace/cpptrace.hpp>
#include <csignal>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <thread>

#include "command_line_parser.hpp"
#include "http_remote_store.hpp"
#include "log.hpp"
#include "progress_meter.hpp"
#include "settings_manager.hpp"
#include "upload_config.hpp"
#include "upload_queue_manager.hpp"

namespace {

void print_summary(const std::vector<FileSnapshot>& snapshots) {
  for(const auto& snapshot : snapshots) {
    const auto& state = snapshot.state;
    std::string fingerprint = state.fingerprint.empty() ? "-" : state.fingerprint;
    std::string elapsed = "-";
    if(state.started_at != std::chrono::steady_clock::time_point{} &&
       state.finished_at != std::chrono::steady_clock::time_point{}) {
      elapsed = format_duration_compact(state.finished_at - state.started_at);
    }
    if(state.phase == UploadPhase::Succeeded) {
      print_out(nullptr, "{}  {}  {}  {}  {}", snapshot.file_name, to_string(state.phase),
                fingerprint, elapsed, state.remote_url.empty() ? "-" : state.remote_url);
    } else {
      print_err(nullptr, "{}  {}  {}  {}", snapshot.file_name, to_string(state.phase),
                fingerprint, state.error.empty() ? "-" : state.error);
    }
  }
}

}

int main(int argc, char** argv){
  try {
    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(std::filesystem::current_path() / ".config" / "settings.json");
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0])
      ? std::filesystem::path(argv[0]).filename().string()
      : "chunkup");
    std::vector<std::string> paths;
    try {
      paths = parser.parse(argc, argv, *settings);
    } catch(const std::invalid_argument& e) {
      print_err(nullptr, "{}", e.what());
      parser.usage(*settings);
      return 1;
    }
    if(settings->help_requested()) {
      parser.usage(*settings);
      return 0;
    }

    init(settings->get<bool>("verbose"), settings->get<std::string>("log_file"));
    auto logger = std::make_shared<Logger>("chunkup");
    if(settings->get<bool>("verbose")) {
      logger->debug("Verbose logging enabled");
    }

    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    if(paths.empty()) {
      print_err(nullptr, "No files given");
      parser.usage(*settings);
      return 1;
    }

    UploadConfig config;
    try {
      config = UploadConfig::from_settings(*settings);
    } catch(const std::invalid_argument& e) {
      logger->error("Invalid configuration: {}", e.what());
      return 1;
    }

    HttpRemoteStore::Options store_options;
    store_options.base_url = config.server_url;
    store_options.request_timeout_seconds = config.request_timeout_seconds;
    auto store = std::make_shared<HttpRemoteStore>(store_options, logger->child("store"));

    if(settings->get<bool>("check_server")) {
      CancellationHandle ping_cancel;
      if(!store->ping(ping_cancel)) {
        logger->error("Chunk store at {} is not reachable", config.server_url);
        return 1;
      }
    }

    UploadQueueManager manager(store, config, logger);

    asio::io_context signal_io;
    asio::signal_set signals(signal_io, SIGINT, SIGTERM);
    std::atomic<bool> interrupted{false};
    signals.async_wait([&](const std::error_code& ec, int signal_number){
      if(ec) return;
      interrupted = true;
      logger->warn("Received signal {}, cancelling uploads", signal_number);
      manager.cancel_all();
    });
    std::thread signal_thread([&signal_io](){
      signal_io.run();
    });

    bool rejected = false;
    for(const auto& path : paths) {
      if(interrupted) {
        logger->warn("Not queueing {}: interrupted", path);
        rejected = true;
        continue;
      }
      try {
        manager.enqueue(make_upload_file(path));
      } catch(const UploadError& e) {
        logger->error("Skipping {}: {}", path, e.what());
        rejected = true;
      } catch(const std::exception& e) {
        logger->error("Skipping {}: {}", path, e.what());
        rejected = true;
      }
    }

    const bool show_progress = settings->get<bool>("transfer_progress");
    const auto interval = std::chrono::milliseconds(
      std::max(50, settings->get<int>("progress_interval_ms")));
    ProgressMeter meter(static_cast<std::size_t>(std::max(8, settings->get<int>("progress_meter_size"))));
    while(!manager.wait_idle(interval)) {
      if(show_progress) {
        meter.draw(std::cout, manager.snapshots(), manager.counters());
      }
    }
    if(show_progress) {
      meter.draw(std::cout, manager.snapshots(), manager.counters());
    }

    signals.cancel();
    signal_io.stop();
    if(signal_thread.joinable()) signal_thread.join();

    auto snapshots = manager.snapshots();
    manager.shutdown();
    print_summary(snapshots);

    bool all_succeeded = !rejected && !snapshots.empty();
    for(const auto& snapshot : snapshots) {
      if(snapshot.state.phase != UploadPhase::Succeeded) all_succeeded = false;
    }
    return all_succeeded ? 0 : 1;
  } catch(std::exception& e) {
    init(false);
    Logger logger("chunkup-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
