#include <asio.hpp>
#include <cpptrace/cpptrace.hpp>

#include <cstring>
#include <filesystem>
#include <sstream>
#include <unistd.h>

#include "command_line_parser.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "mesh_config.hpp"
#include "mesh_coordinator.hpp"
#include "settings_manager.hpp"
#include "utils.hpp"

namespace {

std::string get_unique_display_name() {
  char hostname[256];
  if(gethostname(hostname, sizeof(hostname)) != 0) {
    std::strcpy(hostname, "UnknownHost");
  }
  std::stringstream ss;
  ss << hostname << "-" << getpid();
  return ss.str();
}

void print_peers(Logger& logger, const std::vector<PeerInfo>& peers) {
  if(peers.empty()) {
    logger.print("No peers found");
    return;
  }
  for(const auto& peer : peers) {
    logger.print("  {:<16} {:<24} {:<12} signal {:>3} {}",
                 peer.id.substr(0, 16), peer.name, peer.protocol, peer.signal_strength,
                 peer.signal_strength == 0 ? "(cached)" : peer.address);
  }
}

void wait_for_shutdown_signal(Logger& logger) {
  asio::io_context signal_io;
  asio::signal_set signals(signal_io, SIGINT, SIGTERM);
  signals.async_wait([&](const std::error_code& ec, int signo){
    if(!ec) logger.info("signal {} received, shutting down", signo);
  });
  signal_io.run();
}

} // namespace

int main(int argc, char** argv) {
  try {
    SettingsManager settings;
    settings.load();

    CommandLineParser parser;
    try {
      parser.parse(argc, argv, settings);
    } catch(const MeshError& e) {
      print_err(nullptr, "{}", e.detail());
      parser.usage();
      return 1;
    }
    if(settings.help_requested()) {
      parser.usage();
      return 0;
    }

    init_logging(settings.get<bool>("verbose"), settings.get<std::string>("log_file"));
    auto logger = std::make_shared<Logger>("meshshare");

    if(settings.save_requested()) {
      if(!settings.save()) {
        logger->error("Unable to persist settings to {}", settings.settings_path().string());
      }
    }

    MeshConfig config = MeshConfig::from_settings(settings);
    if(config.node_name.empty()) config.node_name = get_unique_display_name();

    MeshCoordinator node(logger);
    node.start_node(config);

    auto info = node.get_connection_info();
    logger->print("Node {} ({})", node.node_name(), node.node_id());
    logger->print("Connectivity: mode {}, isolation {}, relay {}, public ip {}",
                  to_string(info.mode),
                  info.client_isolation ? "yes" : "no",
                  info.relay_available ? "available" : "unavailable",
                  info.public_ip.empty() ? "unknown" : info.public_ip);

    auto send_to = settings.get<std::string>("send_to");
    auto send_file = settings.get<std::string>("send_file");

    int rc = 0;
    if(settings.get<bool>("scan")) {
      ScanOptions options;
      options.timeout = config.scan_timeout;
      auto result = node.scan(options);
      print_peers(*logger, result.peers);
      if(!result.complete()) logger->warn("Scan incomplete: {}", result.error_summary());
    } else if(!send_to.empty() || !send_file.empty()) {
      if(send_to.empty() || send_file.empty()) {
        logger->error("--send_to and --send_file must be given together");
        rc = 1;
      } else {
        ScanOptions options;
        options.timeout = config.scan_timeout;
        node.scan(options);

        TransferOptions transfer = config.transfer;
        transfer.progress_callback = [&](const FileTransferInfo& p){
          logger->print("{} {}/{} chunks, {} of {} ({}/s) {}",
                        p.file_name, p.completed_count, p.total_chunks,
                        format_bytes(p.bytes_completed), format_bytes(p.file_size),
                        format_bytes(p.transfer_rate), to_string(p.status));
        };
        try {
          auto result = node.send_file_chunked(send_file, send_to, transfer);
          logger->print("Sent {} ({}) to {}", result.file_name, format_bytes(result.file_size), send_to);
        } catch(const MeshError& e) {
          logger->error("Transfer failed [{}]: {}", to_string(e.code()), e.detail());
          rc = 1;
        }
      }
    } else {
      logger->print("Serving; received files land in {} (Ctrl-C to stop)",
                    (config.data_dir / "received").string());
      wait_for_shutdown_signal(*logger);
    }

    node.stop_node();
    return rc;
  } catch(const std::exception& e) {
    init_logging(false);
    Logger logger("meshshare-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
