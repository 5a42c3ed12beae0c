#include <asio.hpp>
#include <cpptrace/cpptrace.hpp>

#include <chrono>

#include "command_line_parser.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "relay_server.hpp"
#include "settings_manager.hpp"

namespace {

const nlohmann::json RELAY_SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","listen_ip"},          {"aliases", {"li"}},       {"type","string"}, {"default","0.0.0.0"}, {"description","Interface/IP the relay binds"}},
  {{"key","port"},               {"aliases", {"p"}},        {"type","int"},    {"default",9100},      {"description","Relay listen port"}, {"min",0}, {"max",65535}},
  {{"key","pending_timeout_ms"}, {"aliases", {"pto"}},      {"type","int"},    {"default",15000},     {"description","How long a RELAY_CONNECT waits for the target to accept"}, {"min",1}},
  {{"key","idle_timeout_s"},     {"aliases", {"idle"}},     {"type","int"},    {"default",300},       {"description","Close control links silent for this long"}, {"min",1}},
  {{"key","max_frame_bytes"},    {"aliases", {"mfb"}},      {"type","int"},    {"default",1048576},   {"description","Largest accepted control frame"}, {"min",1024}},
  {{"key","verbose"},            {"aliases", {"v"}},        {"type","bool"},   {"default",false},     {"description","Enable verbose logging"}},
  {{"key","log_file"},           {"aliases", {"lf"}},       {"type","string"}, {"default",""},        {"description","Also write log records to this file"}},
  {{"key","help"},               {"aliases", {"h","?"}},    {"type","bool"},   {"default",false},     {"description","Show command help and exit"}, {"persistent", false}}
});

} // namespace

int main(int argc, char** argv) {
  try {
    SettingsManager settings(RELAY_SETTINGS_SPECIFICATION);
    CommandLineParser parser("meshshare-relay",
                             "rendezvous relay for meshshare nodes",
                             RELAY_SETTINGS_SPECIFICATION,
                             nlohmann::json::array({{{"index",0},{"key","port"}}}));
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
    auto logger = std::make_shared<Logger>("relay");

    RelayServer::Options options;
    options.listen_ip = settings.get<std::string>("listen_ip");
    options.port = static_cast<uint16_t>(settings.get<long long>("port"));
    options.pending_timeout = std::chrono::milliseconds(settings.get<long long>("pending_timeout_ms"));
    options.channel.idle_timeout = std::chrono::seconds(settings.get<long long>("idle_timeout_s"));
    options.channel.max_frame_bytes = static_cast<uint32_t>(settings.get<long long>("max_frame_bytes"));

    RelayServer server(options, logger);
    server.start();
    logger->print("Relay listening on {}:{} (Ctrl-C to stop)", options.listen_ip, server.port());

    asio::io_context signal_io;
    asio::signal_set signals(signal_io, SIGINT, SIGTERM);
    signals.async_wait([&](const std::error_code& ec, int signo){
      if(!ec) logger->info("signal {} received, shutting down", signo);
    });
    signal_io.run();

    server.stop();
    return 0;
  } catch(const std::exception& e) {
    init_logging(false);
    Logger logger("relay-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
