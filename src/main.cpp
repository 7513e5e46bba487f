#include <cpptrace/cpptrace.hpp>

#include <filesystem>
#include <memory>

#include "command_line_parser.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "session.hpp"
#include "settings_manager.hpp"
#include "tcp_transport.hpp"

namespace {

TcpTransport::Options tcp_options_from_settings(const SettingsManager& settings) {
  TcpTransport::Options options;
  options.listen_ip = settings.get<std::string>("listen_ip");
  int port = settings.get<int>("listen_port");
  if(port < 0 || port > 65535) {
    throw ConfigurationError("Invalid listen_port '" + std::to_string(port) + "'");
  }
  options.listen_port = static_cast<uint16_t>(port);
  options.peer_addr = settings.get<std::string>("peer_addr");
  return options;
}

} // namespace

int main(int argc, char** argv) {
  init(false);
  try {
    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(std::filesystem::current_path() / ".config" / "peerdrop.json");
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "peerdrop");
    parser.parse(argc, argv, *settings);
    if(settings->help_requested()) {
      parser.usage(*settings);
      return 0;
    }

    bool verbose = settings->get<bool>("verbose");
    init(verbose);

    auto paths = settings->get<std::vector<std::string>>("paths");
    auto logger = std::make_shared<Logger>(paths.empty() ? "receiver" : "sender");
    if(verbose) {
      logger->debug("Verbose mode enabled");
      logger->debug("Working directory: {}", std::filesystem::current_path().string());
    }

    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    auto options = session_options_from_settings(*settings, token_from_environment(), *logger);
    auto tcp_options = tcp_options_from_settings(*settings);
    Session session(std::move(options),
                    [tcp_options, logger](uint64_t seed) -> std::unique_ptr<Transport> {
                      return std::make_unique<TcpTransport>(seed, tcp_options, logger);
                    },
                    logger);
    session.run();
    return 0;
  } catch(const SessionError& e) {
    Logger logger("peerdrop");
    logger.print_err("ERROR ({}): {}", error_kind_name(e.kind()), e.what());
    return 1;
  } catch(const std::exception& e) {
    Logger logger("peerdrop");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
