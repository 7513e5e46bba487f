#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "log.hpp"
#include "protocol.hpp"
#include "transport.hpp"

class SettingsManager;

inline constexpr const char* kTokenEnvVar = "PEERDROP_TOKEN";

enum class Role {
  Sender,
  Receiver
};

const char* role_name(Role role);

// One transfer between two peers sharing a token. The session owns its
// transport from creation until it is destroyed; every failure leaves run()
// as a SessionError.
class Session {
public:
  struct Options {
    Role role = Role::Receiver;
    std::string token;
    std::vector<std::string> paths;
    const ProtocolProfile* profile = &kStreamProfile;
    uint64_t chunk_size = kDefaultChunkSize;
    std::chrono::milliseconds latency{100};
    int connect_retries = 30;
    std::chrono::seconds message_timeout{300};
    std::filesystem::path destination_root = ".";
    bool show_progress = true;
    std::size_t meter_size = 40;
  };

  using TransportFactory = std::function<std::unique_ptr<Transport>(uint64_t seed)>;

  Session(Options options,
          TransportFactory make_transport,
          std::shared_ptr<Logger> logger,
          std::ostream& progress_out = std::cerr);
  ~Session();

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  void run();

  Role role() const { return options_.role; }
  const Options& options() const { return options_; }
  const TransferManifest& manifest() const { return manifest_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

private:
  void connect_to_peer();
  void run_sender();
  void run_receiver();
  void close_transport();

  Options options_;
  TransportFactory make_transport_;
  std::shared_ptr<Logger> logger_;
  std::ostream& progress_out_;
  std::unique_ptr<Transport> transport_;
  TransferManifest manifest_;
};

// Token from PEERDROP_TOKEN; ConfigurationError when unset or empty.
std::string token_from_environment();

// Validates settings and turns them into session options. The role follows
// from the paths: none means receive.
Session::Options session_options_from_settings(const SettingsManager& settings,
                                               const std::string& token,
                                               Logger& logger);
