#include "session.hpp"

#include <cstdlib>

#include "connection_establisher.hpp"
#include "errors.hpp"
#include "progress_meter.hpp"
#include "seed_derivation.hpp"
#include "settings_manager.hpp"
#include "transfer_engine.hpp"

const char* role_name(Role role) {
  return role == Role::Sender ? "sender" : "receiver";
}

Session::Session(Options options,
                 TransportFactory make_transport,
                 std::shared_ptr<Logger> logger,
                 std::ostream& progress_out)
  : options_(std::move(options)),
    make_transport_(std::move(make_transport)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>(role_name(options_.role))),
    progress_out_(progress_out) {
  if(!make_transport_) {
    throw ConfigurationError("Session needs a transport factory");
  }
  if(!options_.profile) {
    options_.profile = &kStreamProfile;
  }
}

Session::~Session() {
  close_transport();
}

void Session::close_transport() {
  if(transport_) {
    transport_->close();
  }
}

void Session::run() {
  if(options_.token.empty()) {
    throw ConfigurationError(std::string(kTokenEnvVar) + " environment variable not set");
  }
  if(options_.role == Role::Sender) {
    check_chunk_size(options_.chunk_size);
  }
  logger_->print("Running in {} mode ({} protocol {})", role_name(options_.role),
                 options_.profile->name, options_.profile->version);
  connect_to_peer();
  if(options_.role == Role::Sender) {
    run_sender();
  } else {
    run_receiver();
  }
  close_transport();
}

void Session::connect_to_peer() {
  logger_->debug("Token: {}", redact_token(options_.token));
  auto seeds = derive_seeds(options_.token);
  logger_->debug("Sender seed: {}", seeds.sender_seed);
  logger_->debug("Receiver seed: {}", seeds.receiver_seed);

  bool sending = options_.role == Role::Sender;
  uint64_t local_seed = sending ? seeds.sender_seed : seeds.receiver_seed;
  uint64_t peer_seed = sending ? seeds.receiver_seed : seeds.sender_seed;
  const char* peer_role = role_name(sending ? Role::Receiver : Role::Sender);

  auto peer_id = identity_preview(peer_seed);
  logger_->debug("{} node ID: {}", peer_role, peer_id);

  transport_ = make_transport_(local_seed);
  if(!transport_) {
    throw ConnectionError("No transport available");
  }
  logger_->print("{} node ID: {}", role_name(options_.role), transport_->node_id());
  logger_->print("Connecting to peer {}...", peer_id.substr(0, 16));

  if(!establish_connection(*transport_, peer_id, options_.connect_retries, *logger_)) {
    close_transport();
    throw ConnectionError(std::string("Failed to connect to ") + peer_role + " within " +
                          std::to_string(options_.connect_retries) + "s");
  }
  logger_->print("Connected to peer!");
}

void Session::run_sender() {
  const auto& profile = *options_.profile;
  logger_->print("Sender ready - preparing metadata for {} items...", options_.paths.size());

  auto plan = build_send_plan(options_.paths, options_.chunk_size, profile, *logger_);
  manifest_ = plan.manifest;
  uint64_t total = manifest_.total_size();
  logger_->debug("Total size to send: {} bytes ({})", total, format_size(total));

  Bytes message = encode_manifest(manifest_, profile);
  logger_->debug("Metadata JSON ({} bytes): {}", message.size(), std::string(message.begin(), message.end()));
  await_send(transport_->isend(std::move(message), profile.manifest_tag, options_.latency),
             options_.message_timeout, "metadata");
  logger_->print("Metadata sent - sending {} items", manifest_.items.size());

  TransferConfig config;
  config.profile = &profile;
  config.chunk_size = options_.chunk_size;
  config.latency = options_.latency;
  config.timeout = options_.message_timeout;

  ProgressMeter meter("Sending", total, options_.meter_size, options_.show_progress, progress_out_);
  send_items(*transport_, plan, config, meter, *logger_);
  meter.finish();
  logger_->print("All files sent successfully!");
}

void Session::run_receiver() {
  const auto& profile = *options_.profile;
  logger_->print("Receiver ready - waiting for metadata...");

  Bytes message = await_receive(transport_->irecv(profile.manifest_tag), options_.message_timeout, "metadata");
  logger_->debug("Received {} bytes of metadata: {}", message.size(), std::string(message.begin(), message.end()));
  manifest_ = decode_manifest(message, profile);
  logger_->print("Received metadata for {} items", manifest_.items.size());

  logger_->debug("Checking if any destination paths already exist...");
  check_destinations_clear(options_.destination_root, manifest_);
  logger_->print("All paths clear - ready to receive files");

  uint64_t total = manifest_.total_size();
  logger_->debug("Total size to receive: {} bytes ({})", total, format_size(total));

  TransferConfig config;
  config.profile = &profile;
  config.latency = options_.latency;
  config.timeout = options_.message_timeout;

  ProgressMeter meter("Receiving", total, options_.meter_size, options_.show_progress, progress_out_);
  receive_items(*transport_, manifest_, options_.destination_root, config, meter, *logger_);
  meter.finish();
  logger_->print("All files received successfully!");
}

std::string token_from_environment() {
  const char* value = std::getenv(kTokenEnvVar);
  if(!value || !*value) {
    throw ConfigurationError(std::string(kTokenEnvVar) + " environment variable not set");
  }
  return value;
}

Session::Options session_options_from_settings(const SettingsManager& settings,
                                               const std::string& token,
                                               Logger& logger) {
  Session::Options options;
  options.token = token;
  options.paths = settings.get<std::vector<std::string>>("paths");
  options.role = options.paths.empty() ? Role::Receiver : Role::Sender;
  options.profile = &parse_protocol_mode(settings.get<std::string>("protocol"));

  auto chunk_literal = settings.get<std::string>("chunk_size");
  options.chunk_size = parse_size(chunk_literal);
  if(options.chunk_size == 0) {
    throw ConfigurationError("Chunk size must be greater than zero (got '" + chunk_literal + "')");
  }
  if(options.role == Role::Sender) {
    check_chunk_size(options.chunk_size);
  }
  logger.debug("Chunk size: {} bytes ({})", options.chunk_size, chunk_literal);
  if(options.role == Role::Receiver && settings.is_overridden("chunk_size") &&
     options.chunk_size != kDefaultChunkSize) {
    logger.warn("chunk_size ('{}') is ignored in receiver mode; the sender decides the chunk size",
                chunk_literal);
  }

  int latency = settings.get<int>("latency");
  if(latency < 0) {
    throw ConfigurationError("latency must not be negative");
  }
  options.latency = std::chrono::milliseconds(latency);

  options.connect_retries = settings.get<int>("connect_retries");
  if(options.connect_retries < 1) {
    throw ConfigurationError("connect_retries must be at least 1");
  }
  int timeout = settings.get<int>("timeout");
  if(timeout < 1) {
    throw ConfigurationError("timeout must be at least 1 second");
  }
  options.message_timeout = std::chrono::seconds(timeout);

  options.destination_root = settings.get<std::string>("output_dir");
  if(options.destination_root.empty()) {
    options.destination_root = ".";
  }
  options.show_progress = settings.get<bool>("progress");
  int meter_size = settings.get<int>("progress_meter_size");
  options.meter_size = static_cast<std::size_t>(meter_size > 0 ? meter_size : 1);
  return options;
}
