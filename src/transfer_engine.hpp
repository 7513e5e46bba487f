#pragma once
#include <chrono>
#include <filesystem>
#include <future>
#include <string>

#include "log.hpp"
#include "progress_meter.hpp"
#include "protocol.hpp"
#include "transport.hpp"

struct TransferConfig {
  const ProtocolProfile* profile = &kStreamProfile;
  uint64_t chunk_size = kDefaultChunkSize;
  std::chrono::milliseconds latency{100};
  std::chrono::seconds timeout{300};
};

// Bounded waits on transport futures. Timeouts and transport failures are
// TransferErrors; `what` names the message in the error text.
void await_send(std::future<void> pending, std::chrono::seconds timeout, const std::string& what);
Bytes await_receive(std::future<Bytes> pending, std::chrono::seconds timeout, const std::string& what);

// Streams every plan entry in manifest order, one message in flight at a
// time. Payloads cached in the plan are moved out as they are sent.
void send_items(Transport& transport,
                SendPlan& plan,
                const TransferConfig& config,
                ProgressMeter& meter,
                Logger& logger);

// Receives the items of `manifest` in order below `root`. Each item is
// staged next to its destination, verified, then committed without
// overwriting; an item that fails leaves nothing behind.
void receive_items(Transport& transport,
                   const TransferManifest& manifest,
                   const std::filesystem::path& root,
                   const TransferConfig& config,
                   ProgressMeter& meter,
                   Logger& logger);
