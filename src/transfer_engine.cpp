#include "transfer_engine.hpp"
#include "archive.hpp"
#include "compression.hpp"
#include "errors.hpp"
#include "integrity.hpp"

#include <algorithm>
#include <fstream>

namespace fs = std::filesystem;

void await_send(std::future<void> pending, std::chrono::seconds timeout, const std::string& what) {
  if(pending.wait_for(timeout) != std::future_status::ready) {
    throw TransferError("Timed out after " + std::to_string(timeout.count()) + "s sending " + what);
  }
  try {
    pending.get();
  } catch(const std::future_error& e) {
    throw TransferError("Send of " + what + " abandoned: " + e.what());
  }
}

Bytes await_receive(std::future<Bytes> pending, std::chrono::seconds timeout, const std::string& what) {
  if(pending.wait_for(timeout) != std::future_status::ready) {
    throw TransferError("Timed out after " + std::to_string(timeout.count()) + "s waiting for " + what);
  }
  try {
    return pending.get();
  } catch(const std::future_error& e) {
    throw TransferError("Receive of " + what + " abandoned: " + e.what());
  }
}

namespace {

void send_chunked(Transport& transport,
                  const SendPlanEntry& entry,
                  const TransferConfig& config,
                  ProgressMeter& meter,
                  Logger& logger) {
  const auto& item = entry.item;
  std::ifstream in(entry.source, std::ios::binary);
  if(!in) {
    throw TransferError("Unable to open " + entry.source.string());
  }
  logger.debug("Sending file in {} chunks: {}", item.num_chunks, entry.source.string());

  uint64_t offset = 0;
  for(uint64_t chunk = 0; chunk < item.num_chunks; ++chunk) {
    uint64_t want = std::min(config.chunk_size, entry.raw_size > offset ? entry.raw_size - offset : 0);
    Bytes data(static_cast<std::size_t>(want));
    if(want > 0) {
      in.read(data.data(), static_cast<std::streamsize>(want));
      if(in.bad()) {
        throw TransferError("Read failed on " + entry.source.string());
      }
      data.resize(static_cast<std::size_t>(in.gcount()));
    }
    offset += data.size();
    logger.debug("Read chunk {}/{}: {} bytes", chunk + 1, item.num_chunks, data.size());

    Bytes compressed = gzip_compress(data);
    logger.debug("Compressed chunk to {} bytes", compressed.size());
    await_send(transport.isend(std::move(compressed), config.profile->content_tag, config.latency),
               config.timeout, "chunk " + std::to_string(chunk + 1) + " of " + item.path);
    meter.advance(data.size(), item.path, chunk + 1, item.num_chunks);
  }
}

void send_whole(Transport& transport,
                SendPlanEntry& entry,
                const TransferConfig& config,
                ProgressMeter& meter,
                Logger& logger) {
  if(!entry.payload) {
    throw TransferError("No prepared payload for " + entry.item.path);
  }
  logger.debug("Sending {} as one {} byte message", entry.item.path, entry.payload->size());
  Bytes payload = std::move(*entry.payload);
  entry.payload.reset();
  await_send(transport.isend(std::move(payload), config.profile->content_tag, config.latency),
             config.timeout, entry.item.path);
  meter.advance(entry.item.size, entry.item.path, 1, 1);
}

void prepare_destination(const fs::path& destination) {
  if(destination_exists(destination)) {
    throw PathConflictError("File created during transfer: " + destination.string());
  }
  std::error_code ec;
  fs::create_directories(destination.parent_path(), ec);
  if(ec) {
    throw TransferError("Unable to create " + destination.parent_path().string() + ": " + ec.message());
  }
}

void receive_chunked(Transport& transport,
                     const ManifestItem& item,
                     const fs::path& destination,
                     const TransferConfig& config,
                     ProgressMeter& meter,
                     Logger& logger) {
  StagingFile staging(destination);
  logger.debug("Receiving file in {} chunks: {} (staging {})", item.num_chunks, item.path, staging.path().string());
  for(uint64_t chunk = 0; chunk < item.num_chunks; ++chunk) {
    Bytes compressed = await_receive(transport.irecv(config.profile->content_tag), config.timeout,
                                     "chunk " + std::to_string(chunk + 1) + " of " + item.path);
    logger.debug("Received {} compressed bytes", compressed.size());
    Bytes data = gzip_decompress(compressed);
    logger.debug("Decompressed to {} bytes", data.size());
    staging.append(data);
    if(staging.bytes_written() > item.size) {
      staging.discard();
      throw IntegrityError("Received more than the declared " + std::to_string(item.size) +
                           " bytes for " + item.path);
    }
    meter.advance(data.size(), item.path, chunk + 1, item.num_chunks);
  }
  staging.verify(item.sha256, item.size, logger);
  staging.commit(logger);
}

Bytes receive_whole_message(Transport& transport,
                            const ManifestItem& item,
                            const TransferConfig& config,
                            ProgressMeter& meter) {
  Bytes compressed = await_receive(transport.irecv(config.profile->content_tag), config.timeout, item.path);
  if(compressed.size() != item.size) {
    throw TransferError("Size mismatch for " + item.path + ": expected " + std::to_string(item.size) +
                        " bytes, received " + std::to_string(compressed.size()));
  }
  meter.advance(compressed.size(), item.path, 1, 1);
  return gzip_decompress(compressed);
}

void receive_whole(Transport& transport,
                   const ManifestItem& item,
                   const fs::path& destination,
                   const TransferConfig& config,
                   ProgressMeter& meter,
                   Logger& logger) {
  StagingFile staging(destination);
  Bytes data = receive_whole_message(transport, item, config, meter);
  staging.append(data);
  staging.verify(item.sha256, data.size(), logger);
  staging.commit(logger);
}

void receive_archive_item(Transport& transport,
                          const ManifestItem& item,
                          const fs::path& destination,
                          const TransferConfig& config,
                          ProgressMeter& meter,
                          Logger& logger) {
  if(item.is_dir) {
    StagingDirectory staging(destination);
    Bytes archive = receive_whole_message(transport, item, config, meter);
    unpack_archive(archive, staging.path());
    staging.commit(logger);
    return;
  }
  StagingFile staging(destination);
  Bytes data = receive_whole_message(transport, item, config, meter);
  staging.append(data);
  staging.commit(logger);
}

} // namespace

void send_items(Transport& transport,
                SendPlan& plan,
                const TransferConfig& config,
                ProgressMeter& meter,
                Logger& logger) {
  const auto count = plan.entries.size();
  for(std::size_t i = 0; i < count; ++i) {
    auto& entry = plan.entries[i];
    logger.debug("Sending item {}/{}: {}", i + 1, count, entry.source.string());
    if(config.profile->mode == ProtocolMode::Stream) {
      send_chunked(transport, entry, config, meter, logger);
    } else {
      send_whole(transport, entry, config, meter, logger);
    }
  }
}

void receive_items(Transport& transport,
                   const TransferManifest& manifest,
                   const fs::path& root,
                   const TransferConfig& config,
                   ProgressMeter& meter,
                   Logger& logger) {
  if(config.profile->mode == ProtocolMode::Archive && !manifest.items.empty()) {
    logger.warn("Archive protocol carries no content hashes; received items are not verified");
  }
  const auto count = manifest.items.size();
  for(std::size_t i = 0; i < count; ++i) {
    const auto& item = manifest.items[i];
    auto destination = destination_for(root, item);
    logger.debug("Receiving item {}/{}: {}", i + 1, count, item.path);
    prepare_destination(destination);

    switch(config.profile->mode) {
      case ProtocolMode::Stream:
        receive_chunked(transport, item, destination, config, meter, logger);
        break;
      case ProtocolMode::Whole:
        receive_whole(transport, item, destination, config, meter, logger);
        break;
      case ProtocolMode::Archive:
        receive_archive_item(transport, item, destination, config, meter, logger);
        break;
    }
    logger.debug("Received {}", item.path);
  }
}
