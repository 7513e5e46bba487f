#pragma once
#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "log.hpp"
#include "transport.hpp"
#include "utils.hpp"

using json = nlohmann::json;

enum class ProtocolMode {
  Stream,
  Whole,
  Archive
};

// Wire contract of one transfer strategy. Sender and receiver must agree on
// the mode; the manifest version makes a mismatch fail before any content.
struct ProtocolProfile {
  ProtocolMode mode;
  const char* name;
  const char* version;
  Tag manifest_tag;
  Tag content_tag;
};

inline constexpr ProtocolProfile kStreamProfile{ProtocolMode::Stream, "stream", "2.1.1", 0, 0};
inline constexpr ProtocolProfile kWholeProfile{ProtocolMode::Whole, "whole", "2.0.0", 0, 1};
inline constexpr ProtocolProfile kArchiveProfile{ProtocolMode::Archive, "archive", "1.0.0", 0, 1};

inline constexpr uint64_t kDefaultChunkSize = 5ULL * 1024 * 1024;
// A gzip'd chunk of this size still fits one 2 GiB transport frame and
// zlib's 32-bit buffer lengths.
inline constexpr uint64_t kMaxChunkSize = 1ULL * 1024 * 1024 * 1024;

// ConfigurationError unless 0 < chunk_size <= kMaxChunkSize.
void check_chunk_size(uint64_t chunk_size);

const ProtocolProfile& profile_for(ProtocolMode mode);
// "stream", "whole" or "archive" (case-insensitive); ConfigurationError otherwise.
const ProtocolProfile& parse_protocol_mode(const std::string& name);

// One transferable unit. Which fields travel depends on the mode:
//   stream:  path, size (raw), sha256, num_chunks
//   whole:   path, size (compressed), sha256
//   archive: path, size (compressed), is_dir
struct ManifestItem {
  std::string path;
  uint64_t size = 0;
  std::string sha256;
  uint64_t num_chunks = 1;
  bool is_dir = false;
};

struct TransferManifest {
  std::string version;
  std::vector<ManifestItem> items;

  uint64_t total_size() const;
};

json manifest_to_json(const TransferManifest& manifest, const ProtocolProfile& profile);
Bytes encode_manifest(const TransferManifest& manifest, const ProtocolProfile& profile);

// Parses and validates a received manifest. Every structural problem,
// including a version other than the profile's, is a ProtocolError.
TransferManifest decode_manifest(const Bytes& message, const ProtocolProfile& profile);

// Name a transfer argument travels under: its base name, or for ".", ".."
// and trailing-slash paths the resolved directory name ("root" for /).
std::string resolve_transfer_name(const std::filesystem::path& argument);

struct SendPlanEntry {
  std::filesystem::path source;
  ManifestItem item;
  uint64_t raw_size = 0;
  // Whole-message modes compress before the manifest is sent (the manifest
  // carries the compressed size), so the payload is kept for sending.
  std::optional<Bytes> payload;
};

struct SendPlan {
  TransferManifest manifest;
  std::vector<SendPlanEntry> entries;
};

// Walks the transfer arguments and builds the manifest in streaming order.
// Missing arguments and duplicate relative paths are ConfigurationErrors.
SendPlan build_send_plan(const std::vector<std::string>& arguments,
                         uint64_t chunk_size,
                         const ProtocolProfile& profile,
                         Logger& logger);

std::filesystem::path destination_for(const std::filesystem::path& root, const ManifestItem& item);

// Throws PathConflictError naming the first item whose destination exists.
void check_destinations_clear(const std::filesystem::path& root, const TransferManifest& manifest);
bool destination_exists(const std::filesystem::path& destination);
