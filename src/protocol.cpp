#include "protocol.hpp"
#include "archive.hpp"
#include "compression.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <set>

namespace fs = std::filesystem;

namespace {

std::string lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
    [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return value;
}

const json& require_field(const json& item, std::size_t index, const char* field) {
  auto it = item.find(field);
  if(it == item.end()) {
    throw ProtocolError("Manifest item " + std::to_string(index) + " is missing '" + field + "'");
  }
  return *it;
}

ManifestItem parse_item(const json& entry, std::size_t index, ProtocolMode mode) {
  if(!entry.is_object()) {
    throw ProtocolError("Expected manifest item " + std::to_string(index) +
                        " to be an object, got " + entry.type_name());
  }
  ManifestItem item;

  const auto& path = require_field(entry, index, "path");
  if(!path.is_string()) {
    throw ProtocolError("Manifest item " + std::to_string(index) + ": 'path' must be a string");
  }
  item.path = path.get<std::string>();
  if(!is_safe_relative_path(item.path)) {
    throw ProtocolError("Manifest item " + std::to_string(index) + ": unsafe path '" + item.path + "'");
  }

  const auto& size = require_field(entry, index, "size");
  if(!size.is_number_unsigned()) {
    throw ProtocolError("Manifest item " + std::to_string(index) + ": 'size' must be a non-negative integer");
  }
  item.size = size.get<uint64_t>();

  if(mode == ProtocolMode::Stream || mode == ProtocolMode::Whole) {
    const auto& hash = require_field(entry, index, "sha256");
    if(!hash.is_string() || !looks_like_sha256_hex(hash.get<std::string>())) {
      throw ProtocolError("Manifest item " + std::to_string(index) + ": 'sha256' must be 64 hex digits");
    }
    item.sha256 = lower(hash.get<std::string>());
  }

  if(mode == ProtocolMode::Stream) {
    const auto& chunks = require_field(entry, index, "num_chunks");
    if(!chunks.is_number_unsigned() || chunks.get<uint64_t>() < 1) {
      throw ProtocolError("Manifest item " + std::to_string(index) + ": 'num_chunks' must be at least 1");
    }
    item.num_chunks = chunks.get<uint64_t>();
  }

  if(mode == ProtocolMode::Archive) {
    const auto& is_dir = require_field(entry, index, "is_dir");
    if(!is_dir.is_boolean()) {
      throw ProtocolError("Manifest item " + std::to_string(index) + ": 'is_dir' must be a boolean");
    }
    item.is_dir = is_dir.get<bool>();
  }
  return item;
}

// Two items may not share a path, and no item may sit below another item.
std::optional<std::string> find_path_clash(const std::vector<ManifestItem>& items) {
  std::set<std::string> paths;
  for(const auto& item : items) {
    if(!paths.insert(item.path).second) {
      return "Duplicate path '" + item.path + "'";
    }
  }
  for(const auto& item : items) {
    for(auto pos = item.path.find('/'); pos != std::string::npos; pos = item.path.find('/', pos + 1)) {
      if(paths.count(item.path.substr(0, pos))) {
        return "Path '" + item.path + "' is nested below another item";
      }
    }
  }
  return std::nullopt;
}

std::vector<fs::path> sorted_files_below(const fs::path& directory) {
  std::vector<fs::path> files;
  std::error_code ec;
  fs::recursive_directory_iterator it(directory, ec);
  if(ec) {
    throw ConfigurationError("Unable to read directory " + directory.string() + ": " + ec.message());
  }
  // increment(ec) so an unreadable subdirectory becomes a session error.
  for(const fs::recursive_directory_iterator end{}; it != end; ) {
    const fs::directory_entry entry = *it;
    it.increment(ec);
    if(ec) {
      throw ConfigurationError("Unable to read directory " + directory.string() + ": " + ec.message());
    }
    std::error_code status_ec;
    if(entry.is_regular_file(status_ec)) {
      files.push_back(entry.path());
    }
  }
  std::sort(files.begin(), files.end(), [&directory](const fs::path& a, const fs::path& b){
    return a.lexically_relative(directory).generic_string() < b.lexically_relative(directory).generic_string();
  });
  return files;
}

SendPlanEntry plan_file(const fs::path& source,
                        const std::string& relative_path,
                        uint64_t chunk_size,
                        ProtocolMode mode,
                        Logger& logger) {
  SendPlanEntry entry;
  entry.source = source;
  entry.item.path = relative_path;

  if(mode == ProtocolMode::Stream) {
    std::error_code ec;
    entry.raw_size = fs::file_size(source, ec);
    if(ec) {
      throw ConfigurationError("Unable to stat " + source.string() + ": " + ec.message());
    }
    auto hash = compute_file_hash(source);
    if(!hash) {
      throw ConfigurationError("Unable to read " + source.string());
    }
    entry.item.size = entry.raw_size;
    entry.item.sha256 = *hash;
    entry.item.num_chunks = chunk_count_for(entry.raw_size, chunk_size);
    logger.debug("File {}: {} bytes, SHA256: {}", source.string(), entry.raw_size, entry.item.sha256);
    return entry;
  }

  Bytes raw = read_file_bytes(source);
  entry.raw_size = raw.size();
  if(mode == ProtocolMode::Whole) {
    entry.item.sha256 = sha256_hex(raw);
  }
  entry.payload = gzip_compress(raw);
  entry.item.size = entry.payload->size();
  logger.debug("File {}: {} bytes, {} compressed", source.string(), entry.raw_size, entry.item.size);
  return entry;
}

} // namespace

const ProtocolProfile& profile_for(ProtocolMode mode) {
  switch(mode) {
    case ProtocolMode::Stream: return kStreamProfile;
    case ProtocolMode::Whole: return kWholeProfile;
    case ProtocolMode::Archive: return kArchiveProfile;
  }
  return kStreamProfile;
}

void check_chunk_size(uint64_t chunk_size) {
  if(chunk_size == 0) {
    throw ConfigurationError("Chunk size must be greater than zero");
  }
  if(chunk_size > kMaxChunkSize) {
    throw ConfigurationError("Chunk size " + format_size(chunk_size) + " exceeds the " +
                             format_size(kMaxChunkSize) + " limit");
  }
}

const ProtocolProfile& parse_protocol_mode(const std::string& name) {
  auto key = lower(name);
  for(auto mode : {ProtocolMode::Stream, ProtocolMode::Whole, ProtocolMode::Archive}) {
    const auto& profile = profile_for(mode);
    if(key == profile.name) return profile;
  }
  throw ConfigurationError("Unknown protocol '" + name + "' (expected stream, whole or archive)");
}

uint64_t TransferManifest::total_size() const {
  uint64_t total = 0;
  for(const auto& item : items) total += item.size;
  return total;
}

json manifest_to_json(const TransferManifest& manifest, const ProtocolProfile& profile) {
  json items = json::array();
  for(const auto& item : manifest.items) {
    json j;
    j["path"] = item.path;
    j["size"] = item.size;
    switch(profile.mode) {
      case ProtocolMode::Stream:
        j["sha256"] = item.sha256;
        j["num_chunks"] = item.num_chunks;
        break;
      case ProtocolMode::Whole:
        j["sha256"] = item.sha256;
        break;
      case ProtocolMode::Archive:
        j["is_dir"] = item.is_dir;
        break;
    }
    items.push_back(std::move(j));
  }
  json j;
  j["version"] = manifest.version;
  j["items"] = std::move(items);
  return j;
}

Bytes encode_manifest(const TransferManifest& manifest, const ProtocolProfile& profile) {
  auto text = manifest_to_json(manifest, profile).dump();
  return Bytes(text.begin(), text.end());
}

TransferManifest decode_manifest(const Bytes& message, const ProtocolProfile& profile) {
  json doc;
  try {
    doc = json::parse(message.begin(), message.end());
  } catch(const json::exception& e) {
    throw ProtocolError(std::string("Manifest is not valid JSON: ") + e.what());
  }
  if(!doc.is_object()) {
    throw ProtocolError(std::string("Expected manifest to be an object, got ") + doc.type_name());
  }

  auto version = doc.find("version");
  std::string received = (version != doc.end() && version->is_string())
    ? version->get<std::string>()
    : (version == doc.end() ? std::string("<missing>") : version->dump());
  if(received != profile.version) {
    throw ProtocolError("Version mismatch! Receiver version: " + std::string(profile.version) +
                        ", Sender version: " + received);
  }

  auto items = doc.find("items");
  if(items == doc.end() || !items->is_array()) {
    throw ProtocolError("Expected manifest 'items' to be an array");
  }

  TransferManifest manifest;
  manifest.version = received;
  manifest.items.reserve(items->size());
  for(std::size_t i = 0; i < items->size(); ++i) {
    manifest.items.push_back(parse_item((*items)[i], i, profile.mode));
  }
  if(auto clash = find_path_clash(manifest.items)) {
    throw ProtocolError("Invalid manifest: " + *clash);
  }
  return manifest;
}

std::string resolve_transfer_name(const fs::path& argument) {
  auto name = argument.filename().string();
  if(!name.empty() && name != "." && name != "..") return name;

  std::error_code ec;
  auto resolved = fs::weakly_canonical(fs::absolute(argument, ec), ec);
  if(ec) resolved = fs::absolute(argument).lexically_normal();
  auto resolved_name = resolved.filename().string();
  if(resolved_name.empty() && resolved.has_parent_path() && resolved != resolved.root_path()) {
    resolved_name = resolved.parent_path().filename().string();
  }
  return resolved_name.empty() || resolved_name == "." || resolved_name == ".." ? "root" : resolved_name;
}

SendPlan build_send_plan(const std::vector<std::string>& arguments,
                         uint64_t chunk_size,
                         const ProtocolProfile& profile,
                         Logger& logger) {
  if(arguments.empty()) {
    throw ConfigurationError("No files or directories to send");
  }
  SendPlan plan;
  plan.manifest.version = profile.version;

  auto add = [&](SendPlanEntry entry){
    plan.manifest.items.push_back(entry.item);
    plan.entries.push_back(std::move(entry));
  };

  for(const auto& argument : arguments) {
    fs::path path(argument);
    std::error_code ec;
    auto status = fs::status(path, ec);
    logger.debug("Processing: {}", argument);
    if(ec || !fs::exists(status)) {
      throw ConfigurationError("File/directory does not exist: " + argument);
    }

    std::string name = resolve_transfer_name(path);
    if(fs::is_directory(status)) {
      if(profile.mode == ProtocolMode::Archive) {
        SendPlanEntry entry;
        entry.source = path;
        entry.item.path = name;
        entry.item.is_dir = true;
        Bytes archive = pack_directory(path);
        entry.raw_size = archive.size();
        entry.payload = gzip_compress(archive);
        entry.item.size = entry.payload->size();
        logger.debug("Directory {}: {} byte archive, {} compressed", argument, entry.raw_size, entry.item.size);
        add(std::move(entry));
        continue;
      }
      logger.debug("Walking directory tree: {}", argument);
      for(const auto& file : sorted_files_below(path)) {
        auto relative = name + "/" + file.lexically_relative(path).generic_string();
        add(plan_file(file, relative, chunk_size, profile.mode, logger));
      }
      continue;
    }
    if(!fs::is_regular_file(status)) {
      throw ConfigurationError("Not a regular file or directory: " + argument);
    }
    add(plan_file(path, name, chunk_size, profile.mode, logger));
  }
  if(auto clash = find_path_clash(plan.manifest.items)) {
    throw ConfigurationError("Transfer arguments collide: " + *clash);
  }
  return plan;
}

fs::path destination_for(const fs::path& root, const ManifestItem& item) {
  return root / fs::path(item.path);
}

bool destination_exists(const fs::path& destination) {
  std::error_code ec;
  return fs::exists(fs::symlink_status(destination, ec));
}

void check_destinations_clear(const fs::path& root, const TransferManifest& manifest) {
  for(const auto& item : manifest.items) {
    if(destination_exists(destination_for(root, item))) {
      throw PathConflictError("File already exists: " + item.path);
    }
  }
}
