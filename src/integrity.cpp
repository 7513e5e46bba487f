#include "integrity.hpp"
#include "errors.hpp"
#include "protocol.hpp"

#include <iomanip>
#include <random>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

fs::path staging_path_for(const fs::path& destination) {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  auto parent = destination.parent_path();
  auto name = destination.filename().string();
  for(int attempt = 0; attempt < 64; ++attempt) {
    std::ostringstream suffix;
    suffix << std::hex << std::setw(8) << std::setfill('0') << (rng() & 0xffffffffULL);
    auto candidate = parent / ("." + name + ".peerdrop-partial-" + suffix.str());
    if(!destination_exists(candidate)) return candidate;
  }
  throw TransferError("Unable to pick a staging name for " + destination.string());
}

void commit_staged_file(const fs::path& staged, const fs::path& destination) {
  std::error_code ec;
  fs::create_hard_link(staged, destination, ec);
  if(!ec) {
    std::error_code remove_ec;
    fs::remove(staged, remove_ec);
    return;
  }
  if(ec == std::errc::file_exists) {
    throw PathConflictError("File created during transfer: " + destination.string());
  }
  // Filesystems without hard links (FAT, some network mounts).
  if(destination_exists(destination)) {
    throw PathConflictError("File created during transfer: " + destination.string());
  }
  std::error_code rename_ec;
  fs::rename(staged, destination, rename_ec);
  if(rename_ec) {
    throw TransferError("Unable to move " + staged.string() + " to " + destination.string() +
                        ": " + rename_ec.message());
  }
}

StagingFile::StagingFile(fs::path destination)
  : destination_(std::move(destination)),
    path_(staging_path_for(destination_)) {
  out_.open(path_, std::ios::binary | std::ios::trunc);
  if(!out_) {
    throw TransferError("Cannot open staging file: " + path_.string());
  }
}

StagingFile::~StagingFile() {
  if(!committed_) discard();
}

void StagingFile::append(const Bytes& data) {
  out_.write(data.data(), static_cast<std::streamsize>(data.size()));
  if(!out_) {
    throw TransferError("Write failed on staging file " + path_.string());
  }
  hasher_.update(data);
  bytes_written_ += data.size();
}

void StagingFile::verify(const std::string& expected_sha256, uint64_t expected_size, Logger& logger) {
  auto received = hex_digest();
  logger.debug("Hash verification for {}: received={}, expected={}",
               destination_.string(), received, expected_sha256);
  if(received == expected_sha256 && bytes_written_ == expected_size) return;

  discard();
  if(received != expected_sha256) {
    throw IntegrityError("Hash mismatch for " + destination_.string() +
                         "! Expected: " + expected_sha256 + " Received: " + received);
  }
  throw IntegrityError("Size mismatch for " + destination_.string() + "! Expected " +
                       std::to_string(expected_size) + " bytes, received " +
                       std::to_string(bytes_written_));
}

void StagingFile::commit(Logger& logger) {
  out_.close();
  if(out_.fail()) {
    throw TransferError("Unable to flush staging file " + path_.string());
  }
  logger.debug("Moving {} to {}", path_.string(), destination_.string());
  commit_staged_file(path_, destination_);
  committed_ = true;
}

void StagingFile::discard() {
  if(out_.is_open()) out_.close();
  std::error_code ec;
  fs::remove(path_, ec);
}

StagingDirectory::StagingDirectory(fs::path destination)
  : destination_(std::move(destination)),
    path_(staging_path_for(destination_)) {
  std::error_code ec;
  if(!fs::create_directory(path_, ec) || ec) {
    throw TransferError("Cannot create staging directory " + path_.string() +
                        (ec ? ": " + ec.message() : std::string()));
  }
}

StagingDirectory::~StagingDirectory() {
  if(!committed_) discard();
}

void StagingDirectory::commit(Logger& logger) {
  if(destination_exists(destination_)) {
    throw PathConflictError("File created during transfer: " + destination_.string());
  }
  logger.debug("Moving {} to {}", path_.string(), destination_.string());
  std::error_code ec;
  fs::rename(path_, destination_, ec);
  if(ec) {
    throw TransferError("Unable to move " + path_.string() + " to " + destination_.string() +
                        ": " + ec.message());
  }
  committed_ = true;
}

void StagingDirectory::discard() {
  std::error_code ec;
  fs::remove_all(path_, ec);
}
