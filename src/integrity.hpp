#pragma once
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

#include "log.hpp"
#include "utils.hpp"

// Receive-side scratch file next to its destination. Bytes appended are
// hashed as they are written. Unless commit() succeeds the file is removed
// when the object goes away.
class StagingFile {
public:
  explicit StagingFile(std::filesystem::path destination);
  ~StagingFile();

  StagingFile(const StagingFile&) = delete;
  StagingFile& operator=(const StagingFile&) = delete;

  void append(const Bytes& data);

  uint64_t bytes_written() const { return bytes_written_; }
  std::string hex_digest() { return hasher_.hex_digest(); }
  const std::filesystem::path& path() const { return path_; }
  const std::filesystem::path& destination() const { return destination_; }

  // Compares the running digest and byte count with what the manifest
  // declared. Mismatch removes the file and throws IntegrityError.
  void verify(const std::string& expected_sha256, uint64_t expected_size, Logger& logger);

  // No-overwrite move onto the destination; PathConflictError if it exists.
  void commit(Logger& logger);
  void discard();

private:
  std::filesystem::path destination_;
  std::filesystem::path path_;
  std::ofstream out_;
  Sha256Stream hasher_;
  uint64_t bytes_written_ = 0;
  bool committed_ = false;
};

// Same contract for directory items unpacked from an archive.
class StagingDirectory {
public:
  explicit StagingDirectory(std::filesystem::path destination);
  ~StagingDirectory();

  StagingDirectory(const StagingDirectory&) = delete;
  StagingDirectory& operator=(const StagingDirectory&) = delete;

  const std::filesystem::path& path() const { return path_; }
  void commit(Logger& logger);
  void discard();

private:
  std::filesystem::path destination_;
  std::filesystem::path path_;
  bool committed_ = false;
};

// Hard-link `staged` to `destination` (fails if it exists), then unlink
// `staged`. Falls back to exists-check plus rename where links are unsupported.
void commit_staged_file(const std::filesystem::path& staged, const std::filesystem::path& destination);

// Unused sibling name for `destination`: ".<name>.peerdrop-partial-<hex>".
std::filesystem::path staging_path_for(const std::filesystem::path& destination);
