#pragma once
#include <openssl/evp.h>
#include <openssl/sha.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using Bytes = std::vector<char>;

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::vector<unsigned char> sha256_bytes(const std::string &data);
std::string sha256_hex(const std::string &data);
std::string sha256_hex(const Bytes &data);
std::optional<std::string> compute_file_hash(const std::filesystem::path& file);
bool looks_like_sha256_hex(const std::string& value);

// Incremental SHA-256 over a stream of chunks.
class Sha256Stream {
public:
  Sha256Stream();
  void update(const char* data, std::size_t size);
  void update(const Bytes& data) { update(data.data(), data.size()); }
  std::string hex_digest();

private:
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx_;
  bool finished_ = false;
  std::string digest_;
};

// "1k", "1.5M", "3g", "100" -> bytes (k=1024, m=1024^2, g=1024^3).
// Throws ConfigurationError on malformed input.
uint64_t parse_size(const std::string& size_str);
std::string format_size(uint64_t bytes);
uint64_t chunk_count_for(uint64_t size, uint64_t chunk_size);

// '/'-separated, not absolute, no empty, "." or ".." components.
bool is_safe_relative_path(const std::string& path);
// Throws TransferError when the file cannot be read.
Bytes read_file_bytes(const std::filesystem::path& file);
