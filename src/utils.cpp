#include "utils.hpp"
#include "errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <stdexcept>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::vector<unsigned char> sha256_bytes(const std::string &data){
    std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
    unsigned int length = 0;
    if(EVP_Digest(data.data(), data.size(), out.data(), &length, EVP_sha256(), nullptr) != 1) {
      throw std::runtime_error("SHA-256 digest failed");
    }
    return out;
}

std::string sha256_hex(const std::string &data){
    return hex_from_bytes(sha256_bytes(data));
}

std::string sha256_hex(const Bytes &data){
    Sha256Stream hasher;
    hasher.update(data);
    return hasher.hex_digest();
}

std::optional<std::string> compute_file_hash(const std::filesystem::path& file) {
  std::ifstream in(file, std::ios::binary);
  if(!in) return std::nullopt;

  Sha256Stream hasher;
  std::array<char, 8192> buffer{};
  while(in) {
    in.read(buffer.data(), buffer.size());
    std::streamsize read = in.gcount();
    if(read > 0) {
      hasher.update(buffer.data(), static_cast<std::size_t>(read));
    }
  }
  if(in.bad()) return std::nullopt;
  return hasher.hex_digest();
}

bool looks_like_sha256_hex(const std::string& value) {
  if(value.size() != SHA256_DIGEST_LENGTH * 2) return false;
  for(char c : value) {
    if(!std::isxdigit(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

Sha256Stream::Sha256Stream() : ctx_(EVP_MD_CTX_new(), &EVP_MD_CTX_free) {
  if(!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("Unable to initialise SHA-256");
  }
}

void Sha256Stream::update(const char* data, std::size_t size) {
  if(size == 0 || finished_) return;
  if(EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
    throw std::runtime_error("SHA-256 update failed");
  }
}

std::string Sha256Stream::hex_digest() {
  if(!finished_) {
    std::vector<unsigned char> digest(EVP_MAX_MD_SIZE);
    unsigned int length = 0;
    if(EVP_DigestFinal_ex(ctx_.get(), digest.data(), &length) != 1) {
      throw std::runtime_error("SHA-256 finalisation failed");
    }
    digest.resize(length);
    digest_ = hex_from_bytes(digest);
    finished_ = true;
  }
  return digest_;
}

namespace {

std::string trim_copy(std::string value) {
  value.erase(value.begin(), std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
  return value;
}

// Plain decimal only: digits, at most one '.', optional e/E exponent.
bool is_decimal_literal(const std::string& text) {
  std::size_t i = 0;
  if(i < text.size() && text[i] == '+') ++i;
  std::size_t digits = 0;
  bool seen_dot = false;
  for(; i < text.size(); ++i) {
    char c = text[i];
    if(std::isdigit(static_cast<unsigned char>(c))) {
      ++digits;
    } else if(c == '.' && !seen_dot) {
      seen_dot = true;
    } else {
      break;
    }
  }
  if(digits == 0) return false;
  if(i == text.size()) return true;
  if(text[i] != 'e' && text[i] != 'E') return false;
  ++i;
  if(i < text.size() && (text[i] == '+' || text[i] == '-')) ++i;
  std::size_t exponent_digits = 0;
  for(; i < text.size() && std::isdigit(static_cast<unsigned char>(text[i])); ++i) ++exponent_digits;
  return exponent_digits > 0 && i == text.size();
}

double parse_size_number(const std::string& number_str, const std::string& original) {
  if(!is_decimal_literal(number_str)) {
    throw ConfigurationError("Invalid size format: " + original);
  }
  double number = 0.0;
  try {
    number = std::stod(number_str);
  } catch(const std::exception&) {
    throw ConfigurationError("Invalid size format: " + original);
  }
  if(!std::isfinite(number)) {
    throw ConfigurationError("Invalid size format: " + original);
  }
  return number;
}

} // namespace

uint64_t parse_size(const std::string& size_str) {
  std::string clean = trim_copy(size_str);
  if(clean.empty()) {
    throw ConfigurationError("Invalid size format: empty string");
  }

  uint64_t multiplier = 1;
  std::string number_str = clean;
  switch(std::tolower(static_cast<unsigned char>(clean.back()))) {
    case 'k': multiplier = 1024ULL; break;
    case 'm': multiplier = 1024ULL * 1024ULL; break;
    case 'g': multiplier = 1024ULL * 1024ULL * 1024ULL; break;
    default: break;
  }
  if(multiplier != 1) {
    number_str.pop_back();
  }

  double number = parse_size_number(trim_copy(number_str), clean);
  double bytes = number * static_cast<double>(multiplier);
  if(bytes >= 18446744073709551616.0) {
    throw ConfigurationError("Size out of range: " + clean);
  }
  return static_cast<uint64_t>(bytes);
}

std::string format_size(uint64_t bytes) {
  if(bytes < 1024) {
    return std::to_string(bytes) + "b";
  }

  static const char* suffixes[] = {"B", "K", "M", "G", "T", "P"};
  constexpr std::size_t suffix_count = sizeof(suffixes) / sizeof(suffixes[0]);
  double value = static_cast<double>(bytes);
  size_t idx = 0;
  while(idx + 1 < suffix_count && value >= 1024.0) {
    value /= 1024.0;
    ++idx;
  }

  std::ostringstream oss;
  oss << std::fixed << std::setprecision(value >= 100 ? 0 : (value >= 10 ? 1 : 2)) << value;
  std::string out = oss.str();
  if(out.find('.') != std::string::npos) {
    while(!out.empty() && out.back() == '0') out.pop_back();
    if(!out.empty() && out.back() == '.') out.pop_back();
  }
  return out + suffixes[idx];
}

uint64_t chunk_count_for(uint64_t size, uint64_t chunk_size) {
  if(chunk_size == 0) {
    throw ConfigurationError("Chunk size must be greater than zero");
  }
  if(size == 0) return 1;
  return (size + chunk_size - 1) / chunk_size;
}

bool is_safe_relative_path(const std::string& path) {
  if(path.empty() || path.front() == '/' || path.find('\\') != std::string::npos) return false;
  if(path.find('\0') != std::string::npos) return false;
  std::size_t start = 0;
  while(start <= path.size()) {
    std::size_t end = path.find('/', start);
    if(end == std::string::npos) end = path.size();
    std::string component = path.substr(start, end - start);
    if(component.empty() || component == "." || component == "..") return false;
    start = end + 1;
  }
  return true;
}

Bytes read_file_bytes(const std::filesystem::path& file) {
  std::ifstream in(file, std::ios::binary);
  if(!in) {
    throw TransferError("Unable to open " + file.string());
  }
  Bytes data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if(in.bad()) {
    throw TransferError("Unable to read " + file.string());
  }
  return data;
}
