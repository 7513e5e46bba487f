#include "archive.hpp"
#include "errors.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <ctime>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kBlockSize = 512;
constexpr uint64_t kMaxMemberSize = 077777777777ULL;

struct Member {
  std::string name;
  bool is_dir = false;
  fs::path source;
};

void write_octal(char* field, std::size_t width, uint64_t value) {
  // width includes the trailing NUL
  std::string digits(width - 1, '0');
  for(std::size_t i = width - 1; i-- > 0 && value > 0;) {
    digits[i] = static_cast<char>('0' + (value & 7));
    value >>= 3;
  }
  std::memcpy(field, digits.data(), digits.size());
  field[width - 1] = '\0';
}

uint64_t read_octal(const char* field, std::size_t width) {
  uint64_t value = 0;
  std::size_t i = 0;
  while(i < width && (field[i] == ' ' || field[i] == '\0')) ++i;
  for(; i < width; ++i) {
    char c = field[i];
    if(c == '\0' || c == ' ') break;
    if(c < '0' || c > '7') {
      throw ProtocolError("Malformed archive header: bad octal field");
    }
    value = (value << 3) | static_cast<uint64_t>(c - '0');
  }
  return value;
}

std::string read_field(const char* field, std::size_t width) {
  std::size_t len = 0;
  while(len < width && field[len] != '\0') ++len;
  return std::string(field, len);
}

unsigned header_checksum(const std::array<char, kBlockSize>& header) {
  unsigned sum = 0;
  for(std::size_t i = 0; i < kBlockSize; ++i) {
    bool in_checksum_field = i >= 148 && i < 156;
    sum += in_checksum_field ? static_cast<unsigned>(' ') : static_cast<unsigned char>(header[i]);
  }
  return sum;
}

void split_name(const std::string& name, std::string& prefix, std::string& base) {
  if(name.size() <= 100) {
    prefix.clear();
    base = name;
    return;
  }
  for(std::size_t pos = name.find('/'); pos != std::string::npos; pos = name.find('/', pos + 1)) {
    if(pos <= 155 && name.size() - pos - 1 <= 100 && pos + 1 < name.size()) {
      prefix = name.substr(0, pos);
      base = name.substr(pos + 1);
      return;
    }
  }
  throw ConfigurationError("Path too long for archive: " + name);
}

void append_header(Bytes& out, const std::string& name, bool is_dir, uint64_t size, unsigned mode) {
  if(size > kMaxMemberSize) {
    throw ConfigurationError("File too large for archive: " + name);
  }
  std::string prefix;
  std::string base;
  split_name(name, prefix, base);

  std::array<char, kBlockSize> header{};
  std::memcpy(header.data(), base.data(), base.size());
  write_octal(header.data() + 100, 8, mode);
  write_octal(header.data() + 108, 8, 0);
  write_octal(header.data() + 116, 8, 0);
  write_octal(header.data() + 124, 12, size);
  write_octal(header.data() + 136, 12, static_cast<uint64_t>(std::time(nullptr)));
  header[156] = is_dir ? '5' : '0';
  std::memcpy(header.data() + 257, "ustar", 6);
  std::memcpy(header.data() + 263, "00", 2);
  std::memcpy(header.data() + 345, prefix.data(), prefix.size());

  write_octal(header.data() + 148, 7, header_checksum(header));
  header[155] = ' ';
  out.insert(out.end(), header.begin(), header.end());
}

void pad_to_block(Bytes& out) {
  std::size_t remainder = out.size() % kBlockSize;
  if(remainder != 0) {
    out.insert(out.end(), kBlockSize - remainder, '\0');
  }
}

std::vector<Member> collect_members(const fs::path& directory) {
  std::vector<Member> members;
  std::error_code ec;
  fs::recursive_directory_iterator it(directory, ec);
  if(ec) {
    throw TransferError("Unable to read directory " + directory.string() + ": " + ec.message());
  }
  // increment(ec) so an unreadable subdirectory becomes a session error.
  for(const fs::recursive_directory_iterator end{}; it != end; ) {
    const fs::directory_entry entry = *it;
    it.increment(ec);
    if(ec) {
      throw TransferError("Unable to read directory " + directory.string() + ": " + ec.message());
    }
    std::error_code status_ec;
    bool is_dir = entry.is_directory(status_ec);
    bool is_file = !is_dir && entry.is_regular_file(status_ec);
    if(!is_dir && !is_file) continue;
    Member member;
    member.name = entry.path().lexically_relative(directory).generic_string();
    member.is_dir = is_dir;
    member.source = entry.path();
    members.push_back(std::move(member));
  }
  std::sort(members.begin(), members.end(),
    [](const Member& a, const Member& b){ return a.name < b.name; });
  return members;
}

} // namespace

Bytes pack_directory(const fs::path& directory) {
  Bytes out;
  for(const auto& member : collect_members(directory)) {
    if(member.is_dir) {
      append_header(out, member.name, true, 0, 0755);
      continue;
    }
    Bytes content = read_file_bytes(member.source);
    append_header(out, member.name, false, content.size(), 0644);
    out.insert(out.end(), content.begin(), content.end());
    pad_to_block(out);
  }
  out.insert(out.end(), 2 * kBlockSize, '\0');
  return out;
}

void unpack_archive(const Bytes& archive, const fs::path& destination) {
  std::size_t offset = 0;
  while(offset + kBlockSize <= archive.size()) {
    std::array<char, kBlockSize> header{};
    std::memcpy(header.data(), archive.data() + offset, kBlockSize);
    offset += kBlockSize;

    if(std::all_of(header.begin(), header.end(), [](char c){ return c == '\0'; })) {
      return;
    }
    if(read_octal(header.data() + 148, 8) != header_checksum(header)) {
      throw ProtocolError("Malformed archive: header checksum mismatch");
    }

    std::string name = read_field(header.data(), 100);
    std::string prefix = read_field(header.data() + 345, 155);
    if(!prefix.empty()) name = prefix + "/" + name;
    while(!name.empty() && name.back() == '/') name.pop_back();
    if(!is_safe_relative_path(name)) {
      throw ProtocolError("Unsafe path in archive: '" + name + "'");
    }

    uint64_t size = read_octal(header.data() + 124, 12);
    char type = header[156];
    fs::path target = destination / fs::path(name);
    std::error_code ec;

    if(type == '5') {
      fs::create_directories(target, ec);
      if(ec) {
        throw TransferError("Unable to create " + target.string() + ": " + ec.message());
      }
      continue;
    }
    if(type != '0' && type != '\0') {
      throw ProtocolError("Unsupported archive member type for '" + name + "'");
    }
    if(size > archive.size() - offset) {
      throw ProtocolError("Malformed archive: truncated member '" + name + "'");
    }
    fs::create_directories(target.parent_path(), ec);
    if(ec) {
      throw TransferError("Unable to create " + target.parent_path().string() + ": " + ec.message());
    }
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if(!out) {
      throw TransferError("Unable to write " + target.string());
    }
    out.write(archive.data() + offset, static_cast<std::streamsize>(size));
    if(!out) {
      throw TransferError("Unable to write " + target.string());
    }
    offset += static_cast<std::size_t>((size + kBlockSize - 1) / kBlockSize * kBlockSize);
  }
  throw ProtocolError("Malformed archive: missing end-of-archive marker");
}
