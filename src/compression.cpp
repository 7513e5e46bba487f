#include "compression.hpp"
#include "errors.hpp"

#include <zlib.h>

#include <limits>

namespace {

constexpr int kGzipWindowBits = 15 + 16;
constexpr std::size_t kInflateStep = 64 * 1024;

std::string zlib_message(const z_stream& stream, int code) {
  if(stream.msg) return stream.msg;
  return "zlib error " + std::to_string(code);
}

} // namespace

Bytes gzip_compress(const Bytes& input, int level) {
  if(input.size() > std::numeric_limits<uInt>::max()) {
    throw TransferError("chunk too large to compress");
  }
  z_stream stream{};
  int rc = deflateInit2(&stream, level, Z_DEFLATED, kGzipWindowBits, 8, Z_DEFAULT_STRATEGY);
  if(rc != Z_OK) {
    throw TransferError("deflateInit2 failed: " + zlib_message(stream, rc));
  }

  Bytes output(deflateBound(&stream, static_cast<uLong>(input.size())));
  stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
  stream.avail_in = static_cast<uInt>(input.size());
  stream.next_out = reinterpret_cast<Bytef*>(output.data());
  stream.avail_out = static_cast<uInt>(output.size());

  rc = deflate(&stream, Z_FINISH);
  std::size_t produced = stream.total_out;
  deflateEnd(&stream);
  if(rc != Z_STREAM_END) {
    throw TransferError("gzip compression failed: " + std::to_string(rc));
  }
  output.resize(produced);
  return output;
}

Bytes gzip_decompress(const Bytes& input) {
  if(input.size() > std::numeric_limits<uInt>::max()) {
    throw TransferError("compressed chunk too large");
  }
  z_stream stream{};
  int rc = inflateInit2(&stream, kGzipWindowBits);
  if(rc != Z_OK) {
    throw TransferError("inflateInit2 failed: " + zlib_message(stream, rc));
  }

  Bytes output;
  stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
  stream.avail_in = static_cast<uInt>(input.size());
  do {
    std::size_t offset = output.size();
    output.resize(offset + kInflateStep);
    stream.next_out = reinterpret_cast<Bytef*>(output.data() + offset);
    stream.avail_out = static_cast<uInt>(kInflateStep);
    rc = inflate(&stream, Z_NO_FLUSH);
    if(rc != Z_OK && rc != Z_STREAM_END) {
      std::string message = zlib_message(stream, rc);
      inflateEnd(&stream);
      throw TransferError("Failed to decompress chunk: " + message);
    }
    output.resize(offset + (kInflateStep - stream.avail_out));
    if(rc == Z_OK && stream.avail_in == 0 && stream.avail_out != 0) {
      inflateEnd(&stream);
      throw TransferError("Failed to decompress chunk: truncated gzip stream");
    }
  } while(rc != Z_STREAM_END);

  bool trailing = stream.avail_in != 0;
  inflateEnd(&stream);
  if(trailing) {
    throw TransferError("Failed to decompress chunk: trailing data after gzip stream");
  }
  return output;
}
