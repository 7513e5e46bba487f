#pragma once
#include "utils.hpp"

// Whole-buffer gzip (RFC 1952) via zlib. Each chunk is an independent member.
Bytes gzip_compress(const Bytes& input, int level = 6);

// Throws TransferError on corrupt or truncated input.
Bytes gzip_decompress(const Bytes& input);
