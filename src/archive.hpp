#pragma once
#include <filesystem>

#include "utils.hpp"

// Minimal POSIX ustar support for directory items: regular files and
// directories only. Member names are relative to the packed directory.

// Throws ConfigurationError when a name does not fit the ustar header and
// TransferError when a file cannot be read.
Bytes pack_directory(const std::filesystem::path& directory);

// Recreates the archived tree below `destination`, which must exist.
// Unsafe member paths, bad checksums and truncated input throw ProtocolError.
void unpack_archive(const Bytes& archive, const std::filesystem::path& destination);
