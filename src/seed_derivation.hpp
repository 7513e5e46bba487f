#pragma once
#include <cstdint>
#include <string>

struct SeedPair {
  uint64_t sender_seed = 0;
  uint64_t receiver_seed = 0;
};

// First 8 bytes (big-endian) of SHA-256(token + "sender") and
// SHA-256(token + "receiver").
SeedPair derive_seeds(const std::string& token);

// Identity a transport built from `seed` would present, without opening one.
std::string identity_preview(uint64_t seed);

// Token rendered safe for debug logs.
std::string redact_token(const std::string& token);
