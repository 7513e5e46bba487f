#include "seed_derivation.hpp"
#include "transport.hpp"
#include "utils.hpp"

namespace {

uint64_t seed_from_digest(const std::vector<unsigned char>& digest) {
  uint64_t seed = 0;
  for(std::size_t i = 0; i < 8; ++i) {
    seed = (seed << 8) | digest[i];
  }
  return seed;
}

} // namespace

SeedPair derive_seeds(const std::string& token) {
  SeedPair pair;
  pair.sender_seed = seed_from_digest(sha256_bytes(token + "sender"));
  pair.receiver_seed = seed_from_digest(sha256_bytes(token + "receiver"));
  return pair;
}

std::string identity_preview(uint64_t seed) {
  return node_id_from_seed(seed);
}

std::string redact_token(const std::string& token) {
  if(token.size() < 20) return "<" + std::to_string(token.size()) + " chars>";
  return token.substr(0, 8) + "..." + token.substr(token.size() - 8);
}
