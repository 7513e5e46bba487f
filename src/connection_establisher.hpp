#pragma once
#include <chrono>
#include <string>

#include "log.hpp"
#include "transport.hpp"

inline constexpr std::chrono::milliseconds kReadinessPollInterval{100};

// Starts a connect to `peer_id` and polls readiness until the link is up or
// `num_retries` seconds have passed. Returns false on timeout; closing the
// transport is left to its owner.
bool establish_connection(Transport& transport,
                          const std::string& peer_id,
                          int num_retries,
                          Logger& logger);
