#include "connection_establisher.hpp"

#include <algorithm>
#include <thread>

bool establish_connection(Transport& transport,
                          const std::string& peer_id,
                          int num_retries,
                          Logger& logger) {
  logger.debug("Connecting to {} (retries {})", peer_id, num_retries);
  transport.connect(peer_id, num_retries);

  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(std::max(0, num_retries));
  while(!transport.is_ready()) {
    if(std::chrono::steady_clock::now() >= deadline) {
      logger.debug("Peer {} not ready after {}s", peer_id, num_retries);
      return false;
    }
    std::this_thread::sleep_for(kReadinessPollInterval);
  }
  logger.debug("Connected to {}", peer_id);
  return true;
}
