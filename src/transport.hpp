#pragma once
#include <chrono>
#include <cstdint>
#include <deque>
#include <exception>
#include <future>
#include <map>
#include <mutex>
#include <string>

#include "utils.hpp"

using Tag = uint32_t;

// Public identity of a node built from `seed`: hex Ed25519 public key whose
// private key is SHA-256 of the seed's 8 big-endian bytes. Pure.
std::string node_id_from_seed(uint64_t seed);

// Opaque point-to-point messaging link. Messages are whole byte blobs,
// delivered in order per tag. send/receive return futures the caller waits on
// with its own timeout; transport failures surface as exceptions stored in
// the futures.
class Transport {
public:
  virtual ~Transport() = default;

  virtual std::string node_id() const = 0;

  // Non-blocking. Starts establishing a link to `peer_id`, trying for up to
  // `num_retries` attempts. Poll is_ready() for the outcome.
  virtual void connect(const std::string& peer_id, int num_retries) = 0;
  virtual bool is_ready() const = 0;

  virtual std::future<void> isend(Bytes message, Tag tag, std::chrono::milliseconds latency) = 0;
  virtual std::future<Bytes> irecv(Tag tag) = 0;

  // Idempotent. Pending receives fail with TransferError.
  virtual void close() = 0;
};

// Per-tag FIFO of delivered messages matched against waiting receivers.
class TagMailbox {
public:
  void deliver(Tag tag, Bytes message);
  std::future<Bytes> take(Tag tag);
  // Fails every waiting receiver and every later take().
  void fail_all(const std::string& reason);

private:
  struct Slot {
    std::deque<Bytes> messages;
    std::deque<std::promise<Bytes>> waiters;
  };

  std::mutex m_;
  std::map<Tag, Slot> slots_;
  std::string failure_;
};
