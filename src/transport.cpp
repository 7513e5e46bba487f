#include "transport.hpp"
#include "errors.hpp"

#include <openssl/evp.h>

#include <array>
#include <memory>

std::string node_id_from_seed(uint64_t seed) {
  std::string seed_bytes(8, '\0');
  for(int i = 0; i < 8; ++i) {
    seed_bytes[static_cast<std::size_t>(i)] = static_cast<char>((seed >> (56 - 8 * i)) & 0xff);
  }
  auto private_key = sha256_bytes(seed_bytes);

  std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key(
    EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, private_key.data(), private_key.size()),
    &EVP_PKEY_free);
  if(!key) {
    throw ConnectionError("Unable to derive node identity from seed");
  }
  std::vector<unsigned char> public_key(32);
  std::size_t length = public_key.size();
  if(EVP_PKEY_get_raw_public_key(key.get(), public_key.data(), &length) != 1) {
    throw ConnectionError("Unable to read node public key");
  }
  public_key.resize(length);
  return hex_from_bytes(public_key);
}

void TagMailbox::deliver(Tag tag, Bytes message) {
  std::lock_guard lg(m_);
  if(!failure_.empty()) return;
  auto& slot = slots_[tag];
  if(!slot.waiters.empty()) {
    auto waiter = std::move(slot.waiters.front());
    slot.waiters.pop_front();
    waiter.set_value(std::move(message));
    return;
  }
  slot.messages.push_back(std::move(message));
}

std::future<Bytes> TagMailbox::take(Tag tag) {
  std::lock_guard lg(m_);
  std::promise<Bytes> promise;
  auto future = promise.get_future();
  auto& slot = slots_[tag];
  if(!slot.messages.empty()) {
    promise.set_value(std::move(slot.messages.front()));
    slot.messages.pop_front();
  } else if(!failure_.empty()) {
    promise.set_exception(std::make_exception_ptr(TransferError(failure_)));
  } else {
    slot.waiters.push_back(std::move(promise));
  }
  return future;
}

void TagMailbox::fail_all(const std::string& reason) {
  std::lock_guard lg(m_);
  if(!failure_.empty()) return;
  failure_ = reason.empty() ? "transport closed" : reason;
  for(auto& entry : slots_) {
    for(auto& waiter : entry.second.waiters) {
      waiter.set_exception(std::make_exception_ptr(TransferError(failure_)));
    }
    entry.second.waiters.clear();
  }
}
