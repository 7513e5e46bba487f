#pragma once
#include <asio.hpp>

#include <array>
#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "log.hpp"
#include "transport.hpp"

// Transport over a single TCP connection. The side with a peer_addr dials,
// the other accepts. Both ends announce their node id in a handshake frame;
// the link counts as ready once the announced id is the expected one.
// Wire frame: tag (u32 BE) | length (u64 BE) | payload.
class TcpTransport : public Transport {
public:
  struct Options {
    std::string listen_ip = "0.0.0.0";
    uint16_t listen_port = 0;
    std::string peer_addr; // host:port; empty = accept
  };

  static constexpr Tag kHandshakeTag = 0xffffffffu;
  static constexpr uint64_t kMaxFrameSize = 2ULL * 1024 * 1024 * 1024;
  // Node ids are 64 hex chars; anything longer is not a handshake.
  static constexpr uint64_t kMaxHandshakeSize = 128;
  static constexpr std::size_t kHeaderSize = 12;

  TcpTransport(uint64_t seed, Options options, std::shared_ptr<Logger> logger);
  ~TcpTransport() override;

  TcpTransport(const TcpTransport&) = delete;
  TcpTransport& operator=(const TcpTransport&) = delete;

  std::string node_id() const override { return node_id_; }
  void connect(const std::string& peer_id, int num_retries) override;
  bool is_ready() const override { return ready_.load(); }
  std::future<void> isend(Bytes message, Tag tag, std::chrono::milliseconds latency) override;
  std::future<Bytes> irecv(Tag tag) override;
  void close() override;

  // Bound port once connect() has opened the listener; 0 when dialing.
  uint16_t local_port() const { return local_port_.load(); }

private:
  using tcp = asio::ip::tcp;
  using Header = std::array<char, kHeaderSize>;
  using FrameHandler = std::function<void(std::error_code, Tag, Bytes)>;

  struct OutgoingFrame {
    Header header{};
    Bytes body;
    bool no_delay = false;
    std::promise<void> done;
  };

  void start_dial();
  void schedule_redial();
  void start_accept();
  void begin_handshake(std::shared_ptr<tcp::socket> socket, bool dialed);
  void on_link_up(std::shared_ptr<tcp::socket> socket);
  void read_frame(std::shared_ptr<tcp::socket> socket, uint64_t max_length, FrameHandler handler);
  void do_read();
  void do_write();
  void fail_link(const std::string& reason);
  void shutdown_on_io();

  std::string node_id_;
  Options options_;
  std::shared_ptr<Logger> logger_;

  asio::io_context io_;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  std::thread io_thread_;
  std::unique_ptr<tcp::acceptor> acceptor_;
  std::unique_ptr<asio::steady_timer> retry_timer_;
  std::shared_ptr<tcp::socket> socket_;
  std::deque<std::shared_ptr<OutgoingFrame>> write_queue_;
  TagMailbox mailbox_;

  std::string expected_peer_;
  int dial_attempts_left_ = 0;
  std::atomic<bool> ready_{false};
  std::atomic<bool> closed_{false};
  std::atomic<uint16_t> local_port_{0};
};
