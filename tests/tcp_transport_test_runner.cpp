#include "connection_establisher.hpp"
#include "errors.hpp"
#include "seed_derivation.hpp"
#include "session.hpp"
#include "tcp_transport.hpp"
#include "test_runner_utils.hpp"
#include "transfer_engine.hpp"

#include <array>
#include <functional>
#include <future>
#include <sstream>
#include <thread>

using namespace peerdrop::test;
namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

struct LinkedPair {
  std::unique_ptr<TcpTransport> listener;
  std::unique_ptr<TcpTransport> dialer;
};

// Listener on an ephemeral loopback port, dialer pointed at it.
LinkedPair link_pair(std::shared_ptr<Logger> logger, uint64_t listener_seed, uint64_t dialer_seed,
                     const std::string& dialer_expects) {
  LinkedPair pair;
  TcpTransport::Options listen_options;
  listen_options.listen_ip = "127.0.0.1";
  listen_options.listen_port = 0;
  pair.listener = std::make_unique<TcpTransport>(listener_seed, listen_options, logger);
  pair.listener->connect(identity_preview(dialer_seed), 3);

  TcpTransport::Options dial_options;
  dial_options.peer_addr = "127.0.0.1:" + std::to_string(pair.listener->local_port());
  pair.dialer = std::make_unique<TcpTransport>(dialer_seed, dial_options, logger);
  pair.dialer->connect(dialer_expects, 3);
  return pair;
}

bool test_handshake_and_tags(TestContext& ctx) {
  auto logger = std::make_shared<Logger>("tcp");
  ctx.logs.attach(logger);
  auto pair = link_pair(logger, 100, 200, identity_preview(100));
  if(pair.listener->local_port() == 0) return false;
  bool ready = wait_for_condition([&]{
    return pair.listener->is_ready() && pair.dialer->is_ready();
  }, 3s);
  if(!ready) return false;

  Bytes big = random_bytes(3 * 1024 * 1024, 9);
  await_send(pair.dialer->isend(Bytes{'a'}, 0, 0ms), 2s, "a");
  await_send(pair.dialer->isend(big, 1, 100ms), 5s, "big");
  await_send(pair.dialer->isend(Bytes{}, 0, 0ms), 2s, "empty");
  await_send(pair.listener->isend(Bytes{'r'}, 7, 0ms), 2s, "reply");

  // Per-tag FIFO: tag 1 can be read before the tag 0 backlog.
  auto on_tag1 = await_receive(pair.listener->irecv(1), 5s, "tag 1");
  auto first = await_receive(pair.listener->irecv(0), 2s, "tag 0 #1");
  auto second = await_receive(pair.listener->irecv(0), 2s, "tag 0 #2");
  auto reply = await_receive(pair.dialer->irecv(7), 2s, "reply");
  return on_tag1 == big &&
         first == Bytes{'a'} &&
         second.empty() &&
         reply == Bytes{'r'} &&
         pair.dialer->node_id() == identity_preview(200);
}

bool test_wrong_identity_never_ready(TestContext& ctx) {
  auto logger = std::make_shared<Logger>("tcp");
  ctx.logs.attach(logger);
  // Each side expects a node the other is not.
  TcpTransport::Options listen_options;
  listen_options.listen_ip = "127.0.0.1";
  TcpTransport listener(100, listen_options, logger);
  listener.connect(identity_preview(201), 2);

  TcpTransport::Options dial_options;
  dial_options.peer_addr = "127.0.0.1:" + std::to_string(listener.local_port());
  TcpTransport dialer(200, dial_options, logger);
  bool connected = establish_connection(dialer, identity_preview(101), 2, *logger);
  return !connected && !listener.is_ready() && ctx.logs.contains("Rejected peer");
}

bool test_close_fails_pending_receive(TestContext& ctx) {
  auto logger = std::make_shared<Logger>("tcp");
  ctx.logs.attach(logger);
  auto pair = link_pair(logger, 300, 400, identity_preview(300));
  if(!wait_for_condition([&]{ return pair.listener->is_ready() && pair.dialer->is_ready(); }, 3s)) {
    return false;
  }
  auto pending = pair.listener->irecv(3);
  pair.dialer->close();
  bool peer_failed = throws<TransferError>([&]{ await_receive(std::move(pending), 3s, "never"); });
  bool send_refused = throws<TransferError>([&]{
    await_send(pair.dialer->isend(Bytes{'x'}, 0, 0ms), 1s, "after close");
  });
  bool reserved = throws<TransferError>([&]{
    await_send(pair.listener->isend(Bytes{'x'}, TcpTransport::kHandshakeTag, 0ms), 1s, "reserved");
  });
  return peer_failed && send_refused && reserved;
}

// A stranger announcing a 2 GiB handshake is dropped without reading a body.
bool test_oversized_handshake_dropped(TestContext& ctx) {
  auto logger = std::make_shared<Logger>("tcp");
  ctx.logs.attach(logger);
  TcpTransport::Options listen_options;
  listen_options.listen_ip = "127.0.0.1";
  TcpTransport listener(100, listen_options, logger);
  listener.connect(identity_preview(200), 2);

  asio::io_context io;
  asio::ip::tcp::socket stranger(io);
  stranger.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), listener.local_port()));
  std::array<unsigned char, TcpTransport::kHeaderSize> header = {
    0xff, 0xff, 0xff, 0xff,                         // handshake tag
    0x00, 0x00, 0x00, 0x00, 0x80, 0x00, 0x00, 0x00  // 2 GiB
  };
  asio::write(stranger, asio::buffer(header));

  bool dropped = false;
  std::array<char, 4096> sink{};
  std::function<void()> drain = [&]{
    stranger.async_read_some(asio::buffer(sink), [&](std::error_code ec, std::size_t){
      if(ec) {
        dropped = true;
        return;
      }
      drain();
    });
  };
  drain();
  io.run_for(3s);
  return dropped && !listener.is_ready() && ctx.logs.contains("Handshake read failed");
}

// The link drops while frames are queued and one is being written; every
// send settles exactly once and the io thread survives.
bool test_link_drop_with_writes_in_flight(TestContext& ctx) {
  auto logger = std::make_shared<Logger>("tcp");
  ctx.logs.attach(logger);
  auto pair = link_pair(logger, 500, 600, identity_preview(500));
  if(!wait_for_condition([&]{ return pair.listener->is_ready() && pair.dialer->is_ready(); }, 3s)) {
    return false;
  }
  std::vector<std::future<void>> sends;
  for(int i = 0; i < 64; ++i) {
    sends.push_back(pair.dialer->isend(random_bytes(256 * 1024, i), 2, 0ms));
  }
  pair.listener->close();

  std::size_t settled = 0;
  for(auto& pending : sends) {
    try {
      await_send(std::move(pending), 5s, "queued frame");
      ++settled;
    } catch(const TransferError&) {
      ++settled;
    }
  }
  // Still usable afterwards: a fresh send fails cleanly instead of hanging.
  bool link_down = wait_for_condition([&]{ return !pair.dialer->is_ready(); }, 3s);
  bool refused = throws<TransferError>([&]{
    await_send(pair.dialer->isend(Bytes{'x'}, 2, 0ms), 2s, "after drop");
  });
  return settled == sends.size() && link_down && refused;
}

bool test_bad_peer_addr(TestContext& ctx) {
  auto logger = std::make_shared<Logger>("tcp");
  ctx.logs.attach(logger);
  TcpTransport::Options options;
  options.peer_addr = "no-port-here";
  TcpTransport transport(1, options, logger);
  TcpTransport::Options bad_ip;
  bad_ip.listen_ip = "not-an-ip";
  TcpTransport listener(2, bad_ip, logger);
  return throws<ConfigurationError>([&]{ transport.connect(identity_preview(2), 1); }) &&
         throws<ConfigurationError>([&]{ listener.connect(identity_preview(1), 1); });
}

// Full sender/receiver sessions over real sockets.
bool test_session_over_tcp(TestContext& ctx) {
  TempWorkspace ws("tcp_session");
  write_file(ws / "src/payload.bin", random_bytes(700000, 21));
  write_file(ws / "src/notes/readme.md", std::string("# notes"));

  auto sender_logger = std::make_shared<Logger>("sender");
  auto receiver_logger = std::make_shared<Logger>("receiver");
  ctx.logs.attach(sender_logger);
  ctx.logs.attach(receiver_logger);

  Session::Options receiver_options;
  receiver_options.role = Role::Receiver;
  receiver_options.token = "tcp-session-token-abcdefghijklmnop";
  receiver_options.destination_root = ws / "out";
  receiver_options.connect_retries = 5;
  receiver_options.message_timeout = 10s;
  receiver_options.show_progress = false;

  Session::Options sender_options = receiver_options;
  sender_options.role = Role::Sender;
  sender_options.paths = {(ws / "src/payload.bin").string(), (ws / "src/notes").string()};
  sender_options.chunk_size = 128 * 1024;

  std::promise<uint16_t> port_promise;
  auto port_future = port_promise.get_future().share();
  std::thread port_publisher;
  std::ostringstream progress;

  Session receiver(receiver_options, [&](uint64_t seed) -> std::unique_ptr<Transport> {
    TcpTransport::Options options;
    options.listen_ip = "127.0.0.1";
    auto transport = std::make_unique<TcpTransport>(seed, options, receiver_logger);
    // local_port() is known once the session calls connect().
    auto* raw = transport.get();
    port_publisher = std::thread([raw, &port_promise]{
      wait_for_condition([raw]{ return raw->local_port() != 0; }, 5s, 5ms);
      port_promise.set_value(raw->local_port());
    });
    return transport;
  }, receiver_logger, progress);

  Session sender(sender_options, [&](uint64_t seed) -> std::unique_ptr<Transport> {
    TcpTransport::Options options;
    uint16_t port = 0;
    if(port_future.wait_for(10s) == std::future_status::ready) port = port_future.get();
    options.peer_addr = "127.0.0.1:" + std::to_string(port);
    return std::make_unique<TcpTransport>(seed, options, sender_logger);
  }, sender_logger, progress);

  std::exception_ptr receiver_error;
  std::exception_ptr sender_error;
  std::thread receiver_thread([&]{
    try { receiver.run(); } catch(...) { receiver_error = std::current_exception(); }
  });
  std::thread sender_thread([&]{
    try { sender.run(); } catch(...) { sender_error = std::current_exception(); }
  });
  sender_thread.join();
  receiver_thread.join();
  if(port_publisher.joinable()) port_publisher.join();

  return !sender_error && !receiver_error &&
         read_file(ws / "out/payload.bin") == read_file(ws / "src/payload.bin") &&
         read_file(ws / "out/notes/readme.md") == read_file(ws / "src/notes/readme.md");
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"handshake_and_tags", test_handshake_and_tags},
    {"wrong_identity_never_ready", test_wrong_identity_never_ready},
    {"close_fails_pending_receive", test_close_fails_pending_receive},
    {"oversized_handshake_dropped", test_oversized_handshake_dropped},
    {"link_drop_with_writes_in_flight", test_link_drop_with_writes_in_flight},
    {"bad_peer_addr", test_bad_peer_addr},
    {"session_over_tcp", test_session_over_tcp}
  };
  return run_tests("tcp transport", argc, argv, tests);
}
