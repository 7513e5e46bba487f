#include "tcp_transport.hpp"
#include "errors.hpp"

#include <algorithm>
#include <chrono>

namespace {

void put_u32_be(char* out, uint32_t value) {
  for(int i = 0; i < 4; ++i) {
    out[i] = static_cast<char>((value >> (24 - 8 * i)) & 0xff);
  }
}

void put_u64_be(char* out, uint64_t value) {
  for(int i = 0; i < 8; ++i) {
    out[i] = static_cast<char>((value >> (56 - 8 * i)) & 0xff);
  }
}

uint32_t get_u32_be(const char* in) {
  uint32_t value = 0;
  for(int i = 0; i < 4; ++i) {
    value = (value << 8) | static_cast<unsigned char>(in[i]);
  }
  return value;
}

uint64_t get_u64_be(const char* in) {
  uint64_t value = 0;
  for(int i = 0; i < 8; ++i) {
    value = (value << 8) | static_cast<unsigned char>(in[i]);
  }
  return value;
}

bool split_host_port(const std::string& addr, std::string& host, std::string& port) {
  auto pos = addr.rfind(':');
  if(pos == std::string::npos || pos == 0 || pos + 1 >= addr.size()) return false;
  host = addr.substr(0, pos);
  port = addr.substr(pos + 1);
  if(host.size() > 2 && host.front() == '[' && host.back() == ']') {
    host = host.substr(1, host.size() - 2);
  }
  return true;
}

std::string short_id(const std::string& id) {
  return id.size() > 16 ? id.substr(0, 16) : id;
}

} // namespace

TcpTransport::TcpTransport(uint64_t seed, Options options, std::shared_ptr<Logger> logger)
  : node_id_(node_id_from_seed(seed)),
    options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("tcp")) {
  work_.emplace(asio::make_work_guard(io_));
  io_thread_ = std::thread([this](){ io_.run(); });
}

TcpTransport::~TcpTransport() {
  close();
}

void TcpTransport::connect(const std::string& peer_id, int num_retries) {
  if(closed_) {
    throw ConnectionError("connect() on a closed transport");
  }
  expected_peer_ = peer_id;
  dial_attempts_left_ = std::max(1, num_retries);

  if(!options_.peer_addr.empty()) {
    std::string host;
    std::string port;
    if(!split_host_port(options_.peer_addr, host, port)) {
      throw ConfigurationError("peer_addr must be host:port (got '" + options_.peer_addr + "')");
    }
    asio::post(io_, [this](){ start_dial(); });
    return;
  }

  // The listener is opened synchronously so bind errors surface here and the
  // port is known before connect() returns.
  asio::ip::address address;
  std::error_code ec;
  address = asio::ip::make_address(options_.listen_ip, ec);
  if(ec) {
    throw ConfigurationError("Invalid listen_ip '" + options_.listen_ip + "': " + ec.message());
  }
  tcp::endpoint endpoint(address, options_.listen_port);
  acceptor_ = std::make_unique<tcp::acceptor>(io_);
  acceptor_->open(endpoint.protocol(), ec);
  if(!ec) acceptor_->set_option(tcp::acceptor::reuse_address(true), ec);
  if(!ec) acceptor_->bind(endpoint, ec);
  if(!ec) acceptor_->listen(asio::socket_base::max_listen_connections, ec);
  if(ec) {
    throw ConnectionError("Unable to listen on " + options_.listen_ip + ":" +
                          std::to_string(options_.listen_port) + ": " + ec.message());
  }
  local_port_ = acceptor_->local_endpoint().port();
  logger_->info("Waiting for peer {} on {}:{}", short_id(peer_id), options_.listen_ip, local_port_.load());
  asio::post(io_, [this](){ start_accept(); });
}

void TcpTransport::start_dial() {
  if(closed_ || ready_) return;
  std::string host;
  std::string port;
  split_host_port(options_.peer_addr, host, port);
  --dial_attempts_left_;

  auto resolver = std::make_shared<tcp::resolver>(io_);
  resolver->async_resolve(host, port,
    [this, resolver](std::error_code ec, tcp::resolver::results_type results){
      if(closed_) return;
      if(ec) {
        logger_->debug("Resolve failed for {}: {}", options_.peer_addr, ec.message());
        schedule_redial();
        return;
      }
      auto socket = std::make_shared<tcp::socket>(io_);
      asio::async_connect(*socket, results,
        [this, socket](std::error_code ec, const tcp::endpoint& ep){
          if(closed_) return;
          if(ec) {
            logger_->debug("Connect to {} failed: {}", options_.peer_addr, ec.message());
            schedule_redial();
            return;
          }
          logger_->debug("TCP connected to {}:{}", ep.address().to_string(), ep.port());
          begin_handshake(socket, true);
        });
    });
}

void TcpTransport::schedule_redial() {
  if(closed_ || ready_) return;
  if(dial_attempts_left_ <= 0) {
    logger_->warn("Giving up dialing {}", options_.peer_addr);
    return;
  }
  if(!retry_timer_) retry_timer_ = std::make_unique<asio::steady_timer>(io_);
  retry_timer_->expires_after(std::chrono::seconds(1));
  retry_timer_->async_wait([this](const std::error_code& ec){
    if(ec || closed_) return;
    start_dial();
  });
}

void TcpTransport::start_accept() {
  if(!acceptor_ || closed_ || ready_) return;
  acceptor_->async_accept(
    [this](std::error_code ec, tcp::socket socket){
      if(closed_ || ec == asio::error::operation_aborted) return;
      if(ec) {
        logger_->warn("Accept error: {}", ec.message());
      } else if(!ready_) {
        std::error_code ep_ec;
        auto remote = socket.remote_endpoint(ep_ec);
        logger_->debug("Accepted connection from {}", ep_ec ? std::string("?") : remote.address().to_string());
        begin_handshake(std::make_shared<tcp::socket>(std::move(socket)), false);
      }
      start_accept();
    });
}

void TcpTransport::begin_handshake(std::shared_ptr<tcp::socket> socket, bool dialed) {
  auto hello = std::make_shared<OutgoingFrame>();
  hello->body.assign(node_id_.begin(), node_id_.end());
  put_u32_be(hello->header.data(), kHandshakeTag);
  put_u64_be(hello->header.data() + 4, hello->body.size());

  std::array<asio::const_buffer, 2> buffers = {
    asio::buffer(hello->header), asio::buffer(hello->body)
  };
  asio::async_write(*socket, buffers,
    [this, socket, hello, dialed](std::error_code ec, std::size_t){
      if(closed_) return;
      if(ec) {
        logger_->debug("Handshake write failed: {}", ec.message());
        if(dialed) schedule_redial();
        return;
      }
      read_frame(socket, kMaxHandshakeSize, [this, socket, dialed](std::error_code ec, Tag tag, Bytes body){
        if(closed_) return;
        std::string remote_id(body.begin(), body.end());
        if(ec || tag != kHandshakeTag || remote_id != expected_peer_) {
          if(ec) {
            logger_->debug("Handshake read failed: {}", ec.message());
          } else {
            logger_->warn("Rejected peer {} (expected {})", short_id(remote_id), short_id(expected_peer_));
          }
          std::error_code close_ec;
          socket->close(close_ec);
          if(dialed) schedule_redial();
          return;
        }
        on_link_up(socket);
      });
    });
}

void TcpTransport::on_link_up(std::shared_ptr<tcp::socket> socket) {
  if(socket_) {
    std::error_code ec;
    socket->close(ec);
    return;
  }
  socket_ = std::move(socket);
  if(acceptor_) {
    std::error_code ec;
    acceptor_->close(ec);
  }
  ready_ = true;
  logger_->debug("Link to {} ready", short_id(expected_peer_));
  do_read();
}

void TcpTransport::read_frame(std::shared_ptr<tcp::socket> socket, uint64_t max_length, FrameHandler handler) {
  auto header = std::make_shared<Header>();
  asio::async_read(*socket, asio::buffer(*header),
    [socket, header, max_length, handler = std::move(handler)](std::error_code ec, std::size_t){
      if(ec) {
        handler(ec, 0, {});
        return;
      }
      Tag tag = get_u32_be(header->data());
      uint64_t length = get_u64_be(header->data() + 4);
      if(length > max_length) {
        handler(std::make_error_code(std::errc::message_size), tag, {});
        return;
      }
      auto body = std::make_shared<Bytes>(static_cast<std::size_t>(length));
      if(length == 0) {
        handler({}, tag, {});
        return;
      }
      asio::async_read(*socket, asio::buffer(*body),
        [body, tag, handler](std::error_code ec, std::size_t){
          if(ec) {
            handler(ec, tag, {});
            return;
          }
          handler({}, tag, std::move(*body));
        });
    });
}

void TcpTransport::do_read() {
  if(!socket_) return;
  read_frame(socket_, kMaxFrameSize, [this](std::error_code ec, Tag tag, Bytes body){
    if(closed_) return;
    if(ec) {
      fail_link(ec == asio::error::eof ? "peer closed the connection" : ec.message());
      return;
    }
    if(tag != kHandshakeTag) {
      mailbox_.deliver(tag, std::move(body));
    }
    do_read();
  });
}

std::future<void> TcpTransport::isend(Bytes message, Tag tag, std::chrono::milliseconds latency) {
  auto frame = std::make_shared<OutgoingFrame>();
  auto future = frame->done.get_future();
  if(closed_) {
    frame->done.set_exception(std::make_exception_ptr(TransferError("transport closed")));
    return future;
  }
  if(tag == kHandshakeTag) {
    frame->done.set_exception(std::make_exception_ptr(TransferError("tag is reserved")));
    return future;
  }
  if(message.size() > kMaxFrameSize) {
    frame->done.set_exception(std::make_exception_ptr(TransferError("message exceeds frame limit")));
    return future;
  }
  put_u32_be(frame->header.data(), tag);
  put_u64_be(frame->header.data() + 4, message.size());
  frame->body = std::move(message);
  frame->no_delay = latency.count() <= 0;

  asio::post(io_, [this, frame](){
    if(!socket_ || !ready_) {
      frame->done.set_exception(std::make_exception_ptr(TransferError("not connected")));
      return;
    }
    write_queue_.push_back(frame);
    if(write_queue_.size() == 1) {
      do_write();
    }
  });
  return future;
}

void TcpTransport::do_write() {
  if(write_queue_.empty() || !socket_) return;
  auto frame = write_queue_.front();
  std::error_code ec;
  socket_->set_option(tcp::no_delay(frame->no_delay), ec);

  std::array<asio::const_buffer, 2> buffers = {
    asio::buffer(frame->header), asio::buffer(frame->body)
  };
  asio::async_write(*socket_, buffers,
    [this, frame](std::error_code ec, std::size_t){
      // fail_link() may already have settled and dropped this frame.
      if(write_queue_.empty() || write_queue_.front() != frame) return;
      if(ec) {
        fail_link("write failed: " + ec.message());
        return;
      }
      frame->done.set_value();
      write_queue_.pop_front();
      do_write();
    });
}

std::future<Bytes> TcpTransport::irecv(Tag tag) {
  return mailbox_.take(tag);
}

void TcpTransport::fail_link(const std::string& reason) {
  if(ready_) {
    logger_->debug("Link lost: {}", reason);
  }
  ready_ = false;
  mailbox_.fail_all(reason);
  for(auto& frame : write_queue_) {
    frame->done.set_exception(std::make_exception_ptr(TransferError(reason)));
  }
  write_queue_.clear();
  if(socket_) {
    std::error_code ec;
    socket_->close(ec);
  }
}

void TcpTransport::shutdown_on_io() {
  if(retry_timer_) {
    retry_timer_->cancel();
  }
  if(acceptor_) {
    std::error_code ec;
    acceptor_->close(ec);
  }
  fail_link("transport closed");
}

void TcpTransport::close() {
  if(closed_.exchange(true)) return;
  // Handshakes and dials still in flight are abandoned by stop(); their
  // handlers are destroyed with the io_context without running.
  asio::post(io_, [this](){
    shutdown_on_io();
    io_.stop();
  });
  work_.reset();
  if(io_thread_.joinable()) {
    io_thread_.join();
  }
  mailbox_.fail_all("transport closed");
}
