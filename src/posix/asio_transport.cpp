#include "asio_transport.h"

#include <vector>

namespace artlink {
namespace posix {

namespace asio = boost::asio;
using udp = asio::ip::udp;

struct AsioSocket::State: std::enable_shared_from_this<AsioSocket::State> {
  explicit State(io_context& io): socket(io) {}

  void receiveNext() {
    auto self = shared_from_this();
    socket.async_receive_from(asio::buffer(buffer), remote,
      [self](const error_code& ec, size_t bytes) {
        if(ec == asio::error::operation_aborted || !self->socket.is_open()) return;
        if(ec) {
          ARTLINK_LOGW("Socket error: %s", ec.message().c_str());
          if(self->errorFn)
            self->errorFn(TransportError(TransportError::Receive, "Receive failed: " + ec.message(), ec.value()));
        } else if(self->receiveFn) {
          auto addr = self->remote.address().to_v4().to_uint();
          self->receiveFn(self->buffer.data(), bytes, IPv4::fromHost(addr), self->remote.port());
        }
        if(self->socket.is_open()) self->receiveNext();
      });
  }

  udp_socket socket;
  endpoint remote;
  std::array<uint8_t, def::bufferMax> buffer{};
  ReceiveFn receiveFn;
  ErrorFn errorFn;
  bool receiving = false;
};

AsioSocket::AsioSocket(io_context& io, uint16_t port, bool broadcast):
  state(std::make_shared<State>(io))
{
  error_code ec;
  auto& sock = state->socket;
  sock.open(udp::v4(), ec);
  if(!ec) sock.set_option(asio::socket_base::reuse_address(true), ec);
  if(!ec && broadcast) sock.set_option(asio::socket_base::broadcast(true), ec);
  if(!ec) sock.bind(endpoint(udp::v4(), port), ec);
  if(ec) {
    error_code ignored;
    sock.close(ignored);
    throw TransportError(TransportError::Bind,
        "Could not bind udp port " + std::to_string(port) + ": " + ec.message(), ec.value());
  }
  ARTLINK_LOGV("Socket bound to port %u", localPort());
}

AsioSocket::~AsioSocket() {
  close();
}

void AsioSocket::send(const uint8_t* data, size_t length, IPv4 dest, uint16_t port, SendFn done) {
  if(!isReady()) {
    if(done) {
      TransportError err(TransportError::Send, "Socket closed");
      done(&err);
    }
    return;
  }

  auto payload = std::make_shared<std::vector<uint8_t>>(data, data + length);
  endpoint to(asio::ip::address_v4(dest.host()), port);
  auto self = state;
  state->socket.async_send_to(asio::buffer(*payload), to,
    [self, payload, done](const error_code& ec, size_t) {
      if(!done) return;
      if(ec) {
        TransportError err(TransportError::Send, "Send failed: " + ec.message(), ec.value());
        done(&err);
      } else {
        done(nullptr);
      }
    });
}

void AsioSocket::onReceive(ReceiveFn fn) {
  state->receiveFn = std::move(fn);
  if(!state->receiving && isReady()) {
    state->receiving = true;
    state->receiveNext();
  }
}

void AsioSocket::onError(ErrorFn fn) {
  state->errorFn = std::move(fn);
}

bool AsioSocket::isReady() const {
  return state->socket.is_open();
}

void AsioSocket::close() {
  if(!state->socket.is_open()) return;
  error_code ec;
  state->socket.close(ec);
  if(ec) ARTLINK_LOGW("Socket close: %s", ec.message().c_str());
  state->receiveFn = nullptr;
  state->errorFn = nullptr;
}

uint16_t AsioSocket::localPort() const {
  error_code ec;
  auto local = state->socket.local_endpoint(ec);
  return ec? 0: local.port();
}


struct AsioTimer::State: std::enable_shared_from_this<AsioTimer::State> {
  State(io_context& io, uint32_t intervalMs, std::function<void()> fn):
    timer(io), interval(intervalMs), fn(std::move(fn)) {}

  void arm() {
    timer.expires_after(interval);
    auto self = shared_from_this();
    timer.async_wait([self](const error_code& ec) {
      if(ec || self->cancelled) return;
      self->fn();
      if(!self->cancelled) self->arm();
    });
  }

  steady_timer timer;
  std::chrono::milliseconds interval;
  std::function<void()> fn;
  bool cancelled = false;
};

AsioTimer::AsioTimer(io_context& io, uint32_t intervalMs, std::function<void()> fn):
  state(std::make_shared<State>(io, intervalMs, std::move(fn)))
{
  state->arm();
}

AsioTimer::~AsioTimer() {
  cancel();
}

void AsioTimer::cancel() {
  if(state->cancelled) return;
  state->cancelled = true;
  state->timer.cancel();
}


std::unique_ptr<Socket> AsioTransport::bind(uint16_t port, bool broadcast) {
  return std::make_unique<AsioSocket>(io, port, broadcast);
}

std::unique_ptr<Timer> AsioTransport::every(uint32_t intervalMs, std::function<void()> fn) {
  return std::make_unique<AsioTimer>(io, intervalMs, std::move(fn));
}

} // namespace posix
} // namespace artlink
