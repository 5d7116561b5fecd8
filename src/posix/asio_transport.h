#pragma once

#include <array>
#include <memory>

#include <boost/asio.hpp>

#include "../transport.h"
#include "../protocol.h"

namespace artlink {
namespace posix {

typedef boost::asio::io_context io_context;
typedef boost::asio::ip::udp::socket udp_socket;
typedef boost::asio::ip::udp::endpoint endpoint;
typedef boost::asio::steady_timer steady_timer;
typedef boost::system::error_code error_code;

// UDP socket on an io_context. Pending operations keep the state alive, so
// the Socket itself can go away while sends are in flight.
class AsioSocket: public Socket {
public:
  // Throws TransportError (Bind).
  AsioSocket(io_context& io, uint16_t port, bool broadcast);
  ~AsioSocket() override;

  void send(const uint8_t* data, size_t length, IPv4 dest, uint16_t port, SendFn done) override;
  void onReceive(ReceiveFn fn) override;
  void onError(ErrorFn fn) override;
  bool isReady() const override;
  void close() override;

  uint16_t localPort() const;

private:
  struct State;
  std::shared_ptr<State> state;
};

class AsioTimer: public Timer {
public:
  AsioTimer(io_context& io, uint32_t intervalMs, std::function<void()> fn);
  ~AsioTimer() override;
  void cancel() override;

private:
  struct State;
  std::shared_ptr<State> state;
};

// Transport for a single threaded io_context, everything runs on the thread
// calling io_context::run().
class AsioTransport: public Transport {
public:
  explicit AsioTransport(io_context& io): io(io) {}

  std::unique_ptr<Socket> bind(uint16_t port, bool broadcast) override;
  std::unique_ptr<Timer> every(uint32_t intervalMs, std::function<void()> fn) override;
  uint32_t now() override { return uptimeMs(); }

  io_context& context() { return io; }

private:
  io_context& io;
};

} // namespace posix
} // namespace artlink
