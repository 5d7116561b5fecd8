#pragma once

#include <cstdint>
#include <functional>
#include <memory>

#include "platform.h"
#include "errors.h"

namespace artlink {

// Everything the engine needs from the outside world: UDP sockets, periodic
// timers and a millisecond clock. One implementation runs on Boost.Asio
// (posix/asio_transport.h), the tests use a fake.

class Socket {
public:
  using ReceiveFn = std::function<void(const uint8_t*, size_t, IPv4, uint16_t)>;
  using SendFn    = std::function<void(const TransportError*)>; // nullptr on success

  virtual ~Socket() = default;

  // Fire and forget. done runs once the datagram left or failed.
  virtual void send(const uint8_t* data, size_t length, IPv4 dest, uint16_t port, SendFn done) = 0;
  virtual void onReceive(ReceiveFn fn) = 0;
  // Receive failures (TransportError::Receive), receiving carries on afterwards.
  virtual void onError(ErrorFn fn) = 0;
  virtual bool isReady() const = 0;
  virtual void close() = 0;
};

class Timer {
public:
  virtual ~Timer() = default;
  virtual void cancel() = 0;
};

class Transport {
public:
  virtual ~Transport() = default;

  // port 0 picks an ephemeral port. Throws TransportError.
  virtual std::unique_ptr<Socket> bind(uint16_t port, bool broadcast) = 0;
  // Runs fn every intervalMs until the Timer is cancelled or destroyed.
  virtual std::unique_ptr<Timer> every(uint32_t intervalMs, std::function<void()> fn) = 0;
  virtual uint32_t now() = 0;
};

}
