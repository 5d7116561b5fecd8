#pragma once

#include <algorithm>
#include <memory>
#include <vector>

#include "transport.h"

namespace artlink {
namespace test {

struct Datagram {
  std::vector<uint8_t> data;
  IPv4 dest;
  uint16_t port;
  uint16_t fromPort;
};

class FakeTransport;

class FakeSocket: public Socket {
public:
  FakeSocket(FakeTransport& transport, uint16_t port, bool broadcast):
    transport(transport), port(port), broadcast(broadcast) {}
  ~FakeSocket() override;

  void send(const uint8_t* data, size_t length, IPv4 dest, uint16_t port, SendFn done) override;
  void onReceive(ReceiveFn fn) override { receiveFn = std::move(fn); }
  void onError(ErrorFn fn) override { errorFn = std::move(fn); }
  bool isReady() const override { return open; }
  void close() override { open = false; }

  // Hands a datagram to whoever listens on this socket.
  void deliver(const std::vector<uint8_t>& data, IPv4 from, uint16_t fromPort = 6454) {
    if(open && receiveFn) receiveFn(data.data(), data.size(), from, fromPort);
  }

  // Reports a failed receive the way a real socket would.
  void failReceive(int code = 111) {
    if(open && errorFn) errorFn(TransportError(TransportError::Receive, "receive failed", code));
  }

  FakeTransport& transport;
  uint16_t port;
  bool broadcast;
  bool open = true;
  ReceiveFn receiveFn;
  ErrorFn errorFn;
};

class FakeTimer: public Timer {
public:
  FakeTimer(uint32_t interval, std::function<void()> fn, uint32_t now):
    state(std::make_shared<State>(State{interval, now + interval, std::move(fn), false})) {}
  ~FakeTimer() override { cancel(); }
  void cancel() override { state->cancelled = true; }

  struct State {
    uint32_t interval;
    uint32_t due;
    std::function<void()> fn;
    bool cancelled;
  };
  std::shared_ptr<State> state;
};

// Manual clock, timers that fire from advance() and a log of everything sent.
class FakeTransport: public Transport {
public:
  std::unique_ptr<Socket> bind(uint16_t port, bool broadcast) override {
    if(failBind) throw TransportError(TransportError::Bind, "bind failed", 98);
    uint16_t actual = port? port: nextEphemeral++;
    auto socket = std::make_unique<FakeSocket>(*this, actual, broadcast);
    sockets.push_back(socket.get());
    return socket;
  }

  std::unique_ptr<Timer> every(uint32_t intervalMs, std::function<void()> fn) override {
    auto timer = std::make_unique<FakeTimer>(intervalMs, std::move(fn), clock);
    timers.push_back(timer->state);
    return timer;
  }

  uint32_t now() override { return clock; }

  // Moves the clock forward, firing due timers in order.
  void advance(uint32_t ms) {
    uint32_t target = clock + ms;
    while(true) {
      std::shared_ptr<FakeTimer::State> next;
      for(auto& t: timers) {
        if(t->cancelled || t->due > target) continue;
        if(!next || t->due < next->due) next = t;
      }
      if(!next) break;
      clock = next->due;
      next->due += next->interval;
      next->fn();
    }
    clock = target;
  }

  size_t activeTimers() const {
    size_t n = 0;
    for(auto& t: timers) if(!t->cancelled) n++;
    return n;
  }

  FakeSocket* listener(uint16_t port) {
    for(auto* s: sockets) if(s->port == port && s->open) return s;
    return nullptr;
  }

  std::vector<Datagram> sentWithOpCode(uint16_t opCode) const {
    std::vector<Datagram> found;
    for(auto& d: sent)
      if(d.data.size() >= 10 && (d.data[8] | (d.data[9] << 8)) == opCode) found.push_back(d);
    return found;
  }

  uint32_t clock = 1000;
  uint16_t nextEphemeral = 50000;
  bool failBind = false;
  bool failSend = false;
  std::vector<Datagram> sent;
  std::vector<FakeSocket*> sockets;   // live sockets, not owned
  std::vector<std::shared_ptr<FakeTimer::State>> timers;
};

inline FakeSocket::~FakeSocket() {
  auto& list = transport.sockets;
  list.erase(std::remove(list.begin(), list.end(), this), list.end());
}

inline void FakeSocket::send(const uint8_t* data, size_t length, IPv4 dest, uint16_t destPort, SendFn done) {
  if(transport.failSend) {
    TransportError err(TransportError::Send, "send failed", 101);
    if(done) done(&err);
    return;
  }
  transport.sent.push_back({std::vector<uint8_t>(data, data + length), dest, destPort, port});
  if(done) done(nullptr);
}

} // namespace test
} // namespace artlink
