#pragma once

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "components.h"
#include "transport.h"

namespace artlink {

struct SenderConfig {
  int net = 0;
  int subnet = 0;
  int universe = 0;
  std::string to = "255.255.255.255";  // unicast ip, subnet broadcast or limited broadcast
  bool broadcast = false;              // send to the subnet broadcast of every interface that reaches `to`
  uint16_t port = def::defaultUdpPort;
  uint32_t refreshIntervalMs = def::senderRefresh;  // resend even if nothing changed, 0 disables
};

struct ReceiverConfig {
  std::string from;  // CIDR source filter, empty accepts anything, no "/" means /32
  int net = 0;
  int subnet = 0;
  int universe = 0;
};


// Local DMX output. Owns its own socket and refresh timer and keeps
// transmitting its 512 channels until stopped.
class Sender: public std::enable_shared_from_this<Sender> {
public:
  using StopFn = std::function<void(Sender*)>;

  // Throws InvalidPortAddress. Bind failures go to onError.
  Sender(const SenderConfig& config, const InterfaceList& localInterfaces,
         Transport& transport, ErrorFn onError);
  Sender(const Sender&) = delete;
  Sender& operator=(const Sender&) = delete;
  ~Sender();

  // channel 0-511, value 0-255. Throw InvalidChannelIndex / InvalidChannelValue.
  void setChannel(int channel, int value);   // set and transmit
  void prepChannel(int channel, int value);  // set only
  void fillChannels(int start, int stop, int value); // inclusive range, then transmit
  void blackout();

  void transmit();
  // Cancels the refresh timer and closes the socket, no transmission after
  // this returns.
  void stop();
  void setStopHandler(StopFn fn) { onStopped = std::move(fn); }

  bool isStopped() const { return stopped; }
  bool isBroadcast() const { return broadcast; }
  PortAddress address() const { return addr; }
  IPv4 destination() const { return dest; }
  uint8_t nextSequence() const { return sequence; }
  const dmx_buf_t& values() const { return buffer; }
  const InterfaceList& interfaces() const { return ifaces; }
  const SenderConfig& config() const { return cfg; }

private:
  void resolveDestination(const InterfaceList& localInterfaces);

  SenderConfig cfg;
  PortAddress addr;
  InterfaceList ifaces;   // local interfaces reaching the destination
  IPv4 dest = IPv4::ANY();  // unresolved
  bool broadcast = false;

  dmx_buf_t buffer{};
  uint8_t sequence = 1;   // 1..255, 0, 1.. incremented after every frame

  std::unique_ptr<Socket> socket;
  std::unique_ptr<Timer> refresh;
  ErrorFn onError;
  StopFn onStopped;
  bool stopped = false;
};


// Local DMX input for one Port-Address, optionally only from some sources.
class Receiver {
public:
  using DataFn = std::function<void(const uint8_t*, uint16_t)>;

  // Throws InvalidPortAddress, or Error for a malformed source filter.
  Receiver(const ReceiverConfig& config, const InterfaceList& localInterfaces);
  Receiver(const Receiver&) = delete;
  Receiver& operator=(const Receiver&) = delete;

  bool acceptPacket(uint8_t subUni, IPv4 source) const {
    return subUni == addr.subUni() && sourceFilter.contains(source);
  }
  // Stores the channels and notifies subscribers in registration order.
  void receive(const uint8_t* data, uint16_t length);

  size_t subscribe(DataFn fn);
  void unsubscribe(size_t id);

  PortAddress address() const { return addr; }
  const Netmask& filter() const { return sourceFilter; }
  const dmx_buf_t& values() const { return buffer; }
  uint16_t length() const { return received; }
  const InterfaceList& interfaces() const { return ifaces; }
  const ReceiverConfig& config() const { return cfg; }

private:
  ReceiverConfig cfg;
  PortAddress addr;
  Netmask sourceFilter;   // 0.0.0.0/0 by default
  InterfaceList ifaces;   // local interfaces inside the source filter

  dmx_buf_t buffer{};
  uint16_t received = 0;

  size_t nextSubscription = 0;
  std::vector<std::pair<size_t, DataFn>> subscribers;
};

}
