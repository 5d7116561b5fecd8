/* artlink
 * Art-Net 4 transceiver: DMX senders and receivers plus ArtPoll discovery,
 * on top of any Transport (see posix/asio_transport.h for the Boost.Asio one).
 */
#pragma once

#include <functional>
#include <memory>
#include <string>

#include "platform.h"
#include "protocol.h"
#include "errors.h"
#include "components.h"
#include "transport.h"
#include "ports.h"
#include "registry.h"
#include "discovery.h"
#include "dispatcher.h"

namespace artlink {

class Driver {
public:
  struct Config {
    uint16_t oem            = def::defaultOem;
    uint16_t esta           = def::defaultEstaMan;
    uint16_t port           = def::defaultUdpPort;  // listening port, polls go here too
    std::string name        = "artlink-node";
    uint32_t pollIntervalMs = 0;                    // 0 disables periodic polling
    std::string pollTo      = "0.0.0.0/0";          // polls go to its broadcast address
    uint32_t sweepIntervalMs = def::sweepInterval;
    uint32_t nodeTimeoutMs  = def::nodeTimeout;
    LogLevel logLevel       = LogLevel::Info;
    ErrorFn onError;                                // throws TransportError when empty
  };
  using NodeUpdateFn = DiscoveryEngine::NodeUpdateFn;

  // The interface list is captured here and never refreshed.
  Driver(Config config, InterfaceList localInterfaces, Transport& transport);
  Driver(Driver&&) = delete;
  Driver(const Driver&) = delete;
  ~Driver();

  // Both throw InvalidPortAddress, newReceiver also Error for a bad source filter.
  // Error once the driver is stopped.
  std::shared_ptr<Sender> newSender(const SenderConfig& config);
  std::shared_ptr<Receiver> newReceiver(const ReceiverConfig& config);
  bool removeReceiver(const std::shared_ptr<Receiver>& receiver);

  size_t subscribeNodeUpdates(NodeUpdateFn fn) { return discovery.subscribeNodeUpdates(std::move(fn)); }
  void unsubscribeNodeUpdates(size_t id) { discovery.unsubscribeNodeUpdates(id); }

  bool sendPoll() { return discovery.poll(); }
  void sendPollReply() { discovery.pollReply(); }

  // Stops every sender, cancels the timers and closes the sockets.
  void stop();
  bool isActive() const { return active; }

  const DeviceRegistry::NodeMap& nodes() const { return registry.nodes(); }
  const DeviceRegistry::ControllerList& controllers() const { return registry.controllers(); }
  const DeviceRegistry::SenderList& senders() const { return registry.senders(); }
  const DeviceRegistry::ReceiverList& receivers() const { return registry.receivers(); }
  const InterfaceList& interfaces() const { return ifaces; }
  const NodeName& getNames() const { return names; }
  const DeviceInfo& getDeviceInfo() const { return deviceInfo; }
  const Config& getConfig() const { return cfg; }
  uint16_t replyCounter() const { return discovery.replyCounter(); }

  // Handed every datagram from the listening socket.
  def::OpCode onPacket(const uint8_t* data, size_t length, IPv4 source, uint16_t sourcePort) {
    return dispatcher.onDatagram(data, length, source, sourcePort);
  }

private:
  void bindSockets();
  void startTimers();

  Config cfg;
  InterfaceList ifaces;
  Transport& transport;

  NodeName names;
  DeviceInfo deviceInfo;

  DeviceRegistry registry;
  DiscoveryEngine discovery;
  Dispatcher dispatcher;

  std::unique_ptr<Socket> listener;
  std::unique_ptr<Socket> socket;   // ephemeral port, broadcast enabled
  std::unique_ptr<Timer> pollTimer;
  std::unique_ptr<Timer> sweepTimer;
  bool active = false;
};

// Random version 4 uuid, "xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx".
std::string uuid4();

}
