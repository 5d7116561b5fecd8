#pragma once

#include <functional>
#include <utility>
#include <vector>

#include "components.h"
#include "packet.h"
#include "registry.h"
#include "transport.h"

namespace artlink {

// ArtPoll / ArtPollReply side of the engine: announces the local ports and
// keeps the registry's view of the other devices on the network.
class DiscoveryEngine {
public:
  using NodeUpdateFn = std::function<void(const Node&)>;

  DiscoveryEngine(DeviceRegistry& registry, const InterfaceList& localInterfaces,
                  Transport& transport, const NodeName& names, const DeviceInfo& deviceInfo,
                  ErrorFn onError);

  // Socket all polls and replies go out on, nullptr while unbound.
  void setSocket(Socket* sendSocket) { socket = sendSocket; }
  // Polls go to the broadcast address of target. An invalid target disables them.
  void setPollTarget(const Netmask& target, uint16_t port, uint32_t intervalMs);
  void disablePolling() { pollEnabled = false; }
  void setNodeReport(const std::string& text, def::RC code = def::RC::PowerOk) { report.update(text, code); }

  // Returns whether an ArtPoll went out. Skipped when we replied to someone
  // else's poll within the last half interval.
  bool poll();
  // One ArtPollReply per interface, net, subnet and group of 4 ports.
  void pollReply();

  void onPoll(const packet::PollRecord& poll, IPv4 source);
  void onPollReply(const packet::PollReplyRecord& reply, IPv4 source);
  bool isSelf(const packet::PollReplyRecord& reply, IPv4 source) const;

  size_t subscribeNodeUpdates(NodeUpdateFn fn);
  void unsubscribeNodeUpdates(size_t id);

  uint16_t replyCounter() const { return counter; }
  uint32_t lastReplyAt() const { return lastReply; }
  IPv4 pollDestination() const { return pollDest; }
  bool isPolling() const { return pollEnabled; }

private:
  DeviceRegistry& registry;
  const InterfaceList& interfaces;
  Transport& transport;
  NodeName names;
  DeviceInfo deviceInfo;
  NodeReport report;
  ErrorFn onError;

  Socket* socket = nullptr;
  bool pollEnabled = false;
  IPv4 pollDest = IPv4::NONE();
  uint16_t pollPort = def::defaultUdpPort;
  uint32_t pollIntervalMs = 0;

  uint16_t counter = 0;     // 0..9999
  uint32_t lastReply = 0;
  bool replied = false;

  size_t nextSubscription = 0;
  std::vector<std::pair<size_t, NodeUpdateFn>> subscribers;
};

}
