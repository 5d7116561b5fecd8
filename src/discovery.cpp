#include "discovery.h"

#include <algorithm>

namespace artlink {

DiscoveryEngine::DiscoveryEngine(DeviceRegistry& registry, const InterfaceList& localInterfaces,
                                 Transport& transport, const NodeName& names,
                                 const DeviceInfo& deviceInfo, ErrorFn onError):
  registry(registry), interfaces(localInterfaces), transport(transport),
  names(names), deviceInfo(deviceInfo), onError(std::move(onError))
{}

void DiscoveryEngine::setPollTarget(const Netmask& target, uint16_t port, uint32_t intervalMs) {
  pollEnabled = true;
  pollDest = target.broadcast();
  pollPort = port;
  pollIntervalMs = intervalMs;
}

bool DiscoveryEngine::poll() {
  if(!pollEnabled || !socket || !socket->isReady()) return false;

  auto now = transport.now();
  if(replied && now - lastReply < pollIntervalMs / 2) {
    ARTLINK_LOGD("Skip ArtPoll, last poll reply was less than %u ms ago", pollIntervalMs / 2);
    return false;
  }

  packet::art::Poll packet;
  IPv4 to = pollDest;
  uint16_t port = pollPort;
  ErrorFn sink = onError;
  socket->send(packet::bytes(packet), sizeof(packet), to, port,
    [to, port, sink](const TransportError* err) {
      if(err) {
        reportError(sink, *err);
        return;
      }
      ARTLINK_LOGD("<- ArtPoll packet sent to " IP_FMT ":%u", IP_ARGS(to), port);
    });
  return true;
}


namespace {

struct PortEntry {
  bool output;
  uint8_t universe;
};

struct ReplyGroup {
  Interface iface;
  uint8_t net;
  uint8_t subnet;
  std::vector<PortEntry> ports;
};

void addToGroups(std::vector<ReplyGroup>& groups, const InterfaceList& ifaces,
                 PortAddress addr, bool output) {
  for(auto& iface: ifaces) {
    auto it = std::find_if(groups.begin(), groups.end(), [&](const ReplyGroup& g) {
      return g.iface.ip == iface.ip && g.net == addr.net() && g.subnet == addr.subnet();
    });
    if(it == groups.end())
      it = groups.insert(groups.end(), ReplyGroup{iface, addr.net(), addr.subnet(), {}});
    it->ports.push_back({output, addr.universe()});
  }
}

}

void DiscoveryEngine::pollReply() {
  std::vector<ReplyGroup> groups;
  for(auto& sender: registry.senders())
    addToGroups(groups, sender->interfaces(), sender->address(), true);
  for(auto& receiver: registry.receivers())
    addToGroups(groups, receiver->interfaces(), receiver->address(), false);

  if(socket && socket->isReady()) {
    for(auto& group: groups) {
      size_t chunks = (group.ports.size() + def::numPorts - 1) / def::numPorts;
      for(size_t chunk = 0; chunk < chunks; chunk++) {
        packet::art::PollReply packet(group.iface, names, deviceInfo,
                                      group.net, group.subnet, uint8_t(chunk));
        report.toBuffer(packet.nodeReport, counter);

        size_t first = chunk * def::numPorts;
        size_t count = std::min<size_t>(def::numPorts, group.ports.size() - first);
        packet.setPortCount(uint16_t(count));
        for(size_t slot = 0; slot < count; slot++) {
          auto& port = group.ports[first + slot];
          if(port.output) packet.ports.addOutput(int(slot), port.universe);
          else            packet.ports.addInput(int(slot), port.universe);
        }

        IPv4 to = group.iface.broadcastIP;
        ErrorFn sink = onError;
        socket->send(packet::bytes(packet), sizeof(packet), to, def::defaultUdpPort,
          [to, sink](const TransportError* err) {
            if(err) {
              reportError(sink, *err);
              return;
            }
            ARTLINK_LOGD("<- ArtPollReply packet sent to " IP_FMT ":%u", IP_ARGS(to), def::defaultUdpPort);
          });
      }
    }
  }

  counter = (counter + 1) % def::replyCounterWrap;
  lastReply = transport.now();
  replied = true;
}

void DiscoveryEngine::onPoll(const packet::PollRecord& poll, IPv4 source) {
  Controller controller;
  controller.ip = source;
  controller.lastPoll = transport.now();
  controller.alive = true;
  controller.diagnosticUnicast = poll.diagnosticUnicast();
  controller.diagnosticEnable = poll.diagnosticEnable();
  controller.unilateral = poll.unilateral();
  controller.priority = poll.priority;
  registry.upsertController(controller);

  pollReply();
}

bool DiscoveryEngine::isSelf(const packet::PollReplyRecord& reply, IPv4 source) const {
  return findInterface(interfaces, source) != nullptr &&
         reply.shortName == names.getShort() && reply.longName == names.getLong();
}

void DiscoveryEngine::onPollReply(const packet::PollReplyRecord& reply, IPv4 source) {
  if(isSelf(reply, source)) {
    ARTLINK_LOGV("-> ArtPollReply from ourselves, ignored");
    return;
  }
  ARTLINK_LOGD("-> ArtPollReply from %s (BindIndex: %u)", reply.shortName.c_str(), reply.bindIndex);

  if(!registry.upsertNode(reply, source, transport.now())) return;

  auto node = registry.findNode(reply.mac);
  if(!node) return;
  auto subs = subscribers;
  for(auto& sub: subs)
    sub.second(*node);
}

size_t DiscoveryEngine::subscribeNodeUpdates(NodeUpdateFn fn) {
  subscribers.emplace_back(nextSubscription, std::move(fn));
  return nextSubscription++;
}

void DiscoveryEngine::unsubscribeNodeUpdates(size_t id) {
  subscribers.erase(std::remove_if(subscribers.begin(), subscribers.end(),
                                   [id](auto& sub) { return sub.first == id; }),
                    subscribers.end());
}

}
