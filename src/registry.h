#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "components.h"
#include "packet.h"
#include "ports.h"

namespace artlink {

// Remote node learned from ArtPollReply, keyed by MAC since its ip may change.
class Node {
public:
  using PortMap = std::map<int, PortInfo>;  // by port number, bindIndex * 4 + slot

  explicit Node(const mac_t& mac): mac(mac) {}

  // Returns whether ip, names or any port changed. The node report and the
  // timestamp are refreshed but not compared, the report carries a counter.
  bool updateFromPollReply(const packet::PollReplyRecord& record, IPv4 source,
                           const InterfaceList& localInterfaces, uint32_t now);
  bool isAlive(uint32_t now, uint32_t timeoutMs = def::nodeTimeout) const {
    return now - lastUpdate < timeoutMs;
  }

  mac_t mac;
  IPv4 ip = IPv4::NONE();
  std::string shortName;
  std::string longName;
  std::string status;
  uint32_t lastUpdate = 0;
  PortMap inPorts;
  PortMap outPorts;
};


class DeviceRegistry {
public:
  using SenderList   = std::vector<std::shared_ptr<Sender>>;
  using ReceiverList = std::vector<std::shared_ptr<Receiver>>;
  using NodeMap      = std::map<mac_t, Node>;
  using ControllerList = std::vector<Controller>;

  explicit DeviceRegistry(const InterfaceList& localInterfaces, uint32_t nodeTimeoutMs = def::nodeTimeout):
    interfaces(localInterfaces), nodeTimeoutMs(nodeTimeoutMs) {}

  void addSender(std::shared_ptr<Sender> sender) { senderList.push_back(std::move(sender)); }
  void addReceiver(std::shared_ptr<Receiver> receiver) { receiverList.push_back(std::move(receiver)); }
  bool removeSender(const Sender* sender);
  bool removeReceiver(const Receiver* receiver);

  // Replaces any controller with the same ip. Returns true if it is new.
  bool upsertController(const Controller& controller);
  // Creates the node on first sight. Returns whether anything observable changed.
  bool upsertNode(const packet::PollReplyRecord& record, IPv4 source, uint32_t now);

  // Controllers unseen for over a minute are marked dead, stale nodes dropped.
  void sweep(uint32_t now);

  const SenderList& senders() const { return senderList; }
  const ReceiverList& receivers() const { return receiverList; }
  const ControllerList& controllers() const { return controllerList; }
  const NodeMap& nodes() const { return nodeMap; }
  const Node* findNode(const mac_t& mac) const;
  const Controller* findController(IPv4 ip) const;

private:
  const InterfaceList& interfaces;
  uint32_t nodeTimeoutMs;

  SenderList senderList;
  ReceiverList receiverList;
  ControllerList controllerList;
  NodeMap nodeMap;
};

}
