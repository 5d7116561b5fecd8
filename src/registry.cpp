#include "registry.h"

#include <algorithm>

namespace artlink {

static void updatePorts(const std::vector<PortInfo>& newPorts, Node::PortMap& existing,
                        const InterfaceList& localInterfaces) {
  for(auto& port: newPorts) {
    if(inLocalSubnet(localInterfaces, port.ip))
      existing[port.portNumber] = port;
  }
}

bool Node::updateFromPollReply(const packet::PollReplyRecord& record, IPv4 source,
                               const InterfaceList& localInterfaces, uint32_t now) {
  if(record.mac != mac) return false;

  auto oldIp = ip;
  auto oldShort = shortName, oldLong = longName;
  auto oldIn = inPorts, oldOut = outPorts;

  // ports live at the advertised ip, some nodes leave it empty
  IPv4 portIp = (uint32_t(record.ip) == 0)? source: record.ip;

  ip = source;
  shortName = record.shortName;
  longName = record.longName;

  std::vector<PortInfo> inputs, outputs;
  record.portInfo(portIp, inputs, outputs);
  updatePorts(inputs, inPorts, localInterfaces);
  updatePorts(outputs, outPorts, localInterfaces);

  bool changed = ip != oldIp || shortName != oldShort || longName != oldLong ||
                 inPorts != oldIn || outPorts != oldOut;

  status = record.nodeReport;
  lastUpdate = now;
  return changed;
}


bool DeviceRegistry::removeSender(const Sender* sender) {
  auto it = std::find_if(senderList.begin(), senderList.end(),
                         [sender](auto& s) { return s.get() == sender; });
  if(it == senderList.end()) return false;
  senderList.erase(it);
  return true;
}

bool DeviceRegistry::removeReceiver(const Receiver* receiver) {
  auto it = std::find_if(receiverList.begin(), receiverList.end(),
                         [receiver](auto& r) { return r.get() == receiver; });
  if(it == receiverList.end()) return false;
  receiverList.erase(it);
  return true;
}

bool DeviceRegistry::upsertController(const Controller& controller) {
  auto it = std::find_if(controllerList.begin(), controllerList.end(),
                         [&controller](auto& c) { return c.ip == controller.ip; });
  if(it != controllerList.end()) {
    *it = controller;
    return false;
  }
  controllerList.push_back(controller);
  ARTLINK_LOGD("New Controller detected: " IP_FMT, IP_ARGS(controller.ip));
  return true;
}

bool DeviceRegistry::upsertNode(const packet::PollReplyRecord& record, IPv4 source, uint32_t now) {
  auto it = nodeMap.find(record.mac);
  if(it == nodeMap.end()) {
    it = nodeMap.emplace(record.mac, Node(record.mac)).first;
    ARTLINK_LOGD("New Node detected: " IP_FMT " (%s)", IP_ARGS(source), macToString(record.mac).c_str());
  }
  return it->second.updateFromPollReply(record, source, interfaces, now);
}

void DeviceRegistry::sweep(uint32_t now) {
  for(auto& controller: controllerList) {
    if(controller.alive && now - controller.lastPoll > def::controllerTimeout) {
      controller.alive = false;
      ARTLINK_LOGD("Controller timed out: " IP_FMT, IP_ARGS(controller.ip));
    }
  }
  ARTLINK_LOGV("Check controller alive: %zu / %zu",
      (size_t)std::count_if(controllerList.begin(), controllerList.end(), [](auto& c) { return c.alive; }),
      controllerList.size());

  for(auto it = nodeMap.begin(); it != nodeMap.end();) {
    if(!it->second.isAlive(now, nodeTimeoutMs)) {
      ARTLINK_LOGD("Node removed: " IP_FMT " (%s)", IP_ARGS(it->second.ip), macToString(it->first).c_str());
      it = nodeMap.erase(it);
    } else {
      ++it;
    }
  }
  ARTLINK_LOGV("Check node alive: %zu", nodeMap.size());
}

const Node* DeviceRegistry::findNode(const mac_t& mac) const {
  auto it = nodeMap.find(mac);
  return it != nodeMap.end()? &it->second: nullptr;
}

const Controller* DeviceRegistry::findController(IPv4 ip) const {
  auto it = std::find_if(controllerList.begin(), controllerList.end(),
                         [ip](auto& c) { return c.ip == ip; });
  return it != controllerList.end()? &*it: nullptr;
}

}
