#pragma once

#include "discovery.h"
#include "registry.h"

namespace artlink {

// Routes datagrams from the listening socket to receivers and discovery.
class Dispatcher {
public:
  Dispatcher(DeviceRegistry& registry, DiscoveryEngine& discovery):
    registry(registry), discovery(discovery) {}

  // Returns the opcode handled, OpNone when the datagram was dropped.
  def::OpCode onDatagram(const uint8_t* data, size_t length, IPv4 source, uint16_t sourcePort);

private:
  void dmx(const packet::DmxFrame& frame, IPv4 source);

  DeviceRegistry& registry;
  DiscoveryEngine& discovery;
};

}
