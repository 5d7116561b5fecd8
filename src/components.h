#pragma once

#include <vector>
#include <array>
#include <string>
#include <algorithm>
#include <cstdio>
#include <cstring>

#include "protocol.h"
#include "platform.h"
#include "errors.h"

namespace artlink {

using mac_t       = std::array<uint8_t, 6>;
using dmx_buf_t   = std::array<uint8_t, def::dmxBufferSize>;

std::string macToString(const mac_t& mac);


// 15 bit Port-Address: net (bits 14-8), subnet (7-4), universe (3-0).
class PortAddress {
public:
  PortAddress() = default;

  // Overflowing parts carry upwards, universe into subnet into net, before
  // the range is checked. Throws InvalidPortAddress.
  static PortAddress fromParts(int net, int subnet, int universe);
  static PortAddress fromInt(uint32_t address);

  uint16_t toInt()    const { return address; }
  uint8_t  subUni()   const { return address & 0xFF; }   // "low byte", SubSwitch + universe
  uint8_t  net()      const { return (address >> 8) & 0x7F; }
  uint8_t  subnet()   const { return (address >> 4) & 0x0F; }
  uint8_t  universe() const { return address & 0x0F; }

  bool operator==(const PortAddress& rhs) const { return address == rhs.address; }
  bool operator!=(const PortAddress& rhs) const { return address != rhs.address; }

  void print(const char* desc = "") const {
    ARTLINK_LOGV("%sPORT ADDRESS: full %u, net %u, subnet %u, universe %u, subUni %u",
        desc, address, net(), subnet(), universe(), subUni());
  }

private:
  explicit PortAddress(uint16_t address): address(address) {}
  uint16_t address = 0;
};


// One local IPv4 interface as handed over by the enumeration collaborator.
struct Interface {
  Interface() = default;
  Interface(IPv4 deviceIP, IPv4 subnetMask, const mac_t& deviceMAC):
    ip(deviceIP), netmask(deviceIP, subnetMask),
    broadcastIP(netmask.broadcast()), mac(deviceMAC) {}

  bool contains(IPv4 addr) const { return addr == ip || netmask.contains(addr); }

  IPv4 ip;
  Netmask netmask;
  IPv4 broadcastIP;
  mac_t mac{};
};

using InterfaceList = std::vector<Interface>;

inline const Interface* findInterface(const InterfaceList& interfaces, IPv4 ip) {
  auto it = std::find_if(interfaces.begin(), interfaces.end(),
                         [ip](const Interface& iface) { return iface.ip == ip; });
  return it != interfaces.end()? &*it: nullptr;
}

inline bool inLocalSubnet(const InterfaceList& interfaces, IPv4 ip) {
  return std::any_of(interfaces.begin(), interfaces.end(),
                     [ip](const Interface& iface) { return iface.contains(ip); });
}


#pragma pack(push, 1)

struct NodeName {
  NodeName() = default;
  NodeName(const std::string& name, const std::string& longName) {
    setShort(name); setLong(longName);
  }
  void setShort(const std::string& name) {
    memset(shortName, 0, sizeof(shortName));
    strncpy(shortName, name.c_str(), def::shortNameChars);
  }
  void setLong(const std::string& name) {
    memset(longName, 0, sizeof(longName));
    strncpy(longName, name.c_str(), def::longNameChars);
  }
  std::string getShort() const { return std::string(shortName, strnlen(shortName, sizeof(shortName))); }
  std::string getLong()  const { return std::string(longName, strnlen(longName, sizeof(longName))); }

	char shortName[def::shortNameLength] = {0},
       longName[def::longNameLength] = {0};
};

#pragma pack(pop)


struct NodeReport {
  static constexpr size_t size = def::nodeReportLength;

  NodeReport() = default;
  NodeReport(const std::string& text, def::RC statusCode = def::RC::PowerOk) {
    update(text, statusCode);
  }

  void update(const std::string& text, def::RC statusCode = def::RC::PowerOk) {
    code = statusCode;
    report = text;
  }
  // "#0001 [0042] text", counter is the reply counter of the sending engine
  void toBuffer(char* destination, uint32_t counter) const {
    memset(destination, 0, size);
    snprintf(destination, size, def::nodeReportFmt, (unsigned)code, (unsigned)counter, report.c_str());
  }
  def::RC code = def::RC::PowerOk;
  std::string report;
};


struct DeviceInfo {
  DeviceInfo(uint16_t oem = def::defaultOem, uint16_t estaMan = def::defaultEstaMan):
    oem(oem), estaMan(estaMan) {}
  uint16_t oem        = def::defaultOem;     // OEM code registered with Artistic Licence
  uint16_t estaMan    = def::defaultEstaMan; // ESTA manufacturer code
  uint16_t fwVersion  = def::firmwareVersion;
};


// Remote participant that sent us an ArtPoll.
struct Controller {
  IPv4 ip;
  uint32_t lastPoll = 0;
  bool alive = true;
  bool diagnosticUnicast = false;
  bool diagnosticEnable = false;
  bool unilateral = false;
  uint8_t priority = 0;
};


// A port advertised by a remote node.
struct PortInfo {
  uint8_t net = 0;
  uint8_t subnet = 0;
  uint8_t universe = 0;
  IPv4 ip;
  int portNumber = 0;  // bindIndex * 4 + slot
  bool isGood = false;

  bool operator==(const PortInfo& rhs) const {
    return net == rhs.net && subnet == rhs.subnet && universe == rhs.universe &&
           ip == rhs.ip && portNumber == rhs.portNumber && isGood == rhs.isGood;
  }
  bool operator!=(const PortInfo& rhs) const { return !(*this == rhs); }
};

}
