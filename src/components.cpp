#include "components.h"

namespace artlink {

std::string macToString(const mac_t& mac) {
  char buf[18];
  snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x",
           mac[0], mac[1], mac[2], mac[3], mac[4], mac[5]);
  return buf;
}

PortAddress PortAddress::fromParts(int net, int subnet, int universe) {
  if(net < 0 || subnet < 0 || universe < 0)
    throw InvalidPortAddress("Invalid Port Address: net, subnet and universe must be positive");
  if(net > 0x7FFF || subnet > 0x7FFF || universe > 0x7FFF)
    throw InvalidPortAddress("Invalid Port Address: net * subnet * universe must be smaller than 32768");

  subnet  += universe >> 4;
  universe = universe & 0x0F;
  net     += subnet >> 4;
  subnet   = subnet & 0x0F;

  if(net > 0x7F)
    throw InvalidPortAddress("Invalid Port Address: net * subnet * universe must be smaller than 32768");
  return fromInt((net << 8) | (subnet << 4) | universe);
}

PortAddress PortAddress::fromInt(uint32_t address) {
  if(address > 0x7FFF)
    throw InvalidPortAddress("Invalid Port Address: " + std::to_string(address) + " is larger than 32767");
  return PortAddress(uint16_t(address));
}

}
