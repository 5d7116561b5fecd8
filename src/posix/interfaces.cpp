#include "interfaces.h"

#include <cerrno>
#include <map>
#include <string>

#include <ifaddrs.h>
#include <net/if.h>
#include <netpacket/packet.h>

namespace artlink {
namespace posix {

InterfaceList localInterfaces() {
  InterfaceList interfaces;

  struct ifaddrs* ifaddr = nullptr;
  if(getifaddrs(&ifaddr) != 0 || ifaddr == nullptr) {
    ARTLINK_LOGE("getifaddrs failed: %s", strerror(errno));
    return interfaces;
  }

  // mac addresses come in as separate AF_PACKET entries
  std::map<std::string, mac_t> macs;
  for(auto* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
    if(ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_PACKET) continue;
    auto ll = reinterpret_cast<const sockaddr_ll*>(ifa->ifa_addr);
    mac_t mac{};
    if(ll->sll_halen == mac.size())
      memcpy(mac.data(), ll->sll_addr, mac.size());
    macs[ifa->ifa_name] = mac;
  }

  for(auto* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
    if(ifa->ifa_addr == nullptr || ifa->ifa_netmask == nullptr) continue;
    if(ifa->ifa_addr->sa_family != AF_INET) continue;
    if((ifa->ifa_flags & IFF_LOOPBACK) || !(ifa->ifa_flags & IFF_UP)) continue;

    IPv4 ip(reinterpret_cast<const sockaddr_in*>(ifa->ifa_addr)->sin_addr.s_addr);
    IPv4 mask(reinterpret_cast<const sockaddr_in*>(ifa->ifa_netmask)->sin_addr.s_addr);
    if(findInterface(interfaces, ip)) continue;

    mac_t mac{};
    auto it = macs.find(ifa->ifa_name);
    if(it != macs.end()) mac = it->second;

    interfaces.emplace_back(ip, mask, mac);
    ARTLINK_LOGV("Interface %s: " IP_FMT, ifa->ifa_name, IP_ARGS(ip));
  }

  freeifaddrs(ifaddr);
  return interfaces;
}

} // namespace posix
} // namespace artlink
