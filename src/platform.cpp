#include "platform.h"

#include <cstdio>
#include <cstdarg>
#include <cstdlib>

namespace artlink {

#if !defined(ESP_PLATFORM)
static LogLevel currentLevel = LogLevel::Info;

LogLevel logLevel() { return currentLevel; }
void setLogLevel(LogLevel level) { currentLevel = level; }

void logWrite(LogLevel level, const char* fmt, ...) {
  static const char tags[] = {'-', 'E', 'W', 'I', 'D', 'V'};
  char line[512];
  va_list args;
  va_start(args, fmt);
  vsnprintf(line, sizeof(line), fmt, args);
  va_end(args);
  std::fprintf(stderr, "[artlink] %c: %s\n", tags[(int)level], line);
}
#endif


bool IPv4::parse(const std::string& str, IPv4& out) {
  in_addr addr{};
  if(inet_pton(AF_INET, str.c_str(), &addr) != 1)
    return false;
  out = IPv4(uint32_t(addr.s_addr));
  return true;
}

std::string IPv4::toString() const {
  char buf[INET_ADDRSTRLEN] = {0};
  snprintf(buf, sizeof(buf), IP_FMT, IP_ARGS(*this));
  return buf;
}


static uint8_t prefixLength(uint32_t hostMask) {
  uint8_t bits = 0;
  while(bits < 32 && (hostMask & (0x80000000u >> bits))) bits++;
  return bits;
}

Netmask::Netmask(IPv4 addr, IPv4 netmask):
  base(IPv4::fromHost(addr.host() & netmask.host())), mask(netmask),
  bits(prefixLength(netmask.host())) {}

Netmask::Netmask(IPv4 addr, uint8_t prefix):
  Netmask(addr, IPv4::fromHost(prefix == 0? 0: (0xffffffffu << (32 - (prefix > 32? 32: prefix))))) {}

bool Netmask::parse(const std::string& cidr, Netmask& out) {
  auto slash = cidr.find('/');
  IPv4 addr;
  if(!IPv4::parse(cidr.substr(0, slash), addr))
    return false;
  if(slash == std::string::npos) {
    out = Netmask(addr, uint8_t(32));
    return true;
  }

  auto bitsStr = cidr.substr(slash + 1);
  if(bitsStr.empty() || bitsStr.size() > 2 ||
     bitsStr.find_first_not_of("0123456789") != std::string::npos)
    return false;
  int bits = std::atoi(bitsStr.c_str());
  if(bits > 32) return false;
  out = Netmask(addr, uint8_t(bits));
  return true;
}

std::string Netmask::toString() const {
  return base.toString() + "/" + std::to_string(bits);
}

}
