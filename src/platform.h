#pragma once

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <string>
#include <chrono>

#include <netinet/in.h>
#include <arpa/inet.h>


namespace artlink {

enum class LogLevel: uint8_t {
  None = 0, Error, Warn, Info, Debug, Verbose
};

#if defined(ESP_PLATFORM)
inline void setLogLevel(LogLevel) {} // esp_log_level_set owns this on target
#else
LogLevel logLevel();
void setLogLevel(LogLevel level);
void logWrite(LogLevel level, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
#endif

}

#if defined(ESP_PLATFORM)
#include "esp_log.h"
#define ARTLINK_LOGE(f, ...) ESP_LOGE("artlink", f, ##__VA_ARGS__)
#define ARTLINK_LOGW(f, ...) ESP_LOGW("artlink", f, ##__VA_ARGS__)
#define ARTLINK_LOGI(f, ...) ESP_LOGI("artlink", f, ##__VA_ARGS__)
#define ARTLINK_LOGD(f, ...) ESP_LOGD("artlink", f, ##__VA_ARGS__)
#define ARTLINK_LOGV(f, ...) ESP_LOGV("artlink", f, ##__VA_ARGS__)
#else
#define ARTLINK_LOG(level, f, ...) \
  do { if(artlink::logLevel() >= (level)) artlink::logWrite((level), f, ##__VA_ARGS__); } while(0)
#define ARTLINK_LOGE(f, ...) ARTLINK_LOG(artlink::LogLevel::Error, f, ##__VA_ARGS__)
#define ARTLINK_LOGW(f, ...) ARTLINK_LOG(artlink::LogLevel::Warn, f, ##__VA_ARGS__)
#define ARTLINK_LOGI(f, ...) ARTLINK_LOG(artlink::LogLevel::Info, f, ##__VA_ARGS__)
#define ARTLINK_LOGD(f, ...) ARTLINK_LOG(artlink::LogLevel::Debug, f, ##__VA_ARGS__)
#define ARTLINK_LOGV(f, ...) ARTLINK_LOG(artlink::LogLevel::Verbose, f, ##__VA_ARGS__)
#endif

// dotted quad for printf, "%u.%u.%u.%u"
#define IP_FMT "%u.%u.%u.%u"
#define IP_ARGS(ip) (ip)[0], (ip)[1], (ip)[2], (ip)[3]


namespace artlink {

inline uint32_t uptimeMs() {
  using namespace std::chrono;
  uint32_t ms = duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
  return ms;
}

// Stored in network order, bytes[0] is the first octet.
class IPv4 {
  public:
    IPv4(uint32_t ip = INADDR_NONE): data(ip) {}
    IPv4(uint8_t a, uint8_t b, uint8_t c, uint8_t d): data(a, b, c, d) {}
    IPv4(const uint8_t* ip): data(ip) {}
    IPv4(const IPv4& ip): IPv4(uint32_t(ip)) {}

    static IPv4 fromHost(uint32_t hostOrder) { return IPv4(htonl(hostOrder)); }
    static bool parse(const std::string& str, IPv4& out);

    bool operator==(const IPv4& addr) const { return data.dword == addr.data.dword; }
    bool operator!=(const IPv4& addr) const { return data.dword != addr.data.dword; }
    uint32_t operator*() const { return data.dword; }
    operator uint32_t() const { return data.dword; }
    explicit operator bool()  const { return data.dword != INADDR_NONE; }
    uint8_t operator[](int index) const { return data.bytes[index]; }
    uint8_t& operator[](int index)      { return data.bytes[index]; }
    IPv4& operator=(const IPv4& ip) { data.dword = ip.data.dword; return *this; }
    IPv4& operator=(const uint8_t* ip) { memcpy(data.bytes, ip, sizeof(data.bytes)); return *this; }
    IPv4& operator=(uint32_t ip) { data.dword = ip; return *this; }

    uint32_t host() const { return ntohl(data.dword); }
    const uint8_t* bytes() const { return data.bytes; }
    std::string toString() const;

    static IPv4 NONE() { return IPv4(); }
    static IPv4 ANY() { return IPv4((uint32_t)0); }
  private:
    union Data {
      uint8_t bytes[4];
      uint32_t dword = 0;
      Data(uint32_t ip): dword(ip) {}
      Data(uint8_t a, uint8_t b, uint8_t c, uint8_t d) {
        bytes[0] = a; bytes[1] = b; bytes[2] = c; bytes[3] = d;
      };
      Data(const uint8_t* ip) { memcpy(bytes, ip, sizeof(bytes)); }
    } data;
};

// An IPv4 CIDR block, "10.0.0.0/8". A bare address is a /32.
class Netmask {
  public:
    Netmask(): base(IPv4::ANY()), mask(IPv4::ANY()), bits(0) {}
    Netmask(IPv4 addr, IPv4 mask);
    Netmask(IPv4 addr, uint8_t bits);

    static bool parse(const std::string& cidr, Netmask& out);

    bool contains(IPv4 ip) const { return (ip.host() & mask.host()) == base.host(); }
    IPv4 broadcast() const { return IPv4::fromHost(base.host() | ~mask.host()); }
    IPv4 network() const { return base; }
    IPv4 netmask() const { return mask; }
    uint8_t prefix() const { return bits; }
    std::string toString() const;

  private:
    IPv4 base, mask;
    uint8_t bits;
};

}
