/* Art-Net packet definitions and decoders.
 * Encoding is done by constructing the packed structs below and sending their
 * bytes as-is, decoding copies what the engine needs out of received buffers.
 */
#pragma once

#include <optional>
#include <string>
#include <vector>
#include <algorithm>
#include <endian.h>

#include "platform.h"
#include "protocol.h"
#include "components.h"


namespace artlink {

namespace packet {

using namespace def;


#pragma pack(push, 1)

// PortTypes / GoodInput / GoodOutput / SwIn / SwOut of an ArtPollReply,
// one byte per port slot.
struct PortSlots {
  uint8_t types[numPorts]      = {0},  // bit 7 input, bit 6 output
          goodInput[numPorts]  = {0},  // bit 7 data received
          goodOutput[numPorts] = {0},  // bit 7 data transmitted
          swIn[numPorts]       = {0},  // low nibble: universe
          swOut[numPorts]      = {0};

  void addInput(int slot, uint8_t universe);
  void addOutput(int slot, uint8_t universe);

  // Port descriptors for the first count slots. Port numbers are global,
  // bindIndex * 4 + slot.
  void unpack(int count, uint8_t bindIndex, uint8_t net, uint8_t subnet, IPv4 ip,
              std::vector<PortInfo>& inputs, std::vector<PortInfo>& outputs) const;
};

namespace art {

struct Header { // Core Artnet header. Inherited by all other packets.
  Header(OpCode op): opCode(htole16(op)) {}
	const char ID[8] = {ARTLINK_ID_STR}; // protocol ID = "Art-Net"
	uint16_t opCode;                     // lo byte first

  OpCode getOpCode() const { return OpCode(le16toh(opCode)); }
};
struct HeaderExt: Header { // Most packets also add the protocol version.
  HeaderExt(OpCode op): Header(op) {}
	const uint16_t protocolVer = htons(def::protocolVersion); // hi byte first
};

struct Poll: HeaderExt {
  Poll(uint8_t talkToMe = 0, DiagPriority priority = DiagPriority::All):
    HeaderExt(OpPoll), talkToMe(talkToMe), priority(priority) {}
  uint8_t talkToMe;       // bit 1 unilateral, 2 diagnostics enable, 3 diagnostics unicast
	DiagPriority priority;  // lowest priority of diagnostics message that node should send.
};

struct PollReply: Header {
  PollReply(const Interface& iface, const NodeName& names, const DeviceInfo& deviceInfo,
            uint8_t net, uint8_t subnet, uint8_t bindIndex):
    Header(OpPollReply),
    ip(uint32_t(iface.ip)), fwVersion(htons(deviceInfo.fwVersion)),
    netSwitch(net & 0x7F), subSwitch(subnet & 0x0F),
    oem(htons(deviceInfo.oem)), estaMan(htole16(deviceInfo.estaMan)),
    names(names), mac(iface.mac), bindIp(uint32_t(iface.ip)), bindIndex(bindIndex)
  {}

  void setPortCount(uint16_t count) { portCount = htons(count); }

  uint32_t  ip          = 0;         // 0 is valid, means not configured
	uint16_t  port				= htole16(def::defaultUdpPort);   // always 6454, lo byte first
	uint16_t  fwVersion	  = 0;         // hi, lo
	uint8_t   netSwitch		= 0;         // Bits 14-8 of the 15 bit Port-Address
	uint8_t   subSwitch		= 0;         // Bits 7-4 of the 15 bit Port-Address
	uint16_t  oem				  = 0;         // hi, lo
	uint8_t   ubeaVersion	= 0;
  uint8_t   status      = def::status1;
	uint16_t  estaMan     = 0;         // lo, hi
  NodeName  names;
	char nodeReport[def::nodeReportLength] = {0}; // Text feedback of Node status
  uint16_t  portCount   = 0;         // hi, lo. 0-4
  PortSlots ports;
  uint8_t   acnPriority = 0;
	uint8_t   swMacro     = 0;
	uint8_t   swRemote    = 0;
	uint8_t   spare[3]    = {0};
  Style     style       = StNode;
  mac_t     mac;
  uint32_t  bindIp      = 0;
	uint8_t   bindIndex   = 0;	  // which group of 4 ports this packet describes
  uint8_t   status2     = def::status2;
	uint8_t   filler[26]  = {0};
};

struct DMX: HeaderExt {
  DMX(uint8_t seqId, PortAddress addr, const uint8_t* payload, uint16_t length):
    HeaderExt(OpDmx),
    sequenceID(seqId), subUni(addr.subUni()), net(addr.net()),
    length(htons(length > dmxBufferSize? dmxBufferSize: length)) {
      if(payload) memcpy(data.data(), payload, dmxDataLen());
    }
	uint8_t sequenceID		= 1;
	uint8_t physical      = 0;  // physical input port, informational only
	uint8_t subUni				= 0;  // sub + uni: low 8 bits of 15bit Port-Address
	uint8_t net           = 0;  // high 7 bits of 15bit Port-Address
	uint16_t length       = 0;  // hi, lo
  dmx_buf_t data{};

  uint16_t dmxDataLen() const { return ntohs(length); }
  size_t size() const { return dmxHeaderLength + dmxDataLen(); }
};

} // END NAMESPACE ART

#pragma pack(pop)

static_assert(sizeof(PortSlots) == 20, "PortSlots must be 5 x 4 bytes");
static_assert(sizeof(art::Poll) == pollLength, "ArtPoll must be 14 bytes");
static_assert(sizeof(art::PollReply) == 239, "ArtPollReply must be 239 bytes");
static_assert(sizeof(art::DMX) == dmxHeaderLength + dmxBufferSize, "ArtDmx header must be 18 bytes");

template<class Packet>
const uint8_t* bytes(const Packet& packet) { return reinterpret_cast<const uint8_t*>(&packet); }


// Decoded packets. Only what the engine reads is kept.

struct DmxFrame {
  uint8_t sequence = 0;
  uint8_t physical = 0;
  uint8_t subUni   = 0;
  uint8_t net      = 0;
  uint16_t length  = 0;   // taken from the datagram size, not the length field
  dmx_buf_t data{};
};

struct PollRecord {
  uint16_t protocolVersion = 0;
  uint8_t talkToMe = 0;
  uint8_t priority = 0;

  bool diagnosticUnicast() const { return talkToMe & ttmDiagnosticUnicast; }
  bool diagnosticEnable()  const { return talkToMe & ttmDiagnosticEnable; }
  bool unilateral()        const { return talkToMe & ttmUnilateral; }
};

struct PollReplyRecord {
  IPv4 ip;
  uint16_t port = 0;
  uint16_t fwVersion = 0;
  uint8_t net = 0;
  uint8_t subnet = 0;
  uint16_t oem = 0;
  uint16_t estaMan = 0;
  std::string shortName;
  std::string longName;
  std::string nodeReport;
  uint16_t numPorts = 0;
  PortSlots ports;
  mac_t mac{};
  IPv4 bindIp;
  uint8_t bindIndex = 0;

  // Ports of this packet, numbered bindIndex * 4 + slot. ip is where they live.
  void portInfo(IPv4 ip, std::vector<PortInfo>& inputs, std::vector<PortInfo>& outputs) const {
    ports.unpack(std::min<int>(numPorts, def::numPorts), bindIndex, net, subnet, ip, inputs, outputs);
  }
};

// All decoders return nullopt for anything that isn't a well formed packet.
std::optional<OpCode> parseHeader(const uint8_t* data, size_t length);
std::optional<DmxFrame> parseDmx(const uint8_t* data, size_t length);
std::optional<PollRecord> parsePoll(const uint8_t* data, size_t length);
std::optional<PollReplyRecord> parsePollReply(const uint8_t* data, size_t length);

} // END NAMESPACE PACKET

} // END NAMESPACE
