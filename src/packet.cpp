#include "packet.h"

namespace artlink {
namespace packet {

void PortSlots::addInput(int slot, uint8_t universe) {
  types[slot]    |= PortTypeInput;
  goodInput[slot] = portGood;
  swIn[slot]      = universe & 0x0F;
}

void PortSlots::addOutput(int slot, uint8_t universe) {
  types[slot]     |= PortTypeOutput;
  goodOutput[slot] = portGood;
  swOut[slot]      = universe & 0x0F;
}

void PortSlots::unpack(int count, uint8_t bindIndex, uint8_t net, uint8_t subnet, IPv4 ip,
                       std::vector<PortInfo>& inputs, std::vector<PortInfo>& outputs) const {
  for(int p = 0; p < count && p < (int)numPorts; p++) {
    int portNumber = bindIndex * numPorts + p;
    if(types[p] & PortTypeInput)
      inputs.push_back({net, subnet, uint8_t(swIn[p] & 0x0F), ip, portNumber,
                        (goodInput[p] & portGood) != 0});
    if(types[p] & PortTypeOutput)
      outputs.push_back({net, subnet, uint8_t(swOut[p] & 0x0F), ip, portNumber,
                         (goodOutput[p] & portGood) != 0});
  }
}


static std::string fixedString(const char* field, size_t size) {
  return std::string(field, strnlen(field, size));
}

std::optional<OpCode> parseHeader(const uint8_t* data, size_t length) {
  if(!data || length < headerLength) {
    ARTLINK_LOGD("Payload too short (%zu bytes)", length);
    return std::nullopt;
  }
  auto header = reinterpret_cast<const art::Header*>(data);
  if(memcmp(header->ID, idStr, sizeof(header->ID)) != 0) {
    ARTLINK_LOGD("Invalid header");
    return std::nullopt;
  }
  auto opCode = header->getOpCode();
  if(opCode == OpNone) {
    ARTLINK_LOGD("Invalid OpCode");
    return std::nullopt;
  }
  return opCode;
}

std::optional<DmxFrame> parseDmx(const uint8_t* data, size_t length) {
  auto op = parseHeader(data, length);
  if(!op || *op != OpDmx) return std::nullopt;
  if(length < dmxHeaderLength) {
    ARTLINK_LOGD("ArtDmx too small (%zu bytes)", length);
    return std::nullopt;
  }

  auto packet = reinterpret_cast<const art::DMX*>(data);
  DmxFrame frame;
  frame.sequence = packet->sequenceID;
  frame.physical = packet->physical;
  frame.subUni   = packet->subUni;
  frame.net      = packet->net;
  frame.length   = uint16_t(std::min(length - dmxHeaderLength, dmxBufferSize));
  memcpy(frame.data.data(), data + dmxHeaderLength, frame.length);
  return frame;
}

std::optional<PollRecord> parsePoll(const uint8_t* data, size_t length) {
  auto op = parseHeader(data, length);
  if(!op || *op != OpPoll) return std::nullopt;
  if(length < pollLength) {
    ARTLINK_LOGD("ArtPoll too small (%zu bytes)", length);
    return std::nullopt;
  }

  auto packet = reinterpret_cast<const art::Poll*>(data);
  PollRecord record;
  record.protocolVersion = ntohs(packet->protocolVer);
  if(record.protocolVersion < protocolVersion) {
    ARTLINK_LOGD("ArtPoll protocol version %u not supported", record.protocolVersion);
    return std::nullopt;
  }
  record.talkToMe = packet->talkToMe;
  record.priority = uint8_t(packet->priority);
  return record;
}

std::optional<PollReplyRecord> parsePollReply(const uint8_t* data, size_t length) {
  auto op = parseHeader(data, length);
  if(!op || *op != OpPollReply) return std::nullopt;
  if(length < pollReplyMinLength) {
    ARTLINK_LOGD("Invalid ArtPollReply packet: too short (%zu bytes)", length);
    return std::nullopt;
  }

  // Older nodes send shorter replies, copy what's there into a zeroed
  // full size packet so the tail fields read as 0.
  alignas(art::PollReply) uint8_t storage[sizeof(art::PollReply)] = {0};
  memcpy(storage, data, std::min(length, sizeof(storage)));
  auto packet = reinterpret_cast<const art::PollReply*>(storage);

  PollReplyRecord record;
  record.ip         = IPv4(packet->ip);
  record.port       = le16toh(packet->port);
  record.fwVersion  = ntohs(packet->fwVersion);
  record.net        = packet->netSwitch & 0x7F;
  record.subnet     = packet->subSwitch & 0x0F;
  record.oem        = ntohs(packet->oem);
  record.estaMan    = le16toh(packet->estaMan);
  record.shortName  = fixedString(packet->names.shortName, sizeof(packet->names.shortName));
  record.longName   = fixedString(packet->names.longName, sizeof(packet->names.longName));
  record.nodeReport = fixedString(packet->nodeReport, sizeof(packet->nodeReport));
  record.numPorts   = ntohs(packet->portCount);
  record.ports      = packet->ports;
  record.mac        = packet->mac;
  record.bindIp     = IPv4(packet->bindIp);
  record.bindIndex  = packet->bindIndex;
  return record;
}

}
}
