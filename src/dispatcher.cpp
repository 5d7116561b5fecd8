#include "dispatcher.h"

namespace artlink {

using namespace def;

OpCode Dispatcher::onDatagram(const uint8_t* data, size_t length, IPv4 source, uint16_t sourcePort) {
  auto opCode = packet::parseHeader(data, length);
  if(!opCode) return OpNone;

  switch(*opCode) {
    case OpDmx: {
      auto frame = packet::parseDmx(data, length);
      if(!frame) return OpNone;
      dmx(*frame, source);
      break;
    }
    case OpPoll: {
      auto poll = packet::parsePoll(data, length);
      if(!poll) return OpNone;
      ARTLINK_LOGD("-> ArtPoll from " IP_FMT ":%u", IP_ARGS(source), sourcePort);
      discovery.onPoll(*poll, source);
      break;
    }
    case OpPollReply: {
      auto reply = packet::parsePollReply(data, length);
      if(!reply) return OpNone;
      discovery.onPollReply(*reply, source);
      break;
    }
    default:
      ARTLINK_LOGD("OpCode not supported: 0x%04x", (unsigned)*opCode);
      return OpNone;
  }
  return *opCode;
}

void Dispatcher::dmx(const packet::DmxFrame& frame, IPv4 source) {
  ARTLINK_LOGV("-> ArtDMX frame from " IP_FMT " for subUni %u, seq %u, %u channels",
      IP_ARGS(source), frame.subUni, frame.sequence, frame.length);

  auto receivers = registry.receivers(); // a subscriber may remove its receiver
  bool matched = false;
  for(auto& receiver: receivers) {
    if(!receiver->acceptPacket(frame.subUni, source)) continue;
    receiver->receive(frame.data.data(), frame.length);
    matched = true;
  }
  if(!matched)
    ARTLINK_LOGV("Unrequested ArtDMX frame at subUni %u dropped", frame.subUni);
}

}
