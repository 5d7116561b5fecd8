#pragma once

#include <cstdint>
#include <stddef.h>

#include "platform.h"

namespace artlink::def {


const uint16_t defaultUdpPort       = 6454;
constexpr const char* idStr         = "Art-Net";
#define ARTLINK_ID_STR              'A', 'r', 't', '-', 'N', 'e', 't', '\0'
const uint16_t protocolVersion      = 14;
const uint16_t firmwareVersion      = 0x0001;

const size_t headerLength           = 10;  // ID + OpCode
const size_t pollLength             = 14;
const size_t dmxHeaderLength        = 18;
const size_t pollReplyMinLength     = 208;
const size_t bufferMax              = 600;
const size_t dmxBufferSize          = 512;

const size_t shortNameLength        = 18;
const size_t longNameLength         = 64;
const size_t nodeReportLength       = 64;
const size_t shortNameChars         = 16;
const size_t longNameChars          = 63;
const size_t longNamePrefixChars    = 28;  // rest of the long name is the instance uuid
constexpr const char* nodeReportFmt = "#%04x [%04u] %s";

// time defines, ms
const uint32_t controllerTimeout    = 60000;
const uint32_t nodeTimeout          = 30000;
const uint32_t sweepInterval        = 5000;
const uint32_t senderRefresh        = 1000;

const uint32_t numPorts             = 4;
const uint32_t replyCounterWrap     = 10000;
const uint16_t defaultOem           = 0x2908;
const uint16_t defaultEstaMan       = 0x0000;

enum OpCode: uint16_t {
  OpNone             = 0x0000,
  OpPoll             = 0x2000, // This is an ArtPoll packet, no other data is contained in this UDP packet
  OpPollReply        = 0x2100, // This is an ArtPollReply Packet. It contains device status information.
  OpDmx              = 0x5000, // This is an ArtDmx data packet. It contains zero start code DMX512 information for a single Universe.
};

// PortTypes bits in ArtPollReply
enum PortType: uint8_t {
  PortTypeNone   = 0x00,
  PortTypeOutput = 0x40,  // can output data from the Art-Net network
  PortTypeInput  = 0x80,  // can input onto the Art-Net network
};

// GoodInput / GoodOutput: bit 7 data active
const uint8_t portGood              = 0x80;

// Status1: indicators normal, universe programmed from front panel
const uint8_t status1               = 0b11010000;
// Status2: DHCP configured, DHCP capable, 15 bit port address
const uint8_t status2               = 0b00001110;

// TalkToMe bits in ArtPoll
const uint8_t ttmUnilateral         = 1 << 1;
const uint8_t ttmDiagnosticEnable   = 1 << 2;
const uint8_t ttmDiagnosticUnicast  = 1 << 3;

enum RC: uint16_t { // Report Codes
  Debug	= 0x0000,
  PowerOk, PowerFail, SocketWr1, ParseFail, UdpFail, ShNameOk, LoNameOk,
  DmxError, DmxUdpFull, DmxRxFull, SwitchErr, ConfigErr, DmxShort, FirmareFail, UserFail
};

enum class DiagPriority: uint8_t {
  All = 0x00, // not an actual priority - used as setting for what to accept
  Low	= 0x10, Med = 0x40, High = 0x80, Critical = 0xe0, Vol = 0xf0, None = 0xff
};

enum Style: uint8_t {
  StNode = 0, StController, StMedia, StRoute, StBackup, StConfig, StVisual
};

}
