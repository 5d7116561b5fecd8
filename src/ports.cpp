#include "ports.h"
#include "packet.h"

#include <cstring>

namespace artlink {

static void checkChannel(int channel) {
  if(channel < 0 || channel >= (int)def::dmxBufferSize)
    throw InvalidChannelIndex(channel);
}

static void checkValue(int value) {
  if(value < 0 || value > 255)
    throw InvalidChannelValue(value);
}


Sender::Sender(const SenderConfig& config, const InterfaceList& localInterfaces,
               Transport& transport, ErrorFn onError):
  cfg(config), addr(PortAddress::fromParts(config.net, config.subnet, config.universe)),
  broadcast(config.broadcast), onError(std::move(onError))
{
  addr.print("Sender ");
  resolveDestination(localInterfaces);

  try {
    socket = transport.bind(0, broadcast);
  } catch(const TransportError& e) {
    reportError(this->onError, e);
  }

  ARTLINK_LOGI("SENDER started: net %u, subnet %u, universe %u, to %s, broadcast %d, port %u, refresh %u ms",
      addr.net(), addr.subnet(), addr.universe(), cfg.to.c_str(), broadcast, cfg.port, cfg.refreshIntervalMs);

  transmit(); // first frame right away

  if(cfg.refreshIntervalMs > 0)
    refresh = transport.every(cfg.refreshIntervalMs, [this]() { transmit(); });
}

Sender::~Sender() {
  if(refresh) refresh->cancel();
  if(socket) socket->close();
}

void Sender::resolveDestination(const InterfaceList& localInterfaces) {
  IPv4 to;
  if(!IPv4::parse(cfg.to, to)) {
    ARTLINK_LOGW("Sender: Invalid destination %s", cfg.to.c_str());
    return;
  }

  if(to == IPv4(255, 255, 255, 255)) {
    dest = to;
    broadcast = true;
    ifaces = localInterfaces;
  } else {
    for(auto& iface: localInterfaces) {
      if(!iface.netmask.contains(to)) continue;
      if(to == iface.broadcastIP) broadcast = true;
      dest = broadcast? iface.broadcastIP: to;
      ifaces.push_back(iface);
    }
  }

  if(ifaces.empty())
    ARTLINK_LOGW("Sender: No matching interface found for %s", cfg.to.c_str());
}

void Sender::setChannel(int channel, int value) {
  prepChannel(channel, value);
  transmit();
}

void Sender::prepChannel(int channel, int value) {
  checkChannel(channel);
  checkValue(value);
  buffer[channel] = uint8_t(value);
}

void Sender::fillChannels(int start, int stop, int value) {
  checkChannel(start);
  checkChannel(stop);
  checkValue(value);
  for(int ch = start; ch <= stop; ch++)
    buffer[ch] = uint8_t(value);
  transmit();
}

void Sender::blackout() {
  buffer.fill(0);
  transmit();
}

void Sender::transmit() {
  if(stopped || !socket || !socket->isReady()) return;
  if(dest == IPv4::ANY()) {
    ARTLINK_LOGV("ArtDMX frame for %u dropped, no destination", addr.toInt());
    return;
  }

  packet::art::DMX packet(sequence, addr, buffer.data(), def::dmxBufferSize);
  sequence++; // wraps through 0

  ARTLINK_LOGV("ArtDMX frame prepared for %u, seq %u", addr.toInt(), packet.sequenceID);

  IPv4 to = dest;
  uint16_t port = cfg.port;
  ErrorFn sink = onError;
  socket->send(packet::bytes(packet), packet.size(), to, port,
    [to, port, sink](const TransportError* err) {
      if(err) {
        reportError(sink, *err);
        return;
      }
      ARTLINK_LOGV("<- ArtDMX frame sent to " IP_FMT ":%u", IP_ARGS(to), port);
    });
}

void Sender::stop() {
  if(stopped) return;
  stopped = true;
  if(refresh) {
    refresh->cancel();
    refresh.reset();
  }
  if(socket) {
    socket->close();
    socket.reset();
  }
  ARTLINK_LOGI("SENDER stopped: %u", addr.toInt());

  auto keepAlive = weak_from_this().lock(); // the stop handler may drop the last owner
  if(onStopped) onStopped(this);
}


Receiver::Receiver(const ReceiverConfig& config, const InterfaceList& localInterfaces):
  cfg(config), addr(PortAddress::fromParts(config.net, config.subnet, config.universe))
{
  addr.print("Receiver ");

  if(!cfg.from.empty()) {
    std::string from = cfg.from;
    if(from.find('/') == std::string::npos) {
      from += "/32";
      ARTLINK_LOGD("Receiver: No subnet mask given, assuming %s (exact match)", from.c_str());
    }
    if(!Netmask::parse(from, sourceFilter))
      throw Error("Invalid source filter: " + cfg.from);
  }

  for(auto& iface: localInterfaces)
    if(sourceFilter.contains(iface.ip)) ifaces.push_back(iface);

  if(ifaces.empty())
    ARTLINK_LOGW("Receiver: No matching interface found for %s",
        cfg.from.empty()? "0.0.0.0/0": cfg.from.c_str());

  ARTLINK_LOGI("RECEIVER started: net %u, subnet %u, universe %u, from %s",
      addr.net(), addr.subnet(), addr.universe(), sourceFilter.toString().c_str());
}

void Receiver::receive(const uint8_t* data, uint16_t length) {
  received = std::min<uint16_t>(length, def::dmxBufferSize);
  buffer.fill(0);
  if(received) memcpy(buffer.data(), data, received);
  auto subs = subscribers; // a subscriber may unsubscribe itself
  for(auto& sub: subs)
    sub.second(buffer.data(), received);
}

size_t Receiver::subscribe(DataFn fn) {
  subscribers.emplace_back(nextSubscription, std::move(fn));
  return nextSubscription++;
}

void Receiver::unsubscribe(size_t id) {
  subscribers.erase(std::remove_if(subscribers.begin(), subscribers.end(),
                                   [id](auto& sub) { return sub.first == id; }),
                    subscribers.end());
}

}
