#include "artlink.h"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace artlink {

std::string uuid4() {
  static boost::uuids::random_generator generate;
  return boost::uuids::to_string(generate());
}

static NodeName makeNames(const std::string& name) {
  auto longName = name.substr(0, def::longNamePrefixChars) + " " + uuid4();
  return NodeName(name.substr(0, def::shortNameChars), longName);
}


Driver::Driver(Config config, InterfaceList localInterfaces, Transport& transport):
  cfg(std::move(config)), ifaces(std::move(localInterfaces)), transport(transport),
  names(makeNames(cfg.name)), deviceInfo(cfg.oem, cfg.esta),
  registry(ifaces, cfg.nodeTimeoutMs),
  discovery(registry, ifaces, transport, names, deviceInfo, cfg.onError),
  dispatcher(registry, discovery)
{
  setLogLevel(cfg.logLevel);
  discovery.setNodeReport(cfg.name + " Art-Net transceiver running");

  Netmask pollTo;
  if(Netmask::parse(cfg.pollTo, pollTo)) {
    discovery.setPollTarget(pollTo, cfg.port, cfg.pollIntervalMs);
  } else {
    ARTLINK_LOGW("Invalid poll_to address: %s, polling disabled", cfg.pollTo.c_str());
  }

  for(auto& iface: ifaces)
    ARTLINK_LOGD("Interface " IP_FMT "/%u, broadcast " IP_FMT ", mac %s", IP_ARGS(iface.ip),
        iface.netmask.prefix(), IP_ARGS(iface.broadcastIP), macToString(iface.mac).c_str());

  bindSockets();
  startTimers();
  active = true;
  ARTLINK_LOGI("artlink started: %s / %s", names.getShort().c_str(), names.getLong().c_str());
}

Driver::~Driver() {
  stop();
}

void Driver::bindSockets() {
  try {
    listener = transport.bind(cfg.port, false);
    listener->onReceive([this](const uint8_t* data, size_t length, IPv4 ip, uint16_t port) {
      onPacket(data, length, ip, port);
    });
    listener->onError([this](const TransportError& e) { reportError(cfg.onError, e); });
    ARTLINK_LOGD("Listening on port %u", cfg.port);
  } catch(const TransportError& e) {
    reportError(cfg.onError, e);
  }

  try {
    socket = transport.bind(0, true);
    discovery.setSocket(socket.get());
  } catch(const TransportError& e) {
    reportError(cfg.onError, e);
  }
}

void Driver::startTimers() {
  if(cfg.pollIntervalMs > 0 && discovery.isPolling())
    pollTimer = transport.every(cfg.pollIntervalMs, [this]() { discovery.poll(); });

  if(cfg.sweepIntervalMs > 0)
    sweepTimer = transport.every(cfg.sweepIntervalMs, [this]() { registry.sweep(transport.now()); });
}

std::shared_ptr<Sender> Driver::newSender(const SenderConfig& config) {
  if(!active) throw Error("Driver is stopped, cannot add a sender");
  auto sender = std::make_shared<Sender>(config, ifaces, transport, cfg.onError);
  sender->setStopHandler([this](Sender* stopped) { registry.removeSender(stopped); });
  registry.addSender(sender);
  return sender;
}

std::shared_ptr<Receiver> Driver::newReceiver(const ReceiverConfig& config) {
  if(!active) throw Error("Driver is stopped, cannot add a receiver");
  auto receiver = std::make_shared<Receiver>(config, ifaces);
  registry.addReceiver(receiver);
  return receiver;
}

bool Driver::removeReceiver(const std::shared_ptr<Receiver>& receiver) {
  return registry.removeReceiver(receiver.get());
}

void Driver::stop() {
  if(!active) return;
  active = false;

  auto senders = registry.senders(); // stopping removes them from the registry
  for(auto& sender: senders)
    sender->stop();

  if(pollTimer)  pollTimer->cancel();
  if(sweepTimer) sweepTimer->cancel();
  pollTimer.reset();
  sweepTimer.reset();

  discovery.setSocket(nullptr);
  if(listener) listener->close();
  if(socket)   socket->close();
  ARTLINK_LOGI("artlink stopped");
}

}
