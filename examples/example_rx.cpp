// Prints every DMX frame for one universe, and nodes as they show up.
//   artlink_rx [universe] [from]    e.g. artlink_rx 0 10.0.0.0/8

#include <csignal>
#include <cstdio>
#include <cstdlib>

#include "artlink.h"
#include "posix/asio_transport.h"
#include "posix/interfaces.h"

using namespace artlink;

int main(int argc, char* argv[]) {
  ReceiverConfig rxConfig;
  if(argc > 1) rxConfig.universe = atoi(argv[1]);
  if(argc > 2) rxConfig.from = argv[2];

  posix::io_context io;
  posix::AsioTransport transport(io);

  Driver::Config config;
  config.name = "artlink-rx";
  config.pollIntervalMs = 10000;
  config.logLevel = LogLevel::Debug;
  config.onError = [](const TransportError& e) { ARTLINK_LOGE("%s", e.what()); };

  try {
    Driver driver(config, posix::localInterfaces(), transport);

    auto receiver = driver.newReceiver(rxConfig);
    receiver->subscribe([](const uint8_t* data, uint16_t length) {
      printf("DMX data (%u):", length);
      for(int i = 0; i < 16 && i < length; i++) printf(" %3u", data[i]);
      printf(length > 16? " ...\n": "\n");
    });

    driver.subscribeNodeUpdates([](const Node& node) {
      printf("Node %s (" IP_FMT ", %s): %zu in, %zu out\n", node.shortName.c_str(),
          IP_ARGS(node.ip), macToString(node.mac).c_str(), node.inPorts.size(), node.outPorts.size());
    });

    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const posix::error_code&, int) {
      driver.stop();
      io.stop();
    });

    driver.sendPoll();
    io.run();
  } catch(const Error& e) {
    fprintf(stderr, "%s\n", e.what());
    return 1;
  }
  return 0;
}
