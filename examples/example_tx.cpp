// Sends a slow fade on the first channels of one universe.
//   artlink_tx [universe] [to] [channels]    e.g. artlink_tx 1 10.0.0.255 8

#include <csignal>
#include <cstdio>
#include <cstdlib>

#include "artlink.h"
#include "posix/asio_transport.h"
#include "posix/interfaces.h"

using namespace artlink;

int main(int argc, char* argv[]) {
  SenderConfig txConfig;
  int channels = 8;
  if(argc > 1) txConfig.universe = atoi(argv[1]);
  if(argc > 2) txConfig.to = argv[2];
  if(argc > 3) channels = atoi(argv[3]);

  posix::io_context io;
  posix::AsioTransport transport(io);

  Driver::Config config;
  config.name = "artlink-tx";
  config.onError = [](const TransportError& e) { ARTLINK_LOGE("%s", e.what()); };

  try {
    Driver driver(config, posix::localInterfaces(), transport);
    auto sender = driver.newSender(txConfig);

    int level = 0;
    auto fade = transport.every(40, [&]() {
      level = (level + 5) % 256;
      try {
        sender->fillChannels(0, channels - 1, level);
      } catch(const Error& e) {
        ARTLINK_LOGE("%s", e.what());
        io.stop();
      }
    });

    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const posix::error_code&, int) {
      fade->cancel();
      sender->blackout();
      driver.stop();
      io.stop();
    });

    io.run();
  } catch(const Error& e) {
    fprintf(stderr, "%s\n", e.what());
    return 1;
  }
  return 0;
}
