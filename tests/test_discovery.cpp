#include <gtest/gtest.h>

#include "test_util.h"

using namespace artlink;
using namespace artlink::test;

class DiscoveryTest: public ::testing::Test {
protected:
  Driver::Config config(uint32_t pollIntervalMs = 0) {
    Driver::Config cfg;
    cfg.name = "test-node";
    cfg.pollIntervalMs = pollIntervalMs;
    cfg.logLevel = LogLevel::Error;
    return cfg;
  }

  std::vector<uint8_t> remoteReply(const NodeName& names, uint8_t universe = 1) {
    Interface remote(IPv4(10, 0, 0, 7), IPv4(255, 255, 255, 0), mac_t{0x0a, 1, 2, 3, 4, 5});
    packet::art::PollReply reply(remote, names, DeviceInfo(), 0, 0, 0);
    reply.setPortCount(1);
    reply.ports.addOutput(0, universe);
    return toVector(reply);
  }

  FakeTransport transport;
};

TEST_F(DiscoveryTest, NamesCarryInstanceId) {
  auto cfg = config();
  cfg.name = "a-rather-long-node-name-that-goes-on-and-on";
  Driver driver(cfg, testInterfaces(), transport);

  EXPECT_EQ(driver.getNames().getShort(), "a-rather-long-no");
  auto longName = driver.getNames().getLong();
  ASSERT_EQ(longName.size(), def::longNameChars);  // uuid tail is cut off
  EXPECT_EQ(longName.substr(0, 29), "a-rather-long-node-name-that ");
  EXPECT_EQ(longName[29 + 14], '4');

  Driver other(config(), testInterfaces(), transport);
  EXPECT_NE(other.getNames().getLong(), driver.getNames().getLong());
}

TEST(Uuid4Test, Version4Layout) {
  auto id = uuid4();
  ASSERT_EQ(id.size(), 36u);
  for(size_t dash: {8, 13, 18, 23}) EXPECT_EQ(id[dash], '-');
  EXPECT_EQ(id[14], '4');
  EXPECT_NE(std::string("89ab").find(id[19]), std::string::npos);
  EXPECT_EQ(id.find_first_not_of("0123456789abcdef-"), std::string::npos);
  EXPECT_NE(uuid4(), id);
}

TEST_F(DiscoveryTest, BindsListenerAndSendSocket) {
  Driver driver(config(), testInterfaces(), transport);
  ASSERT_NE(transport.listener(6454), nullptr);
  EXPECT_FALSE(transport.listener(6454)->broadcast);
  ASSERT_NE(transport.listener(50000), nullptr);
  EXPECT_TRUE(transport.listener(50000)->broadcast);
}

TEST_F(DiscoveryTest, PollGoesToBroadcastOfPollTarget) {
  auto cfg = config();
  cfg.pollTo = "10.0.0.0/24";
  cfg.port = 6455;
  Driver driver(cfg, testInterfaces(), transport);

  EXPECT_TRUE(driver.sendPoll());
  auto polls = transport.sentWithOpCode(def::OpPoll);
  ASSERT_EQ(polls.size(), 1u);
  EXPECT_EQ(polls[0].dest, IPv4(10, 0, 0, 255));
  EXPECT_EQ(polls[0].port, 6455);
  EXPECT_EQ(polls[0].fromPort, 50000);
  ASSERT_EQ(polls[0].data.size(), 14u);
  EXPECT_EQ(polls[0].data[12], 0);   // TalkToMe
  EXPECT_EQ(polls[0].data[13], 0);   // priority
}

TEST_F(DiscoveryTest, DefaultPollTargetIsLimitedBroadcast) {
  Driver driver(config(), testInterfaces(), transport);
  EXPECT_TRUE(driver.sendPoll());
  auto polls = transport.sentWithOpCode(def::OpPoll);
  ASSERT_EQ(polls.size(), 1u);
  EXPECT_EQ(polls[0].dest, IPv4(255, 255, 255, 255));
  EXPECT_EQ(polls[0].port, 6454);
}

TEST_F(DiscoveryTest, InvalidPollTargetDisablesPolling) {
  auto cfg = config(2000);
  cfg.pollTo = "nowhere";
  Driver driver(cfg, testInterfaces(), transport);

  EXPECT_FALSE(driver.sendPoll());
  transport.advance(10000);
  EXPECT_TRUE(transport.sentWithOpCode(def::OpPoll).empty());
}

TEST_F(DiscoveryTest, PeriodicPolling) {
  Driver driver(config(2000), testInterfaces(), transport);
  transport.advance(1999);
  EXPECT_TRUE(transport.sentWithOpCode(def::OpPoll).empty());
  transport.advance(1);
  EXPECT_EQ(transport.sentWithOpCode(def::OpPoll).size(), 1u);
  transport.advance(4000);
  EXPECT_EQ(transport.sentWithOpCode(def::OpPoll).size(), 3u);
}

TEST_F(DiscoveryTest, PollSkippedRightAfterReply) {
  Driver driver(config(10000), testInterfaces(), transport);
  driver.sendPollReply();

  transport.advance(4999);
  EXPECT_FALSE(driver.sendPoll());
  transport.advance(1);
  EXPECT_TRUE(driver.sendPoll());
}

TEST_F(DiscoveryTest, ForeignPollSuppressesPeriodicPoll) {
  Driver driver(config(10000), testInterfaces(), transport);
  packet::art::Poll poll;

  transport.advance(7000);
  transport.listener(6454)->deliver(toVector(poll), IPv4(10, 0, 0, 9));
  transport.advance(3000);   // timer fires 3 s after our reply
  EXPECT_TRUE(transport.sentWithOpCode(def::OpPoll).empty());

  transport.advance(10000);
  EXPECT_EQ(transport.sentWithOpCode(def::OpPoll).size(), 1u);
}

TEST_F(DiscoveryTest, RepliesGroupedInFours) {
  Driver driver(config(), testInterfaces(), transport);
  for(int u = 0; u < 6; u++) {
    SenderConfig sc;
    sc.universe = u;
    driver.newSender(sc);
  }
  auto counter = driver.replyCounter();

  driver.sendPollReply();

  auto replies = transport.sentWithOpCode(def::OpPollReply);
  ASSERT_EQ(replies.size(), 2u);
  EXPECT_EQ(driver.replyCounter(), counter + 1);

  for(size_t i = 0; i < replies.size(); i++) {
    auto& data = replies[i].data;
    ASSERT_EQ(data.size(), 239u);
    EXPECT_EQ(replies[i].dest, IPv4(10, 0, 0, 255));
    EXPECT_EQ(replies[i].port, 6454);
    EXPECT_EQ(data[211], i);   // bind index
  }
  EXPECT_EQ(be16(replies[0].data, 172), 4);
  EXPECT_EQ(be16(replies[1].data, 172), 2);
  EXPECT_EQ(replies[0].data[174], 0x40);
  EXPECT_EQ(replies[0].data[182], 0x80);
  EXPECT_EQ(replies[0].data[193], 3);   // swOut of slot 3
  EXPECT_EQ(replies[1].data[190], 4);
  EXPECT_EQ(replies[1].data[191], 5);
  EXPECT_EQ(replies[1].data[176], 0x00);
}

TEST_F(DiscoveryTest, RepliesSplitByNetAndSubnet) {
  Driver driver(config(), testInterfaces(), transport);
  SenderConfig sc;
  sc.subnet = 1;
  driver.newSender(sc);
  ReceiverConfig rc;
  rc.subnet = 1;
  rc.universe = 2;
  driver.newReceiver(rc);
  ReceiverConfig other;
  other.net = 3;
  driver.newReceiver(other);

  driver.sendPollReply();
  auto replies = transport.sentWithOpCode(def::OpPollReply);
  ASSERT_EQ(replies.size(), 2u);

  auto& mixed = replies[0].data;
  EXPECT_EQ(mixed[18], 0);
  EXPECT_EQ(mixed[19], 1);
  EXPECT_EQ(be16(mixed, 172), 2);
  EXPECT_EQ(mixed[174], 0x40);   // sender first
  EXPECT_EQ(mixed[175], 0x80);
  EXPECT_EQ(mixed[187], 2);      // swIn
  EXPECT_EQ(mixed[211], 0);

  EXPECT_EQ(replies[1].data[18], 3);
  EXPECT_EQ(replies[1].data[211], 0);
}

TEST_F(DiscoveryTest, NodeReportCarriesCounter) {
  Driver driver(config(), testInterfaces(), transport);
  driver.newReceiver(ReceiverConfig{});
  driver.sendPollReply();
  driver.sendPollReply();

  auto replies = transport.sentWithOpCode(def::OpPollReply);
  ASSERT_EQ(replies.size(), 2u);
  auto report = [](const Datagram& d) { return std::string(reinterpret_cast<const char*>(&d.data[108])); };
  EXPECT_EQ(report(replies[0]), "#0001 [0000] test-node Art-Net transceiver running");
  EXPECT_EQ(report(replies[1]), "#0001 [0001] test-node Art-Net transceiver running");
}

TEST_F(DiscoveryTest, PollRegistersControllerAndReplies) {
  Driver driver(config(), testInterfaces(), transport);
  driver.newReceiver(ReceiverConfig{});

  packet::art::Poll poll(def::ttmDiagnosticEnable);
  transport.listener(6454)->deliver(toVector(poll), IPv4(10, 0, 0, 9));

  ASSERT_EQ(driver.controllers().size(), 1u);
  auto& controller = driver.controllers()[0];
  EXPECT_EQ(controller.ip, IPv4(10, 0, 0, 9));
  EXPECT_EQ(controller.lastPoll, transport.clock);
  EXPECT_TRUE(controller.alive);
  EXPECT_TRUE(controller.diagnosticEnable);
  EXPECT_FALSE(controller.unilateral);
  EXPECT_EQ(transport.sentWithOpCode(def::OpPollReply).size(), 1u);
  EXPECT_EQ(driver.replyCounter(), 1);

  transport.listener(6454)->deliver(toVector(poll), IPv4(10, 0, 0, 9));
  EXPECT_EQ(driver.controllers().size(), 1u);
  EXPECT_EQ(driver.replyCounter(), 2);
}

TEST_F(DiscoveryTest, ControllerTimesOutOnSweep) {
  Driver driver(config(), testInterfaces(), transport);
  packet::art::Poll poll;
  transport.listener(6454)->deliver(toVector(poll), IPv4(10, 0, 0, 9));

  transport.advance(60000);
  EXPECT_TRUE(driver.controllers()[0].alive);
  transport.advance(5000);
  EXPECT_FALSE(driver.controllers()[0].alive);
}

TEST_F(DiscoveryTest, OwnRepliesAreIgnored) {
  Driver driver(config(), testInterfaces(), transport);
  int updates = 0;
  driver.subscribeNodeUpdates([&](const Node&) { updates++; });

  auto own = remoteReply(driver.getNames());
  transport.listener(6454)->deliver(own, IPv4(10, 0, 0, 2));
  EXPECT_TRUE(driver.nodes().empty());
  EXPECT_EQ(updates, 0);
}

TEST_F(DiscoveryTest, SameNamesFromAnotherHostAreANode) {
  Driver driver(config(), testInterfaces(), transport);
  auto reply = remoteReply(driver.getNames());
  transport.listener(6454)->deliver(reply, IPv4(10, 0, 0, 7));
  EXPECT_EQ(driver.nodes().size(), 1u);
}

TEST_F(DiscoveryTest, NodeUpdatesOnlyOnChange) {
  Driver driver(config(), testInterfaces(), transport);
  std::vector<std::string> seen;
  driver.subscribeNodeUpdates([&](const Node& node) { seen.push_back("a:" + node.shortName); });
  driver.subscribeNodeUpdates([&](const Node& node) { seen.push_back("b:" + node.shortName); });

  NodeName names("desk", "lighting desk");
  transport.listener(6454)->deliver(remoteReply(names), IPv4(10, 0, 0, 7));
  ASSERT_EQ(seen.size(), 2u);
  EXPECT_EQ(seen[0], "a:desk");
  EXPECT_EQ(seen[1], "b:desk");

  transport.listener(6454)->deliver(remoteReply(names), IPv4(10, 0, 0, 7));
  EXPECT_EQ(seen.size(), 2u);

  transport.listener(6454)->deliver(remoteReply(names, 9), IPv4(10, 0, 0, 7));
  EXPECT_EQ(seen.size(), 4u);

  auto& node = driver.nodes().begin()->second;
  EXPECT_EQ(node.ip, IPv4(10, 0, 0, 7));
  EXPECT_EQ(node.outPorts.at(0).universe, 9);
}

TEST_F(DiscoveryTest, UnsubscribedListenersAreNotCalled) {
  Driver driver(config(), testInterfaces(), transport);
  int updates = 0;
  auto id = driver.subscribeNodeUpdates([&](const Node&) { updates++; });
  driver.unsubscribeNodeUpdates(id);

  transport.listener(6454)->deliver(remoteReply(NodeName("desk", "desk")), IPv4(10, 0, 0, 7));
  EXPECT_EQ(driver.nodes().size(), 1u);
  EXPECT_EQ(updates, 0);
}

TEST_F(DiscoveryTest, SilentNodesAreDropped) {
  Driver driver(config(), testInterfaces(), transport);
  transport.listener(6454)->deliver(remoteReply(NodeName("desk", "desk")), IPv4(10, 0, 0, 7));
  ASSERT_EQ(driver.nodes().size(), 1u);

  transport.advance(25000);
  EXPECT_EQ(driver.nodes().size(), 1u);
  transport.advance(5000);
  EXPECT_TRUE(driver.nodes().empty());
}

TEST_F(DiscoveryTest, BindFailureGoesToErrorSink) {
  transport.failBind = true;
  std::vector<TransportError::Kind> errors;
  auto cfg = config();
  cfg.onError = [&](const TransportError& e) { errors.push_back(e.kind); };

  Driver driver(cfg, testInterfaces(), transport);
  ASSERT_EQ(errors.size(), 2u);
  EXPECT_EQ(errors[0], TransportError::Bind);
  EXPECT_FALSE(driver.sendPoll());
  driver.sendPollReply();
  EXPECT_TRUE(transport.sent.empty());
}

TEST_F(DiscoveryTest, BindFailureThrowsWithoutSink) {
  transport.failBind = true;
  EXPECT_THROW({ Driver driver(config(), testInterfaces(), transport); }, TransportError);
}

TEST_F(DiscoveryTest, ReceiveErrorsGoToErrorSink) {
  std::vector<TransportError::Kind> errors;
  auto cfg = config();
  cfg.onError = [&](const TransportError& e) { errors.push_back(e.kind); };
  Driver driver(cfg, testInterfaces(), transport);

  auto* listener = transport.listener(6454);
  ASSERT_NE(listener, nullptr);
  listener->failReceive();
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0], TransportError::Receive);

  // still listening
  packet::art::Poll poll;
  listener->deliver(toVector(poll), IPv4(10, 0, 0, 9));
  EXPECT_EQ(driver.controllers().size(), 1u);
}

TEST_F(DiscoveryTest, ReceiveErrorThrowsWithoutSink) {
  Driver driver(config(), testInterfaces(), transport);
  ASSERT_NE(transport.listener(6454), nullptr);
  EXPECT_THROW(transport.listener(6454)->failReceive(), TransportError);
}

TEST_F(DiscoveryTest, StopCancelsTimersAndClosesSockets) {
  Driver driver(config(2000), testInterfaces(), transport);
  EXPECT_EQ(transport.activeTimers(), 2u);
  driver.stop();
  EXPECT_FALSE(driver.isActive());
  EXPECT_EQ(transport.activeTimers(), 0u);
  EXPECT_EQ(transport.listener(6454), nullptr);
  EXPECT_FALSE(driver.sendPoll());
}
