#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "engine.hpp"
#include "test_util.hpp"

using namespace tftpff;
using std::chrono::seconds;

namespace {

class EngineTest : public ::testing::Test {
protected:
  EngineTest() : backend(dir.path()) {}

  std::unique_ptr<Engine> make_engine(unsigned max_retries = DEFAULT_MAX_RETRIES,
                                      size_t max_sessions = DEFAULT_MAX_SESSIONS) {
    SessionLimits limits;
    limits.max_retries = max_retries;
    return std::make_unique<Engine>(backend, sender, limits, max_sessions);
  }

  void deliver(Engine &engine, const Endpoint &from, const std::vector<char> &packet) {
    engine.handle_datagram(from, packet.data(), packet.size(), now);
  }

  // Exactly one packet went out, to `to`; returns it decoded.
  Packet only_reply(const Endpoint &to) {
    std::vector<test::RecordingSender::Sent> sent = sender.take();
    if (sent.size() != 1) {
      ADD_FAILURE() << "expected one reply, got " << sent.size();
      return Packet();
    }
    EXPECT_EQ(sent[0].peer, to);
    return test::decode(sent[0].packet);
  }

  test::QuietLogs quiet;
  test::TempDir dir;
  FsBackend backend;
  test::RecordingSender sender;
  TimePoint now = TimePoint() + std::chrono::hours(1);
  Endpoint client = test::endpoint("10.0.0.5", 40000);
  Endpoint other = test::endpoint("10.0.0.6", 40000);
};

} // namespace

TEST_F(EngineTest, ServesReadRequest) {
  std::vector<char> content = test::make_content(1025);
  test::write_file(dir.path() / "a.bin", content);
  std::unique_ptr<Engine> engine = make_engine();

  deliver(*engine, client, create_rrq_packet("a.bin"));
  Packet p = only_reply(client);
  ASSERT_TRUE(std::holds_alternative<DataPacket>(p));
  EXPECT_EQ(std::get<DataPacket>(p).block, 1);
  EXPECT_EQ(std::get<DataPacket>(p).payload.size(), 512u);
  EXPECT_EQ(engine->session_count(), 1u);
  EXPECT_EQ(*engine->timers().deadline(client), now + seconds(DEFAULT_TIMEOUT_SEC));

  std::vector<char> received = std::get<DataPacket>(p).payload;
  for (uint16_t block = 1; block <= 2; ++block) {
    deliver(*engine, client, create_ack_packet(block));
    p = only_reply(client);
    const DataPacket &data = std::get<DataPacket>(p);
    EXPECT_EQ(data.block, block + 1);
    received.insert(received.end(), data.payload.begin(), data.payload.end());
  }
  EXPECT_EQ(received, content);

  deliver(*engine, client, create_ack_packet(3));
  EXPECT_TRUE(sender.sent.empty());
  EXPECT_EQ(engine->session_count(), 0u);
  EXPECT_FALSE(engine->timers().armed(client));
}

TEST_F(EngineTest, TraversalIsRejectedWithoutSession) {
  std::unique_ptr<Engine> engine = make_engine();
  deliver(*engine, client, create_rrq_packet("../etc/passwd"));
  Packet p = only_reply(client);
  const ErrorPacket &err = std::get<ErrorPacket>(p);
  EXPECT_EQ(err.code, 2);
  EXPECT_EQ(err.message, "access violation");
  EXPECT_EQ(engine->session_count(), 0u);
}

TEST_F(EngineTest, MissingFileIsNotFound) {
  std::unique_ptr<Engine> engine = make_engine();
  deliver(*engine, client, create_rrq_packet("nope.bin"));
  Packet p = only_reply(client);
  EXPECT_EQ(std::get<ErrorPacket>(p).code, 1);
  EXPECT_EQ(std::get<ErrorPacket>(p).message, "file not found");
  EXPECT_EQ(engine->session_count(), 0u);
}

TEST_F(EngineTest, RetriesThenGivesUp) {
  test::write_file(dir.path() / "a.bin", test::make_content(100));
  std::unique_ptr<Engine> engine = make_engine(3);

  deliver(*engine, client, create_rrq_packet("a.bin"));
  std::vector<char> first = sender.take().at(0).packet;

  for (int i = 0; i < 3; ++i) {
    // Nothing fires before the deadline.
    engine->handle_timeouts(now + seconds(4));
    EXPECT_TRUE(sender.sent.empty());

    now += seconds(5);
    engine->handle_timeouts(now);
    std::vector<test::RecordingSender::Sent> sent = sender.take();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].packet, first);
  }

  now += seconds(5);
  engine->handle_timeouts(now);
  Packet p = only_reply(client);
  EXPECT_EQ(std::get<ErrorPacket>(p).code, 0);
  EXPECT_EQ(std::get<ErrorPacket>(p).message, "timeout");
  EXPECT_EQ(engine->session_count(), 0u);
  EXPECT_FALSE(engine->next_deadline());
}

TEST_F(EngineTest, ConcurrentClientsAreIndependent) {
  test::write_file(dir.path() / "a.bin", std::vector<char>(600, 'a'));
  test::write_file(dir.path() / "b.bin", std::vector<char>(700, 'b'));
  std::unique_ptr<Engine> engine = make_engine();

  deliver(*engine, client, create_rrq_packet("a.bin"));
  deliver(*engine, other, create_rrq_packet("b.bin"));
  EXPECT_EQ(engine->session_count(), 2u);
  std::vector<test::RecordingSender::Sent> sent = sender.take();
  ASSERT_EQ(sent.size(), 2u);
  EXPECT_EQ(sent[0].peer, client);
  EXPECT_EQ(sent[1].peer, other);

  // Advancing one client leaves the other where it was.
  deliver(*engine, other, create_ack_packet(1));
  Packet p = only_reply(other);
  EXPECT_EQ(std::get<DataPacket>(p).payload, std::vector<char>(188, 'b'));
  EXPECT_EQ(engine->find_session(client)->block(), 1);

  deliver(*engine, client, create_ack_packet(1));
  p = only_reply(client);
  EXPECT_EQ(std::get<DataPacket>(p).payload, std::vector<char>(88, 'a'));

  deliver(*engine, other, create_ack_packet(2));
  EXPECT_EQ(engine->session_count(), 1u);
  EXPECT_NE(engine->find_session(client), nullptr);
}

TEST_F(EngineTest, FullTableRefusesNewClients) {
  test::write_file(dir.path() / "a.bin", test::make_content(100));
  std::unique_ptr<Engine> engine = make_engine(DEFAULT_MAX_RETRIES, 1);

  deliver(*engine, client, create_rrq_packet("a.bin"));
  sender.take();
  deliver(*engine, other, create_rrq_packet("a.bin"));
  Packet p = only_reply(other);
  EXPECT_EQ(std::get<ErrorPacket>(p).code, 0);
  EXPECT_EQ(std::get<ErrorPacket>(p).message, "server too busy");
  EXPECT_EQ(engine->session_count(), 1u);
}

TEST_F(EngineTest, RequestDuringActiveTransferIsIllegal) {
  test::write_file(dir.path() / "a.bin", test::make_content(2000));
  std::unique_ptr<Engine> engine = make_engine();
  deliver(*engine, client, create_rrq_packet("a.bin"));
  sender.take();
  TimePoint deadline = *engine->timers().deadline(client);

  now += seconds(1);
  deliver(*engine, client, create_rrq_packet("a.bin"));
  Packet p = only_reply(client);
  EXPECT_EQ(std::get<ErrorPacket>(p).code, 4);

  const Session *session = engine->find_session(client);
  ASSERT_NE(session, nullptr);
  EXPECT_EQ(session->block(), 1);
  EXPECT_EQ(session->state(), SessionState::Transferring);
  EXPECT_EQ(*engine->timers().deadline(client), deadline);

  // The first transfer carries on.
  deliver(*engine, client, create_ack_packet(1));
  EXPECT_EQ(std::get<DataPacket>(only_reply(client)).block, 2);
}

TEST_F(EngineTest, UnsolicitedPacketsAreDropped) {
  std::unique_ptr<Engine> engine = make_engine();
  deliver(*engine, client, create_ack_packet(1));
  std::vector<char> payload(10, 'x');
  deliver(*engine, client, create_data_packet(1, payload.data(), payload.size()));
  deliver(*engine, client, create_error_packet(TftpErrorCode::NotDefined, "bye"));
  EXPECT_TRUE(sender.sent.empty());
  EXPECT_EQ(engine->session_count(), 0u);
}

TEST_F(EngineTest, MalformedDatagramsAreDropped) {
  test::write_file(dir.path() / "a.bin", test::make_content(2000));
  std::unique_ptr<Engine> engine = make_engine();
  deliver(*engine, client, std::vector<char>{0, 9, 1});
  deliver(*engine, client, create_rrq_packet("a.bin", "netascii"));
  EXPECT_TRUE(sender.sent.empty());
  EXPECT_EQ(engine->session_count(), 0u);

  // Garbage from a client with a session leaves it alone.
  deliver(*engine, client, create_rrq_packet("a.bin"));
  sender.take();
  deliver(*engine, client, std::vector<char>{0, 4, 0});
  EXPECT_TRUE(sender.sent.empty());
  EXPECT_EQ(engine->find_session(client)->block(), 1);
}

TEST_F(EngineTest, StaleAckDoesNotRearmTimer) {
  test::write_file(dir.path() / "a.bin", test::make_content(2000));
  std::unique_ptr<Engine> engine = make_engine();
  deliver(*engine, client, create_rrq_packet("a.bin"));
  deliver(*engine, client, create_ack_packet(1));
  sender.take();
  TimePoint deadline = *engine->timers().deadline(client);

  now += seconds(2);
  deliver(*engine, client, create_ack_packet(1));
  EXPECT_TRUE(sender.sent.empty());
  EXPECT_EQ(*engine->timers().deadline(client), deadline);
}

TEST_F(EngineTest, ReceivesWriteRequest) {
  std::unique_ptr<Engine> engine = make_engine();
  deliver(*engine, client, create_wrq_packet("up.bin"));
  EXPECT_EQ(std::get<AckPacket>(only_reply(client)).block, 0);

  std::vector<char> content = test::make_content(600);
  deliver(*engine, client, create_data_packet(1, content.data(), 512));
  EXPECT_EQ(std::get<AckPacket>(only_reply(client)).block, 1);
  EXPECT_FALSE(std::filesystem::exists(dir.path() / "up.bin"));

  // A retransmitted block is acknowledged again, not written twice.
  deliver(*engine, client, create_data_packet(1, content.data(), 512));
  EXPECT_EQ(std::get<AckPacket>(only_reply(client)).block, 1);

  deliver(*engine, client, create_data_packet(2, content.data() + 512, 88));
  EXPECT_EQ(std::get<AckPacket>(only_reply(client)).block, 2);
  EXPECT_EQ(engine->session_count(), 0u);
  EXPECT_EQ(test::read_file(dir.path() / "up.bin"), content);
}

TEST_F(EngineTest, ClientErrorAbandonsUpload) {
  std::unique_ptr<Engine> engine = make_engine();
  deliver(*engine, client, create_wrq_packet("up.bin"));
  std::vector<char> block(512, 'u');
  deliver(*engine, client, create_data_packet(1, block.data(), block.size()));
  sender.take();

  deliver(*engine, client, create_error_packet(TftpErrorCode::NotDefined, "cancelled"));
  EXPECT_TRUE(sender.sent.empty());
  EXPECT_EQ(engine->session_count(), 0u);
  EXPECT_TRUE(std::filesystem::is_empty(dir.path()));
}

TEST_F(EngineTest, NegotiatesOptions) {
  test::write_file(dir.path() / "a.bin", test::make_content(1500));
  std::unique_ptr<Engine> engine = make_engine();
  deliver(*engine, client,
          create_rrq_packet("a.bin", "octet",
                            {{"blksize", "1024"}, {"tsize", "0"}, {"timeout", "2"}}));

  Packet p = only_reply(client);
  const OptionAckPacket &oack = std::get<OptionAckPacket>(p);
  OptionList expected = {{"blksize", "1024"}, {"tsize", "1500"}, {"timeout", "2"}};
  EXPECT_EQ(oack.options, expected);
  EXPECT_EQ(*engine->timers().deadline(client), now + seconds(2));

  deliver(*engine, client, create_ack_packet(0));
  p = only_reply(client);
  EXPECT_EQ(std::get<DataPacket>(p).payload.size(), 1024u);
  deliver(*engine, client, create_ack_packet(1));
  p = only_reply(client);
  EXPECT_EQ(std::get<DataPacket>(p).payload.size(), 476u);
}

TEST_F(EngineTest, RequestAfterCompletionStartsFresh) {
  test::write_file(dir.path() / "a.bin", test::make_content(10));
  std::unique_ptr<Engine> engine = make_engine();
  deliver(*engine, client, create_rrq_packet("a.bin"));
  deliver(*engine, client, create_ack_packet(1));
  EXPECT_EQ(engine->session_count(), 0u);
  sender.take();

  deliver(*engine, client, create_rrq_packet("a.bin"));
  EXPECT_EQ(std::get<DataPacket>(only_reply(client)).block, 1);
  EXPECT_EQ(engine->session_count(), 1u);
}

TEST_F(EngineTest, ShutdownDropsSessionsSilently) {
  test::write_file(dir.path() / "a.bin", test::make_content(2000));
  std::unique_ptr<Engine> engine = make_engine();
  deliver(*engine, client, create_rrq_packet("a.bin"));
  deliver(*engine, other, create_wrq_packet("b.bin"));
  sender.take();

  engine->shutdown();
  EXPECT_EQ(engine->session_count(), 0u);
  EXPECT_FALSE(engine->next_deadline());
  EXPECT_TRUE(sender.sent.empty());
  EXPECT_FALSE(std::filesystem::exists(dir.path() / "b.bin"));
}

TEST_F(EngineTest, RefusedRequestLeavesNoTimerBehind) {
  test::write_file(dir.path() / "a.bin", test::make_content(100));
  std::unique_ptr<Engine> engine = make_engine(DEFAULT_MAX_RETRIES, 0);

  deliver(*engine, client, create_rrq_packet("a.bin"));
  deliver(*engine, other, create_wrq_packet("b.bin"));
  std::vector<test::RecordingSender::Sent> sent = sender.take();
  ASSERT_EQ(sent.size(), 2u);
  for (const test::RecordingSender::Sent &reply : sent) {
    Packet p = test::decode(reply.packet);
    EXPECT_EQ(std::get<ErrorPacket>(p).message, "server too busy");
  }
  EXPECT_EQ(engine->session_count(), 0u);
  EXPECT_FALSE(engine->timers().armed(client));
  EXPECT_FALSE(engine->next_deadline());
  EXPECT_FALSE(std::filesystem::exists(dir.path() / "b.bin"));
}
