#include <gtest/gtest.h>
#include "daemon/protocol.h"

#include <nlohmann/json.hpp>

using namespace kild;

TEST(Base64Test, KnownVectors) {
    EXPECT_EQ(base64_encode(""), "");
    EXPECT_EQ(base64_encode("f"), "Zg==");
    EXPECT_EQ(base64_encode("fo"), "Zm8=");
    EXPECT_EQ(base64_encode("foo"), "Zm9v");

    auto decoded = base64_decode("Zm8=");
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(*decoded, "fo");
}

TEST(Base64Test, PreservesBinaryBytes) {
    std::string bytes("\x00\x1b[0m\xff\n", 7);
    auto decoded = base64_decode(base64_encode(bytes));
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(*decoded, bytes);
}

TEST(Base64Test, RejectsMalformed) {
    EXPECT_FALSE(base64_decode("abc").ok());
    EXPECT_FALSE(base64_decode("a!c$").ok());
}

TEST(ProtocolTest, CreateSessionRequest) {
    ClientMessage msg;
    msg.id = "7";
    msg.type = RequestType::CreateSession;
    msg.session_id = "proj/feature";
    msg.command = "claude";
    msg.cwd = "/tmp/wt";
    msg.env = {{"KILD_PORT_RANGE_START", "3000"}};
    msg.rows = 40;
    msg.cols = 120;

    auto line = encode_client_message(msg);
    EXPECT_EQ(line.find('\n'), std::string::npos);

    auto j = nlohmann::json::parse(line);
    EXPECT_EQ(j["type"], "create_session");
    EXPECT_EQ(j["env"]["KILD_PORT_RANGE_START"], "3000");

    auto decoded = decode_client_message(line);
    ASSERT_TRUE(decoded.ok()) << decoded.error().describe();
    EXPECT_EQ(decoded->id, "7");
    EXPECT_EQ(decoded->type, RequestType::CreateSession);
    EXPECT_EQ(decoded->command, "claude");
    EXPECT_EQ(decoded->rows, 40);
    ASSERT_EQ(decoded->env.size(), 1u);
    EXPECT_EQ(decoded->env[0].second, "3000");
}

TEST(ProtocolTest, WriteStdinCarriesBase64) {
    ClientMessage msg;
    msg.id = "1";
    msg.type = RequestType::WriteStdin;
    msg.session_id = "s";
    msg.data = "ls\r";

    auto j = nlohmann::json::parse(encode_client_message(msg));
    EXPECT_EQ(j["data"], base64_encode("ls\r"));

    auto decoded = decode_client_message(j.dump());
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded->data, "ls\r");
}

TEST(ProtocolTest, RejectsBadRequests) {
    const char* bad[] = {
        "not json",
        "[1, 2]",
        R"({"id": "1", "type": "teleport"})",
        R"({"id": "1", "type": "attach"})",
        R"({"id": "1", "type": "create_session", "session_id": "s"})",
        R"({"id": "1", "type": "resize_pty", "session_id": "s", "rows": 0, "cols": 80})",
        R"({"id": "1", "type": "write_stdin", "session_id": "s", "data": "@@@"})",
    };
    for (const char* line : bad) {
        auto decoded = decode_client_message(line);
        ASSERT_FALSE(decoded.ok()) << line;
        EXPECT_EQ(decoded.error().kind, ErrorKind::InvalidInput) << line;
    }
}

TEST(ProtocolTest, PingNeedsNoSession) {
    auto decoded = decode_client_message(R"({"id": "1", "type": "ping"})");
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded->type, RequestType::Ping);
}

TEST(ProtocolTest, SessionListResponse) {
    DaemonMessage msg;
    msg.id = "3";
    msg.type = ResponseType::SessionList;
    PtySessionInfo running;
    running.session_id = "a";
    running.state = PtyState::Idle;
    running.pid = 100;
    running.attached_clients = 2;
    PtySessionInfo exited;
    exited.session_id = "b";
    exited.state = PtyState::Exited;
    exited.exit_code = 3;
    msg.sessions = {running, exited};

    auto decoded = decode_daemon_message(encode_daemon_message(msg));
    ASSERT_TRUE(decoded.ok());
    ASSERT_EQ(decoded->sessions.size(), 2u);
    EXPECT_EQ(decoded->sessions[0].state, PtyState::Idle);
    EXPECT_EQ(decoded->sessions[0].attached_clients, 2u);
    EXPECT_FALSE(decoded->sessions[0].exit_code.has_value());
    EXPECT_EQ(decoded->sessions[1].exit_code, 3);
}

TEST(ProtocolTest, PushedMessagesHaveNoId) {
    DaemonMessage msg;
    msg.type = ResponseType::PtyOutput;
    msg.session_id = "s";
    msg.data = "hello\r\n";

    auto j = nlohmann::json::parse(encode_daemon_message(msg));
    EXPECT_FALSE(j.contains("id"));

    auto decoded = decode_daemon_message(j.dump());
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded->data, "hello\r\n");
}

TEST(ProtocolTest, ErrorResponse) {
    auto msg = DaemonMessage::error("9", protocol_error::SESSION_NOT_FOUND, "no such session");
    auto decoded = decode_daemon_message(encode_daemon_message(msg));
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded->type, ResponseType::Error);
    EXPECT_EQ(decoded->id, "9");
    EXPECT_EQ(decoded->code, "session_not_found");
    EXPECT_EQ(decoded->message, "no such session");
}
