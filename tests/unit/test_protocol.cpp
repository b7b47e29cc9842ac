#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <fcntl.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <unistd.h>
#include "../../src/core/types/errors.hpp"
#include "../../src/ipc/channel.hpp"
#include "../../src/ipc/frame.hpp"
#include "../../src/ipc/protocol.hpp"

using namespace Folio::Ipc;
using Folio::Core::Cookie;
using Folio::Core::ProtocolError;
using json = nlohmann::json;

namespace {

DownloadMessage sample_download() {
    DownloadMessage m;
    m.task_id   = "worker-1-1700000000000";
    m.url       = "https://docs.example.com/Guide-0123456789abcdef0123456789abcdef";
    m.page_id   = "0123456789abcdef0123456789abcdef";
    m.save_path = "/tmp/mirror/Guide/index.html";
    m.cookies   = {Cookie{"session", "abc", ".example.com", "/", 1.7e9, true, true}};
    return m;
}

std::string envelope(const std::string& type, const json& payload) {
    return json{{"type", type}, {"payload", payload}}.dump();
}

}  // namespace

TEST(ProtocolTest, EnvelopeShape) {
    json j = json::parse(encode(sample_download()));
    EXPECT_EQ(j["type"], "DOWNLOAD");
    EXPECT_EQ(j["payload"]["savePath"], "/tmp/mirror/Guide/index.html");
    EXPECT_EQ(j["payload"]["pageId"], "0123456789abcdef0123456789abcdef");
    EXPECT_EQ(j["payload"]["cookies"][0]["httpOnly"], true);
}

TEST(ProtocolTest, DownloadSurvivesTheWire) {
    Message decoded = decode(encode(sample_download()));
    ASSERT_EQ(type_of(decoded), MessageType::Download);
    const auto& m = std::get<DownloadMessage>(decoded);
    EXPECT_EQ(m.task_id, "worker-1-1700000000000");
    ASSERT_EQ(m.cookies.size(), 1u);
    EXPECT_EQ(m.cookies[0], sample_download().cookies[0]);
}

TEST(ProtocolTest, ResultCarriesDataOrError) {
    ResultMessage ok;
    ok.task_id = "t1";
    ok.data    = TaskData{"p1", "/out/p1/index.html", "Title", 2048, 3};
    auto back  = std::get<ResultMessage>(decode(encode(ok)));
    ASSERT_TRUE(back.ok());
    EXPECT_EQ(back.data->bytes, 2048u);
    EXPECT_EQ(back.data->block_ids, 3u);

    ResultMessage failed;
    failed.task_id = "t2";
    failed.error   = TaskError{"p2", "navigation timeout", ErrorKind::Render, true};
    back           = std::get<ResultMessage>(decode(encode(failed)));
    ASSERT_FALSE(back.ok());
    EXPECT_EQ(back.error->kind, ErrorKind::Render);
    EXPECT_TRUE(back.error->retryable);
    EXPECT_EQ(back.error->message, "navigation timeout");
}

TEST(ProtocolTest, CommandsAndReplies) {
    EXPECT_TRUE(is_command(InitMessage{}));
    EXPECT_TRUE(is_command(SetCookiesMessage{}));
    EXPECT_TRUE(is_command(sample_download()));
    EXPECT_TRUE(is_command(ShutdownMessage{}));
    EXPECT_FALSE(is_command(ReadyMessage{42}));
    EXPECT_FALSE(is_command(ResultMessage{}));
}

TEST(ProtocolTest, TypeNamesRoundTrip) {
    for (int i = 0; i <= static_cast<int>(MessageType::Result); ++i) {
        auto type = static_cast<MessageType>(i);
        EXPECT_EQ(message_type_from_string(to_string(type)), type);
    }
    EXPECT_FALSE(message_type_from_string("download").has_value());
}

TEST(ProtocolTest, RejectsMalformedEnvelopes) {
    EXPECT_THROW(decode("{not json"), ProtocolError);
    EXPECT_THROW(decode("[1,2,3]"), ProtocolError);
    EXPECT_THROW(decode(R"({"type":"EXPLODE","payload":{}})"), ProtocolError);
    EXPECT_THROW(decode(R"({"type":"SHUTDOWN"})"), ProtocolError);
    EXPECT_THROW(decode(R"({"type":"READY","payload":{"pid":"many"}})"), ProtocolError);
}

TEST(ProtocolTest, DownloadNeedsAbsoluteSavePath) {
    json payload = json::parse(encode(sample_download()))["payload"];
    payload["savePath"] = "Guide/index.html";
    EXPECT_THROW(decode(envelope("DOWNLOAD", payload)), ProtocolError);

    payload.erase("savePath");
    EXPECT_THROW(decode(envelope("DOWNLOAD", payload)), ProtocolError);
}

TEST(ProtocolTest, DownloadNeedsCookieArray) {
    json payload = json::parse(encode(sample_download()))["payload"];
    payload["cookies"] = "session=abc";
    EXPECT_THROW(decode(envelope("DOWNLOAD", payload)), ProtocolError);

    payload["cookies"] = json::array({{{"value", "no name"}}});
    EXPECT_THROW(decode(envelope("DOWNLOAD", payload)), ProtocolError);
}

TEST(ProtocolTest, ResultNeedsExactlyOneOutcome) {
    json both = {{"taskType", "DOWNLOAD"},
                 {"taskId", "t"},
                 {"data", {{"pageId", "p"}, {"savedPath", "/x"}, {"title", ""}, {"bytes", 1}, {"blockIds", 0}}},
                 {"error", {{"pageId", "p"}, {"message", "m"}, {"kind", "render"}, {"retryable", true}}}};
    EXPECT_THROW(decode(envelope("RESULT", both)), ProtocolError);

    json neither = {{"taskType", "DOWNLOAD"}, {"taskId", "t"}};
    EXPECT_THROW(decode(envelope("RESULT", neither)), ProtocolError);

    json bad_kind = both;
    bad_kind.erase("data");
    bad_kind["error"]["kind"] = "cosmic-ray";
    EXPECT_THROW(decode(envelope("RESULT", bad_kind)), ProtocolError);
}

TEST(FrameTest, BigEndianLengthPrefix) {
    std::string frame = encode_frame(std::string(258, 'x'));
    ASSERT_EQ(frame.size(), 4u + 258u);
    EXPECT_EQ(static_cast<uint8_t>(frame[0]), 0);
    EXPECT_EQ(static_cast<uint8_t>(frame[2]), 1);
    EXPECT_EQ(static_cast<uint8_t>(frame[3]), 2);

    FrameHeader header{0, 0, 1, 2};
    EXPECT_EQ(decode_frame_length(header), 258u);
}

TEST(FrameTest, OversizedFrameIsRejected) {
    FrameHeader header{0xFF, 0xFF, 0xFF, 0xFF};
    EXPECT_THROW(decode_frame_length(header), ProtocolError);
}

class ChannelTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(pipe(to_b_), 0);
        ASSERT_EQ(pipe(to_a_), 0);
    }

    template <typename T>
    T receive_on(Channel& channel) {
        std::optional<Message> received;
        std::exception_ptr     failure;
        boost::asio::co_spawn(
            ioc_,
            [&]() -> boost::asio::awaitable<void> { received = co_await channel.receive(); },
            [&](std::exception_ptr e) { failure = e; });
        ioc_.restart();
        ioc_.run();
        if (failure)
            std::rethrow_exception(failure);
        return std::get<T>(*received);
    }

    boost::asio::io_context ioc_;
    int                     to_b_[2];
    int                     to_a_[2];
};

TEST_F(ChannelTest, MessagesCrossThePipe) {
    Channel a(ioc_, to_a_[0], to_b_[1]);
    Channel b(ioc_, to_b_[0], to_a_[1]);

    boost::system::error_code ec;
    ASSERT_TRUE(a.send(sample_download(), ec)) << ec.message();
    EXPECT_EQ(receive_on<DownloadMessage>(b).url, sample_download().url);

    ASSERT_TRUE(b.send(ReadyMessage{1234}, ec));
    EXPECT_EQ(receive_on<ReadyMessage>(a).pid, 1234);
}

TEST_F(ChannelTest, DescriptorsAreClosedOnExec) {
    ASSERT_EQ(fcntl(to_b_[0], F_GETFD) & FD_CLOEXEC, 0);
    Channel b(ioc_, to_b_[0], to_a_[1]);

    EXPECT_NE(fcntl(to_b_[0], F_GETFD) & FD_CLOEXEC, 0);
    EXPECT_NE(fcntl(to_a_[1], F_GETFD) & FD_CLOEXEC, 0);
    close(to_b_[1]);
    close(to_a_[0]);
}

TEST_F(ChannelTest, GarbageFrameIsProtocolError) {
    Channel     b(ioc_, to_b_[0], to_a_[1]);
    std::string frame = encode_frame(R"({"type":"DOWNLOAD","payload":{}})");
    ASSERT_EQ(write(to_b_[1], frame.data(), frame.size()), static_cast<ssize_t>(frame.size()));

    EXPECT_THROW(receive_on<DownloadMessage>(b), ProtocolError);
    close(to_b_[1]);
    close(to_a_[0]);
}

TEST_F(ChannelTest, ClosedPeerIsEndOfFile) {
    Channel b(ioc_, to_b_[0], to_a_[1]);
    close(to_b_[1]);
    close(to_a_[0]);

    try {
        receive_on<ShutdownMessage>(b);
        FAIL() << "expected end of file";
    } catch (const boost::system::system_error& e) {
        EXPECT_EQ(e.code(), boost::asio::error::eof);
    }
}

TEST_F(ChannelTest, SendAfterCloseFails) {
    Channel a(ioc_, to_a_[0], to_b_[1]);
    close(to_b_[0]);
    close(to_a_[1]);
    a.close();
    EXPECT_FALSE(a.is_open());

    boost::system::error_code ec;
    EXPECT_FALSE(a.send(ShutdownMessage{}, ec));
    EXPECT_TRUE(ec);
}
