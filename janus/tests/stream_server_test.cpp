#include <gtest/gtest.h>

#include "handler/builtin_handlers.hpp"
#include "stream_server.hpp"
#include "test_helpers.hpp"

#include <atomic>
#include <iterator>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

std::shared_ptr<janus::Dispatcher> make_dispatcher(const janus::ServerConfig& config) {
    auto registry = std::make_shared<janus::handler::CommandRegistry>();
    janus::handler::register_builtin_handlers(*registry, nullptr);
    return std::make_shared<janus::Dispatcher>(registry, nullptr, config, std::make_shared<janus::TimeoutManager>());
}

size_t open_fd_count() {
    return static_cast<size_t>(std::distance(std::filesystem::directory_iterator("/proc/self/fd"),
                                             std::filesystem::directory_iterator{}));
}

class StreamServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.max_concurrent_handlers = 2;
        config_.max_message_size = 4096;
        dispatcher_ = make_dispatcher(config_);
        path_ = unique_socket_path("stream");
        server_ = std::make_unique<janus::StreamServer>(path_, dispatcher_, config_);
        server_->start();
    }

    void TearDown() override {
        server_->stop();
    }

    janus::Request request(const std::string& command, nlohmann::json args = nlohmann::json::object()) {
        // On a stream connection reply_to only marks that an answer is expected.
        return janus::make_request(command, std::move(args), path_, 1.0);
    }

    janus::ServerConfig config_;
    std::shared_ptr<janus::Dispatcher> dispatcher_;
    std::string path_;
    std::unique_ptr<janus::StreamServer> server_;
};

} // namespace

TEST_F(StreamServerTest, AnswersOnTheSameConnection) {
    auto req = request("ping");
    auto response = janus::stream_call(path_, req, 1000ms);
    EXPECT_TRUE(response.success);
    EXPECT_EQ(response.request_id, req.id);
    EXPECT_EQ((*response.result)["message"], "pong");

    auto echo = janus::stream_call(path_, request("echo", {{"message", "framed"}}), 1000ms);
    EXPECT_EQ((*echo.result)["echo"], "framed");
}

TEST_F(StreamServerTest, UnknownCommandOverStream) {
    auto response = janus::stream_call(path_, request("doesNotExist"), 1000ms);
    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.error->code, -32601);
}

TEST_F(StreamServerTest, ParallelConnections) {
    std::vector<std::thread> callers;
    std::atomic<int> ok{0};
    for (int i = 0; i < 4; ++i) {
        callers.emplace_back([&, i]() {
            auto response =
                janus::stream_call(path_, request("echo", {{"message", "n" + std::to_string(i)}}), 2000ms);
            if (response.success && (*response.result)["echo"] == "n" + std::to_string(i)) {
                ++ok;
            }
        });
    }
    for (auto& caller : callers) {
        caller.join();
    }
    EXPECT_EQ(ok.load(), 4);
}

TEST_F(StreamServerTest, MissingResponseTimesOut) {
    auto req = janus::make_request("ping", std::nullopt, std::nullopt, std::nullopt);
    try {
        janus::stream_call(path_, req, 100ms);
        FAIL() << "fire-and-forget request was answered";
    } catch (const janus::JanusError& exc) {
        EXPECT_EQ(exc.code(), -32006);
    }
}

TEST(StreamServer, CallWithoutServerFails) {
    auto req = janus::make_request("ping", std::nullopt, std::string("/tmp/x.sock"), 1.0);
    try {
        janus::stream_call(unique_socket_path("absent"), req, 100ms);
        FAIL() << "connected to nothing";
    } catch (const janus::JanusError& exc) {
        EXPECT_EQ(exc.code(), -32007);
    }
}

TEST_F(StreamServerTest, FrameLargerThanMessageLimitClosesConnection) {
    auto req = request("echo", {{"message", std::string(8192, 'x')}});
    try {
        janus::stream_call(path_, req, 1000ms);
        FAIL() << "oversized frame was served";
    } catch (const janus::JanusError& exc) {
        EXPECT_EQ(exc.code(), -32007);
    }

    // The server keeps serving other connections.
    EXPECT_TRUE(janus::stream_call(path_, request("ping"), 1000ms).success);
}

TEST_F(StreamServerTest, UnframeableRequestLeaksNoDescriptor) {
    auto req = request("echo", {{"message", std::string(1024, 'x')}});
    size_t before = open_fd_count();
    try {
        janus::stream_call(path_, req, 1000ms, 64);
        FAIL() << "request exceeded the frame limit but was sent";
    } catch (const janus::JanusError& exc) {
        EXPECT_EQ(exc.code(), -32010);
    }
    EXPECT_EQ(open_fd_count(), before);
}

TEST(StreamServer, StaleSocketFileHonoursCleanupOnStart) {
    const std::string path = unique_socket_path("stream_stale");
    std::ofstream(path) << "stale";

    janus::ServerConfig keep;
    keep.cleanup_on_start = false;
    janus::StreamServer refused(path, make_dispatcher(keep), keep);
    EXPECT_THROW(refused.start(), janus::JanusError);
    EXPECT_TRUE(std::filesystem::exists(path));

    janus::ServerConfig replace;
    janus::StreamServer server(path, make_dispatcher(replace), replace);
    ASSERT_NO_THROW(server.start());
    auto req = janus::make_request("ping", std::nullopt, path, 1.0);
    EXPECT_TRUE(janus::stream_call(path, req, 1000ms).success);
    server.stop();
}

TEST(StreamServer, SocketFileHonoursCleanupOnShutdown) {
    const std::string path = unique_socket_path("stream_shutdown");

    janus::ServerConfig keep;
    keep.cleanup_on_shutdown = false;
    {
        janus::StreamServer server(path, make_dispatcher(keep), keep);
        server.start();
        server.stop();
    }
    EXPECT_TRUE(std::filesystem::exists(path));

    janus::ServerConfig remove;
    {
        janus::StreamServer server(path, make_dispatcher(remove), remove);
        server.start();
        server.stop();
    }
    EXPECT_FALSE(std::filesystem::exists(path));
}
