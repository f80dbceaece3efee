#include <gtest/gtest.h>

#include "client.hpp"
#include "handler/builtin_handlers.hpp"
#include "server.hpp"
#include "socket.hpp"
#include "test_helpers.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

using namespace std::chrono_literals;
using janus::handler::CommandContext;
using janus::handler::HandlerResult;

namespace {

/// A request that timed out on either side: thrown by the client timer, or
/// answered by the server's own deadline first.
bool timed_out(const std::function<janus::Response()>& call) {
    try {
        janus::Response response = call();
        return !response.success && response.error->is(janus::ErrorCode::handler_timeout);
    } catch (const janus::JanusError& exc) {
        return exc.error().is(janus::ErrorCode::handler_timeout);
    }
}

/// Bound datagram socket that never answers.
class SilentPeer {
public:
    SilentPeer() : path_(unique_socket_path("silent")), fd_(janus::bind_datagram_socket(path_, true)) {}
    ~SilentPeer() {
        janus::close_socket(fd_);
        janus::unlink_socket_path(path_);
    }

    const std::string& path() const { return path_; }

private:
    std::string path_;
    int fd_;
};

class ClientServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        socket_path_ = unique_socket_path("server");
        server_config_.max_concurrent_handlers = 4;
        server_ = std::make_unique<janus::JanusServer>(server_config_, sample_manifest());
        janus::handler::register_builtin_handlers(server_->registry(), sample_manifest());
        server_->register_handler("sleep", [](const CommandContext& ctx) {
            std::this_thread::sleep_for(std::chrono::milliseconds(ctx.args.value("ms", 0)));
            return HandlerResult::success({{"slept", ctx.args.value("ms", 0)}});
        });
        server_->register_handler("note", [this](const CommandContext&) {
            ++notes_;
            return HandlerResult::success(nullptr);
        });
        server_->start(socket_path_);
    }

    void TearDown() override {
        server_->stop();
    }

    janus::ClientConfig client_config() const {
        janus::ClientConfig config;
        config.default_timeout = 2000ms;
        return config;
    }

    janus::ServerConfig server_config_;
    std::string socket_path_;
    std::unique_ptr<janus::JanusServer> server_;
    std::atomic<int> notes_{0};
};

} // namespace

TEST_F(ClientServerTest, PingAndEchoRoundTrip) {
    janus::JanusClient client(socket_path_, client_config());

    auto pong = client.send_request("ping");
    EXPECT_TRUE(pong.success);
    EXPECT_EQ((*pong.result)["message"], "pong");

    auto echo = client.send_request("echo", {{"message", "hello"}});
    EXPECT_TRUE(echo.success);
    EXPECT_EQ((*echo.result)["echo"], "hello");

    EXPECT_TRUE(client.ping(1000ms));
    EXPECT_EQ(client.pending_count(), 0u);
}

TEST_F(ClientServerTest, UnknownCommandIsAnsweredWithMethodNotFound) {
    janus::JanusClient client(socket_path_, client_config());
    auto response = client.send_request("doesNotExist");
    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.error->code, -32601);
}

TEST_F(ClientServerTest, ServerValidatesDeclaredCommands) {
    server_->register_handler("createWorkspace",
                              [](const CommandContext& ctx) { return HandlerResult::success({{"id", ctx.args["name"]}}); });
    janus::JanusClient client(socket_path_, client_config());

    auto rejected = client.send_request("createWorkspace", {{"name", "My Workspace!"}});
    EXPECT_FALSE(rejected.success);
    EXPECT_EQ(rejected.error->code, -32602);
    EXPECT_EQ(rejected.error->data->field.value_or(""), "name");

    auto accepted = client.send_request("createWorkspace", {{"name", "lib-1"}});
    EXPECT_TRUE(accepted.success);
    EXPECT_EQ((*accepted.result)["id"], "lib-1");
}

TEST_F(ClientServerTest, ClientTimesOutWhileServerKeepsServing) {
    janus::JanusClient client(socket_path_, client_config());

    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(timed_out([&]() { return client.send_request("sleep", {{"ms", 600}}, 100ms); }));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 500ms);
    EXPECT_EQ(client.pending_count(), 0u);

    // The late result goes to a reply address that is gone; the server carries on.
    std::this_thread::sleep_for(600ms);
    EXPECT_TRUE(server_->is_running());
    EXPECT_TRUE(client.ping(1000ms));
}

TEST_F(ClientServerTest, ConcurrentRequestsResolveIndependently) {
    janus::JanusClient client(socket_path_, client_config());

    auto short_lived = client.send_request_async("sleep", {{"ms", 500}}, 100ms);
    auto long_lived = client.send_request_async("sleep", {{"ms", 200}}, 2000ms);
    EXPECT_EQ(client.pending_count(), 2u);

    auto first = client.wait(short_lived);
    bool first_timed_out = first.state == janus::RequestState::timed_out ||
                           (first.response && first.response->error &&
                            first.response->error->is(janus::ErrorCode::handler_timeout));
    EXPECT_TRUE(first_timed_out);

    auto second = client.wait(long_lived);
    ASSERT_EQ(second.state, janus::RequestState::completed);
    ASSERT_TRUE(second.response.has_value());
    EXPECT_TRUE(second.response->success);
    EXPECT_EQ((*second.response->result)["slept"], 200);
}

TEST_F(ClientServerTest, FireAndForgetLeavesNothingBehind) {
    std::string reply_dir = "/tmp/janus_test_replies_" + std::to_string(::getpid());
    std::filesystem::create_directories(reply_dir);
    janus::ClientConfig config = client_config();
    config.reply_directory = reply_dir;
    janus::JanusClient client(socket_path_, config);

    client.send_no_response("note");
    ASSERT_TRUE(wait_until([this]() { return notes_.load() == 1; }));
    EXPECT_EQ(client.pending_count(), 0u);
    EXPECT_TRUE(std::filesystem::is_empty(reply_dir));

    client.send_request("ping");
    EXPECT_TRUE(std::filesystem::is_empty(reply_dir));
    std::filesystem::remove_all(reply_dir);
}

TEST_F(ClientServerTest, CancelIsIdempotent) {
    janus::JanusClient client(socket_path_, client_config());
    auto handle = client.send_request_async("sleep", {{"ms", 300}});
    EXPECT_EQ(client.status(handle), janus::RequestState::sent);

    EXPECT_TRUE(client.cancel(handle));
    EXPECT_FALSE(client.cancel(handle));
    EXPECT_TRUE(handle->is_cancelled());
    EXPECT_EQ(client.wait(handle).state, janus::RequestState::cancelled);
    EXPECT_EQ(client.status(handle), janus::RequestState::cancelled);

    auto stats = client.statistics();
    EXPECT_EQ(stats.cancelled, 1u);
    EXPECT_EQ(stats.pending, 0u);
}

TEST_F(ClientServerTest, CancelAllResolvesEveryPendingRequest) {
    janus::JanusClient client(socket_path_, client_config());
    std::vector<std::shared_ptr<janus::RequestHandle>> handles;
    for (int i = 0; i < 3; ++i) {
        handles.push_back(client.send_request_async("sleep", {{"ms", 300}}));
    }
    EXPECT_EQ(client.cancel_all(), 3u);
    for (const auto& handle : handles) {
        EXPECT_EQ(client.wait(handle).state, janus::RequestState::cancelled);
    }
    EXPECT_EQ(client.pending_count(), 0u);
}

TEST_F(ClientServerTest, PendingLimitIsEnforced) {
    janus::ClientConfig config = client_config();
    config.max_pending_requests = 1;
    janus::JanusClient client(socket_path_, config);

    auto handle = client.send_request_async("sleep", {{"ms", 300}});
    try {
        client.send_request_async("ping");
        FAIL() << "second request accepted";
    } catch (const janus::JanusError& exc) {
        EXPECT_EQ(exc.code(), -32010);
    }
    EXPECT_EQ(client.pending_count(), 1u);
    EXPECT_EQ(client.wait(handle).state, janus::RequestState::completed);
}

TEST_F(ClientServerTest, StatisticsTrackCompletedRequests) {
    janus::JanusClient client(socket_path_, client_config());
    client.send_request("ping");
    client.send_request("echo", {{"message", "x"}});

    auto stats = client.statistics();
    EXPECT_EQ(stats.completed, 2u);
    EXPECT_EQ(stats.timed_out, 0u);
    EXPECT_GT(stats.average_response_time, 0.0);
}

TEST_F(ClientServerTest, ServerEventsAndStats) {
    janus::JanusClient client(socket_path_, client_config());
    client.send_request("ping");
    client.send_request("doesNotExist");

    ASSERT_TRUE(wait_until([this]() { return server_->stats().responses_sent == 2; }));
    EXPECT_EQ(server_->stats().received, 2u);
}

TEST_F(ClientServerTest, ServerBuiltinsDescribeThemselves) {
    janus::JanusClient client(socket_path_, client_config());
    auto info = client.send_request("get_info");
    EXPECT_EQ((*info.result)["server"], "janus");

    auto manifest = client.send_request("manifest");
    ASSERT_TRUE(manifest.success);
    EXPECT_TRUE((*manifest.result)["commands"].contains("createWorkspace"));

    auto valid = client.send_request("validate", {{"message", R"({"a":1})"}});
    EXPECT_EQ((*valid.result)["valid"], true);
    auto invalid = client.send_request("validate", {{"message", "{oops"}});
    EXPECT_EQ((*invalid.result)["valid"], false);
}

TEST_F(ClientServerTest, SlowProcessHonoursRequestDeadline) {
    janus::JanusClient client(socket_path_, client_config());
    EXPECT_TRUE(timed_out([&]() { return client.send_request("slow_process", nlohmann::json::object(), 100ms); }));
}

TEST(ClientServer, BusyServerRejectsOverflow) {
    janus::ServerConfig config;
    config.max_concurrent_handlers = 1;
    config.max_queued_requests = 1;
    janus::JanusServer server(config);
    std::atomic<bool> release{false};
    server.register_handler("block", [&](const CommandContext&) {
        while (!release.load()) {
            std::this_thread::sleep_for(5ms);
        }
        return HandlerResult::success(true);
    });
    std::string path = unique_socket_path("busy");
    server.start(path);

    janus::ClientConfig client_config;
    client_config.default_timeout = 3000ms;
    janus::JanusClient client(path, client_config);

    std::vector<std::shared_ptr<janus::RequestHandle>> handles;
    for (int i = 0; i < 4; ++i) {
        handles.push_back(client.send_request_async("block"));
        std::this_thread::sleep_for(20ms);
    }
    release = true;

    int busy = 0;
    int served = 0;
    for (const auto& handle : handles) {
        auto outcome = client.wait(handle);
        ASSERT_EQ(outcome.state, janus::RequestState::completed);
        if (outcome.response->success) {
            ++served;
        } else if (outcome.response->error->is(janus::ErrorCode::resource_limit_exceeded)) {
            ++busy;
        }
    }
    EXPECT_GE(busy, 1);
    EXPECT_GE(served, 1);
    server.stop();
}

TEST(ClientServer, ClientSideTimeoutAgainstSilentPeer) {
    SilentPeer peer;
    janus::JanusClient client(peer.path());

    std::atomic<int> callbacks{0};
    client.on_timeout([&](const std::string& id, std::chrono::milliseconds timeout) {
        EXPECT_FALSE(id.empty());
        EXPECT_EQ(timeout, 80ms);
        ++callbacks;
    });

    try {
        client.send_request("ping", nlohmann::json::object(), 80ms);
        FAIL() << "silent peer answered";
    } catch (const janus::JanusError& exc) {
        EXPECT_EQ(exc.code(), -32006);
        EXPECT_STREQ(exc.what(), "JSON-RPC Error -32006: Handler timeout - Request 'ping' timed out after 80ms");
    }
    ASSERT_TRUE(wait_until([&]() { return callbacks.load() == 1; }));
    EXPECT_EQ(client.statistics().timed_out, 1u);
    EXPECT_FALSE(client.ping(50ms));
}

TEST(ClientServer, ClientValidatesBeforeSending) {
    SilentPeer peer;
    janus::JanusClient client(peer.path(), janus::ClientConfig{}, sample_manifest());

    try {
        client.send_request("createWorkspace", {{"name", "My Workspace!"}}, 100ms);
        FAIL() << "invalid request was sent";
    } catch (const janus::JanusError& exc) {
        EXPECT_EQ(exc.code(), -32602);
    }
    EXPECT_EQ(client.pending_count(), 0u);

    EXPECT_THROW(client.send_request("bad command"), janus::JanusError);
    EXPECT_THROW(client.send_request("ping", nlohmann::json::object(), 0ms), janus::JanusError);
}

TEST(ClientServer, ConstructionAndTransportFailures) {
    EXPECT_THROW({ janus::JanusClient bad("relative.sock"); }, janus::JanusError);

    janus::JanusClient client(unique_socket_path("nobody"));
    try {
        client.send_request("ping", nlohmann::json::object(), 100ms);
        FAIL() << "send to a missing server succeeded";
    } catch (const janus::JanusError& exc) {
        EXPECT_EQ(exc.code(), -32007);
    }
    EXPECT_EQ(client.pending_count(), 0u);
}

TEST(ClientServer, ServerLifecycle) {
    std::string path = unique_socket_path("lifecycle");
    std::vector<std::string> listening;
    {
        janus::JanusServer server;
        server.events().on_listening = [&](const std::string& socket_path) { listening.push_back(socket_path); };
        server.start(path);
        EXPECT_TRUE(server.is_running());
        EXPECT_TRUE(std::filesystem::exists(path));
        server.stop();
        EXPECT_FALSE(server.is_running());
        EXPECT_FALSE(std::filesystem::exists(path));
    }
    ASSERT_EQ(listening.size(), 1u);
    EXPECT_EQ(listening[0], path);

    janus::JanusServer server;
    EXPECT_THROW(server.start("not/absolute.sock"), janus::JanusError);
    EXPECT_FALSE(server.is_running());
}
