#include <chrono>
#include <fcntl.h>
#include <filesystem>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <unistd.h>
#include <utility>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "bridge/companion_endpoint.hpp"
#include "bridge/subprocess_bridge.hpp"
#include "core/cancellation/cancel_token.hpp"
#include "core/errors/agent_errors.hpp"
#include "temp_workspace.hpp"

namespace {

using conductor::bridge::BridgeRequest;
using conductor::bridge::BridgeResult;
using conductor::bridge::CompanionEndpoint;
using conductor::bridge::DeliveryPath;
using conductor::bridge::SubprocessBridge;
using conductor::core::cancellation::CancelToken;
using conductor::core::cancellation::make_cancel_token;
using conductor::core::errors::AgentError;
using conductor::core::errors::ErrorCategory;
using conductor::core::errors::get_error;
using conductor::core::errors::get_value;
using conductor::core::errors::is_error;
using conductor::core::errors::Result;
using conductor::core::errors::Unit;
using conductor::testing::TempWorkspace;
using nlohmann::json;

// Sidecar stand-in. When it "delivers" it writes straight into the pipe the
// way the real companion does.
class FakeCompanion : public CompanionEndpoint {
public:
    FakeCompanion(bool ready, bool deliver_ok, std::filesystem::path fifo)
        : ready_(ready), deliver_ok_(deliver_ok), fifo_(std::move(fifo)) {}

    bool wait_until_ready(const CancelToken&) override {
        ++ready_calls;
        return ready_;
    }

    Result<Unit> deliver(const std::string& text) override {
        ++deliver_calls;
        if (!deliver_ok_) {
            return AgentError{ErrorCategory::Delivery, "sidecar returned 503",
                              "companion_rejected"};
        }
        const int fd = ::open(fifo_.c_str(), O_WRONLY);
        if (fd < 0) {
            return AgentError{ErrorCategory::Delivery, "open failed", "companion_open_failed"};
        }
        const std::string line = "companion:" + text + "\n";
        const ssize_t written = ::write(fd, line.data(), line.size());
        static_cast<void>(::close(fd));
        if (written != static_cast<ssize_t>(line.size())) {
            return AgentError{ErrorCategory::Delivery, "short write", "companion_write_failed"};
        }
        return Unit{};
    }

    int ready_calls = 0;
    int deliver_calls = 0;

private:
    bool ready_;
    bool deliver_ok_;
    std::filesystem::path fifo_;
};

BridgeRequest cat_request(const TempWorkspace& ws, const std::string& prompt) {
    BridgeRequest request;
    request.argv = {"cat"};
    request.working_dir = ws.root();
    request.fifo_path = ws.root() / "agent-input.jsonl";
    request.prompt = prompt;
    request.termination_grace = std::chrono::milliseconds(500);
    return request;
}

// Runs the bridge on a worker so a protocol deadlock fails the test instead
// of hanging it.
Result<BridgeResult> run_bounded(const SubprocessBridge& bridge, const BridgeRequest& request,
                                 const CancelToken& cancel,
                                 std::chrono::seconds limit = std::chrono::seconds(5)) {
    auto future = std::async(std::launch::async,
                             [&bridge, &request, &cancel]() { return bridge.run(request, cancel); });
    if (future.wait_for(limit) != std::future_status::ready) {
        cancel->store(true);
        ADD_FAILURE() << "bridge did not return within " << limit.count() << "s";
    }
    return future.get();
}

TEST(EncodeUserMessageTest, ProducesOneStreamJsonLine) {
    const std::string encoded = conductor::bridge::encode_user_message("fix \"it\"\nplease");
    ASSERT_FALSE(encoded.empty());
    EXPECT_EQ(encoded.back(), '\n');
    EXPECT_EQ(encoded.find('\n'), encoded.size() - 1);

    const json doc = json::parse(encoded);
    EXPECT_EQ(doc.at("type"), "user");
    EXPECT_EQ(doc.at("message").at("role"), "user");
    EXPECT_EQ(doc.at("message").at("content").at(0).at("text"), "fix \"it\"\nplease");
}

TEST(SubprocessBridgeTest, DeliversOverPipeAndClosesBeforeWaiting) {
    TempWorkspace ws("bridge_fifo");
    SubprocessBridge bridge;
    auto result = run_bounded(bridge, cat_request(ws, "hello agent"), make_cancel_token());

    ASSERT_FALSE(is_error(result)) << get_error(result).message;
    const auto& outcome = get_value(result);
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_EQ(outcome.delivery, DeliveryPath::Fifo);
    EXPECT_EQ(outcome.stdout_text, conductor::bridge::encode_user_message("hello agent"));
    EXPECT_FALSE(outcome.cancelled);
    EXPECT_FALSE(outcome.timed_out);
}

TEST(SubprocessBridgeTest, ReusesAnExistingPipe) {
    TempWorkspace ws("bridge_reuse");
    SubprocessBridge bridge;
    const auto request = cat_request(ws, "first");
    ASSERT_FALSE(is_error(run_bounded(bridge, request, make_cancel_token())));
    auto second = run_bounded(bridge, request, make_cancel_token());
    ASSERT_FALSE(is_error(second));
    EXPECT_EQ(get_value(second).exit_code, 0);
}

TEST(SubprocessBridgeTest, PassesEnvironment) {
    TempWorkspace ws("bridge_env");
    SubprocessBridge bridge;
    BridgeRequest request = cat_request(ws, "ignored");
    request.argv = {"sh", "-c", "cat >/dev/null; printf '%s' \"$CONDUCTOR_STAGE\""};
    request.env = {{"CONDUCTOR_STAGE", "quality"}};

    auto result = run_bounded(bridge, request, make_cancel_token());
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).stdout_text, "quality");
}

TEST(SubprocessBridgeTest, CompanionDeliversWhenReady) {
    TempWorkspace ws("bridge_companion");
    const auto request = cat_request(ws, "via sidecar");
    auto companion = std::make_shared<FakeCompanion>(true, true, request.fifo_path);
    SubprocessBridge bridge(companion);

    auto result = run_bounded(bridge, request, make_cancel_token());
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).delivery, DeliveryPath::Companion);
    EXPECT_EQ(get_value(result).stdout_text, "companion:via sidecar\n");
    EXPECT_EQ(companion->deliver_calls, 1);
}

TEST(SubprocessBridgeTest, FallsBackWhenCompanionNeverReady) {
    TempWorkspace ws("bridge_not_ready");
    const auto request = cat_request(ws, "fallback");
    auto companion = std::make_shared<FakeCompanion>(false, true, request.fifo_path);
    SubprocessBridge bridge(companion);

    auto result = run_bounded(bridge, request, make_cancel_token());
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).delivery, DeliveryPath::Fifo);
    EXPECT_EQ(companion->deliver_calls, 0);
    EXPECT_EQ(get_value(result).stdout_text, conductor::bridge::encode_user_message("fallback"));
}

TEST(SubprocessBridgeTest, FallsBackWhenCompanionRejects) {
    TempWorkspace ws("bridge_rejected");
    const auto request = cat_request(ws, "retry locally");
    auto companion = std::make_shared<FakeCompanion>(true, false, request.fifo_path);
    SubprocessBridge bridge(companion);

    auto result = run_bounded(bridge, request, make_cancel_token());
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).delivery, DeliveryPath::Fifo);
    EXPECT_EQ(companion->deliver_calls, 1);
}

TEST(SubprocessBridgeTest, CancellationEscalatesToKill) {
    TempWorkspace ws("bridge_cancel");
    SubprocessBridge bridge;
    BridgeRequest request = cat_request(ws, "stubborn");
    request.argv = {"sh", "-c", "trap '' TERM; cat >/dev/null; sleep 30"};
    request.termination_grace = std::chrono::milliseconds(200);

    auto cancel = make_cancel_token();
    std::thread canceller([cancel]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        cancel->store(true);
    });
    const auto started = std::chrono::steady_clock::now();
    auto result = run_bounded(bridge, request, cancel, std::chrono::seconds(10));
    canceller.join();

    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).cancelled);
    EXPECT_EQ(get_value(result).exit_code, 128 + 9);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
}

TEST(SubprocessBridgeTest, HangTimeoutTerminates) {
    TempWorkspace ws("bridge_hang");
    SubprocessBridge bridge;
    BridgeRequest request = cat_request(ws, "hang");
    request.argv = {"sh", "-c", "cat >/dev/null; exec sleep 30"};
    request.hang_timeout = std::chrono::milliseconds(300);

    auto result = run_bounded(bridge, request, make_cancel_token(), std::chrono::seconds(10));
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).timed_out);
    EXPECT_EQ(get_value(result).exit_code, 128 + 15);
}

TEST(SubprocessBridgeTest, MissingExecutableExits127) {
    TempWorkspace ws("bridge_missing");
    SubprocessBridge bridge;
    BridgeRequest request = cat_request(ws, "nobody listens");
    request.argv = {"conductor-no-such-agent-binary"};

    auto result = run_bounded(bridge, request, make_cancel_token());
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).exit_code, 127);
}

TEST(SubprocessBridgeTest, RejectsNonPipeInputPath) {
    TempWorkspace ws("bridge_conflict");
    BridgeRequest request = cat_request(ws, "x");
    conductor::testing::write_file(request.fifo_path, "regular file");

    SubprocessBridge bridge;
    auto result = bridge.run(request, make_cancel_token());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "fifo_path_conflict");
}

TEST(SubprocessBridgeTest, EmptyArgvIsRejected) {
    TempWorkspace ws("bridge_empty");
    BridgeRequest request = cat_request(ws, "x");
    request.argv.clear();

    SubprocessBridge bridge;
    auto result = bridge.run(request, make_cancel_token());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "empty_command");
}

}  // namespace
