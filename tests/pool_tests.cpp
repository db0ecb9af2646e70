#include "TestSupport.h"

#include "networking/WebSocketServer.h"
#include "pool/BaudPacer.h"
#include "pool/ExponentialBackoff.hpp"
#include "pool/PtyProcess.h"
#include "pool/SessionPool.h"
#include "pool/SlotPool.h"
#include "pool/UplinkConnection.h"

#include <boost/asio/ip/tcp.hpp>
#include <gtest/gtest.h>

#include <sys/wait.h>

#include <cerrno>
#include <memory>
#include <set>
#include <stdexcept>
#include <system_error>

namespace asio = boost::asio;
using namespace termrelay;
using namespace termrelay::test;
using protocol::MessageType;
using std::chrono::milliseconds;

namespace {

pool::PoolOptions fast_options(const std::string& script) {
    pool::PoolOptions opts;
    opts.script = script;
    opts.interpreter = "/bin/sh";
    opts.attention_wait = milliseconds(50);
    opts.newline_wait = milliseconds(20);
    opts.terminate_wait = milliseconds(1000);
    opts.kill_wait = milliseconds(1000);
    return opts;
}

std::string frame(MessageType type, const std::string& session, const std::string& data = {}) {
    return protocol::make_frame(type, session, data);
}

} // namespace

// ---- SlotPool ----

TEST(SlotPool, HandsOutLowestFreeSlot) {
    pool::SlotPool slots;
    EXPECT_EQ(slots.acquire(), 0);
    EXPECT_EQ(slots.acquire(), 1);
    EXPECT_EQ(slots.acquire(), 2);
    EXPECT_TRUE(slots.release(1));
    EXPECT_EQ(slots.acquire(), 1);
    EXPECT_EQ(slots.acquire(), 3);
}

TEST(SlotPool, FreePlusAssignedIsAlwaysCapacity) {
    pool::SlotPool slots;
    std::set<int> seen;
    for (int i = 0; i < pool::SlotPool::kCapacity; ++i) {
        auto slot = slots.acquire();
        ASSERT_TRUE(slot);
        EXPECT_TRUE(seen.insert(*slot).second);
        EXPECT_EQ(slots.free_count() + slots.assigned_count(), 8u);
    }
    EXPECT_TRUE(slots.exhausted());
    EXPECT_FALSE(slots.acquire());
    EXPECT_EQ(slots.free_count() + slots.assigned_count(), 8u);
}

TEST(SlotPool, ReleaseOfFreeSlotChangesNothing) {
    pool::SlotPool slots;
    EXPECT_FALSE(slots.release(5));
    EXPECT_EQ(slots.free_count(), 8u);
    EXPECT_THROW(slots.release(8), std::out_of_range);
    EXPECT_THROW(slots.release(-1), std::out_of_range);
}

// ---- ExponentialBackoff ----

TEST(ExponentialBackoff, DoublesUpToCapAndResets) {
    pool::ExponentialBackoff backoff;
    std::vector<long> delays;
    for (int i = 0; i < 7; ++i) {
        delays.push_back(static_cast<long>(backoff.delay().count()));
        backoff.record_failure();
    }
    EXPECT_EQ(delays, (std::vector<long>{1000, 2000, 4000, 8000, 16000, 16000, 16000}));
    EXPECT_EQ(backoff.failures(), 7u);

    backoff.reset();
    EXPECT_EQ(backoff.delay(), milliseconds(1000));
}

TEST(ExponentialBackoff, LargeFailureCountsStayCapped) {
    constexpr pool::ExponentialBackoff backoff(milliseconds(250), milliseconds(3000));
    static_assert(backoff.delay_for(0) == milliseconds(250));
    static_assert(backoff.delay_for(3) == milliseconds(2000));
    EXPECT_EQ(backoff.delay_for(4), milliseconds(3000));
    EXPECT_EQ(backoff.delay_for(1000), milliseconds(3000));
}

// ---- BaudPacer ----

TEST(BaudPacer, ChunkIsATenthOfASecond) {
    pool::BaudPacer pacer;
    EXPECT_EQ(pacer.baud(), 9600);
    EXPECT_EQ(pacer.chunk_chars(), 96u);
    EXPECT_EQ(pacer.delay_for(96), std::chrono::microseconds(100000));

    pacer.set_baud(300);
    EXPECT_EQ(pacer.chunk_chars(), 3u);
    EXPECT_EQ(pacer.delay_for(3), std::chrono::microseconds(100000));

    pacer.set_baud(110);
    EXPECT_EQ(pacer.chunk_chars(), 1u);
    EXPECT_DOUBLE_EQ(pacer.chars_per_second(), 11.0);
}

TEST(BaudPacer, RejectsNonPositiveRates) {
    pool::BaudPacer pacer;
    EXPECT_THROW(pacer.set_baud(0), std::invalid_argument);
    EXPECT_THROW(pacer.set_baud(-300), std::invalid_argument);
    EXPECT_EQ(pacer.baud(), 9600);
}

TEST(BaudPacer, SplitsOnCodePointBoundaries) {
    pool::BaudPacer pacer(110);
    const std::string text = "h\xC3\xA9llo";
    const auto chunks = pacer.split(text);
    ASSERT_EQ(chunks.size(), 5u);
    EXPECT_EQ(chunks[1], "\xC3\xA9");

    pacer.set_baud(300);
    const auto three = pacer.split(text);
    ASSERT_EQ(three.size(), 2u);
    EXPECT_EQ(three[0], "h\xC3\xA9l");
    EXPECT_EQ(three[1], "lo");
}

// ---- PtyProcess ----

TEST(PtyProcess, MissingScriptThrows) {
    pool::PtyProcess::Options opts;
    opts.interpreter = "/bin/sh";
    opts.script = "/nonexistent/termrelay/run.sh";
    EXPECT_THROW(pool::PtyProcess::spawn(opts), std::system_error);
}

TEST(PtyProcess, ExecFailureIsReported) {
    TempScript script("exit 0");
    pool::PtyProcess::Options opts;
    opts.interpreter = "/nonexistent/termrelay/sh";
    opts.script = script.path();
    EXPECT_THROW(pool::PtyProcess::spawn(opts), std::system_error);
}

TEST(PtyProcess, TeardownReapsTheChild) {
    TempScript script("exec sleep 30");
    pool::PtyProcess::Options opts;
    opts.interpreter = "/bin/sh";
    opts.script = script.path();

    pid_t pid = -1;
    {
        auto process = pool::PtyProcess::spawn(opts);
        pid = process.pid();
        ASSERT_GT(pid, 0);
        ASSERT_TRUE(process.running());
    }

    errno = 0;
    EXPECT_EQ(::waitpid(pid, nullptr, WNOHANG), -1);
    EXPECT_EQ(errno, ECHILD);
}

// ---- SessionPool ----

class SessionPoolTest : public ::testing::Test {
protected:
    void TearDown() override {
        if (pool_) run_task(ioc_, pool_->shutdown());
    }

    pool::SessionPool& make_pool(const std::string& script) {
        pool_ = std::make_unique<pool::SessionPool>(ioc_.get_executor(), fast_options(script));
        return *pool_;
    }

    pool::SessionPool& make_pool(pool::PoolOptions opts) {
        pool_ = std::make_unique<pool::SessionPool>(ioc_.get_executor(), std::move(opts));
        return *pool_;
    }

    asio::io_context ioc_;
    std::unique_ptr<pool::SessionPool> pool_;
};

TEST_F(SessionPoolTest, NinthSessionIsRefusedWithErrorAndExit) {
    TempScript script("exec sleep 30");
    auto& sessions = make_pool(script.path());
    auto owner = std::make_shared<RecordingChannel>();

    std::set<int> slots;
    for (int i = 0; i < 8; ++i) {
        const std::string id = "s" + std::to_string(i);
        ASSERT_TRUE(sessions.create_session(id, owner));
        slots.insert(*sessions.slot_of(id));
    }
    EXPECT_EQ(slots, (std::set<int>{0, 1, 2, 3, 4, 5, 6, 7}));
    EXPECT_TRUE(sessions.slots().exhausted());

    EXPECT_FALSE(sessions.create_session("s8", owner));
    const auto replies = owner->for_session("s8");
    ASSERT_EQ(replies.size(), 2u);
    EXPECT_EQ(replies[0].type, MessageType::Error);
    EXPECT_NE(replies[0].data.find("busy"), std::string::npos);
    EXPECT_EQ(replies[1].type, MessageType::Exit);
    EXPECT_FALSE(sessions.has_session("s8"));
    EXPECT_EQ(sessions.session_count(), 8u);
}

TEST_F(SessionPoolTest, DestroyFreesSlotAndIsIdempotent) {
    TempScript script("exec sleep 30");
    auto& sessions = make_pool(script.path());
    auto owner = std::make_shared<RecordingChannel>();

    ASSERT_TRUE(sessions.create_session("a", owner));
    ASSERT_TRUE(sessions.create_session("b", owner));
    EXPECT_EQ(sessions.slot_of("a"), 0);
    EXPECT_EQ(sessions.slot_of("b"), 1);

    run_task(ioc_, sessions.destroy_session("a"));
    EXPECT_FALSE(sessions.has_session("a"));
    EXPECT_FALSE(sessions.slots().is_assigned(0));
    EXPECT_TRUE(sessions.slots().is_assigned(1));

    run_task(ioc_, sessions.destroy_session("a"));
    EXPECT_EQ(sessions.slots().free_count(), 7u);

    ASSERT_TRUE(sessions.create_session("c", owner));
    EXPECT_EQ(sessions.slot_of("c"), 0);
}

TEST_F(SessionPoolTest, DuplicateNewSessionIsIgnored) {
    TempScript script("exec sleep 30");
    auto& sessions = make_pool(script.path());
    auto owner = std::make_shared<RecordingChannel>();

    ASSERT_TRUE(sessions.create_session("dup", owner));
    EXPECT_FALSE(sessions.create_session("dup", owner));
    EXPECT_EQ(sessions.session_count(), 1u);
    EXPECT_EQ(sessions.slots().assigned_count(), 1u);
}

TEST_F(SessionPoolTest, ScriptSeesItsSlotNumber) {
    TempScript script("echo \"slot=$SESSION_NUMBER\"\nexec sleep 30");
    auto& sessions = make_pool(script.path());
    auto first = std::make_shared<RecordingChannel>();

    sessions.handle_frame(frame(MessageType::NewSession, "x"), first);
    sessions.handle_frame(frame(MessageType::NewSession, "y"), first);
    EXPECT_TRUE(run_until(ioc_, [&] {
        return first->output_of("x").find("slot=0") != std::string::npos &&
               first->output_of("y").find("slot=1") != std::string::npos;
    }));
}

TEST_F(SessionPoolTest, InputReachesTheScript) {
    TempScript script("read line\necho \"got:$line\"\nexec sleep 30");
    auto& sessions = make_pool(script.path());
    auto owner = std::make_shared<RecordingChannel>();

    ASSERT_TRUE(sessions.create_session("i", owner));
    sessions.handle_frame(frame(MessageType::Input, "i", "hello\n"), owner);
    EXPECT_TRUE(run_until(ioc_, [&] { return owner->output_of("i").find("got:hello") != std::string::npos; }));
}

TEST_F(SessionPoolTest, ResizeChangesTerminalSize) {
    TempScript script("sleep 0.3\nstty size\nexec sleep 30");
    auto& sessions = make_pool(script.path());
    auto owner = std::make_shared<RecordingChannel>();

    ASSERT_TRUE(sessions.create_session("r", owner));
    sessions.handle_frame(R"({"type":"resize","session":"r","cols":100,"rows":40})", owner);
    EXPECT_TRUE(run_until(ioc_, [&] { return owner->output_of("r").find("40 100") != std::string::npos; }));
}

TEST_F(SessionPoolTest, OutputIsPacedAtTheBaudRate) {
    // 960 characters at 9600 baud: ten chunks of 96, about one second.
    TempScript script("printf '%0960d' 0\nexec sleep 30");
    auto& sessions = make_pool(script.path());
    auto owner = std::make_shared<RecordingChannel>();

    const auto start = std::chrono::steady_clock::now();
    ASSERT_TRUE(sessions.create_session("p", owner));
    ASSERT_TRUE(run_until(ioc_, [&] { return owner->output_of("p").size() >= 960; }));
    const auto elapsed = std::chrono::duration_cast<milliseconds>(owner->times.back() - start);

    EXPECT_EQ(owner->output_of("p"), std::string(960, '0'));
    for (const auto& m : owner->for_session("p")) {
        EXPECT_LE(m.data.size(), 96u);
    }
    // Expected 1000 ms; the last chunk goes out one chunk-time early.
    EXPECT_GE(elapsed.count(), 800);
    EXPECT_LE(elapsed.count(), 1200);
}

TEST_F(SessionPoolTest, BaudRateChangeSlowsOutput) {
    TempScript script("sleep 0.2\nprintf '%060d' 0\nexec sleep 30");
    auto& sessions = make_pool(script.path());
    auto owner = std::make_shared<RecordingChannel>();

    ASSERT_TRUE(sessions.create_session("slow", owner));
    sessions.handle_frame(R"({"type":"setBaudRate","session":"slow","baudRate":1200})", owner);
    EXPECT_EQ(sessions.baud_rate_of("slow"), 1200);

    // 60 characters at 120 cps: five 12-character chunks, 0.4 s before the last.
    ASSERT_TRUE(run_until(ioc_, [&] { return owner->output_of("slow").size() >= 60; }));
    const auto frames = owner->for_session("slow");
    ASSERT_GE(frames.size(), 5u);
    const auto spread = std::chrono::duration_cast<milliseconds>(owner->times.back() - owner->times.front());
    EXPECT_GE(spread.count(), 320);
    EXPECT_LE(spread.count(), 700);
}

TEST_F(SessionPoolTest, SessionEndsWhenScriptExits) {
    TempScript script("echo bye");
    auto& sessions = make_pool(script.path());
    auto owner = std::make_shared<RecordingChannel>();

    ASSERT_TRUE(sessions.create_session("e", owner));
    EXPECT_TRUE(run_until(ioc_, [&] { return !sessions.has_session("e") && sessions.slots().free_count() == 8; }));
    EXPECT_NE(owner->output_of("e").find("bye"), std::string::npos);
}

TEST_F(SessionPoolTest, TruncatedUtf8AtExitIsReplaced) {
    TempScript script("printf 'end\\342\\202'");
    auto& sessions = make_pool(script.path());
    auto owner = std::make_shared<RecordingChannel>();

    ASSERT_TRUE(sessions.create_session("t", owner));
    EXPECT_TRUE(run_until(ioc_, [&] { return !sessions.has_session("t"); }));
    EXPECT_NE(owner->output_of("t").find("end\xEF\xBF\xBD\xEF\xBF\xBD"), std::string::npos);
}

TEST_F(SessionPoolTest, SimulatorInheritsNoSockets) {
    asio::ip::tcp::acceptor listener(ioc_, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    TempScript script("ls -l /proc/$$/fd\necho fd-list-done\nexec sleep 30");
    auto& sessions = make_pool(script.path());
    auto owner = std::make_shared<RecordingChannel>();

    ASSERT_TRUE(sessions.create_session("fd", owner));
    ASSERT_TRUE(run_until(ioc_, [&] { return owner->output_of("fd").find("fd-list-done") != std::string::npos; }));
    EXPECT_EQ(owner->output_of("fd").find("socket:"), std::string::npos) << owner->output_of("fd");
}

TEST_F(SessionPoolTest, CloseSessionFromOwnerTearsDown) {
    TempScript script("exec sleep 30");
    auto& sessions = make_pool(script.path());
    auto owner = std::make_shared<RecordingChannel>();
    auto stranger = std::make_shared<RecordingChannel>("stranger");

    ASSERT_TRUE(sessions.create_session("c", owner));

    sessions.handle_frame(frame(MessageType::CloseSession, "c"), stranger);
    run_until(ioc_, [] { return false; }, milliseconds(100));
    EXPECT_TRUE(sessions.has_session("c"));

    sessions.handle_frame(frame(MessageType::CloseSession, "c"), owner);
    EXPECT_TRUE(run_until(ioc_, [&] { return sessions.slots().free_count() == 8; }));
    EXPECT_FALSE(sessions.has_session("c"));
}

TEST_F(SessionPoolTest, StubbornProcessIsKilled) {
    TempScript script("trap '' TERM HUP INT\nexec sleep 30");
    auto opts = fast_options(script.path());
    opts.terminate_wait = milliseconds(300);
    auto& sessions = make_pool(opts);
    auto owner = std::make_shared<RecordingChannel>();

    ASSERT_TRUE(sessions.create_session("k", owner));
    run_until(ioc_, [] { return false; }, milliseconds(200));

    const auto start = std::chrono::steady_clock::now();
    run_task(ioc_, sessions.destroy_session("k"));
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(sessions.has_session("k"));
    EXPECT_EQ(sessions.slots().free_count(), 8u);
    EXPECT_GE(elapsed, milliseconds(300));
}

TEST_F(SessionPoolTest, DropOwnerDestroysOnlyItsSessions) {
    TempScript script("exec sleep 30");
    auto& sessions = make_pool(script.path());
    auto a = std::make_shared<RecordingChannel>("a");
    auto b = std::make_shared<RecordingChannel>("b");

    ASSERT_TRUE(sessions.create_session("a1", a));
    ASSERT_TRUE(sessions.create_session("a2", a));
    ASSERT_TRUE(sessions.create_session("b1", b));

    a->open = false;
    run_task(ioc_, sessions.drop_owner(a));

    EXPECT_FALSE(sessions.has_session("a1"));
    EXPECT_FALSE(sessions.has_session("a2"));
    EXPECT_TRUE(sessions.has_session("b1"));
    EXPECT_EQ(sessions.slot_of("b1"), 2);
    EXPECT_EQ(sessions.slots().free_count(), 7u);
}

TEST_F(SessionPoolTest, SpawnFailureReturnsSlot) {
    auto& sessions = make_pool("/nonexistent/termrelay/run.sh");
    auto owner = std::make_shared<RecordingChannel>();

    EXPECT_FALSE(sessions.create_session("f", owner));
    const auto replies = owner->for_session("f");
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(replies[0].type, MessageType::Error);
    EXPECT_EQ(replies[0].data, "Failed to start simulator");
    EXPECT_EQ(sessions.slots().free_count(), 8u);
    EXPECT_EQ(sessions.session_count(), 0u);
}

TEST_F(SessionPoolTest, UnknownSessionsAndBadFramesAreIgnored) {
    TempScript script("exec sleep 30");
    auto& sessions = make_pool(script.path());
    auto owner = std::make_shared<RecordingChannel>();

    sessions.handle_input("nope", "x");
    sessions.handle_resize("nope", 80, 24);
    sessions.handle_baud_rate("nope", 300);
    sessions.handle_frame("{not json", owner);
    sessions.handle_frame(R"({"type":"input","data":"no session"})", owner);
    sessions.handle_frame(R"({"type":"bogus","session":"z"})", owner);

    EXPECT_TRUE(owner->frames.empty());
    EXPECT_EQ(sessions.session_count(), 0u);
}

// ---- UplinkConnection ----

namespace {

unsigned short unused_port(asio::io_context& ioc) {
    asio::ip::tcp::acceptor probe(ioc, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    return probe.local_endpoint().port();
}

} // namespace

TEST(UplinkConnection, BackoffGrowsBetweenFailedAttempts) {
    asio::io_context ioc;
    TempScript script("exec sleep 30");
    pool::SessionPool sessions(ioc.get_executor(), fast_options(script.path()));

    const auto url = networking::WebSocketUrl::parse("ws://127.0.0.1:" + std::to_string(unused_port(ioc)));
    pool::UplinkConnection uplink(ioc.get_executor(), url, sessions,
                                  pool::ExponentialBackoff(milliseconds(100), milliseconds(400)));

    std::vector<std::chrono::steady_clock::time_point> attempts;
    uplink.set_on_state_change([&](pool::LinkState s) {
        if (s == pool::LinkState::Connecting) attempts.push_back(std::chrono::steady_clock::now());
    });

    const auto start = std::chrono::steady_clock::now();
    bool finished = false;
    asio::co_spawn(ioc, uplink.supervise(), [&](std::exception_ptr) { finished = true; });

    ASSERT_TRUE(run_until(ioc, [&] { return attempts.size() >= 5; }));

    std::vector<long> gaps;
    auto prev = start;
    for (const auto& t : attempts) {
        gaps.push_back(static_cast<long>(std::chrono::duration_cast<milliseconds>(t - prev).count()));
        prev = t;
    }
    // Delays 100, 200, 400, 400, 400 ms (cap).
    EXPECT_GE(gaps[0], 100);
    EXPECT_GE(gaps[1], 200);
    EXPECT_GE(gaps[2], 400);
    EXPECT_GE(gaps[3], 400);
    EXPECT_GT(gaps[1], gaps[0]);
    EXPECT_GT(gaps[2], gaps[1]);
    EXPECT_LT(gaps[4], 700);

    uplink.stop();
    ASSERT_TRUE(run_until(ioc, [&] { return finished; }));
    EXPECT_EQ(uplink.state(), pool::LinkState::Disconnected);
    EXPECT_GE(uplink.retry_count(), 4u);
}

TEST(UplinkConnection, ServesSessionsAndReconnectsAfterLoss) {
    asio::io_context ioc;
    TempScript script("echo hi\nexec sleep 30");
    pool::SessionPool sessions(ioc.get_executor(), fast_options(script.path()));

    networking::ServerOptions server_opts;
    server_opts.name = "test-router";
    server_opts.address = "127.0.0.1";
    networking::WebSocketServer router(ioc, server_opts);

    std::vector<networking::ClientId> clients;
    std::vector<std::string> received;
    router.set_on_connect([&](networking::ClientId id) {
        clients.push_back(id);
        router.send(id, protocol::make_session_frame(MessageType::NewSession, "up-" + std::to_string(id)));
    });
    router.set_on_message([&](networking::ClientId, const std::string& msg) { received.push_back(msg); });
    router.start();

    const auto url = networking::WebSocketUrl::parse("ws://127.0.0.1:" + std::to_string(router.port()));
    pool::UplinkConnection uplink(ioc.get_executor(), url, sessions,
                                  pool::ExponentialBackoff(milliseconds(100), milliseconds(400)));

    bool connected = false;
    run_task(ioc, [&]() -> asio::awaitable<void> { connected = co_await uplink.connect_once(); }());
    ASSERT_TRUE(connected);
    EXPECT_EQ(uplink.state(), pool::LinkState::Connected);
    EXPECT_EQ(uplink.retry_count(), 0u);

    bool finished = false;
    asio::co_spawn(ioc, uplink.supervise(), [&](std::exception_ptr) { finished = true; });

    auto saw_output = [&] {
        for (const auto& r : received) {
            const auto msg = protocol::decode(r);
            if (msg.type == MessageType::Output && msg.data.find("hi") != std::string::npos) return true;
        }
        return false;
    };
    ASSERT_TRUE(run_until(ioc, saw_output));
    ASSERT_EQ(clients.size(), 1u);
    EXPECT_EQ(sessions.session_count(), 1u);

    // Router drops the link: the session goes with it, then the uplink comes back.
    router.close(clients.front());
    ASSERT_TRUE(run_until(ioc, [&] { return clients.size() == 2 && sessions.slots().free_count() >= 7; }));
    EXPECT_TRUE(run_until(ioc, [&] { return uplink.state() == pool::LinkState::Connected; }));
    EXPECT_FALSE(sessions.has_session("up-" + std::to_string(clients.front())));

    uplink.stop();
    router.stop();
    ASSERT_TRUE(run_until(ioc, [&] { return finished; }));
    run_task(ioc, sessions.shutdown());
    EXPECT_EQ(sessions.slots().free_count(), 8u);
}
