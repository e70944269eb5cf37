// tests/test_streaming_executor.cpp
/**
 * @file test_streaming_executor.cpp
 * @brief Tests for StreamingExecutor, ProcessRegistry and Subprocess.
 *
 * Real /bin/sh children (native backend, no Landlock) cover exit codes,
 * stderr routing, timeouts, cancellation and the output cap. The scripted
 * backend covers provisioning order, backend failures and UTF-8 chunking.
 */
#include <sandterm/exec/streaming_executor.hpp>
#include <sandterm/exec/process_registry.hpp>
#include <sandterm/exec/native_backend.hpp>
#include <sandterm/exec/subprocess.hpp>
#include <sandterm/core/sandbox.hpp>
#include <sandterm/core/utils.hpp>
#include <gtest/gtest.h>

#include "test_support.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <sys/stat.h>
#include <vector>

using namespace sandterm;
using sandterm::testing_support::Script;
using sandterm::testing_support::ScriptStep;
using sandterm::testing_support::ScriptedBackend;

namespace {

// Thread-safe log of every callback, in arrival order
class Recorder {
public:
    ExecCallbacks callbacks() {
        ExecCallbacks cb;
        cb.on_started = [this]() { push("started", ""); };
        cb.on_output = [this](OutputStream stream, const std::string& text) {
            push(stream_name(stream), text);
        };
        cb.on_completed = [this](int code) { push("completed", std::to_string(code)); };
        cb.on_error = [this](const ExecError& err) {
            push(std::string("error:") + error_kind_name(err.kind), err.message);
        };
        return cb;
    }

    std::vector<std::pair<std::string, std::string>> events() {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    std::string text(const std::string& kind) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string out;
        for (const auto& e : events_) {
            if (e.first == kind) out += e.second;
        }
        return out;
    }

    int count(const std::string& kind) {
        std::lock_guard<std::mutex> lock(mutex_);
        int n = 0;
        for (const auto& e : events_) {
            if (e.first == kind) ++n;
        }
        return n;
    }

    int terminal_count() {
        return count("completed") + count("error:validation") + count("error:infrastructure") +
               count("error:execution") + count("error:timeout") + count("error:cancellation");
    }

    bool seen(const std::string& kind) { return count(kind) > 0; }

private:
    void push(const std::string& kind, const std::string& data) {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(std::make_pair(kind, data));
    }

    std::mutex mutex_;
    std::vector<std::pair<std::string, std::string>> events_;
};

// Zombies count as gone: an orphan may wait for a reaper that never comes
bool process_alive(pid_t pid) {
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    if (!stat) return false;
    std::string line;
    std::getline(stat, line);
    size_t paren = line.rfind(')');
    if (paren == std::string::npos || paren + 2 >= line.size()) return false;
    return line[paren + 2] != 'Z';
}

class NativeExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        char tmpl[] = "/tmp/sandterm_exec_XXXXXX";
        char* dir = mkdtemp(tmpl);
        ASSERT_NE(dir, nullptr);
        root_ = dir;
        sandbox_.reset(new Sandbox(root_, "/workspace"));
        ASSERT_TRUE(sandbox_->init());
        backend_.reset(new NativeBackend(*sandbox_, false));
        user_ = UserContext("1", "alice");
    }

    void TearDown() override {
        std::string cmd = "rm -rf '" + root_ + "'";
        if (system(cmd.c_str()) != 0) {
            ADD_FAILURE() << "cleanup failed for " << root_;
        }
    }

    std::shared_ptr<StreamingExecutor> run(const std::string& command, Recorder& rec,
                                           const ExecLimits& limits = ExecLimits(),
                                           const std::string& cwd = "/workspace") {
        ExecRequest req;
        req.user = user_;
        req.invocation_id = generate_uuid();
        req.cwd = cwd;
        req.command = command;
        std::shared_ptr<StreamingExecutor> ex =
            StreamingExecutor::create(*backend_, req, limits, rec.callbacks());
        ex->start();
        return ex;
    }

    std::string root_;
    std::unique_ptr<Sandbox> sandbox_;
    std::unique_ptr<NativeBackend> backend_;
    UserContext user_;
};

} // namespace

// ============================================================================
// Completion and ordering
// ============================================================================

TEST_F(NativeExecutorTest, StartedOutputCompletedInOrder)
{
    Recorder rec;
    auto ex = run("echo hello", rec);
    ex->wait();

    auto events = rec.events();
    ASSERT_GE(events.size(), 3u);
    EXPECT_EQ(events.front().first, "started");
    EXPECT_EQ(events.back().first, "completed");
    EXPECT_EQ(events.back().second, "0");
    EXPECT_EQ(rec.text("stdout"), "hello\n");
    EXPECT_EQ(rec.terminal_count(), 1);

    EXPECT_TRUE(ex->finished());
    EXPECT_EQ(ex->outcome(), InvocationOutcome::SUCCESS);
    EXPECT_EQ(ex->exit_code(), 0);
}

TEST_F(NativeExecutorTest, NonZeroExitIsCompletedNotError)
{
    Recorder rec;
    auto ex = run("echo out; echo err >&2; exit 3", rec);
    ex->wait();

    EXPECT_EQ(rec.text("stdout"), "out\n");
    EXPECT_EQ(rec.text("stderr"), "err\n");
    EXPECT_EQ(rec.events().back().first, "completed");
    EXPECT_EQ(rec.events().back().second, "3");
    EXPECT_EQ(ex->outcome(), InvocationOutcome::FAILURE);
    EXPECT_EQ(ex->exit_code(), 3);
    // Output was produced, so no notice
    EXPECT_EQ(rec.text("info").find("no output"), std::string::npos);
}

TEST_F(NativeExecutorTest, SilentFailureGetsNotice)
{
    Recorder rec;
    auto ex = run("exit 7", rec);
    ex->wait();

    EXPECT_EQ(rec.text("info"), "Command finished with no output (exit code: 7)\n");
    EXPECT_EQ(rec.events().back().second, "7");
}

TEST_F(NativeExecutorTest, SilentSuccessHasNoNotice)
{
    Recorder rec;
    auto ex = run("true", rec);
    ex->wait();
    EXPECT_FALSE(rec.seen("info"));
    EXPECT_EQ(rec.events().back().first, "completed");
}

TEST_F(NativeExecutorTest, RunsInTheMappedWorkingDirectory)
{
    ASSERT_TRUE(create_directories(root_ + "/alice/site"));
    Recorder rec;
    auto ex = run("pwd", rec, ExecLimits(), "/workspace/site");
    ex->wait();
    EXPECT_EQ(rec.text("stdout"), root_ + "/alice/site\n");
}

TEST_F(NativeExecutorTest, NoShellStateSurvivesBetweenInvocations)
{
    Recorder first;
    run("export SANDTERM_MARK=1; cd /tmp", first)->wait();

    Recorder second;
    run("echo \"[$SANDTERM_MARK]\"; pwd", second)->wait();
    EXPECT_EQ(second.text("stdout"), "[]\n" + root_ + "/alice\n");
}

// ============================================================================
// Timeout and cancellation
// ============================================================================

TEST_F(NativeExecutorTest, TimeoutKillsTheProcess)
{
    ExecLimits limits;
    limits.timeout_ms = 1000;

    Recorder rec;
    int64_t t0 = monotonic_ms();
    auto ex = run("echo $$; exec sleep 30", rec, limits);
    ex->wait();
    int64_t elapsed = monotonic_ms() - t0;

    EXPECT_LT(elapsed, 10000);
    EXPECT_EQ(ex->outcome(), InvocationOutcome::TIMEOUT);
    EXPECT_EQ(rec.events().back().first, "error:timeout");
    EXPECT_EQ(rec.events().back().second, "Command timed out after 1 seconds");
    EXPECT_EQ(rec.terminal_count(), 1);

    pid_t pid = static_cast<pid_t>(atoi(trim(rec.text("stdout")).c_str()));
    ASSERT_GT(pid, 0);
    EXPECT_FALSE(process_alive(pid));
}

TEST_F(NativeExecutorTest, CancelTerminatesDescendants)
{
    Recorder rec;
    auto ex = run("sleep 30 & echo $!; wait", rec);

    // Wait for the child pid to be reported
    int64_t deadline = monotonic_ms() + 5000;
    while (rec.text("stdout").empty() && monotonic_ms() < deadline) sleep_ms(20);
    pid_t child = static_cast<pid_t>(atoi(trim(rec.text("stdout")).c_str()));
    ASSERT_GT(child, 0);

    ex->cancel();
    ex->cancel();
    ex->wait();

    EXPECT_EQ(ex->outcome(), InvocationOutcome::CANCELED);
    EXPECT_EQ(rec.events().back().first, "error:cancellation");
    EXPECT_EQ(rec.terminal_count(), 1);

    // The background sleep is gone too (allow the reaper a moment)
    deadline = monotonic_ms() + 2000;
    while (process_alive(child) && monotonic_ms() < deadline) sleep_ms(20);
    EXPECT_FALSE(process_alive(child));
}

TEST_F(NativeExecutorTest, CancelAfterCompletionIsNoOp)
{
    Recorder rec;
    auto ex = run("echo done", rec);
    ex->wait();
    ex->cancel();
    EXPECT_EQ(ex->outcome(), InvocationOutcome::SUCCESS);
    EXPECT_EQ(rec.terminal_count(), 1);
}

// ============================================================================
// Output cap
// ============================================================================

TEST_F(NativeExecutorTest, OutputBeyondCapIsDroppedWithOneNotice)
{
    ExecLimits limits;
    limits.max_output_bytes = 100;

    Recorder rec;
    auto ex = run("head -c 5000 /dev/zero | tr '\\000' a", rec, limits);
    ex->wait();

    EXPECT_EQ(rec.text("stdout"), std::string(100, 'a'));
    EXPECT_EQ(rec.count("info"), 1);
    EXPECT_NE(rec.text("info").find("Output limit reached (100 bytes)"), std::string::npos);
    EXPECT_EQ(rec.events().back().first, "completed");
    EXPECT_EQ(rec.events().back().second, "0");
}

// ============================================================================
// Scripted backend
// ============================================================================

namespace {

std::shared_ptr<StreamingExecutor> make_scripted(ScriptedBackend& backend, Recorder& rec,
                                                 const std::string& command,
                                                 const ExecLimits& limits = ExecLimits())
{
    ExecRequest req;
    req.user = UserContext("1", "alice");
    req.invocation_id = generate_uuid();
    req.cwd = "/workspace";
    req.command = command;
    return StreamingExecutor::create(backend, req, limits, rec.callbacks());
}

} // namespace

TEST(ScriptedExecutorTest, ProvisioningInfoPrecedesOutput)
{
    ScriptedBackend backend;
    Script install;
    install.steps.push_back(ScriptStep(OutputStream::STDOUT, "added 120 packages\n"));
    backend.scripts["npm install"] = install;

    Recorder rec;
    auto ex = make_scripted(backend, rec, "npm install");
    ex->start();
    ex->wait();

    auto events = rec.events();
    ASSERT_EQ(events.size(), 5u);
    EXPECT_EQ(events[0].first, "started");
    EXPECT_EQ(events[1], std::make_pair(std::string("info"), std::string("Starting container...\n")));
    EXPECT_EQ(events[2], std::make_pair(std::string("info"), std::string("Container ready\n")));
    EXPECT_EQ(events[3], std::make_pair(std::string("stdout"), std::string("added 120 packages\n")));
    EXPECT_EQ(events[4], std::make_pair(std::string("completed"), std::string("0")));
}

TEST(ScriptedExecutorTest, BackendFailureIsInfrastructureError)
{
    ScriptedBackend backend;
    backend.fail_provisioning = true;

    Recorder rec;
    auto ex = make_scripted(backend, rec, "ls");
    ex->start();
    ex->wait();

    EXPECT_EQ(ex->outcome(), InvocationOutcome::FAILURE);
    EXPECT_EQ(rec.events().back().first, "error:infrastructure");
    EXPECT_EQ(rec.events().back().second, "Docker is not running.");
    EXPECT_EQ(rec.terminal_count(), 1);
}

TEST(ScriptedExecutorTest, CancelBeforeStartNeverExecutes)
{
    ScriptedBackend backend;
    Recorder rec;
    auto ex = make_scripted(backend, rec, "ls");
    ex->cancel();
    ex->start();
    ex->wait();

    EXPECT_EQ(ex->outcome(), InvocationOutcome::CANCELED);
    EXPECT_EQ(backend.request_count(), 0u);
    EXPECT_EQ(rec.events().back().first, "error:cancellation");
}

TEST(ScriptedExecutorTest, CancelHangingCommandTerminatesHandle)
{
    ScriptedBackend backend;
    backend.default_script = Script::hanging();

    Recorder rec;
    auto ex = make_scripted(backend, rec, "node server.js");
    ex->start();
    sleep_ms(150);
    EXPECT_FALSE(ex->finished());

    ex->cancel();
    ex->wait();
    EXPECT_EQ(backend.terminated.load(), 1);
    EXPECT_EQ(rec.terminal_count(), 1);
}

TEST(ScriptedExecutorTest, SplitUtf8SequencesAreJoinedBeforeDelivery)
{
    ScriptedBackend backend;
    Script script;
    script.steps.push_back(ScriptStep(OutputStream::STDOUT, "caf\xC3"));
    script.steps.push_back(ScriptStep(OutputStream::STDOUT, "\xA9 ok\n"));
    backend.default_script = script;

    Recorder rec;
    auto ex = make_scripted(backend, rec, "cat menu.txt");
    ex->start();
    ex->wait();

    EXPECT_EQ(rec.text("stdout"), "caf\xC3\xA9 ok\n");
    for (const auto& e : rec.events()) {
        if (e.first == "stdout") {
            EXPECT_EQ(utf8_complete_prefix(e.second), e.second.size()) << e.second;
        }
    }
}

TEST(Utf8PrefixTest, StopsBeforeIncompleteTrailingSequence)
{
    EXPECT_EQ(utf8_complete_prefix(""), 0u);
    EXPECT_EQ(utf8_complete_prefix("abc"), 3u);
    EXPECT_EQ(utf8_complete_prefix("ab\xC3"), 2u);
    EXPECT_EQ(utf8_complete_prefix("ab\xC3\xA9"), 4u);
    EXPECT_EQ(utf8_complete_prefix("a\xE2\x82"), 1u);
    EXPECT_EQ(utf8_complete_prefix("a\xE2\x82\xAC"), 4u);
    EXPECT_EQ(utf8_complete_prefix("\xF0\x9F\x98"), 0u);
}

// ============================================================================
// ProcessRegistry
// ============================================================================

TEST(ProcessRegistryTest, OneEntryPerSession)
{
    ScriptedBackend backend;
    Recorder rec;
    auto a = make_scripted(backend, rec, "ls");
    auto b = make_scripted(backend, rec, "pwd");

    ProcessRegistry registry;
    EXPECT_TRUE(registry.add("s1", a));
    EXPECT_FALSE(registry.add("s1", b));
    EXPECT_TRUE(registry.add("s2", b));
    EXPECT_EQ(registry.size(), 2u);
    EXPECT_EQ(registry.find("s1"), a);
    EXPECT_EQ(registry.find("missing"), nullptr);
}

TEST(ProcessRegistryTest, RemoveOnlyMatchingInvocation)
{
    ScriptedBackend backend;
    Recorder rec;
    auto a = make_scripted(backend, rec, "ls");

    ProcessRegistry registry;
    ASSERT_TRUE(registry.add("s1", a));
    EXPECT_FALSE(registry.remove("s1", "some-other-invocation"));
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_TRUE(registry.remove("s1", a->request().invocation_id));
    EXPECT_EQ(registry.size(), 0u);
}

TEST(ProcessRegistryTest, TakeEmptiesTheRegistry)
{
    ScriptedBackend backend;
    Recorder rec;
    ProcessRegistry registry;
    ASSERT_TRUE(registry.add("s1", make_scripted(backend, rec, "ls")));
    ASSERT_TRUE(registry.add("s2", make_scripted(backend, rec, "ls")));

    EXPECT_NE(registry.take("s1"), nullptr);
    EXPECT_EQ(registry.take("s1"), nullptr);
    EXPECT_EQ(registry.take_all().size(), 1u);
    EXPECT_EQ(registry.size(), 0u);
}

// ============================================================================
// Subprocess helpers
// ============================================================================

TEST(SubprocessTest, RunCaptureCollectsBothStreams)
{
    CaptureResult r = run_capture({"/bin/sh", "-c", "echo out; echo err >&2; exit 2"}, 5000);
    EXPECT_TRUE(r.started);
    EXPECT_FALSE(r.timed_out);
    EXPECT_EQ(r.exit_code, 2);
    EXPECT_EQ(r.out, "out\n");
    EXPECT_EQ(r.err, "err\n");
    EXPECT_FALSE(r.success());
}

TEST(SubprocessTest, RunCaptureTimesOut)
{
    int64_t t0 = monotonic_ms();
    CaptureResult r = run_capture({"/bin/sh", "-c", "sleep 30"}, 300);
    EXPECT_TRUE(r.timed_out);
    EXPECT_LT(monotonic_ms() - t0, 5000);
}

TEST(SubprocessTest, MissingBinaryFailsToStart)
{
    CaptureResult r = run_capture({"/nonexistent/sandterm-binary"}, 1000);
    EXPECT_FALSE(r.started);
    EXPECT_FALSE(r.error.empty());
}
