// tests/test_terminal_service.cpp
/**
 * @file test_terminal_service.cpp
 * @brief Tests for event frames, schema change detection and the
 *        TerminalService event flow.
 *
 * The service runs against the scripted backend; a recording emitter
 * collects every frame a client would receive so tests can assert on
 * event order and payloads.
 */
#include <sandterm/server/terminal_service.hpp>
#include <sandterm/server/events.hpp>
#include <sandterm/server/schema_hook.hpp>
#include <sandterm/audit/audit_log.hpp>
#include <sandterm/core/sandbox.hpp>
#include <sandterm/exec/process_registry.hpp>
#include <sandterm/session/session_store.hpp>
#include <sandterm/session/site_registry.hpp>
#include <sandterm/storage/database.hpp>
#include <gtest/gtest.h>

#include "test_support.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace sandterm;
using sandterm::testing_support::Script;
using sandterm::testing_support::ScriptStep;
using sandterm::testing_support::ScriptedBackend;

// ============================================================================
// Frames
// ============================================================================

TEST(EventFrameTest, EncodeIsOneLine)
{
    Json data;
    data["command"] = "ls\n-la";
    std::string frame = encode_frame(events::EXECUTE_COMMAND, data);
    ASSERT_FALSE(frame.empty());
    EXPECT_EQ(frame.back(), '\n');
    EXPECT_EQ(frame.find('\n'), frame.size() - 1);

    std::string event, error;
    Json parsed;
    ASSERT_TRUE(parse_frame(frame.substr(0, frame.size() - 1), event, parsed, error)) << error;
    EXPECT_EQ(event, "execute_command");
    EXPECT_EQ(parsed["data"]["command"], "ls\n-la");
}

TEST(EventFrameTest, EncodeReplacesInvalidUtf8)
{
    Json data;
    data["data"] = std::string("bad \xFF byte");
    std::string frame = encode_frame(events::COMMAND_OUTPUT, data);
    EXPECT_NE(frame.find("bad"), std::string::npos);
    EXPECT_EQ(frame.find('\xFF'), std::string::npos);
}

TEST(EventFrameTest, ParseRejectsMalformedFrames)
{
    std::string event, error;
    Json frame;
    EXPECT_FALSE(parse_frame("{not json", event, frame, error));
    EXPECT_EQ(error, "Malformed frame");
    EXPECT_FALSE(parse_frame("[1,2]", event, frame, error));
    EXPECT_FALSE(parse_frame("{\"event\": 7}", event, frame, error));
}

TEST(EventFrameTest, MissingDataBecomesEmptyObject)
{
    std::string event, error;
    Json frame;
    ASSERT_TRUE(parse_frame("{\"event\":\"ping\"}", event, frame, error));
    EXPECT_EQ(event, "ping");
    EXPECT_TRUE(frame["data"].is_object());
    EXPECT_TRUE(frame["data"].empty());
}

TEST(EventFrameTest, Payloads)
{
    Json out = output_payload(OutputStream::STDERR, "warn\n");
    EXPECT_EQ(out["type"], "stderr");
    EXPECT_EQ(out["data"], "warn\n");

    Json err = error_payload(ExecError(ErrorKind::INFRASTRUCTURE, "Docker is not running.",
                                       "Start Docker."));
    EXPECT_EQ(err["error"], "Docker is not running. Start Docker.");
    EXPECT_EQ(err["kind"], "infrastructure");
    EXPECT_EQ(err["remediation"], "Start Docker.");
    EXPECT_FALSE(err.contains("exitCode"));

    Json exec = error_payload(ExecError(ErrorKind::EXECUTION, "boom", "", 2));
    EXPECT_EQ(exec["exitCode"], 2);
    EXPECT_FALSE(exec.contains("remediation"));
}

// ============================================================================
// Schema change detection
// ============================================================================

TEST(SchemaChangeTest, ClassifiesOperations)
{
    struct Case { const char* command; const char* operation; };
    const Case cases[] = {
        { "php artisan migrate", "migrate" },
        { "php artisan migrate --force", "migrate" },
        { "php artisan migrate:fresh --seed", "wipe" },
        { "php artisan db:wipe", "wipe" },
        { "php artisan migrate:rollback", "rollback" },
        { "php artisan migrate:reset", "rollback" },
        { "php artisan db:seed", "seed" },
        { "npx prisma migrate dev", "migrate" },
        { "npx knex migrate:latest", "migrate" },
        { "mysql -u app shop", "query" },
        { "mysql", "query" },
        { "  PHP ARTISAN MIGRATE  ", "migrate" },
        { "npx prisma db push", "unknown" },
    };
    for (const Case& c : cases) {
        std::string op;
        EXPECT_TRUE(detect_schema_change(c.command, op)) << c.command;
        EXPECT_EQ(op, c.operation) << c.command;
    }
}

TEST(SchemaChangeTest, OrdinaryCommandsDoNotMatch)
{
    const char* commands[] = { "ls", "npm install", "php artisan serve", "git pull", "mysqldump" };
    for (const char* c : commands) {
        std::string op = "untouched";
        EXPECT_FALSE(detect_schema_change(c, op)) << c;
    }
}

// ============================================================================
// TerminalService
// ============================================================================

namespace {

struct Frame {
    std::string event;
    Json data;
};

// Collects frames for one session and lets the test block until one arrives
class FrameRecorder {
public:
    EventEmitter emitter() {
        return [this](const std::string& event, const Json& data) {
            std::lock_guard<std::mutex> lock(mutex_);
            Frame f;
            f.event = event;
            f.data = data;
            frames_.push_back(f);
            cv_.notify_all();
        };
    }

    // Wait until `event` has been seen `n` times in total
    bool wait_for(const std::string& event, size_t n = 1, int timeout_ms = 5000) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [&]() {
            return count_locked(event) >= n;
        });
    }

    // Wait for the n-th terminal frame (completed or error)
    bool wait_done(size_t n = 1, int timeout_ms = 5000) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [&]() {
            return count_locked(events::COMMAND_COMPLETED) + count_locked(events::COMMAND_ERROR) >= n;
        });
    }

    std::vector<Frame> frames() {
        std::lock_guard<std::mutex> lock(mutex_);
        return frames_;
    }

    std::vector<std::string> names() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> out;
        for (const auto& f : frames_) out.push_back(f.event);
        return out;
    }

    Frame last(const std::string& event) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = frames_.rbegin(); it != frames_.rend(); ++it) {
            if (it->event == event) return *it;
        }
        return Frame();
    }

    std::string output(const std::string& type) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string out;
        for (const auto& f : frames_) {
            if (f.event == events::COMMAND_OUTPUT && f.data["type"] == type) {
                out += f.data["data"].get<std::string>();
            }
        }
        return out;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        frames_.clear();
    }

private:
    size_t count_locked(const std::string& event) const {
        size_t n = 0;
        for (const auto& f : frames_) {
            if (f.event == event) ++n;
        }
        return n;
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Frame> frames_;
};

class MemoryAuditSink : public AuditSink {
public:
    bool append(const AuditRecord& record) {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back(record);
        return true;
    }

    std::vector<AuditRecord> records() {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

private:
    std::mutex mutex_;
    std::vector<AuditRecord> records_;
};

class RecordingSchemaHook : public SchemaChangeHook {
public:
    void on_schema_change(const SchemaChangeEvent& event) {
        std::lock_guard<std::mutex> lock(mutex_);
        seen.push_back(event);
    }

    std::vector<SchemaChangeEvent> seen;

private:
    std::mutex mutex_;
};

Json command(const std::string& text) {
    Json data;
    data["command"] = text;
    return data;
}

class TerminalServiceTest : public ::testing::Test {
protected:
    TerminalServiceTest()
        : sandbox_("/srv/userdata", "/workspace")
        , policy_(PolicyTables::defaults())
        , sessions_("/workspace", nullptr)
        , audit_(sink_)
        , alice_("1", "alice") {}

    void SetUp() override {
        audit_.start();
        service_.reset(new TerminalService(backend_, policy_, sessions_,
                                           registry_, &audit_, &sandbox_));
        service_->set_schema_hook(&hook_);
        ASSERT_TRUE(service_->connect("s1", alice_, rec_.emitter()));
        ASSERT_TRUE(rec_.wait_for(events::CONNECTED));
        rec_.clear();
    }

    void TearDown() override {
        service_->shutdown();
        audit_.stop();
    }

    void execute(const std::string& text) {
        service_->handle_event("s1", events::EXECUTE_COMMAND, command(text));
    }

    std::vector<AuditRecord> audited() {
        audit_.flush();
        return sink_.records();
    }

    // The session is released just after its terminal frame goes out
    bool wait_idle(const std::string& session_id = "s1", int timeout_ms = 5000) {
        int64_t deadline = monotonic_ms() + timeout_ms;
        for (;;) {
            Session session;
            bool idle = registry_.size() == 0 &&
                        (!sessions_.get(session_id, session) || session.active_invocation.empty());
            if (idle) return true;
            if (monotonic_ms() >= deadline) return false;
            sleep_ms(10);
        }
    }

    Sandbox sandbox_;
    PolicyTables policy_;
    ScriptedBackend backend_;
    SessionStore sessions_;
    ProcessRegistry registry_;
    MemoryAuditSink sink_;
    AuditLogger audit_;
    RecordingSchemaHook hook_;
    FrameRecorder rec_;
    std::unique_ptr<TerminalService> service_;
    UserContext alice_;
};

} // namespace

TEST_F(TerminalServiceTest, ConnectGreetsWithSandboxRoot)
{
    FrameRecorder other;
    ASSERT_TRUE(service_->connect("s2", UserContext("2", "bob"), other.emitter()));
    ASSERT_TRUE(other.wait_for(events::CONNECTED));
    Frame hello = other.last(events::CONNECTED);
    EXPECT_EQ(hello.data["sandbox_root"], "/workspace");
    EXPECT_EQ(hello.data["backend"], "scripted");

    EXPECT_FALSE(service_->connect("s2", UserContext("2", "bob"), other.emitter()));
    service_->disconnect("s2");
}

TEST_F(TerminalServiceTest, FirstCommandReportsProvisioningThenOutput)
{
    backend_.scripts["npm install"] = Script::output("added 120 packages\n");
    execute("npm install");
    ASSERT_TRUE(rec_.wait_done());

    std::vector<Frame> frames = rec_.frames();
    ASSERT_EQ(frames.size(), 5u);
    EXPECT_EQ(frames[0].event, "command_started");
    EXPECT_EQ(frames[0].data["command"], "npm install");
    EXPECT_EQ(frames[0].data["cwd"], "/workspace");
    EXPECT_TRUE(frames[0].data["site"].is_null());
    EXPECT_EQ(frames[1].data["type"], "info");
    EXPECT_EQ(frames[1].data["data"], "Starting container...\n");
    EXPECT_EQ(frames[2].data["data"], "Container ready\n");
    EXPECT_EQ(frames[3].data["type"], "stdout");
    EXPECT_EQ(frames[3].data["data"], "added 120 packages\n");
    EXPECT_EQ(frames[4].event, "command_completed");
    EXPECT_EQ(frames[4].data["exitCode"], 0);

    std::vector<AuditRecord> records = audited();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].status, "success");
    EXPECT_EQ(records[0].command, "npm install");
    EXPECT_EQ(records[0].backend, "scripted");
    EXPECT_EQ(records[0].user_id, "1");
    EXPECT_TRUE(wait_idle());
}

TEST_F(TerminalServiceTest, NonZeroExitIsReportedAsCompletion)
{
    backend_.scripts["npm test"] = Script::output("1 failing\n", 1);
    execute("npm test");
    ASSERT_TRUE(rec_.wait_done());

    EXPECT_EQ(rec_.last(events::COMMAND_COMPLETED).data["exitCode"], 1);
    std::vector<AuditRecord> records = audited();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].status, "failure");
    EXPECT_EQ(records[0].exit_code, 1);
}

TEST_F(TerminalServiceTest, SecondCommandWhileBusyIsRejected)
{
    backend_.default_script = Script::hanging();
    execute("node server.js");
    ASSERT_TRUE(rec_.wait_for(events::COMMAND_STARTED));

    execute("ls");
    ASSERT_TRUE(rec_.wait_for(events::COMMAND_ERROR));
    Frame busy = rec_.last(events::COMMAND_ERROR);
    EXPECT_EQ(busy.data["kind"], "validation");
    EXPECT_NE(busy.data["error"].get<std::string>().find("already running"), std::string::npos);

    // The first invocation is untouched
    EXPECT_EQ(registry_.size(), 1u);
    EXPECT_EQ(backend_.request_count(), 1u);
    EXPECT_EQ(backend_.last_request().command, "node server.js");

    service_->handle_event("s1", events::CANCEL_COMMAND, Json::object());
    ASSERT_TRUE(rec_.wait_for(events::COMMAND_ERROR, 2));
}

TEST_F(TerminalServiceTest, RejectedCommandNeverReachesBackend)
{
    execute("rm -rf /");
    ASSERT_TRUE(rec_.wait_done());

    Frame err = rec_.last(events::COMMAND_ERROR);
    EXPECT_EQ(err.data["kind"], "validation");
    EXPECT_NE(err.data["error"].get<std::string>().find("blocked"), std::string::npos);
    EXPECT_EQ(backend_.request_count(), 0u);

    std::vector<AuditRecord> records = audited();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].status, "rejected");
    EXPECT_EQ(records[0].command, "rm -rf /");

    // Session is free again
    backend_.scripts["ls"] = Script::output("a\n");
    execute("ls");
    ASSERT_TRUE(rec_.wait_for(events::COMMAND_COMPLETED));
}

TEST_F(TerminalServiceTest, ChainingIsRejected)
{
    execute("ls && cat /etc/passwd");
    ASSERT_TRUE(rec_.wait_done());
    Frame err = rec_.last(events::COMMAND_ERROR);
    EXPECT_NE(err.data["error"].get<std::string>().find("Operator not allowed"), std::string::npos);
    EXPECT_EQ(backend_.request_count(), 0u);
}

TEST_F(TerminalServiceTest, MissingCommandIsAnError)
{
    service_->handle_event("s1", events::EXECUTE_COMMAND, Json::object());
    ASSERT_TRUE(rec_.wait_done());
    EXPECT_EQ(rec_.last(events::COMMAND_ERROR).data["error"], "Missing command");
}

TEST_F(TerminalServiceTest, CdChangesDirectoryForLaterCommands)
{
    backend_.directories.insert("/workspace/site");
    execute("cd site");
    ASSERT_TRUE(rec_.wait_done());
    EXPECT_EQ(rec_.last(events::COMMAND_COMPLETED).data["exitCode"], 0);
    EXPECT_EQ(rec_.output("stdout"), "/workspace/site\n");
    EXPECT_EQ(sessions_.get_cwd("s1"), "/workspace/site");

    backend_.scripts["ls"] = Script::output("index.php\n");
    execute("ls");
    ASSERT_TRUE(rec_.wait_done(2));
    EXPECT_EQ(backend_.last_request().cwd, "/workspace/site");
    EXPECT_EQ(rec_.last(events::COMMAND_STARTED).data["cwd"], "/workspace/site");
}

TEST_F(TerminalServiceTest, CdFailuresKeepDirectory)
{
    execute("cd nope");
    ASSERT_TRUE(rec_.wait_done());
    EXPECT_EQ(rec_.last(events::COMMAND_ERROR).data["error"], "Directory not found: nope");

    execute("cd /etc");
    ASSERT_TRUE(rec_.wait_done(2));
    std::string err = rec_.last(events::COMMAND_ERROR).data["error"].get<std::string>();
    EXPECT_FALSE(err.empty());
    EXPECT_EQ(sessions_.get_cwd("s1"), "/workspace");
    EXPECT_EQ(backend_.request_count(), 0u);
}

TEST_F(TerminalServiceTest, QuotedCdTarget)
{
    backend_.directories.insert("/workspace/my site");
    execute("cd \"my site\"");
    ASSERT_TRUE(rec_.wait_done());
    EXPECT_EQ(sessions_.get_cwd("s1"), "/workspace/my site");
}

TEST_F(TerminalServiceTest, Builtins)
{
    execute("clear");
    ASSERT_TRUE(rec_.wait_for(events::TERMINAL_CLEAR));

    execute("pwd");
    ASSERT_TRUE(rec_.wait_done());
    EXPECT_EQ(rec_.output("stdout"), "/workspace\n");

    rec_.clear();
    execute("help");
    ASSERT_TRUE(rec_.wait_done());
    std::string help = rec_.output("stdout");
    EXPECT_NE(help.find("Available commands:"), std::string::npos);
    EXPECT_NE(help.find("npm"), std::string::npos);
    EXPECT_NE(help.find("git"), std::string::npos);

    EXPECT_EQ(backend_.request_count(), 0u);
    std::vector<AuditRecord> records = audited();
    ASSERT_EQ(records.size(), 3u);
    for (const auto& r : records) {
        EXPECT_EQ(r.backend, "builtin");
        EXPECT_EQ(r.status, "success");
    }
}

TEST_F(TerminalServiceTest, CancelStopsRunningCommand)
{
    backend_.default_script = Script::hanging();
    execute("npm run dev");
    ASSERT_TRUE(rec_.wait_for(events::COMMAND_STARTED));

    service_->handle_event("s1", events::CANCEL_COMMAND, Json::object());
    ASSERT_TRUE(rec_.wait_done());

    Frame err = rec_.last(events::COMMAND_ERROR);
    EXPECT_EQ(err.data["kind"], "cancellation");
    EXPECT_EQ(backend_.terminated.load(), 1);
    EXPECT_TRUE(wait_idle());

    std::vector<AuditRecord> records = audited();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].status, "canceled");

    // Cancel with nothing running is ignored
    service_->cancel_command("s1");
    EXPECT_EQ(backend_.terminated.load(), 1);
}

TEST_F(TerminalServiceTest, DisconnectTerminatesRunningCommand)
{
    backend_.default_script = Script::hanging();
    execute("node server.js");
    ASSERT_TRUE(rec_.wait_for(events::COMMAND_STARTED));

    service_->disconnect("s1");
    EXPECT_EQ(backend_.terminated.load(), 1);
    EXPECT_EQ(registry_.size(), 0u);
    EXPECT_EQ(sessions_.size(), 0u);
    EXPECT_EQ(audited().size(), 1u);
}

TEST_F(TerminalServiceTest, MigrationAnnouncesDatabaseChange)
{
    backend_.scripts["php artisan migrate"] = Script::output("Migrated: 2024_01_01_create_users\n");
    execute("php artisan migrate");
    ASSERT_TRUE(rec_.wait_done());

    std::vector<std::string> names = rec_.names();
    ASSERT_GE(names.size(), 2u);
    EXPECT_EQ(names[names.size() - 2], "database_changed");
    EXPECT_EQ(names.back(), "command_completed");

    Frame changed = rec_.last(events::DATABASE_CHANGED);
    EXPECT_EQ(changed.data["operation"], "migrate");
    EXPECT_EQ(changed.data["command"], "php artisan migrate");
    EXPECT_FALSE(changed.data.contains("siteId"));

    ASSERT_EQ(hook_.seen.size(), 1u);
    EXPECT_EQ(hook_.seen[0].user.user_id, "1");
}

TEST_F(TerminalServiceTest, FailedMigrationIsNotAnnounced)
{
    backend_.scripts["php artisan migrate"] = Script::output("SQLSTATE error\n", 1);
    execute("php artisan migrate");
    ASSERT_TRUE(rec_.wait_done());
    EXPECT_TRUE(rec_.last(events::DATABASE_CHANGED).event.empty());
    EXPECT_TRUE(hook_.seen.empty());
}

TEST_F(TerminalServiceTest, HostPathsAreRedacted)
{
    backend_.default_script = Script::output("cannot open /srv/userdata/alice/site/.env\n", 1);
    execute("cat site/.env");
    ASSERT_TRUE(rec_.wait_done());
    EXPECT_EQ(rec_.output("stdout"), "cannot open /workspace/site/.env\n");
}

TEST_F(TerminalServiceTest, BackendFailureCarriesRemediation)
{
    backend_.fail_provisioning = true;
    execute("ls");
    ASSERT_TRUE(rec_.wait_done());

    Frame err = rec_.last(events::COMMAND_ERROR);
    EXPECT_EQ(err.data["kind"], "infrastructure");
    EXPECT_EQ(err.data["remediation"], "Start the Docker daemon and try again.");
    EXPECT_EQ(audited()[0].status, "failure");
}

TEST_F(TerminalServiceTest, PingAndUnknownEvents)
{
    service_->handle_event("s1", events::PING, Json::object());
    ASSERT_TRUE(rec_.wait_for(events::PONG));
    EXPECT_GT(rec_.last(events::PONG).data["timestamp"].get<int64_t>(), 0);

    service_->handle_event("s1", "format_disk", Json::object());
    ASSERT_TRUE(rec_.wait_for(events::ERROR));
    EXPECT_EQ(rec_.last(events::ERROR).data["error"], "Unknown event: format_disk");
}

TEST_F(TerminalServiceTest, TerminalStatusAndStop)
{
    service_->handle_event("s1", events::TERMINAL_STATUS, Json::object());
    ASSERT_TRUE(rec_.wait_for(events::TERMINAL_STATUS));
    Frame status = rec_.last(events::TERMINAL_STATUS);
    EXPECT_EQ(status.data["running"], false);
    EXPECT_EQ(status.data["busy"], false);
    EXPECT_EQ(status.data["cwd"], "/workspace");

    backend_.default_script = Script::hanging();
    execute("node server.js");
    ASSERT_TRUE(rec_.wait_for(events::COMMAND_STARTED));

    service_->handle_event("s1", events::STOP_TERMINAL, Json::object());
    ASSERT_TRUE(rec_.wait_for(events::ERROR));
    EXPECT_EQ(backend_.stops, 0);

    service_->cancel_command("s1");
    ASSERT_TRUE(rec_.wait_done());
    ASSERT_TRUE(wait_idle());

    service_->handle_event("s1", events::STOP_TERMINAL, Json::object());
    ASSERT_TRUE(rec_.wait_for(events::TERMINAL_STATUS, 2));
    EXPECT_EQ(rec_.last(events::TERMINAL_STATUS).data["running"], false);
    EXPECT_EQ(backend_.stops, 1);
}

TEST_F(TerminalServiceTest, SessionsAreIndependent)
{
    FrameRecorder bob_rec;
    ASSERT_TRUE(service_->connect("s2", UserContext("2", "bob"), bob_rec.emitter()));

    backend_.default_script = Script::hanging();
    execute("node server.js");
    ASSERT_TRUE(rec_.wait_for(events::COMMAND_STARTED));

    backend_.scripts["ls"] = Script::output("readme\n");
    service_->handle_event("s2", events::EXECUTE_COMMAND, command("ls"));
    ASSERT_TRUE(bob_rec.wait_for(events::COMMAND_COMPLETED));
    EXPECT_EQ(bob_rec.output("stdout"), "readme\n");
    EXPECT_EQ(rec_.output("stdout"), "");

    service_->disconnect("s2");
    service_->cancel_command("s1");
    ASSERT_TRUE(rec_.wait_done());
}

namespace {

// Submits another command from inside the schema hook, while the first
// invocation is still reporting its completion
class ResubmittingSchemaHook : public SchemaChangeHook {
public:
    explicit ResubmittingSchemaHook(TerminalService& service) : service_(service) {}

    void on_schema_change(const SchemaChangeEvent&) {
        service_.handle_event("s1", events::EXECUTE_COMMAND, command("npm run build"));
    }

private:
    TerminalService& service_;
};

} // namespace

TEST_F(TerminalServiceTest, CompletionFrameGoesOutBeforeSessionIsReleased)
{
    ResubmittingSchemaHook resubmit(*service_);
    service_->set_schema_hook(&resubmit);
    backend_.scripts["php artisan migrate"] = Script::output("Migrated\n");
    backend_.scripts["npm run build"] = Script::output("built\n");

    execute("php artisan migrate");
    ASSERT_TRUE(rec_.wait_for(events::COMMAND_COMPLETED));

    // The follow-up arrived while the migration still owned the session
    std::vector<std::string> names = rec_.names();
    size_t completed = 0;
    while (names[completed] != "command_completed") ++completed;
    size_t started = 0;
    for (size_t i = 0; i < completed; ++i) {
        if (names[i] == "command_started") ++started;
    }
    EXPECT_EQ(started, 1u);
    EXPECT_EQ(names[completed - 1], "database_changed");
    EXPECT_EQ(rec_.output("stdout"), "Migrated\n");
    EXPECT_EQ(backend_.request_count(), 1u);

    Frame busy = rec_.last(events::COMMAND_ERROR);
    EXPECT_NE(busy.data["error"].get<std::string>().find("already running"), std::string::npos);

    ASSERT_TRUE(wait_idle());
    service_->set_schema_hook(&hook_);
    rec_.clear();
    execute("npm run build");
    ASSERT_TRUE(rec_.wait_for(events::COMMAND_COMPLETED));
    EXPECT_EQ(rec_.output("stdout"), "built\n");
}

TEST_F(TerminalServiceTest, TimeoutIsReportedAndFreesSession)
{
    service_->disconnect("s1");
    TerminalOptions options;
    options.limits.timeout_ms = 300;
    service_.reset(new TerminalService(backend_, policy_, sessions_, registry_,
                                       &audit_, &sandbox_, options));
    ASSERT_TRUE(service_->connect("s1", alice_, rec_.emitter()));
    ASSERT_TRUE(rec_.wait_for(events::CONNECTED));
    rec_.clear();

    backend_.default_script = Script::hanging();
    execute("node server.js");
    ASSERT_TRUE(rec_.wait_done());

    Frame err = rec_.last(events::COMMAND_ERROR);
    EXPECT_EQ(err.data["kind"], "timeout");
    EXPECT_NE(err.data["error"].get<std::string>().find("timed out"), std::string::npos);
    EXPECT_EQ(backend_.terminated.load(), 1);
    EXPECT_TRUE(wait_idle());

    std::vector<AuditRecord> records = audited();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].status, "timeout");
    EXPECT_EQ(records[0].command, "node server.js");

    backend_.scripts["ls"] = Script::output("index.php\n");
    execute("ls");
    ASSERT_TRUE(rec_.wait_done(2));
    EXPECT_EQ(rec_.last(events::COMMAND_COMPLETED).data["exitCode"], 0);
}

TEST_F(TerminalServiceTest, StartTerminalProvisionsAhead)
{
    EXPECT_FALSE(backend_.is_running(alice_));
    service_->handle_event("s1", events::START_TERMINAL, Json::object());
    ASSERT_TRUE(rec_.wait_for(events::TERMINAL_STATUS));

    Frame status = rec_.last(events::TERMINAL_STATUS);
    EXPECT_EQ(status.data["running"], true);
    EXPECT_EQ(status.data["backend"], "scripted");
    EXPECT_EQ(rec_.output("info"), "Starting container...\nContainer ready\n");
    EXPECT_TRUE(backend_.is_running(alice_));

    // Already up: no provisioning lines on the first command
    rec_.clear();
    backend_.scripts["ls"] = Script::output("a\n");
    execute("ls");
    ASSERT_TRUE(rec_.wait_done());
    EXPECT_EQ(rec_.output("info"), "");
    EXPECT_EQ(backend_.request_count(), 1u);
}

TEST_F(TerminalServiceTest, StartTerminalFailureIsAnError)
{
    backend_.fail_provisioning = true;
    service_->handle_event("s1", events::START_TERMINAL, Json::object());
    ASSERT_TRUE(rec_.wait_for(events::ERROR));

    Frame err = rec_.last(events::ERROR);
    EXPECT_EQ(err.data["kind"], "infrastructure");
    EXPECT_EQ(err.data["remediation"], "Start the Docker daemon and try again.");
    EXPECT_TRUE(rec_.last(events::TERMINAL_STATUS).event.empty());
}

// ============================================================================
// Site binding through execute_command
// ============================================================================

namespace {

class TerminalSiteTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(db_.open(":memory:"));
        sites_.reset(new SqliteSiteRegistry(db_));
        ASSERT_TRUE(sites_->ensure_schema());
        ASSERT_TRUE(sites_->upsert_site("42", "1", "shop"));
        sessions_.reset(new SessionStore("/workspace", sites_.get()));
        service_.reset(new TerminalService(backend_, policy_, *sessions_,
                                           registry_, nullptr, nullptr));
        ASSERT_TRUE(service_->connect("s1", UserContext("1", "alice"), rec_.emitter()));
        rec_.clear();
    }

    TerminalSiteTest() : policy_(PolicyTables::defaults()) {}

    Database db_;
    PolicyTables policy_;
    std::unique_ptr<SqliteSiteRegistry> sites_;
    std::unique_ptr<SessionStore> sessions_;
    ScriptedBackend backend_;
    ProcessRegistry registry_;
    FrameRecorder rec_;
    std::unique_ptr<TerminalService> service_;
};

} // namespace

TEST_F(TerminalSiteTest, SiteIdMovesIntoSiteFolder)
{
    Json data = command("pwd");
    data["siteId"] = 42;
    service_->execute_command("s1", data);
    ASSERT_TRUE(rec_.wait_done());

    EXPECT_EQ(rec_.output("stdout"), "/workspace/shop\n");
    EXPECT_EQ(rec_.last(events::COMMAND_STARTED).data["site"], "42");
}

TEST_F(TerminalSiteTest, MigrationCarriesSiteId)
{
    Json data = command("php artisan migrate");
    data["siteId"] = "42";
    service_->execute_command("s1", data);
    ASSERT_TRUE(rec_.wait_done());

    EXPECT_EQ(backend_.last_request().cwd, "/workspace/shop");
    EXPECT_EQ(rec_.last(events::DATABASE_CHANGED).data["siteId"], "42");
}

TEST_F(TerminalSiteTest, UnknownSiteIsAnError)
{
    Json data = command("ls");
    data["siteId"] = 99;
    service_->execute_command("s1", data);
    ASSERT_TRUE(rec_.wait_done());

    EXPECT_EQ(rec_.last(events::COMMAND_ERROR).data["error"], "Site not found");
    EXPECT_EQ(backend_.request_count(), 0u);

    // Not left busy
    service_->execute_command("s1", command("pwd"));
    ASSERT_TRUE(rec_.wait_done(2));
    EXPECT_EQ(rec_.last(events::COMMAND_COMPLETED).data["exitCode"], 0);
}
