/*
 * sandterm C++ - Application
 *
 * Process-wide singleton that loads the configuration, wires the execution
 * backend, session store, audit pipeline and realtime gateway together and
 * runs the main loop (idle container reclamation) until a signal arrives.
 */
#ifndef sandterm_CORE_APPLICATION_HPP
#define sandterm_CORE_APPLICATION_HPP

#include <sandterm/core/config.hpp>
#include <sandterm/security/policy.hpp>
#include <atomic>
#include <memory>
#include <string>

namespace sandterm {

class AuditLogger;
class ContainerLifecycleManager;
class ContainerRuntime;
class Database;
class ExecutionBackend;
class Gateway;
class IdentityProvider;
class ProcessRegistry;
class Sandbox;
class SchemaChangeHook;
class SessionStore;
class SqliteAuditStore;
class SqliteSiteRegistry;
class TerminalService;

struct AppInfo {
    static constexpr const char* NAME = "sandterm";
    static constexpr const char* VERSION = "1.0.0";
};

class Application {
public:
    static Application& instance();

    // False for --help/--version and on fatal setup errors (is_running() tells which)
    bool init(int argc, char* argv[]);
    int run();
    void shutdown();

    void stop() { running_ = false; }
    bool is_running() const { return running_.load(); }

    Config& config() { return config_; }

private:
    Application();
    ~Application();
    Application(const Application&);
    Application& operator=(const Application&);

    bool parse_args(int argc, char* argv[]);
    void setup_logging();
    bool setup_storage();
    bool setup_backend();
    bool setup_service();

    std::atomic<bool> running_;
    std::string config_file_;
    Config config_;
    PolicyTables policy_;

    std::unique_ptr<Sandbox> sandbox_;
    std::unique_ptr<Database> db_;
    std::unique_ptr<SqliteSiteRegistry> sites_;
    std::unique_ptr<SqliteAuditStore> audit_store_;
    std::unique_ptr<AuditLogger> audit_;
    std::unique_ptr<ContainerRuntime> runtime_;
    std::unique_ptr<ContainerLifecycleManager> lifecycle_;
    std::unique_ptr<ExecutionBackend> backend_;
    std::unique_ptr<SessionStore> sessions_;
    std::unique_ptr<ProcessRegistry> registry_;
    std::unique_ptr<SchemaChangeHook> schema_hook_;
    std::unique_ptr<TerminalService> service_;
    std::unique_ptr<IdentityProvider> identity_;
    std::unique_ptr<Gateway> gateway_;
};

} // namespace sandterm

#endif // sandterm_CORE_APPLICATION_HPP
