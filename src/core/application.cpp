/*
 * sandterm C++ - Application Implementation
 *
 * Central application singleton managing the lifecycle of all components.
 */
#include <sandterm/core/application.hpp>
#include <sandterm/core/logger.hpp>
#include <sandterm/core/sandbox.hpp>
#include <sandterm/core/utils.hpp>
#include <sandterm/audit/audit_log.hpp>
#include <sandterm/audit/audit_store.hpp>
#include <sandterm/exec/container_lifecycle.hpp>
#include <sandterm/exec/container_runtime.hpp>
#include <sandterm/exec/docker_backend.hpp>
#include <sandterm/exec/native_backend.hpp>
#include <sandterm/exec/process_registry.hpp>
#include <sandterm/exec/ssh_backend.hpp>
#include <sandterm/server/gateway.hpp>
#include <sandterm/server/schema_hook.hpp>
#include <sandterm/server/terminal_service.hpp>
#include <sandterm/session/identity.hpp>
#include <sandterm/session/session_store.hpp>
#include <sandterm/session/site_registry.hpp>
#include <sandterm/storage/database.hpp>

#include <iostream>
#include <csignal>
#include <climits>
#include <cstring>
#include <unistd.h>

namespace sandterm {

static const int REAP_INTERVAL_TICKS = 300;    // 30 s at 100 ms per tick

// ============================================================================
// Utility Functions
// ============================================================================

static void print_usage(const char* prog) {
    std::cout << AppInfo::NAME << " - Sandboxed terminal execution service\n\n"
              << "Usage: " << prog << " [options]\n\n"
              << "Options:\n"
              << "  -c, --config <file>  Configuration file (default: config.json)\n"
              << "  -h, --help           Show this help message\n"
              << "  -v, --version        Show version\n\n"
              << "Example:\n"
              << "  " << prog << " --config /etc/sandterm/config.json\n";
}

static void print_version() {
    std::cout << AppInfo::NAME << " v" << AppInfo::VERSION << "\n";
}

static std::string absolute_path(const std::string& path) {
    if (path.empty() || path[0] == '/') return normalize_path(path);
    char cwd[PATH_MAX];
    if (!getcwd(cwd, sizeof(cwd))) return path;
    return normalize_path(join_path(cwd, path));
}

// ============================================================================
// Signal Handler
// ============================================================================

namespace {
    void signal_handler(int sig) {
        (void)sig;
        Application::instance().stop();
    }
}

// ============================================================================
// Application Implementation
// ============================================================================

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application()
    : running_(true)
    , config_file_("config.json")
{}

Application::~Application() {}

bool Application::parse_args(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            running_ = false;
            return false;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            running_ = false;
            return false;
        }
        if ((strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            config_file_ = std::string(argv[++i]);
            continue;
        }
        LOG_WARN("Ignoring unknown argument: %s", argv[i]);
    }
    return true;
}

void Application::setup_logging() {
    Logger::instance().set_level(parse_log_level(config_.get_string("log_level", "info")));
}

bool Application::setup_storage() {
    const std::string storage_root = absolute_path(config_.get_string("storage_root", "./userdata"));
    sandbox_.reset(new Sandbox(storage_root, config_.get_string("terminal.sandbox_root", "/workspace")));
    if (!sandbox_->init()) {
        return false;
    }

    std::string db_path = config_.get_string("database_path", "");
    if (db_path.empty()) {
        db_path = normalize_path(join_path(storage_root, "../sandterm.db"));
    }

    db_.reset(new Database());
    if (!db_->open(db_path)) {
        LOG_ERROR("Failed to open database %s", db_path.c_str());
        return false;
    }

    sites_.reset(new SqliteSiteRegistry(*db_));
    audit_store_.reset(new SqliteAuditStore(*db_));
    if (!sites_->ensure_schema() || !audit_store_->ensure_schema()) {
        LOG_ERROR("Failed to initialize database schema");
        return false;
    }

    audit_.reset(new AuditLogger(*audit_store_));
    audit_->start();
    return true;
}

bool Application::setup_backend() {
    const std::string kind = to_lower(config_.get_string("backend", "docker"));

    if (kind == "docker") {
        runtime_.reset(new DockerCliRuntime(config_.get_string("docker.binary", "docker")));
        ContainerSettings settings = ContainerSettings::from_config(config_);
        lifecycle_.reset(new ContainerLifecycleManager(*runtime_, settings));
        backend_.reset(new DockerBackend(*lifecycle_, *sandbox_));
        LOG_INFO("[Docker] Image %s, limits cpus=%s memory=%s, idle timeout %llds",
                 settings.image.c_str(), settings.cpus.c_str(), settings.memory.c_str(),
                 static_cast<long long>(settings.idle_timeout_ms / 1000));
    } else if (kind == "native") {
        bool landlock = config_.get_bool("native.landlock", true);
        backend_.reset(new NativeBackend(*sandbox_, landlock));
        if (!landlock) {
            LOG_WARN("[Native] Landlock disabled: commands are NOT jailed to the user directory");
        }
    } else if (kind == "ssh") {
        SshSettings settings = SshSettings::from_config(config_);
        if (settings.host.empty()) {
            LOG_ERROR("[SSH] ssh.host is required for the ssh backend");
            return false;
        }
        sandbox_->add_redacted_root(settings.root);
        backend_.reset(new SshBackend(settings, *sandbox_));
    } else {
        LOG_ERROR("Unknown backend '%s' (expected docker, native or ssh)", kind.c_str());
        return false;
    }

    LOG_INFO("Execution backend: %s", backend_->name());
    return true;
}

bool Application::setup_service() {
    policy_ = PolicyTables::defaults();
    policy_.tighten(config_);
    LOG_INFO("[Validator] %zu allowed commands, %zu blocked, max length %zu",
             policy_.allowlist.size(), policy_.absolute_blocklist.size(),
             policy_.max_command_length);

    sessions_.reset(new SessionStore(sandbox_->logical_root(), sites_.get()));
    registry_.reset(new ProcessRegistry());

    TerminalOptions options;
    options.limits.timeout_ms = config_.get_int("terminal.exec_timeout_seconds", 300) * 1000;
    options.limits.max_output_bytes = static_cast<size_t>(
        config_.get_int("terminal.max_output_bytes", 10 * 1024 * 1024));
    options.record_rejections = config_.get_bool("audit.record_rejections", true);

    service_.reset(new TerminalService(*backend_, policy_, *sessions_, *registry_,
                                       audit_.get(), sandbox_.get(), options));
    schema_hook_.reset(new LoggingSchemaChangeHook());
    service_->set_schema_hook(schema_hook_.get());

    ConfigIdentityProvider* identity = new ConfigIdentityProvider(config_);
    identity_.reset(identity);
    if (identity->size() == 0) {
        LOG_WARN("No identity.tokens configured: every connection will be refused");
    }

    gateway_.reset(new Gateway(*service_, *identity_, GatewaySettings::from_config(config_)));
    return gateway_->start();
}

bool Application::init(int argc, char* argv[]) {
    if (!parse_args(argc, argv)) {
        return false;
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    // Peer disconnects surface as EPIPE on write
    signal(SIGPIPE, SIG_IGN);

    LOG_INFO("%s v%s starting...", AppInfo::NAME, AppInfo::VERSION);

    if (!config_.load_file(config_file_)) {
        LOG_WARN("Failed to load config from %s, aborting!", config_file_.c_str());
        return false;
    }
    LOG_INFO("Loaded config from %s", config_file_.c_str());

    setup_logging();

    if (!setup_storage() || !setup_backend() || !setup_service()) {
        return false;
    }
    return true;
}

int Application::run() {
    LOG_INFO("Entering main loop (poll interval: 100ms)");

    int reap_counter = 0;
    while (running_.load()) {
        sleep_ms(100);

        if (++reap_counter >= REAP_INTERVAL_TICKS) {
            reap_counter = 0;
            size_t stopped = backend_->reap_idle();
            if (stopped > 0) {
                LOG_INFO("Reclaimed %zu idle environment(s)", stopped);
            }
        }
    }
    return 0;
}

void Application::shutdown() {
    LOG_INFO("Shutting down...");

    if (gateway_) {
        gateway_->stop();
        gateway_.reset();
    }
    if (service_) {
        service_->shutdown();
        service_.reset();
    }
    if (audit_) {
        audit_->stop();
        LOG_DEBUG("[App] Audit writer stopped");
    }
    if (db_) {
        db_->close();
    }

    LOG_INFO("Goodbye!");
}

} // namespace sandterm
