/*
 * sandterm C++ - Container Lifecycle Manager
 *
 * One container per user, named deterministically from the user id:
 *
 *   absent -> created/running -> stopped (idle reclamation or explicit stop)
 *
 * All state changes for a user happen under that user's mutex, so concurrent
 * acquire() calls converge on one container and the idle reaper can never
 * stop a container between acquire() and the exec that follows it. A Lease
 * counts one in-flight use; a container with leases is never reaped.
 */
#ifndef sandterm_EXEC_CONTAINER_LIFECYCLE_HPP
#define sandterm_EXEC_CONTAINER_LIFECYCLE_HPP

#include <sandterm/exec/container_runtime.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace sandterm {

class Config;

struct ContainerSettings {
    std::string image;
    std::string prefix;
    std::string cpus;
    std::string memory;
    std::string network;
    std::string workdir;            // Logical sandbox root
    int64_t idle_timeout_ms;

    ContainerSettings();

    static ContainerSettings from_config(const Config& cfg);
};

struct ContainerRecord {
    std::string user_id;
    std::string container_name;
    ContainerStatus status;
    int64_t last_activity_ms;       // Monotonic
    int in_flight;

    ContainerRecord() : status(ContainerStatus::ABSENT), last_activity_ms(0), in_flight(0) {}
};

class ContainerLifecycleManager {
private:
    struct UserSlot {
        std::mutex mutex;
        ContainerRecord record;
    };

public:
    // Holds one in-flight use of a user's container. Movable, releases on destruction.
    class Lease {
    public:
        Lease() : manager_(NULL) {}
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;
        ~Lease();

        void release();
        bool valid() const { return manager_ != NULL; }
        const std::string& container_name() const { return container_name_; }

    private:
        friend class ContainerLifecycleManager;
        Lease(ContainerLifecycleManager* manager, std::shared_ptr<UserSlot> slot,
              const std::string& container_name);
        Lease(const Lease&);
        Lease& operator=(const Lease&);

        ContainerLifecycleManager* manager_;
        std::shared_ptr<UserSlot> slot_;
        std::string container_name_;
    };

    ContainerLifecycleManager(ContainerRuntime& runtime, const ContainerSettings& settings);

    // Deterministic: prefix + user id when it is name-safe, else a SHA-256 prefix of it
    std::string container_name(const std::string& user_id) const;

    // Ensure the user's container is running and take a lease on it
    BackendResult acquire(const UserContext& user, const std::string& host_mount,
                          const InfoSink& info, Lease& lease);

    // Explicit user stop; refused while leases are held
    BackendResult stop(const std::string& user_id);

    bool is_running(const std::string& user_id);

    // Stop running containers with no leases and no activity for idle_timeout_ms
    size_t reap_idle(int64_t now_ms);

    ContainerRecord record(const std::string& user_id);

    ContainerRuntime& runtime() { return runtime_; }
    const ContainerSettings& settings() const { return settings_; }

private:
    std::shared_ptr<UserSlot> slot_for(const std::string& user_id);
    void release_lease(UserSlot& slot);

    ContainerRuntime& runtime_;
    ContainerSettings settings_;

    std::mutex slots_mutex_;
    std::map<std::string, std::shared_ptr<UserSlot>> slots_;
};

} // namespace sandterm

#endif // sandterm_EXEC_CONTAINER_LIFECYCLE_HPP
