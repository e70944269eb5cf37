/*
 * sandterm C++ - Container Lifecycle Manager Implementation
 */
#include <sandterm/exec/container_lifecycle.hpp>
#include <sandterm/core/config.hpp>
#include <sandterm/core/logger.hpp>
#include <sandterm/core/utils.hpp>

#include <vector>

namespace sandterm {

// ============================================================================
// Settings
// ============================================================================

ContainerSettings::ContainerSettings()
    : image("sandterm-terminal:latest")
    , prefix("sandterm_terminal_")
    , cpus("0.5")
    , memory("512m")
    , network("bridge")
    , workdir("/workspace")
    , idle_timeout_ms(30 * 60 * 1000)
{
}

ContainerSettings ContainerSettings::from_config(const Config& cfg) {
    ContainerSettings s;
    s.image = cfg.get_string("docker.image", s.image);
    s.prefix = cfg.get_string("docker.container_prefix", s.prefix);
    s.cpus = cfg.get_string("docker.cpus", s.cpus);
    s.memory = cfg.get_string("docker.memory", s.memory);
    s.network = cfg.get_string("docker.network", s.network);
    s.workdir = normalize_path(cfg.get_string("terminal.sandbox_root", s.workdir));
    s.idle_timeout_ms = cfg.get_int("terminal.idle_timeout_seconds", s.idle_timeout_ms / 1000) * 1000;

    // Host networking is never allowed
    if (s.network == "host") {
        LOG_WARN("[Docker] docker.network=host is not allowed, using bridge");
        s.network = "bridge";
    }
    return s;
}

// ============================================================================
// Lease
// ============================================================================

ContainerLifecycleManager::Lease::Lease(ContainerLifecycleManager* manager,
                                        std::shared_ptr<UserSlot> slot,
                                        const std::string& container_name)
    : manager_(manager)
    , slot_(slot)
    , container_name_(container_name)
{
}

ContainerLifecycleManager::Lease::Lease(Lease&& other) noexcept
    : manager_(other.manager_)
    , slot_(std::move(other.slot_))
    , container_name_(std::move(other.container_name_))
{
    other.manager_ = NULL;
}

ContainerLifecycleManager::Lease&
ContainerLifecycleManager::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        release();
        manager_ = other.manager_;
        slot_ = std::move(other.slot_);
        container_name_ = std::move(other.container_name_);
        other.manager_ = NULL;
    }
    return *this;
}

ContainerLifecycleManager::Lease::~Lease() {
    release();
}

void ContainerLifecycleManager::Lease::release() {
    if (manager_ && slot_) {
        manager_->release_lease(*slot_);
    }
    manager_ = NULL;
    slot_.reset();
}

// ============================================================================
// Manager
// ============================================================================

ContainerLifecycleManager::ContainerLifecycleManager(ContainerRuntime& runtime,
                                                     const ContainerSettings& settings)
    : runtime_(runtime)
    , settings_(settings)
{
}

std::string ContainerLifecycleManager::container_name(const std::string& user_id) const {
    bool safe = !user_id.empty() && user_id.size() <= 40;
    for (char c : user_id) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '_' || c == '-';
        if (!ok) {
            safe = false;
            break;
        }
    }
    if (safe) {
        return settings_.prefix + user_id;
    }
    return settings_.prefix + sha256_hex(user_id).substr(0, 16);
}

std::shared_ptr<ContainerLifecycleManager::UserSlot>
ContainerLifecycleManager::slot_for(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    auto it = slots_.find(user_id);
    if (it != slots_.end()) {
        return it->second;
    }
    std::shared_ptr<UserSlot> slot = std::make_shared<UserSlot>();
    slot->record.user_id = user_id;
    slot->record.container_name = container_name(user_id);
    slots_[user_id] = slot;
    return slot;
}

BackendResult ContainerLifecycleManager::acquire(const UserContext& user,
                                                 const std::string& host_mount,
                                                 const InfoSink& info, Lease& lease) {
    // Releasing takes the slot lock, so drop any previous lease first
    lease.release();

    std::shared_ptr<UserSlot> slot = slot_for(user.user_id);
    std::lock_guard<std::mutex> lock(slot->mutex);
    ContainerRecord& rec = slot->record;

    ContainerStatus actual = ContainerStatus::ABSENT;
    BackendResult r = runtime_.inspect(rec.container_name, actual);
    if (!r.success) {
        return r;
    }

    if (actual == ContainerStatus::STOPPED) {
        LOG_INFO("[Docker] Container %s stopped, starting", rec.container_name.c_str());
        if (info) info("Starting container...");
        r = runtime_.start(rec.container_name);
        if (!r.success) {
            rec.status = ContainerStatus::STOPPED;
            return r;
        }
        if (info) info("Container ready");
    } else if (actual == ContainerStatus::ABSENT) {
        r = runtime_.check_ready(settings_.image);
        if (!r.success) {
            rec.status = ContainerStatus::ABSENT;
            return r;
        }

        if (info) info("Starting container...");
        ContainerSpec spec;
        spec.name = rec.container_name;
        spec.image = settings_.image;
        spec.cpus = settings_.cpus;
        spec.memory = settings_.memory;
        spec.network = settings_.network;
        spec.host_mount = host_mount;
        spec.workdir = settings_.workdir;

        r = runtime_.create(spec);
        if (!r.success) {
            rec.status = ContainerStatus::ABSENT;
            return r;
        }
        if (info) info("Container ready");
    }

    rec.status = ContainerStatus::RUNNING;
    rec.in_flight++;
    rec.last_activity_ms = monotonic_ms();
    lease = Lease(this, slot, rec.container_name);
    return BackendResult::ok();
}

void ContainerLifecycleManager::release_lease(UserSlot& slot) {
    std::lock_guard<std::mutex> lock(slot.mutex);
    if (slot.record.in_flight > 0) {
        slot.record.in_flight--;
    }
    slot.record.last_activity_ms = monotonic_ms();
}

BackendResult ContainerLifecycleManager::stop(const std::string& user_id) {
    std::shared_ptr<UserSlot> slot = slot_for(user_id);
    std::lock_guard<std::mutex> lock(slot->mutex);
    ContainerRecord& rec = slot->record;

    if (rec.in_flight > 0) {
        return BackendResult::fail(ErrorKind::VALIDATION,
            "A command is still running. Cancel it before stopping the terminal.");
    }

    ContainerStatus actual = ContainerStatus::ABSENT;
    BackendResult r = runtime_.inspect(rec.container_name, actual);
    if (!r.success) return r;

    if (actual == ContainerStatus::RUNNING) {
        r = runtime_.stop(rec.container_name);
        if (!r.success) return r;
        rec.status = ContainerStatus::STOPPED;
    } else {
        rec.status = actual;
    }
    return BackendResult::ok();
}

bool ContainerLifecycleManager::is_running(const std::string& user_id) {
    std::shared_ptr<UserSlot> slot = slot_for(user_id);
    std::lock_guard<std::mutex> lock(slot->mutex);

    ContainerStatus actual = ContainerStatus::ABSENT;
    if (!runtime_.inspect(slot->record.container_name, actual).success) {
        return false;
    }
    slot->record.status = actual;
    return actual == ContainerStatus::RUNNING;
}

size_t ContainerLifecycleManager::reap_idle(int64_t now_ms) {
    std::vector<std::shared_ptr<UserSlot>> snapshot;
    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        for (const auto& entry : slots_) {
            snapshot.push_back(entry.second);
        }
    }

    size_t stopped = 0;
    for (const auto& slot : snapshot) {
        // A slot being provisioned right now is by definition not idle
        std::unique_lock<std::mutex> lock(slot->mutex, std::try_to_lock);
        if (!lock.owns_lock()) continue;

        ContainerRecord& rec = slot->record;
        if (rec.status != ContainerStatus::RUNNING || rec.in_flight > 0) continue;
        if (now_ms - rec.last_activity_ms < settings_.idle_timeout_ms) continue;

        LOG_INFO("[Docker] Container %s idle for %lld s, stopping", rec.container_name.c_str(),
                 static_cast<long long>((now_ms - rec.last_activity_ms) / 1000));
        BackendResult r = runtime_.stop(rec.container_name);
        if (r.success) {
            rec.status = ContainerStatus::STOPPED;
            ++stopped;
        } else {
            LOG_WARN("[Docker] Idle stop of %s failed: %s", rec.container_name.c_str(),
                     r.error.message.c_str());
        }
    }
    return stopped;
}

ContainerRecord ContainerLifecycleManager::record(const std::string& user_id) {
    std::shared_ptr<UserSlot> slot = slot_for(user_id);
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->record;
}

} // namespace sandterm
