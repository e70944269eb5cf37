/*
 * sandterm C++ - Active Process Registry Implementation
 */
#include <sandterm/exec/process_registry.hpp>
#include <sandterm/core/logger.hpp>

namespace sandterm {

bool ProcessRegistry::add(const std::string& session_id,
                          const std::shared_ptr<StreamingExecutor>& executor) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_.count(session_id)) {
        return false;
    }
    active_[session_id] = executor;
    return true;
}

std::shared_ptr<StreamingExecutor> ProcessRegistry::find(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(session_id);
    return it == active_.end() ? std::shared_ptr<StreamingExecutor>() : it->second;
}

bool ProcessRegistry::remove(const std::string& session_id, const std::string& invocation_id) {
    std::shared_ptr<StreamingExecutor> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_.find(session_id);
        if (it == active_.end() || it->second->request().invocation_id != invocation_id) {
            return false;
        }
        dropped = it->second;
        active_.erase(it);
    }
    // `dropped` may be the last reference; release it outside the lock
    return true;
}

std::shared_ptr<StreamingExecutor> ProcessRegistry::take(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(session_id);
    if (it == active_.end()) {
        return std::shared_ptr<StreamingExecutor>();
    }
    std::shared_ptr<StreamingExecutor> executor = it->second;
    active_.erase(it);
    return executor;
}

std::vector<std::shared_ptr<StreamingExecutor>> ProcessRegistry::take_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<StreamingExecutor>> all;
    for (auto& entry : active_) {
        all.push_back(entry.second);
    }
    active_.clear();
    if (!all.empty()) {
        LOG_INFO("[Registry] Releasing %zu active invocations", all.size());
    }
    return all;
}

size_t ProcessRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

} // namespace sandterm
