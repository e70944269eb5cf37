/*
 * sandterm C++ - Active Process Registry
 *
 * session id -> the session's running StreamingExecutor. An entry exists
 * exactly while an invocation runs; it is removed before the terminal event
 * reaches the client and on disconnect.
 */
#ifndef sandterm_EXEC_PROCESS_REGISTRY_HPP
#define sandterm_EXEC_PROCESS_REGISTRY_HPP

#include <sandterm/exec/streaming_executor.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sandterm {

class ProcessRegistry {
public:
    // False when the session already has an entry
    bool add(const std::string& session_id, const std::shared_ptr<StreamingExecutor>& executor);

    std::shared_ptr<StreamingExecutor> find(const std::string& session_id) const;

    // Remove only if the entry still belongs to `invocation_id`
    bool remove(const std::string& session_id, const std::string& invocation_id);

    // Remove and return whatever the session has (disconnect path)
    std::shared_ptr<StreamingExecutor> take(const std::string& session_id);

    std::vector<std::shared_ptr<StreamingExecutor>> take_all();

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<StreamingExecutor>> active_;
};

} // namespace sandterm

#endif // sandterm_EXEC_PROCESS_REGISTRY_HPP
