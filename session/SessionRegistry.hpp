#pragma once

#include "session/SessionWorker.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace vigil {

// session-id -> worker. The only process-wide mutable state of the engine.
class SessionRegistry {
public:
    // False when the id is already registered.
    bool Add(std::shared_ptr<SessionWorker> worker);

    std::shared_ptr<SessionWorker> Find(const std::string& session_id) const;

    // Removes and returns the worker; null when unknown.
    std::shared_ptr<SessionWorker> Remove(const std::string& session_id);

    std::vector<std::shared_ptr<SessionWorker>> Snapshot() const;
    size_t Size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<SessionWorker>> workers_;
};

} // namespace vigil
