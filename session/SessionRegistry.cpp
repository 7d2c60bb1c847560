#include "session/SessionRegistry.hpp"

namespace vigil {

bool SessionRegistry::Add(std::shared_ptr<SessionWorker> worker) {
    if (!worker) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_.emplace(worker->SessionId(), std::move(worker)).second;
}

std::shared_ptr<SessionWorker> SessionRegistry::Find(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = workers_.find(session_id);
    return it != workers_.end() ? it->second : nullptr;
}

std::shared_ptr<SessionWorker> SessionRegistry::Remove(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = workers_.find(session_id);
    if (it == workers_.end()) {
        return nullptr;
    }
    auto worker = std::move(it->second);
    workers_.erase(it);
    return worker;
}

std::vector<std::shared_ptr<SessionWorker>> SessionRegistry::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<SessionWorker>> out;
    out.reserve(workers_.size());
    for (const auto& [id, worker] : workers_) {
        out.push_back(worker);
    }
    return out;
}

size_t SessionRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_.size();
}

} // namespace vigil
