#include "engine/ProfileArena.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include <stdexcept>

namespace vigil {

bool ProfileSet::Complete() const {
    for (ModelKind kind : kAllModelKinds) {
        auto it = profiles.find(kind);
        if (it == profiles.end() || !it->second || !it->second->trained) {
            return false;
        }
    }
    return true;
}

ProfileArena::ProfileArena(std::chrono::milliseconds lock_timeout)
    : lock_timeout_(lock_timeout) {}

ProfileArena::Slot& ProfileArena::SlotFor(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    auto& slot = slots_[user_id];
    if (!slot) {
        slot = std::make_unique<Slot>();
    }
    return *slot;
}

ProfileSetPtr ProfileArena::Acquire(const std::string& user_id) const {
    Slot& slot = SlotFor(user_id);
    std::shared_lock<std::shared_timed_mutex> lock(slot.mutex, std::defer_lock);
    if (!lock.try_lock_for(lock_timeout_)) {
        throw ProfileLockTimeout("Timed out after " + std::to_string(lock_timeout_.count()) +
                                 " ms waiting for profile set of user '" + user_id + "'");
    }
    return std::atomic_load(&slot.current);
}

ProfileSetPtr ProfileArena::Published(const std::string& user_id) const {
    Slot& slot = SlotFor(user_id);
    return std::atomic_load(&slot.current);
}

ProfileSetPtr ProfileArena::AcquireOrFallback(const std::string& user_id) const {
    try {
        return Acquire(user_id);
    } catch (const ProfileLockTimeout& ex) {
        LOG_WARN("{}; scoring against the last published profile set", ex.what());
        return Published(user_id);
    }
}

void ProfileArena::Publish(ProfileSet set) {
    auto guard = LockExclusive(set.user_id);
    PublishLocked(std::move(set), guard);
}

void ProfileArena::PublishLocked(ProfileSet set, const std::unique_lock<std::shared_timed_mutex>& guard) {
    Slot& slot = SlotFor(set.user_id);
    if (!guard.owns_lock() || guard.mutex() != &slot.mutex) {
        throw std::logic_error("PublishLocked requires the exclusive lock of user '" + set.user_id + "'");
    }

    auto previous = std::atomic_load(&slot.current);
    set.generation = previous ? previous->generation + 1 : 1;

    const std::string user_id = set.user_id;
    const uint64_t generation = set.generation;
    std::atomic_store(&slot.current, std::shared_ptr<const ProfileSet>(std::make_shared<ProfileSet>(std::move(set))));
    LOG_INFO("Published profile set for user {} (generation {})", user_id, generation);
}

bool ProfileArena::ReplaceProfile(const std::string& user_id, std::shared_ptr<const ModelProfile> profile) {
    if (!profile) return false;

    Slot& slot = SlotFor(user_id);
    std::unique_lock<std::shared_timed_mutex> lock(slot.mutex, std::defer_lock);
    if (!lock.try_lock_for(lock_timeout_)) {
        LOG_WARN("Skipped online update of {} profile for user {}: profile set busy",
                 ModelKindToString(profile->kind), user_id);
        return false;
    }

    auto current = std::atomic_load(&slot.current);
    if (!current) {
        return false;
    }

    auto next = std::make_shared<ProfileSet>(*current);
    next->profiles[profile->kind] = std::move(profile);
    next->generation = current->generation + 1;
    std::atomic_store(&slot.current, std::shared_ptr<const ProfileSet>(std::move(next)));
    return true;
}

void ProfileArena::Remove(const std::string& user_id) {
    Slot& slot = SlotFor(user_id);
    std::unique_lock<std::shared_timed_mutex> lock(slot.mutex);
    std::atomic_store(&slot.current, std::shared_ptr<const ProfileSet>());
}

bool ProfileArena::Contains(const std::string& user_id) const {
    return Published(user_id) != nullptr;
}

std::unique_lock<std::shared_timed_mutex> ProfileArena::LockExclusive(const std::string& user_id) {
    return std::unique_lock<std::shared_timed_mutex>(SlotFor(user_id).mutex);
}

} // namespace vigil
