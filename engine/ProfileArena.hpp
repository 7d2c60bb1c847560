#pragma once

#include "engine/Aggregator.hpp"
#include "models/ModelTypes.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace vigil {

// Everything needed to score one user's windows: the six active profiles and
// their calibration transforms. Immutable once published.
struct ProfileSet {
    std::string user_id;
    std::map<ModelKind, std::shared_ptr<const ModelProfile>> profiles;
    TransformSet transforms;
    uint64_t generation{0};
    bool degraded{false};
    std::vector<Modality> missing_modalities;

    // All six kinds present and trained.
    bool Complete() const;
};

using ProfileSetPtr = std::shared_ptr<const ProfileSet>;

/**
 * ProfileArena: per-user profile sets under a single-writer/multiple-reader
 * discipline.
 *
 * Readers take a shared lock with a bounded wait. Writers (calibration,
 * retraining, online updates) take the exclusive lock. The published pointer
 * is also swapped atomically so a reader that timed out can still score
 * against the last published set.
 */
class ProfileArena {
public:
    explicit ProfileArena(std::chrono::milliseconds lock_timeout = std::chrono::milliseconds(50));

    ProfileArena(const ProfileArena&) = delete;
    ProfileArena& operator=(const ProfileArena&) = delete;

    // Throws ProfileLockTimeout when the shared lock is not granted in time.
    ProfileSetPtr Acquire(const std::string& user_id) const;

    // Last published set, read without the lock. Null when none.
    ProfileSetPtr Published(const std::string& user_id) const;

    // Acquire(), falling back to Published() on timeout. Timeouts are logged.
    ProfileSetPtr AcquireOrFallback(const std::string& user_id) const;

    // Replaces the user's set under the exclusive lock; assigns the generation.
    void Publish(ProfileSet set);

    // Same as Publish() for a caller already holding LockExclusive(set.user_id).
    void PublishLocked(ProfileSet set, const std::unique_lock<std::shared_timed_mutex>& guard);

    // Copy-on-write replacement of one profile. Returns false when the
    // exclusive lock is not granted in time or the user has no set.
    bool ReplaceProfile(const std::string& user_id, std::shared_ptr<const ModelProfile> profile);

    void Remove(const std::string& user_id);
    bool Contains(const std::string& user_id) const;

    // Holds the user's exclusive lock for the lifetime of the returned guard.
    std::unique_lock<std::shared_timed_mutex> LockExclusive(const std::string& user_id);

private:
    struct Slot {
        mutable std::shared_timed_mutex mutex;
        std::shared_ptr<const ProfileSet> current;
    };

    Slot& SlotFor(const std::string& user_id) const;

    std::chrono::milliseconds lock_timeout_;

    mutable std::mutex slots_mutex_;
    mutable std::unordered_map<std::string, std::unique_ptr<Slot>> slots_;
};

} // namespace vigil
