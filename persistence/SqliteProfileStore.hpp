#pragma once

#include "persistence/ProfileStore.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace vigil {

// SQLite-backed ProfileStore. Payloads are JSON; every profile, drift state
// and calibration row carries an HMAC-SHA256 tag over its identity and payload.
class SqliteProfileStore : public ProfileStore {
public:
    explicit SqliteProfileStore(std::string integrity_key);
    ~SqliteProfileStore() override;

    SqliteProfileStore(const SqliteProfileStore&) = delete;
    SqliteProfileStore& operator=(const SqliteProfileStore&) = delete;

    bool Initialize(const std::string& db_path = "data/vigil.db");
    void Shutdown();

    std::optional<ModelProfile> LoadProfile(const std::string& user_id, ModelKind kind) override;
    bool SaveProfile(const ModelProfile& profile) override;

    std::optional<DriftState> LoadBaselineStats(const std::string& user_id) override;
    bool SaveDriftState(const std::string& user_id, const DriftState& state) override;

    std::optional<TransformSet> LoadCalibration(const std::string& user_id) override;
    bool SaveCalibration(const std::string& user_id, const TransformSet& transforms) override;

    bool RecordDecision(const DecisionEvent& event) override;

    // Decision journal, newest first, as JSON strings.
    std::vector<std::string> QueryDecisionsJson(const std::string& session_id = "", int limit = 100);
    size_t GetDecisionCount();

private:
    void CreateSchema();
    void PrepareStatements();
    void FinalizeStatements();

    std::string ComputeTag(const std::string& scope, const std::string& payload) const;

    // Reads (payload, tag) from a prepared single-row lookup and verifies the
    // tag. nullopt when no row matches.
    std::optional<std::string> ReadVerified(sqlite3_stmt* stmt, const std::string& scope, int payload_col,
                                            int tag_col);

    static std::string TimestampToISO8601(uint64_t ms_epoch);

    std::string integrity_key_;

    sqlite3* db_{nullptr};
    std::mutex mutex_;

    sqlite3_stmt* stmt_upsert_profile_{nullptr};
    sqlite3_stmt* stmt_load_profile_{nullptr};
    sqlite3_stmt* stmt_upsert_drift_{nullptr};
    sqlite3_stmt* stmt_load_drift_{nullptr};
    sqlite3_stmt* stmt_upsert_calibration_{nullptr};
    sqlite3_stmt* stmt_load_calibration_{nullptr};
    sqlite3_stmt* stmt_insert_decision_{nullptr};
    sqlite3_stmt* stmt_decision_count_{nullptr};
};

} // namespace vigil
