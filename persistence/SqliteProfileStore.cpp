#include "persistence/SqliteProfileStore.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "persistence/ProfileCodec.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace vigil {

namespace {

const char* ColumnText(sqlite3_stmt* stmt, int col) {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? text : "";
}

std::string ProfileScope(const std::string& user_id, ModelKind kind) {
    return "profile|" + user_id + "|" + ModelKindToString(kind);
}

std::string DriftScope(const std::string& user_id) {
    return "drift|" + user_id;
}

std::string CalibrationScope(const std::string& user_id) {
    return "calibration|" + user_id;
}

} // namespace

SqliteProfileStore::SqliteProfileStore(std::string integrity_key)
    : integrity_key_(std::move(integrity_key)) {}

SqliteProfileStore::~SqliteProfileStore() {
    Shutdown();
}

bool SqliteProfileStore::Initialize(const std::string& db_path) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (db_path != ":memory:") {
        try {
            std::filesystem::path p(db_path);
            if (p.has_parent_path() && !p.parent_path().empty()) {
                std::filesystem::create_directories(p.parent_path());
            }
        } catch (const std::exception& ex) {
            LOG_ERROR("SqliteProfileStore: Failed to create directory for {}: {}", db_path, ex.what());
            return false;
        }
    }

    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        LOG_ERROR("SqliteProfileStore: Failed to open database {}: {}", db_path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);

    CreateSchema();
    PrepareStatements();

    LOG_INFO("SqliteProfileStore initialized (db_path={})", db_path);
    return true;
}

void SqliteProfileStore::Shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    FinalizeStatements();

    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_INFO("SqliteProfileStore shutdown");
    }
}

void SqliteProfileStore::CreateSchema() {
    const char* schema = R"SQL(
        CREATE TABLE IF NOT EXISTS model_profiles (
            user_id         TEXT    NOT NULL,
            model_kind      TEXT    NOT NULL,
            version         INTEGER NOT NULL,
            trained_at      INTEGER NOT NULL,
            payload         TEXT    NOT NULL,
            integrity_tag   TEXT    NOT NULL,
            updated_at      TEXT    DEFAULT (datetime('now')),
            PRIMARY KEY (user_id, model_kind)
        );

        CREATE TABLE IF NOT EXISTS drift_states (
            user_id         TEXT PRIMARY KEY,
            payload         TEXT NOT NULL,
            integrity_tag   TEXT NOT NULL,
            updated_at      TEXT DEFAULT (datetime('now'))
        );

        CREATE TABLE IF NOT EXISTS calibration_transforms (
            user_id         TEXT PRIMARY KEY,
            payload         TEXT NOT NULL,
            integrity_tag   TEXT NOT NULL,
            updated_at      TEXT DEFAULT (datetime('now'))
        );

        CREATE TABLE IF NOT EXISTS decisions (
            id              INTEGER PRIMARY KEY AUTOINCREMENT,
            session_id      TEXT    NOT NULL,
            user_id         TEXT    NOT NULL,
            window_id       INTEGER NOT NULL,
            timestamp       TEXT    NOT NULL,
            state           TEXT    NOT NULL,
            previous_state  TEXT    NOT NULL,
            aggregate       REAL,
            drift_score     REAL,
            reason          TEXT    NOT NULL,
            transition      INTEGER NOT NULL,
            details         TEXT
        );

        CREATE INDEX IF NOT EXISTS idx_decisions_session ON decisions(session_id);
        CREATE INDEX IF NOT EXISTS idx_decisions_user ON decisions(user_id);
    )SQL";

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, schema, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        LOG_ERROR("SqliteProfileStore: Failed to create schema: {}", err_msg ? err_msg : "unknown");
        sqlite3_free(err_msg);
    }
}

void SqliteProfileStore::PrepareStatements() {
    sqlite3_prepare_v2(db_,
        "INSERT OR REPLACE INTO model_profiles "
        "(user_id, model_kind, version, trained_at, payload, integrity_tag, updated_at) "
        "VALUES (?, ?, ?, ?, ?, ?, datetime('now'))",
        -1, &stmt_upsert_profile_, nullptr);

    sqlite3_prepare_v2(db_,
        "SELECT payload, integrity_tag FROM model_profiles WHERE user_id = ? AND model_kind = ?",
        -1, &stmt_load_profile_, nullptr);

    sqlite3_prepare_v2(db_,
        "INSERT OR REPLACE INTO drift_states (user_id, payload, integrity_tag, updated_at) "
        "VALUES (?, ?, ?, datetime('now'))",
        -1, &stmt_upsert_drift_, nullptr);

    sqlite3_prepare_v2(db_,
        "SELECT payload, integrity_tag FROM drift_states WHERE user_id = ?",
        -1, &stmt_load_drift_, nullptr);

    sqlite3_prepare_v2(db_,
        "INSERT OR REPLACE INTO calibration_transforms (user_id, payload, integrity_tag, updated_at) "
        "VALUES (?, ?, ?, datetime('now'))",
        -1, &stmt_upsert_calibration_, nullptr);

    sqlite3_prepare_v2(db_,
        "SELECT payload, integrity_tag FROM calibration_transforms WHERE user_id = ?",
        -1, &stmt_load_calibration_, nullptr);

    sqlite3_prepare_v2(db_,
        "INSERT INTO decisions (session_id, user_id, window_id, timestamp, state, previous_state, "
        "aggregate, drift_score, reason, transition, details) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
        -1, &stmt_insert_decision_, nullptr);

    sqlite3_prepare_v2(db_,
        "SELECT COUNT(*) FROM decisions",
        -1, &stmt_decision_count_, nullptr);
}

void SqliteProfileStore::FinalizeStatements() {
    auto finalize = [](sqlite3_stmt*& stmt) {
        if (stmt) { sqlite3_finalize(stmt); stmt = nullptr; }
    };
    finalize(stmt_upsert_profile_);
    finalize(stmt_load_profile_);
    finalize(stmt_upsert_drift_);
    finalize(stmt_load_drift_);
    finalize(stmt_upsert_calibration_);
    finalize(stmt_load_calibration_);
    finalize(stmt_insert_decision_);
    finalize(stmt_decision_count_);
}

// --- Integrity ---

std::string SqliteProfileStore::ComputeTag(const std::string& scope, const std::string& payload) const {
    const std::string data = scope + "|" + payload;

    unsigned char result[EVP_MAX_MD_SIZE];
    unsigned int result_len = 0;

    HMAC(EVP_sha256(),
         integrity_key_.c_str(), static_cast<int>(integrity_key_.size()),
         reinterpret_cast<const unsigned char*>(data.c_str()),
         data.size(),
         result, &result_len);

    std::ostringstream oss;
    for (unsigned int i = 0; i < result_len; i++) {
        oss << std::hex << std::setfill('0') << std::setw(2)
            << static_cast<int>(result[i]);
    }
    return oss.str();
}

std::optional<std::string> SqliteProfileStore::ReadVerified(sqlite3_stmt* stmt, const std::string& scope,
                                                            int payload_col, int tag_col) {
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_DONE) {
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        throw ModelLoadError("Failed to read " + scope + ": " + sqlite3_errmsg(db_));
    }

    std::string payload = ColumnText(stmt, payload_col);
    std::string stored_tag = ColumnText(stmt, tag_col);
    std::string computed = ComputeTag(scope, payload);
    if (computed != stored_tag) {
        LOG_ERROR("SqliteProfileStore: integrity tag mismatch for {} (expected={}, got={})",
                  scope, computed.substr(0, 16), stored_tag.substr(0, 16));
        throw ModelLoadError("Integrity check failed for " + scope);
    }
    return payload;
}

// --- Profiles ---

std::optional<ModelProfile> SqliteProfileStore::LoadProfile(const std::string& user_id, ModelKind kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_ || !stmt_load_profile_) {
        throw ModelLoadError("Profile store is not initialized");
    }

    const std::string kind_str = ModelKindToString(kind);
    sqlite3_reset(stmt_load_profile_);
    sqlite3_bind_text(stmt_load_profile_, 1, user_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_load_profile_, 2, kind_str.c_str(), -1, SQLITE_TRANSIENT);

    auto payload = ReadVerified(stmt_load_profile_, ProfileScope(user_id, kind), 0, 1);
    sqlite3_reset(stmt_load_profile_);
    if (!payload) {
        return std::nullopt;
    }

    nlohmann::json j = nlohmann::json::parse(*payload, nullptr, false);
    if (j.is_discarded()) {
        throw ModelLoadError("Unparsable " + kind_str + " profile for user " + user_id);
    }
    ModelProfile profile = DecodeProfile(j);
    if (profile.user_id != user_id || profile.kind != kind) {
        throw ModelLoadError("Stored " + kind_str + " profile for user " + user_id +
                             " belongs to a different user or kind");
    }
    return profile;
}

bool SqliteProfileStore::SaveProfile(const ModelProfile& profile) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_ || !stmt_upsert_profile_) return false;

    const std::string kind_str = ModelKindToString(profile.kind);
    const std::string payload = EncodeProfile(profile).dump();
    const std::string tag = ComputeTag(ProfileScope(profile.user_id, profile.kind), payload);

    sqlite3_reset(stmt_upsert_profile_);
    sqlite3_bind_text(stmt_upsert_profile_, 1, profile.user_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_upsert_profile_, 2, kind_str.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt_upsert_profile_, 3, static_cast<sqlite3_int64>(profile.version));
    sqlite3_bind_int64(stmt_upsert_profile_, 4, static_cast<sqlite3_int64>(profile.trained_at));
    sqlite3_bind_text(stmt_upsert_profile_, 5, payload.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_upsert_profile_, 6, tag.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt_upsert_profile_);
    if (rc != SQLITE_DONE) {
        LOG_ERROR("SqliteProfileStore: Failed to save {} profile for {}: {}",
                  kind_str, profile.user_id, sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

// --- Drift state ---

std::optional<DriftState> SqliteProfileStore::LoadBaselineStats(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_ || !stmt_load_drift_) {
        throw ModelLoadError("Profile store is not initialized");
    }

    sqlite3_reset(stmt_load_drift_);
    sqlite3_bind_text(stmt_load_drift_, 1, user_id.c_str(), -1, SQLITE_TRANSIENT);

    auto payload = ReadVerified(stmt_load_drift_, DriftScope(user_id), 0, 1);
    sqlite3_reset(stmt_load_drift_);
    if (!payload) {
        return std::nullopt;
    }

    nlohmann::json j = nlohmann::json::parse(*payload, nullptr, false);
    if (j.is_discarded()) {
        throw ModelLoadError("Unparsable drift state for user " + user_id);
    }
    return DecodeDriftState(j);
}

bool SqliteProfileStore::SaveDriftState(const std::string& user_id, const DriftState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_ || !stmt_upsert_drift_) return false;

    const std::string payload = EncodeDriftState(state).dump();
    const std::string tag = ComputeTag(DriftScope(user_id), payload);

    sqlite3_reset(stmt_upsert_drift_);
    sqlite3_bind_text(stmt_upsert_drift_, 1, user_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_upsert_drift_, 2, payload.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_upsert_drift_, 3, tag.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt_upsert_drift_);
    if (rc != SQLITE_DONE) {
        LOG_ERROR("SqliteProfileStore: Failed to save drift state for {}: {}", user_id, sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

// --- Calibration transforms ---

std::optional<TransformSet> SqliteProfileStore::LoadCalibration(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_ || !stmt_load_calibration_) {
        throw ModelLoadError("Profile store is not initialized");
    }

    sqlite3_reset(stmt_load_calibration_);
    sqlite3_bind_text(stmt_load_calibration_, 1, user_id.c_str(), -1, SQLITE_TRANSIENT);

    auto payload = ReadVerified(stmt_load_calibration_, CalibrationScope(user_id), 0, 1);
    sqlite3_reset(stmt_load_calibration_);
    if (!payload) {
        return std::nullopt;
    }

    nlohmann::json j = nlohmann::json::parse(*payload, nullptr, false);
    if (j.is_discarded()) {
        throw ModelLoadError("Unparsable calibration transforms for user " + user_id);
    }
    return DecodeTransforms(j);
}

bool SqliteProfileStore::SaveCalibration(const std::string& user_id, const TransformSet& transforms) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_ || !stmt_upsert_calibration_) return false;

    const std::string payload = EncodeTransforms(transforms).dump();
    const std::string tag = ComputeTag(CalibrationScope(user_id), payload);

    sqlite3_reset(stmt_upsert_calibration_);
    sqlite3_bind_text(stmt_upsert_calibration_, 1, user_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_upsert_calibration_, 2, payload.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_upsert_calibration_, 3, tag.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt_upsert_calibration_);
    if (rc != SQLITE_DONE) {
        LOG_ERROR("SqliteProfileStore: Failed to save calibration for {}: {}", user_id, sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

// --- Decision journal ---

bool SqliteProfileStore::RecordDecision(const DecisionEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_ || !stmt_insert_decision_) return false;

    const std::string ts = TimestampToISO8601(event.timestamp);
    const std::string state = SessionStateToString(event.state);
    const std::string previous = SessionStateToString(event.previous_state);

    nlohmann::json scores = nlohmann::json::object();
    for (const auto& [kind, score] : event.model_scores) {
        scores[ModelKindToString(kind)] = score;
    }
    const std::string details = scores.dump();

    sqlite3_reset(stmt_insert_decision_);
    sqlite3_bind_text(stmt_insert_decision_, 1, event.session_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_insert_decision_, 2, event.user_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt_insert_decision_, 3, static_cast<sqlite3_int64>(event.window_id));
    sqlite3_bind_text(stmt_insert_decision_, 4, ts.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_insert_decision_, 5, state.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_insert_decision_, 6, previous.c_str(), -1, SQLITE_TRANSIENT);
    if (event.aggregate) {
        sqlite3_bind_double(stmt_insert_decision_, 7, *event.aggregate);
    } else {
        sqlite3_bind_null(stmt_insert_decision_, 7);
    }
    if (event.drift_score) {
        sqlite3_bind_double(stmt_insert_decision_, 8, *event.drift_score);
    } else {
        sqlite3_bind_null(stmt_insert_decision_, 8);
    }
    sqlite3_bind_text(stmt_insert_decision_, 9, event.reason.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt_insert_decision_, 10, event.transition ? 1 : 0);
    sqlite3_bind_text(stmt_insert_decision_, 11, details.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt_insert_decision_);
    if (rc != SQLITE_DONE) {
        LOG_ERROR("SqliteProfileStore: Failed to record decision for session {}: {}",
                  event.session_id, sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<std::string> SqliteProfileStore::QueryDecisionsJson(const std::string& session_id, int limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> results;
    if (!db_) return results;

    std::string sql = "SELECT session_id, user_id, window_id, timestamp, state, previous_state, "
                      "aggregate, drift_score, reason, transition, details FROM decisions";
    if (!session_id.empty()) {
        sql += " WHERE session_id = ?";
    }
    sql += " ORDER BY id DESC LIMIT " + std::to_string(limit);

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("SqliteProfileStore: Decision query prepare failed: {}", sqlite3_errmsg(db_));
        return results;
    }
    if (!session_id.empty()) {
        sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        nlohmann::json j;
        j["session_id"] = ColumnText(stmt, 0);
        j["user_id"] = ColumnText(stmt, 1);
        j["window_id"] = sqlite3_column_int64(stmt, 2);
        j["timestamp"] = ColumnText(stmt, 3);
        j["state"] = ColumnText(stmt, 4);
        j["previous_state"] = ColumnText(stmt, 5);
        j["aggregate"] = sqlite3_column_type(stmt, 6) == SQLITE_NULL
                             ? nlohmann::json(nullptr) : nlohmann::json(sqlite3_column_double(stmt, 6));
        j["drift_score"] = sqlite3_column_type(stmt, 7) == SQLITE_NULL
                               ? nlohmann::json(nullptr) : nlohmann::json(sqlite3_column_double(stmt, 7));
        j["reason"] = ColumnText(stmt, 8);
        j["transition"] = sqlite3_column_int(stmt, 9) != 0;

        nlohmann::json scores = nlohmann::json::parse(ColumnText(stmt, 10), nullptr, false);
        j["model_scores"] = scores.is_discarded() ? nlohmann::json::object() : scores;
        results.push_back(j.dump());
    }

    sqlite3_finalize(stmt);
    return results;
}

size_t SqliteProfileStore::GetDecisionCount() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_ || !stmt_decision_count_) return 0;

    sqlite3_reset(stmt_decision_count_);
    if (sqlite3_step(stmt_decision_count_) == SQLITE_ROW) {
        return static_cast<size_t>(sqlite3_column_int64(stmt_decision_count_, 0));
    }
    return 0;
}

// --- Helpers ---

std::string SqliteProfileStore::TimestampToISO8601(uint64_t ms_epoch) {
    auto seconds = static_cast<time_t>(ms_epoch / 1000);
    auto millis = ms_epoch % 1000;

    std::tm tm_buf{};
    gmtime_r(&seconds, &tm_buf);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
        tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
        tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
        static_cast<int>(millis));
    return buf;
}

} // namespace vigil
