#include "core/Config.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "engine/AuthEngine.hpp"
#include "persistence/SqliteProfileStore.hpp"
#include "session/DecisionWriter.hpp"

#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace vigil {

std::atomic<bool> g_running{true};

void SignalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = false;
    }
}

struct ReplayRecord {
    std::string session_id;
    std::string user_id;
    BehavioralEvent event;
};

// CSV row: session_id,user_id,kind,timestamp,f1,f2,f3
//   keystroke    f1=key_id f2=release_time
//   mouse_move   f1=x f2=y
//   mouse_click  f1=x f2=y f3=button
//   scroll       f1=x f2=y f3=delta
std::optional<ReplayRecord> ParseReplayLine(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
        fields.push_back(field);
    }
    if (fields.size() < 5) {
        return std::nullopt;
    }

    auto number = [&fields](size_t i) { return i < fields.size() && !fields[i].empty() ? std::stod(fields[i]) : 0.0; };

    ReplayRecord record;
    record.session_id = fields[0];
    record.user_id = fields[1];
    const std::string& kind = fields[2];
    const uint64_t timestamp = std::stoull(fields[3]);

    if (kind == "keystroke") {
        record.event = BehavioralEvent::Keystroke(static_cast<uint32_t>(number(4)), timestamp,
                                                  static_cast<uint64_t>(number(5)));
    } else if (kind == "mouse_move") {
        record.event = BehavioralEvent::MouseMove(number(4), number(5), timestamp);
    } else if (kind == "mouse_click") {
        record.event = BehavioralEvent::MouseClick(number(4), number(5), timestamp, static_cast<int32_t>(number(6)));
    } else if (kind == "scroll") {
        record.event = BehavioralEvent::Scroll(number(4), number(5), timestamp, number(6));
    } else {
        return std::nullopt;
    }
    return record;
}

class VigilDaemon {
public:
    explicit VigilDaemon(const EngineConfig& config)
        : config_(config), store_(config.storage.integrity_key) {}

    bool Initialize() {
        LOG_INFO("Initializing vigild...");

        if (!store_.Initialize(config_.storage.database_path)) {
            LOG_ERROR("Profile store unavailable at {}", config_.storage.database_path);
            return false;
        }

        engine_ = std::make_unique<AuthEngine>(config_, &store_);
        engine_->SubscribeDecisions([this](const DecisionEvent& decision) {
            writer_.Write(decision);
        });

        engine_->Bus().Subscribe(EventType::RECALIBRATION_SUGGESTED, [](const Event& event) {
            LOG_INFO("Recalibration suggested for user {} (session {})", event.user_id, event.session_id);
        });
        engine_->Bus().Subscribe(EventType::CALIBRATION_FAILED, [](const Event& event) {
            auto it = event.metadata.find("error");
            LOG_WARN("Calibration failed for user {}: {}", event.user_id,
                     it != event.metadata.end() ? it->second : "unknown");
        });

        LOG_INFO("vigild initialized");
        return true;
    }

    size_t Replay(std::istream& input) {
        std::set<std::string> started;
        std::string line;
        size_t line_no = 0;
        size_t accepted = 0;

        while (g_running && std::getline(input, line)) {
            ++line_no;
            if (line.empty() || line[0] == '#') continue;

            std::optional<ReplayRecord> record;
            try {
                record = ParseReplayLine(line);
            } catch (const std::logic_error& ex) {
                LOG_WARN("Line {}: malformed field ({})", line_no, ex.what());
                continue;
            }
            if (!record) {
                LOG_WARN("Line {}: unrecognized record, skipped", line_no);
                continue;
            }

            if (started.insert(record->session_id).second) {
                if (!engine_->StartSession(record->session_id, record->user_id)) {
                    LOG_ERROR("Line {}: could not start session {}", line_no, record->session_id);
                    continue;
                }
                sessions_.push_back(record->session_id);
            }
            if (engine_->PushEvent(record->session_id, record->event)) {
                ++accepted;
            }
        }
        return accepted;
    }

    void Stop() {
        if (!engine_) return;
        for (const auto& session_id : sessions_) {
            engine_->WaitForSession(session_id);
        }
        engine_->WaitForBackground();
        for (const auto& session_id : sessions_) {
            engine_->EndSession(session_id);
        }
        engine_->Shutdown();
        store_.Shutdown();
        LOG_INFO("vigild stopped ({} sessions)", sessions_.size());
    }

private:
    EngineConfig config_;
    SqliteProfileStore store_;
    DecisionWriter writer_{std::cout};
    std::unique_ptr<AuthEngine> engine_;
    std::vector<std::string> sessions_;
};

} // namespace vigil

int main(int argc, char* argv[]) {
    std::string config_path = "config/config.yaml";
    std::string events_path;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "usage: vigild [--config config.yaml] [events.csv]\n"
                      << "Replays behavioral events (stdin when no file is given) and prints one\n"
                      << "JSON decision per line.\n";
            return 0;
        } else {
            events_path = arg;
        }
    }

    vigil::EngineConfig config;
    try {
        config = vigil::LoadEngineConfig(config_path);
    } catch (const vigil::ConfigError& ex) {
        std::cerr << "vigild: " << ex.what() << std::endl;
        return 2;
    }

    vigil::Logger::Initialize(config.logging);

    std::signal(SIGINT, vigil::SignalHandler);
    std::signal(SIGTERM, vigil::SignalHandler);

    try {
        vigil::VigilDaemon daemon(config);
        if (!daemon.Initialize()) {
            LOG_CRITICAL("Failed to initialize vigild");
            vigil::Logger::Shutdown();
            return 1;
        }

        size_t accepted = 0;
        if (events_path.empty()) {
            accepted = daemon.Replay(std::cin);
        } else {
            std::ifstream input(events_path);
            if (!input) {
                LOG_CRITICAL("Cannot open event log {}", events_path);
                daemon.Stop();
                vigil::Logger::Shutdown();
                return 1;
            }
            accepted = daemon.Replay(input);
        }
        LOG_INFO("Replayed {} events", accepted);

        daemon.Stop();
        vigil::Logger::Shutdown();
        return 0;
    } catch (const std::exception& ex) {
        LOG_CRITICAL("Fatal error: {}", ex.what());
        vigil::Logger::Shutdown();
        return 1;
    }
}
