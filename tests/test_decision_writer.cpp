#include <gtest/gtest.h>
#include "session/DecisionWriter.hpp"
#include <nlohmann/json.hpp>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace vigil;

class DecisionWriterTest : public ::testing::Test {
protected:
    static DecisionEvent MakeDecision(const std::string& session, uint64_t window) {
        DecisionEvent decision;
        decision.session_id = session;
        decision.user_id = "alice";
        decision.window_id = window;
        decision.state = SessionState::TRUSTED;
        decision.previous_state = SessionState::TRUSTED;
        decision.aggregate = 0.8;
        decision.model_scores[ModelKind::SEQUENCE] = 0.8;
        decision.reason = reason::kWindowScored;
        return decision;
    }

    std::ostringstream out;
};

TEST_F(DecisionWriterTest, WritesOneJsonLinePerDecision) {
    DecisionWriter writer(out);
    writer.Write(MakeDecision("s1", 1));

    std::string line;
    std::istringstream in(out.str());
    ASSERT_TRUE(std::getline(in, line));
    auto j = nlohmann::json::parse(line);
    EXPECT_EQ(j["session_id"], "s1");
    EXPECT_EQ(j["state"], "Trusted");
    EXPECT_EQ(writer.LinesWritten(), 1u);
}

TEST_F(DecisionWriterTest, ConcurrentWritersNeverInterleaveLines) {
    DecisionWriter writer(out);
    const int kThreads = 8;
    const int kPerThread = 200;

    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&writer, t]() {
            const std::string session = "session-" + std::to_string(t);
            for (int i = 0; i < kPerThread; ++i) {
                writer.Write(MakeDecision(session, static_cast<uint64_t>(i)));
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    std::istringstream in(out.str());
    std::string line;
    std::set<std::string> seen;
    int lines = 0;
    while (std::getline(in, line)) {
        auto j = nlohmann::json::parse(line);
        seen.insert(j["session_id"].get<std::string>() + "/" +
                    std::to_string(j["window_id"].get<uint64_t>()));
        ++lines;
    }

    EXPECT_EQ(lines, kThreads * kPerThread);
    EXPECT_EQ(seen.size(), static_cast<size_t>(kThreads * kPerThread));
    EXPECT_EQ(writer.LinesWritten(), static_cast<size_t>(kThreads * kPerThread));
}
