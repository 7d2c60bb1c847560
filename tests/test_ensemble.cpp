#include <gtest/gtest.h>
#include "core/Errors.hpp"
#include "engine/Aggregator.hpp"
#include "engine/EnsembleScorer.hpp"
#include "TestData.hpp"
#include <future>

using namespace vigil;

class EnsembleScorerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.isolation_trees = 30;
        config_.isolation_subsample = 16;

        for (const auto& window : testdata::PersonaWindows(testdata::Genuine(), 30, 1)) {
            for (Modality modality : kAllModalities) {
                data_[modality].push_back(window.Block(modality).values);
            }
        }
        window_ = testdata::PersonaWindows(testdata::Genuine(), 1, 2, testdata::kEpoch + 900000).front();
    }

    ProfileSet TrainSet() {
        ProfileSet set;
        set.user_id = "alice";
        for (ModelKind kind : kAllModelKinds) {
            ModelProfile profile = ScoringModel::Train(kind, "alice", data_, config_, testdata::kEpoch);
            profile.version = 1;
            set.profiles[kind] = std::make_shared<const ModelProfile>(std::move(profile));
        }
        return set;
    }

    ModelConfig config_;
    TrainingData data_;
    FeatureWindow window_;
};

TEST_F(EnsembleScorerTest, AllModelsScoreGenuineWindow) {
    ProfileSet set = TrainSet();

    ScoreRecord record = EnsembleScorer::ScoreWith(&set, "alice", window_, {});

    EXPECT_TRUE(record.Complete());
    EXPECT_TRUE(record.errors.empty());
    EXPECT_EQ(record.window_id, window_.window_id);
    for (const auto& [kind, score] : record.scores) {
        EXPECT_GE(score, 0.0);
        EXPECT_LE(score, 1.0);
    }
}

TEST_F(EnsembleScorerTest, FailingModelIsOmittedAndOthersAggregate) {
    ProfileSet set = TrainSet();

    // Neighbor profile trained on a wider feature layout than the windows carry.
    TrainingData wide = data_;
    for (auto& [modality, rows] : wide) {
        for (auto& row : rows) {
            row.push_back(1.0);
            row.push_back(2.0);
        }
    }
    set.profiles[ModelKind::NEAREST_NEIGHBOR] = std::make_shared<const ModelProfile>(
        ScoringModel::Train(ModelKind::NEAREST_NEIGHBOR, "alice", wide, config_, testdata::kEpoch));

    ScoreRecord record = EnsembleScorer::ScoreWith(&set, "alice", window_, {});

    EXPECT_EQ(record.scores.size(), 5u);
    EXPECT_EQ(record.scores.count(ModelKind::NEAREST_NEIGHBOR), 0u);
    ASSERT_EQ(record.errors.count(ModelKind::NEAREST_NEIGHBOR), 1u);
    EXPECT_EQ(record.errors[ModelKind::NEAREST_NEIGHBOR].rfind("score-error", 0), 0u);

    Aggregator aggregator{ThresholdConfig(), ModelConfig()};
    AggregateResult result = aggregator.Evaluate(record.scores, set.transforms);
    EXPECT_EQ(result.model_count, 5u);
    EXPECT_GE(result.aggregate, 0.0);
    EXPECT_LE(result.aggregate, 1.0);
}

TEST_F(EnsembleScorerTest, UntrainedAndMissingProfilesAreReported) {
    ProfileSet set = TrainSet();
    set.profiles.erase(ModelKind::ISOLATION);
    ModelProfile untrained;
    untrained.user_id = "alice";
    untrained.kind = ModelKind::BOUNDARY;
    set.profiles[ModelKind::BOUNDARY] = std::make_shared<const ModelProfile>(untrained);

    ScoreRecord record = EnsembleScorer::ScoreWith(&set, "alice", window_, {});

    EXPECT_EQ(record.scores.size(), 4u);
    EXPECT_EQ(record.errors[ModelKind::ISOLATION], "profile-missing");
    EXPECT_EQ(record.errors[ModelKind::BOUNDARY], "untrained");
}

TEST_F(EnsembleScorerTest, WindowWithoutTrainedModalityScoresNothing) {
    TrainingData mouse_only;
    mouse_only[Modality::MOUSE] = data_[Modality::MOUSE];
    ProfileSet set;
    set.user_id = "alice";
    for (ModelKind kind : kAllModelKinds) {
        set.profiles[kind] = std::make_shared<const ModelProfile>(
            ScoringModel::Train(kind, "alice", mouse_only, config_, testdata::kEpoch));
    }
    FeatureWindow typing = testdata::MakeWindow(1, testdata::kEpoch, 30000, testdata::Genuine().keystroke,
                                                std::nullopt);

    ScoreRecord record = EnsembleScorer::ScoreWith(&set, "alice", typing, {});

    EXPECT_TRUE(record.scores.empty());
    EXPECT_EQ(record.errors.size(), kModelKindCount);
    EXPECT_EQ(record.errors[ModelKind::SEQUENCE], "modality-unavailable");
}

TEST_F(EnsembleScorerTest, UnknownUserHasNoProfiles) {
    ProfileArena arena;
    EnsembleScorer scorer(arena);

    ScoreRecord record = scorer.Score("mallory", window_, {});

    EXPECT_TRUE(record.scores.empty());
    EXPECT_EQ(record.errors[ModelKind::SEQUENCE], "profile-missing");
}

TEST_F(EnsembleScorerTest, LockTimeoutFallsBackToPublishedSet) {
    ProfileArena arena(std::chrono::milliseconds(20));
    arena.Publish(TrainSet());
    ProfileSetPtr published = arena.Published("alice");
    ASSERT_TRUE(published);

    EnsembleScorer scorer(arena);
    auto guard = arena.LockExclusive("alice");

    auto strict = std::async(std::launch::async, [&arena]() { return arena.Acquire("alice"); });
    EXPECT_THROW(strict.get(), ProfileLockTimeout);

    auto scored = std::async(std::launch::async, [this, &scorer]() {
        ProfileSetPtr used;
        ScoreRecord record = scorer.Score("alice", window_, {}, &used);
        return std::make_pair(record, used);
    });
    auto [record, used] = scored.get();
    guard.unlock();

    EXPECT_EQ(used, published);
    EXPECT_TRUE(record.Complete());
}

TEST_F(EnsembleScorerTest, ReplaceProfileIsCopyOnWrite) {
    ProfileArena arena;
    arena.Publish(TrainSet());
    ProfileSetPtr before = arena.Published("alice");

    ModelProfile updated = ScoringModel::Update(*before->profiles.at(ModelKind::ONLINE_LINEAR), window_);
    updated.version = 2;
    ASSERT_TRUE(arena.ReplaceProfile("alice", std::make_shared<const ModelProfile>(std::move(updated))));

    ProfileSetPtr after = arena.Published("alice");
    EXPECT_NE(before, after);
    EXPECT_EQ(before->profiles.at(ModelKind::ONLINE_LINEAR)->version, 1u);
    EXPECT_EQ(after->profiles.at(ModelKind::ONLINE_LINEAR)->version, 2u);
    EXPECT_EQ(before->profiles.at(ModelKind::SEQUENCE), after->profiles.at(ModelKind::SEQUENCE));
}

TEST_F(EnsembleScorerTest, PublishLockedRejectsForeignGuard) {
    ProfileArena arena;
    auto guard = arena.LockExclusive("bob");

    ProfileSet set = TrainSet();
    EXPECT_THROW(arena.PublishLocked(std::move(set), guard), std::logic_error);
}
