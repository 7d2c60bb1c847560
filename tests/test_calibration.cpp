#include <gtest/gtest.h>
#include "core/Errors.hpp"
#include "engine/CalibrationManager.hpp"
#include "TestData.hpp"

using namespace vigil;

class CalibrationManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.models.isolation_trees = 30;
        config_.models.isolation_subsample = 16;
    }

    void AddAll(CalibrationManager& manager, const std::vector<FeatureWindow>& windows) {
        for (const auto& window : windows) {
            manager.AddWindow("alice", window);
        }
    }

    EngineConfig config_;
    ProfileArena arena_;
};

TEST_F(CalibrationManagerTest, TwoMinutesOfDataIsIncomplete) {
    DriftMonitor drift(config_.drift, config_.thresholds);
    CalibrationManager manager(config_, arena_, drift, nullptr);

    // Four 30 s windows cover 120 s.
    AddAll(manager, testdata::PersonaWindows(testdata::Genuine(), 4, 1));
    EXPECT_EQ(manager.ElapsedMs("alice"), 120000u);
    EXPECT_FALSE(manager.Ready("alice"));

    EXPECT_THROW(manager.Calibrate("alice", testdata::kEpoch + 120000), CalibrationIncomplete);
    EXPECT_FALSE(arena_.Contains("alice"));
    EXPECT_EQ(manager.WindowCount("alice"), 4u);
}

TEST_F(CalibrationManagerTest, FiveMinutesOfDualModalityDataTrainsAllModels) {
    DriftMonitor drift(config_.drift, config_.thresholds);
    CalibrationManager manager(config_, arena_, drift, nullptr);

    AddAll(manager, testdata::PersonaWindows(testdata::Genuine(), 10, 2));
    ASSERT_TRUE(manager.Ready("alice"));

    CalibrationResult result = manager.Calibrate("alice", testdata::kEpoch + 300000);

    EXPECT_EQ(result.windows, 10u);
    EXPECT_EQ(result.elapsed_ms, 300000u);
    EXPECT_FALSE(result.degraded);
    EXPECT_TRUE(result.missing_modalities.empty());
    EXPECT_EQ(manager.WindowCount("alice"), 0u);

    ProfileSetPtr set = arena_.Published("alice");
    ASSERT_TRUE(set);
    EXPECT_TRUE(set->Complete());
    EXPECT_EQ(set->generation, result.generation);
    EXPECT_EQ(set->transforms.size(), kModelKindCount);
    for (const auto& [kind, profile] : set->profiles) {
        EXPECT_EQ(profile->version, 1u);
        EXPECT_TRUE(profile->HasModality(Modality::KEYSTROKE));
        EXPECT_TRUE(profile->HasModality(Modality::MOUSE));
    }
    EXPECT_TRUE(drift.HasBaseline("alice"));
}

TEST_F(CalibrationManagerTest, SingleModalityProducesDegradedProfile) {
    DriftMonitor drift(config_.drift, config_.thresholds);
    CalibrationManager manager(config_, arena_, drift, nullptr);

    AddAll(manager, testdata::PersonaWindows(testdata::Genuine(), 10, 3, testdata::kEpoch, 30000, 1,
                                             true, false));

    CalibrationResult result = manager.Calibrate("alice", testdata::kEpoch + 300000);

    EXPECT_TRUE(result.degraded);
    ASSERT_EQ(result.missing_modalities.size(), 1u);
    EXPECT_EQ(result.missing_modalities.front(), Modality::MOUSE);

    ProfileSetPtr set = arena_.Published("alice");
    ASSERT_TRUE(set);
    EXPECT_TRUE(set->degraded);
    EXPECT_FALSE(set->profiles.at(ModelKind::BOUNDARY)->HasModality(Modality::MOUSE));
}

TEST_F(CalibrationManagerTest, NoUsableModalityRaises) {
    DriftMonitor drift(config_.drift, config_.thresholds);
    CalibrationManager manager(config_, arena_, drift, nullptr);

    // Each modality appears in only four windows, below the per-modality minimum.
    auto keys = testdata::PersonaWindows(testdata::Genuine(), 4, 4, testdata::kEpoch, 30000, 1, true, false);
    auto mouse = testdata::PersonaWindows(testdata::Genuine(), 4, 5, testdata::kEpoch + 120000, 30000, 5,
                                          false, true);
    auto idle = testdata::PersonaWindows(testdata::Genuine(), 2, 6, testdata::kEpoch + 240000, 30000, 9,
                                         false, false);
    AddAll(manager, keys);
    AddAll(manager, mouse);
    AddAll(manager, idle);

    EXPECT_THROW(manager.Calibrate("alice", testdata::kEpoch + 300000), InsufficientModalityData);
    EXPECT_FALSE(arena_.Contains("alice"));
}

TEST_F(CalibrationManagerTest, RecalibrationBumpsVersionsAndGeneration) {
    DriftMonitor drift(config_.drift, config_.thresholds);
    CalibrationManager manager(config_, arena_, drift, nullptr);
    AddAll(manager, testdata::PersonaWindows(testdata::Genuine(), 10, 7));
    CalibrationResult first = manager.Calibrate("alice", testdata::kEpoch + 300000);

    auto recent = testdata::PersonaWindows(testdata::Genuine(), 12, 8, testdata::kEpoch + 600000);
    CalibrationResult second = manager.Recalibrate("alice", recent, testdata::kEpoch + 960000);

    EXPECT_GT(second.generation, first.generation);
    ProfileSetPtr set = arena_.Published("alice");
    ASSERT_TRUE(set);
    for (const auto& [kind, profile] : set->profiles) {
        EXPECT_EQ(profile->version, 2u);
    }
    auto state = drift.Snapshot("alice");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->last_recalibration, testdata::kEpoch + 960000);
}

TEST_F(CalibrationManagerTest, RecalibrationNeedsMinimumWindows) {
    DriftMonitor drift(config_.drift, config_.thresholds);
    CalibrationManager manager(config_, arena_, drift, nullptr);

    auto few = testdata::PersonaWindows(testdata::Genuine(), 3, 9);
    EXPECT_THROW(manager.Recalibrate("alice", few, testdata::kEpoch), CalibrationIncomplete);
}
