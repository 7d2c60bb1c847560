#include <gtest/gtest.h>
#include "features/FeatureExtractor.hpp"
#include "TestData.hpp"
#include <cmath>
#include <limits>

using namespace vigil;

class FeatureExtractorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.window_size_ms = 10000;
        config_.min_keystroke_events = 1000;
        config_.min_mouse_events = 1000;
        config_.min_modality_events = 3;
    }

    WindowConfig config_;
};

TEST_F(FeatureExtractorTest, EmitsWindowWhenNextEventCrossesBoundary) {
    FeatureExtractor extractor(config_, "s1");
    const uint64_t t0 = testdata::kEpoch;

    for (uint64_t i = 0; i < 5; ++i) {
        EXPECT_FALSE(extractor.Push(BehavioralEvent::Keystroke(65, t0 + i * 1000, t0 + i * 1000 + 90)));
    }

    auto window = extractor.Push(BehavioralEvent::Keystroke(66, t0 + 10000, t0 + 10090));
    ASSERT_TRUE(window.has_value());
    EXPECT_EQ(window->window_id, 1u);
    EXPECT_EQ(window->start_time, t0);
    EXPECT_EQ(window->end_time, t0 + 4000);
    EXPECT_TRUE(window->Has(Modality::KEYSTROKE));
    EXPECT_EQ(window->Block(Modality::KEYSTROKE).event_count, 5u);
    EXPECT_DOUBLE_EQ(window->Block(Modality::KEYSTROKE).values[0], 90.0);
    EXPECT_EQ(extractor.PendingEventCount(), 1u);
}

TEST_F(FeatureExtractorTest, CountTriggerCompletesWindowEarly) {
    config_.min_keystroke_events = 4;
    FeatureExtractor extractor(config_, "s1");
    const uint64_t t0 = testdata::kEpoch;

    std::optional<FeatureWindow> window;
    for (uint64_t i = 0; i < 4; ++i) {
        window = extractor.Push(BehavioralEvent::Keystroke(65, t0 + i * 200, t0 + i * 200 + 80));
    }
    ASSERT_TRUE(window.has_value());
    EXPECT_EQ(window->Block(Modality::KEYSTROKE).event_count, 4u);
    EXPECT_EQ(extractor.PendingEventCount(), 0u);
}

TEST_F(FeatureExtractorTest, NoTrailingPartialWindow) {
    auto events = testdata::GenerateEvents(testdata::GenuineStyle(), testdata::kEpoch, 35000, 7);
    WindowSequence sequence(events, config_, "s1");

    auto windows = sequence.Collect();

    // 35 s of input yields three complete 10 s windows; the last 5 s stay pending.
    EXPECT_EQ(windows.size(), 3u);
    for (const auto& window : windows) {
        EXPECT_LT(window.DurationMs(), config_.window_size_ms);
    }
}

TEST_F(FeatureExtractorTest, MissingModalityIsFlaggedNotFabricated) {
    FeatureExtractor extractor(config_, "s1");
    const uint64_t t0 = testdata::kEpoch;

    for (uint64_t i = 0; i < 6; ++i) {
        extractor.Push(BehavioralEvent::Keystroke(70, t0 + i * 500, t0 + i * 500 + 100));
    }
    extractor.Push(BehavioralEvent::MouseMove(10.0, 10.0, t0 + 3100));

    auto window = extractor.Push(BehavioralEvent::Keystroke(70, t0 + 12000, t0 + 12100));
    ASSERT_TRUE(window.has_value());
    EXPECT_TRUE(window->Has(Modality::KEYSTROKE));
    EXPECT_FALSE(window->Has(Modality::MOUSE));

    const FeatureBlock& mouse = window->Block(Modality::MOUSE);
    EXPECT_EQ(mouse.event_count, 1u);
    ASSERT_EQ(mouse.values.size(), kMouseFeatureCount);
    for (double v : mouse.values) {
        EXPECT_TRUE(std::isnan(v));
    }
}

TEST_F(FeatureExtractorTest, OutOfOrderEventsAreDropped) {
    FeatureExtractor extractor(config_, "s1");
    const uint64_t t0 = testdata::kEpoch;

    extractor.Push(BehavioralEvent::Keystroke(65, t0 + 1000, t0 + 1080));
    extractor.Push(BehavioralEvent::Keystroke(65, t0 + 500, t0 + 580));

    EXPECT_EQ(extractor.DroppedCount(), 1u);
    EXPECT_EQ(extractor.PendingEventCount(), 1u);
}

TEST_F(FeatureExtractorTest, NonFiniteEventsAreDropped) {
    FeatureExtractor extractor(config_, "s1");
    const uint64_t t0 = testdata::kEpoch;
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    for (uint64_t i = 0; i < 15; ++i) {
        extractor.Push(BehavioralEvent::MouseMove(100.0 + 10.0 * i, 200.0, t0 + i * 100));
    }
    EXPECT_FALSE(extractor.Push(BehavioralEvent::MouseMove(nan, 200.0, t0 + 1600)));
    EXPECT_FALSE(extractor.Push(BehavioralEvent::MouseMove(300.0, inf, t0 + 1700)));
    EXPECT_FALSE(extractor.Push(BehavioralEvent::Scroll(300.0, 200.0, t0 + 1800, nan)));
    EXPECT_EQ(extractor.DroppedCount(), 3u);
    EXPECT_EQ(extractor.PendingEventCount(), 15u);

    auto window = extractor.Push(BehavioralEvent::MouseMove(400.0, 200.0, t0 + 10000));
    ASSERT_TRUE(window.has_value());
    ASSERT_TRUE(window->Has(Modality::MOUSE));
    for (double value : window->Block(Modality::MOUSE).values) {
        EXPECT_TRUE(std::isfinite(value));
    }
}

TEST_F(FeatureExtractorTest, RewindReplaysIdenticalWindows) {
    auto events = testdata::GenerateEvents(testdata::GenuineStyle(), testdata::kEpoch, 60000, 11);
    WindowSequence sequence(events, config_, "s1");

    auto first = sequence.Collect();
    sequence.Rewind();
    auto second = sequence.Collect();

    ASSERT_EQ(first.size(), second.size());
    ASSERT_FALSE(first.empty());
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_TRUE(first[i] == second[i]) << "window " << i;
    }
}

TEST_F(FeatureExtractorTest, SequenceIsLazy) {
    auto events = testdata::GenerateEvents(testdata::GenuineStyle(), testdata::kEpoch, 40000, 3);
    WindowSequence sequence(events, config_, "s1");

    auto first = sequence.Next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->window_id, 1u);

    auto second = sequence.Next();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->window_id, 2u);
    EXPECT_GE(second->start_time, first->end_time);
}

TEST_F(FeatureExtractorTest, KeystrokeRhythmFeatures) {
    FeatureExtractor extractor(config_, "s1");
    const uint64_t t0 = testdata::kEpoch;

    // Holds of 100 ms, presses every 300 ms: flight 200 ms, digraph 300 ms.
    for (uint64_t i = 0; i < 5; ++i) {
        extractor.Push(BehavioralEvent::Keystroke(65, t0 + i * 300, t0 + i * 300 + 100));
    }
    auto window = extractor.Push(BehavioralEvent::Keystroke(8, t0 + 20000, t0 + 20100));
    ASSERT_TRUE(window.has_value());

    const auto& values = window->Block(Modality::KEYSTROKE).values;
    ASSERT_EQ(values.size(), kKeystrokeFeatureCount);
    EXPECT_DOUBLE_EQ(values[0], 100.0);   // hold mean
    EXPECT_DOUBLE_EQ(values[1], 0.0);     // hold std
    EXPECT_DOUBLE_EQ(values[2], 200.0);   // flight mean
    EXPECT_DOUBLE_EQ(values[4], 300.0);   // digraph mean
    EXPECT_DOUBLE_EQ(values[7], 0.0);     // no corrections
}
