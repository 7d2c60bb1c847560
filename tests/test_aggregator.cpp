#include <gtest/gtest.h>
#include "core/Errors.hpp"
#include "engine/Aggregator.hpp"

using namespace vigil;

class AggregatorTest : public ::testing::Test {
protected:
    std::map<ModelKind, double> Uniform(double value) {
        std::map<ModelKind, double> scores;
        for (ModelKind kind : kAllModelKinds) {
            scores[kind] = value;
        }
        return scores;
    }

    ThresholdConfig thresholds_;
    ModelConfig models_;
    CalibrationConfig calibration_;
};

TEST_F(AggregatorTest, UniformScoresAggregateToThatScore) {
    Aggregator aggregator(thresholds_, models_);

    AggregateResult result = aggregator.Evaluate(Uniform(0.9), {});

    EXPECT_NEAR(result.aggregate, 0.9, 1e-12);
    EXPECT_EQ(result.model_count, 6u);
    EXPECT_TRUE(result.genuine);
    EXPECT_FALSE(result.severe_anomaly);
    EXPECT_EQ(result.consecutive_low, 0u);
}

TEST_F(AggregatorTest, WeightsAreRenormalizedOverPresentModels) {
    models_.weights[ModelKind::SEQUENCE] = 3.0;
    models_.weights[ModelKind::BOUNDARY] = 1.0;
    Aggregator aggregator(thresholds_, models_);

    std::map<ModelKind, double> scores = {
        {ModelKind::SEQUENCE, 0.8},
        {ModelKind::BOUNDARY, 0.4},
    };

    EXPECT_NEAR(aggregator.Combine(scores, {}), (3.0 * 0.8 + 1.0 * 0.4) / 4.0, 1e-12);
}

TEST_F(AggregatorTest, ZeroScoresRaiseUntrained) {
    Aggregator aggregator(thresholds_, models_);

    EXPECT_THROW(aggregator.Combine({}, {}), ModelUntrainedError);
    EXPECT_THROW(aggregator.Evaluate({}, {}), ModelUntrainedError);
}

TEST_F(AggregatorTest, AggregateStaysInUnitInterval) {
    Aggregator aggregator(thresholds_, models_);
    TransformSet transforms;
    transforms[ModelKind::SEQUENCE] = CalibrationTransform{10.0, 0.5};
    transforms[ModelKind::ISOLATION] = CalibrationTransform{10.0, -5.0};

    std::map<ModelKind, double> scores = {
        {ModelKind::SEQUENCE, 0.9},
        {ModelKind::ISOLATION, 0.1},
    };
    std::map<ModelKind, double> calibrated;
    const double aggregate = aggregator.Combine(scores, transforms, &calibrated);

    EXPECT_DOUBLE_EQ(calibrated[ModelKind::SEQUENCE], 1.0);
    EXPECT_DOUBLE_EQ(calibrated[ModelKind::ISOLATION], 0.0);
    EXPECT_GE(aggregate, 0.0);
    EXPECT_LE(aggregate, 1.0);
}

TEST_F(AggregatorTest, TransformMapsPercentilesOntoFloorAndOne) {
    std::vector<double> raw;
    for (int i = 0; i <= 100; ++i) {
        raw.push_back(0.2 + 0.004 * i); // 0.2 .. 0.6
    }

    CalibrationTransform transform = CalibrationTransform::Fit(raw, calibration_);

    EXPECT_NEAR(transform.Apply(0.22), calibration_.calibration_floor, 1e-9); // 5th percentile
    EXPECT_NEAR(transform.Apply(0.58), 1.0, 1e-9);                            // 95th percentile
    EXPECT_DOUBLE_EQ(transform.Apply(0.0), 0.0);
    EXPECT_DOUBLE_EQ(transform.Apply(0.9), 1.0);
}

TEST_F(AggregatorTest, DegenerateCalibrationKeepsRawScores) {
    CalibrationTransform transform = CalibrationTransform::Fit({0.2, 0.2, 0.2, 0.2}, calibration_);

    EXPECT_DOUBLE_EQ(transform.scale, 1.0);
    EXPECT_DOUBLE_EQ(transform.offset, 0.0);
    EXPECT_DOUBLE_EQ(transform.Apply(0.0), 0.0);
    EXPECT_DOUBLE_EQ(transform.Apply(0.2), 0.2);
}

TEST_F(AggregatorTest, DegenerateCalibrationNeverPassesZeroScore) {
    TransformSet transforms;
    for (ModelKind kind : kAllModelKinds) {
        transforms[kind] = CalibrationTransform::Fit({0.2, 0.2, 0.2, 0.2}, calibration_);
    }
    Aggregator aggregator(thresholds_, models_);

    AggregateResult result = aggregator.Evaluate(Uniform(0.0), transforms);

    EXPECT_DOUBLE_EQ(result.aggregate, 0.0);
    EXPECT_FALSE(result.genuine);
    EXPECT_TRUE(result.severe_anomaly);
}

TEST_F(AggregatorTest, ConsecutiveLowCounterResetsOnGenuineWindow) {
    Aggregator aggregator(thresholds_, models_);

    EXPECT_EQ(aggregator.Evaluate(Uniform(0.3), {}).consecutive_low, 1u);
    EXPECT_EQ(aggregator.Evaluate(Uniform(0.4), {}).consecutive_low, 2u);

    AggregateResult genuine = aggregator.Evaluate(Uniform(0.95), {});
    EXPECT_EQ(genuine.consecutive_low, 0u);

    aggregator.Evaluate(Uniform(0.3), {});
    aggregator.Evaluate(Uniform(0.4), {});
    AggregateResult third = aggregator.Evaluate(Uniform(0.5), {});
    EXPECT_EQ(third.consecutive_low, 3u);
    EXPECT_TRUE(third.consecutive_limit_reached);
}

TEST_F(AggregatorTest, UnscorableWindowCountsAsLow) {
    Aggregator aggregator(thresholds_, models_);

    aggregator.Evaluate(Uniform(0.3), {});
    AggregateResult result = aggregator.RecordUnscorable();

    EXPECT_EQ(result.consecutive_low, 2u);
    EXPECT_FALSE(result.genuine);
    EXPECT_EQ(result.model_count, 0u);
}

TEST_F(AggregatorTest, SevereAnomalyUsesInvertedScale) {
    Aggregator aggregator(thresholds_, models_);

    EXPECT_TRUE(aggregator.IsSevereAnomaly(0.15));
    EXPECT_TRUE(aggregator.IsSevereAnomaly(0.05));
    EXPECT_FALSE(aggregator.IsSevereAnomaly(0.3));
}
