#pragma once

#include <cstddef>
#include <vector>

namespace vigil {

// Welford running mean/variance. Remove() undoes a previous Add() of the same
// value, which lets a bounded window evict its oldest sample in O(1).
// Non-finite values are ignored by both.
class RunningStats {
public:
    void Add(double x);
    void Remove(double x);
    void Reset();

    size_t Count() const { return count_; }
    double Mean() const { return count_ > 0 ? mean_ : 0.0; }
    double Variance() const;        // population variance
    double StdDev() const;

private:
    size_t count_{0};
    double mean_{0.0};
    double m2_{0.0};
};

// Interpolated quantile, q clamped to [0,1]. Empty input yields 0.
double Quantile(std::vector<double> values, double q);
double Median(std::vector<double> values);

double Sigmoid(double z);
double Clamp01(double x);

double SquaredDistance(const std::vector<double>& a, const std::vector<double>& b);
double Distance(const std::vector<double>& a, const std::vector<double>& b);
double Dot(const std::vector<double>& a, const std::vector<double>& b);

// Per-feature z-scoring fitted on training rows. Constant features get unit
// scale so they pass through centered.
struct Standardizer {
    std::vector<double> mean;
    std::vector<double> scale;

    static Standardizer Fit(const std::vector<std::vector<double>>& rows);
    std::vector<double> Apply(const std::vector<double>& x) const;
    size_t Dimension() const { return mean.size(); }
};

} // namespace vigil
