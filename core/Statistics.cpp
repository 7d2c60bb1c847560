#include "core/Statistics.hpp"
#include <algorithm>
#include <cmath>

namespace vigil {

static constexpr double kMinScale = 1e-6;

void RunningStats::Add(double x) {
    if (!std::isfinite(x)) return;
    ++count_;
    const double delta = x - mean_;
    mean_ += delta / static_cast<double>(count_);
    m2_ += delta * (x - mean_);
}

void RunningStats::Remove(double x) {
    if (!std::isfinite(x)) return;
    if (count_ <= 1) {
        Reset();
        return;
    }
    const double n = static_cast<double>(count_);
    const double old_mean = mean_;
    mean_ = (n * old_mean - x) / (n - 1.0);
    m2_ -= (x - old_mean) * (x - mean_);
    if (m2_ < 0.0) m2_ = 0.0;
    --count_;
}

void RunningStats::Reset() {
    count_ = 0;
    mean_ = 0.0;
    m2_ = 0.0;
}

double RunningStats::Variance() const {
    if (count_ < 2) return 0.0;
    return m2_ / static_cast<double>(count_);
}

double RunningStats::StdDev() const {
    return std::sqrt(Variance());
}

double Quantile(std::vector<double> v, double q) {
    if (v.empty()) return 0.0;
    q = std::clamp(q, 0.0, 1.0);

    const double pos = q * static_cast<double>(v.size() - 1);
    const size_t k = static_cast<size_t>(std::floor(pos));
    const size_t k2 = std::min(k + 1, v.size() - 1);
    const double frac = pos - static_cast<double>(k);

    std::nth_element(v.begin(), v.begin() + k, v.end());
    const double a = v[k];
    if (k2 == k) return a;

    std::nth_element(v.begin(), v.begin() + k2, v.end());
    const double b = v[k2];
    return a + frac * (b - a);
}

double Median(std::vector<double> values) {
    return Quantile(std::move(values), 0.5);
}

double Sigmoid(double z) {
    if (z >= 40.0) return 1.0;
    if (z <= -40.0) return 0.0;
    return 1.0 / (1.0 + std::exp(-z));
}

double Clamp01(double x) {
    if (!std::isfinite(x)) return 0.0;
    return std::clamp(x, 0.0, 1.0);
}

double SquaredDistance(const std::vector<double>& a, const std::vector<double>& b) {
    const size_t n = std::min(a.size(), b.size());
    double s = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double d = a[i] - b[i];
        s += d * d;
    }
    return s;
}

double Distance(const std::vector<double>& a, const std::vector<double>& b) {
    return std::sqrt(SquaredDistance(a, b));
}

double Dot(const std::vector<double>& a, const std::vector<double>& b) {
    const size_t n = std::min(a.size(), b.size());
    double s = 0.0;
    for (size_t i = 0; i < n; ++i) s += a[i] * b[i];
    return s;
}

Standardizer Standardizer::Fit(const std::vector<std::vector<double>>& rows) {
    Standardizer st;
    if (rows.empty()) return st;

    const size_t dim = rows.front().size();
    std::vector<RunningStats> stats(dim);
    for (const auto& row : rows) {
        for (size_t i = 0; i < dim && i < row.size(); ++i) {
            stats[i].Add(row[i]);
        }
    }

    st.mean.resize(dim);
    st.scale.resize(dim);
    for (size_t i = 0; i < dim; ++i) {
        st.mean[i] = stats[i].Mean();
        const double sd = stats[i].StdDev();
        st.scale[i] = sd > kMinScale ? sd : 1.0;
    }
    return st;
}

std::vector<double> Standardizer::Apply(const std::vector<double>& x) const {
    std::vector<double> z(mean.size(), 0.0);
    for (size_t i = 0; i < mean.size() && i < x.size(); ++i) {
        z[i] = (x[i] - mean[i]) / scale[i];
    }
    return z;
}

} // namespace vigil
