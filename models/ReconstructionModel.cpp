#include "models/ReconstructionModel.hpp"
#include <algorithm>
#include <cmath>

namespace vigil {

namespace {

constexpr size_t kPowerIterations = 200;
constexpr double kMinEigenvalue = 1e-9;
constexpr double kMinErrorReference = 1e-6;
constexpr double kErrorPercentile = 0.95;

using Matrix = std::vector<std::vector<double>>;

Matrix Covariance(const Matrix& z) {
    const size_t dim = z.front().size();
    Matrix cov(dim, std::vector<double>(dim, 0.0));
    for (const auto& row : z) {
        for (size_t i = 0; i < dim; ++i) {
            for (size_t j = i; j < dim; ++j) {
                cov[i][j] += row[i] * row[j];
            }
        }
    }
    const double n = static_cast<double>(z.size());
    for (size_t i = 0; i < dim; ++i) {
        for (size_t j = i; j < dim; ++j) {
            cov[i][j] /= n;
            cov[j][i] = cov[i][j];
        }
    }
    return cov;
}

std::vector<double> Multiply(const Matrix& m, const std::vector<double>& v) {
    std::vector<double> out(m.size(), 0.0);
    for (size_t i = 0; i < m.size(); ++i) {
        out[i] = Dot(m[i], v);
    }
    return out;
}

bool Normalize(std::vector<double>& v) {
    const double norm = std::sqrt(Dot(v, v));
    if (norm < 1e-12) return false;
    for (auto& x : v) x /= norm;
    return true;
}

// Leading eigenvector by power iteration; deterministic start vector.
bool LeadingEigenvector(const Matrix& m, std::vector<double>& v, double& eigenvalue) {
    const size_t dim = m.size();
    v.assign(dim, 0.0);
    for (size_t i = 0; i < dim; ++i) {
        v[i] = 1.0 + 0.1 * static_cast<double>(i);
    }
    if (!Normalize(v)) return false;

    for (size_t it = 0; it < kPowerIterations; ++it) {
        std::vector<double> next = Multiply(m, v);
        if (!Normalize(next)) return false;
        v = std::move(next);
    }
    eigenvalue = Dot(v, Multiply(m, v));
    return eigenvalue > kMinEigenvalue;
}

} // namespace

ReconstructionParams ReconstructionModel::Fit(const std::vector<std::vector<double>>& rows, const ModelConfig& config) {
    ReconstructionParams params;
    params.standardizer = Standardizer::Fit(rows);
    if (rows.empty()) {
        return params;
    }

    Matrix z;
    z.reserve(rows.size());
    for (const auto& row : rows) {
        z.push_back(params.standardizer.Apply(row));
    }

    const size_t dim = params.standardizer.Dimension();
    size_t k = std::min(config.pca_components, dim > 1 ? dim - 1 : 0);
    k = std::min(k, rows.size() > 1 ? rows.size() - 1 : 0);

    Matrix cov = Covariance(z);
    for (size_t c = 0; c < k; ++c) {
        std::vector<double> v;
        double lambda = 0.0;
        if (!LeadingEigenvector(cov, v, lambda)) {
            break;
        }
        params.components.push_back(v);
        for (size_t i = 0; i < dim; ++i) {
            for (size_t j = 0; j < dim; ++j) {
                cov[i][j] -= lambda * v[i] * v[j];
            }
        }
    }

    std::vector<double> errors;
    errors.reserve(rows.size());
    for (const auto& row : rows) {
        errors.push_back(ReconstructionError(params, row));
    }
    params.error_reference = std::max(Quantile(errors, kErrorPercentile), kMinErrorReference);
    return params;
}

double ReconstructionModel::ReconstructionError(const ReconstructionParams& params, const std::vector<double>& x) {
    std::vector<double> z = params.standardizer.Apply(x);
    std::vector<double> residual = z;
    for (const auto& component : params.components) {
        const double coefficient = Dot(component, z);
        for (size_t i = 0; i < residual.size(); ++i) {
            residual[i] -= coefficient * component[i];
        }
    }
    return Dot(residual, residual);
}

double ReconstructionModel::Score(const ReconstructionParams& params, const ModalityInput& input) {
    const double error = ReconstructionError(params, input.current);
    return params.error_reference / (params.error_reference + error);
}

} // namespace vigil
