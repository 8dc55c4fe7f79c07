#include "glamcast/fitting/backend.hpp"
#include "glamcast/core/errors.hpp"
#include "glamcast/utils/logging.hpp"

#include <algorithm>
#include <cmath>

namespace glamcast::fitting {

namespace {

constexpr int kMaxJitterAttempts = 6;

} // namespace

OptimizationOutcome LbfgsBackend::minimize(const optimization::LBFGSOptimizer::Objective &objective,
                                           const Eigen::VectorXd &start, int max_iterations) const {
	optimization::LBFGSOptimizer::Options options;
	options.max_iterations = max_iterations;
	const auto result = optimization::LBFGSOptimizer::minimize(objective, start, options);

	OptimizationOutcome outcome;
	outcome.mode = result.x;
	outcome.objective = result.fx;
	outcome.iterations = result.iterations;
	outcome.converged = result.converged;
	outcome.message = result.message;
	return outcome;
}

std::vector<Eigen::VectorXd> LbfgsBackend::sampleGaussian(const Eigen::VectorXd &mode, const Eigen::MatrixXd &hessian,
                                                          int draws, std::mt19937_64 &rng) const {
	if (hessian.rows() != mode.size() || hessian.cols() != mode.size()) {
		throw std::invalid_argument("Hessian must be square and match the mode.");
	}
	if (!hessian.allFinite()) {
		throw core::NumericalError("Curvature at the mode contains non-finite entries.");
	}

	const Eigen::MatrixXd symmetric = 0.5 * (hessian + hessian.transpose());
	const double base = std::max(symmetric.diagonal().cwiseAbs().mean(), 1.0);
	Eigen::LLT<Eigen::MatrixXd> cholesky(symmetric);
	double jitter = 0.0;
	for (int attempt = 0; cholesky.info() != Eigen::Success; ++attempt) {
		if (attempt == kMaxJitterAttempts) {
			throw core::NumericalError("Curvature at the mode is not positive definite; Laplace sampling failed.");
		}
		jitter = base * std::pow(10.0, -8 + 2 * attempt);
		GLAMCAST_WARN("Hessian not positive definite, adding jitter {}", jitter);
		cholesky.compute(symmetric + jitter * Eigen::MatrixXd::Identity(mode.size(), mode.size()));
	}

	// hessian = U^T U, so U^-1 z has covariance hessian^-1.
	const auto upper = cholesky.matrixU();
	std::normal_distribution<double> standard_normal(0.0, 1.0);
	std::vector<Eigen::VectorXd> samples;
	samples.reserve(static_cast<std::size_t>(std::max(draws, 0)));
	for (int d = 0; d < draws; ++d) {
		Eigen::VectorXd z(mode.size());
		for (Eigen::Index i = 0; i < z.size(); ++i) {
			z[i] = standard_normal(rng);
		}
		samples.emplace_back(mode + upper.solve(z));
	}
	return samples;
}

} // namespace glamcast::fitting
