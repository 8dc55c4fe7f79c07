#include "glamcast/fitting/posterior_fitter.hpp"
#include "glamcast/core/errors.hpp"
#include "glamcast/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace glamcast::fitting {

namespace {

// Gradient norm per observation, in normalized parameter space, at which a
// non-converged run is still accepted.
constexpr double kRelaxedGradientTolerance = 1e-3;
constexpr double kHessianStep = 1e-5;

} // namespace

PosteriorFitter::PosteriorFitter(std::shared_ptr<const IPosteriorBackend> backend) : backend_(std::move(backend)) {
	if (!backend_) {
		throw std::invalid_argument("PosteriorFitter requires a backend.");
	}
}

Eigen::MatrixXd PosteriorFitter::numericHessian(const LogPosterior &posterior, const Eigen::VectorXd &theta) {
	const auto n = theta.size();
	Eigen::MatrixXd hessian(n, n);
	Eigen::VectorXd forward_gradient(n);
	Eigen::VectorXd backward_gradient(n);
	Eigen::VectorXd point = theta;
	for (Eigen::Index j = 0; j < n; ++j) {
		const double step = kHessianStep * std::max(1.0, std::abs(theta[j]));
		point[j] = theta[j] + step;
		posterior(point, forward_gradient);
		point[j] = theta[j] - step;
		posterior(point, backward_gradient);
		point[j] = theta[j];
		hessian.col(j) = (forward_gradient - backward_gradient) / (2.0 * step);
	}
	return 0.5 * (hessian + hessian.transpose());
}

FitResult PosteriorFitter::fit(const design::DesignMatrix &design, const design::TrendBasis &basis,
                               const families::Family &family, const PriorSpec &priors, const FitData &data,
                               const FitOptions &options) const {
	if (options.mode != FitMode::MaximumAPosteriori) {
		throw core::ConfigurationError(core::ConfigErrorKind::InvalidParameter, "Only MAP fitting is supported.");
	}
	const LogPosterior posterior(basis, design, family, priors, data);
	const Eigen::VectorXd start = posterior.initialPoint();

	const auto objective = [&posterior](const Eigen::VectorXd &theta, Eigen::VectorXd &gradient) {
		return posterior(theta, gradient);
	};
	const OptimizationOutcome outcome = backend_->minimize(objective, start, options.max_iterations);

	if (outcome.mode.size() != start.size() || !outcome.mode.allFinite()) {
		throw core::OptimizationError("Optimizer returned an invalid parameter vector: " + outcome.message);
	}
	Eigen::VectorXd gradient;
	const double objective_value = posterior(outcome.mode, gradient);
	if (!std::isfinite(objective_value) || !gradient.allFinite()) {
		throw core::OptimizationError("Log posterior is not finite at the optimizer result.");
	}
	if (!outcome.converged) {
		const double gradient_norm = gradient.cwiseAbs().maxCoeff();
		const auto rows = static_cast<double>(std::max<std::size_t>(1, data.y.size()));
		const double tolerance = kRelaxedGradientTolerance * rows;
		if (gradient_norm > tolerance) {
			throw core::OptimizationError("Optimizer did not converge (" + outcome.message +
			                              "), gradient norm " + std::to_string(gradient_norm));
		}
		GLAMCAST_WARN("Optimizer stopped early ({}), accepting mode with gradient norm {}", outcome.message,
		              gradient_norm);
	}

	FitResult result;
	result.map = posterior.layout().unpack(outcome.mode);
	result.log_posterior = -objective_value;
	result.iterations = outcome.iterations;
	GLAMCAST_DEBUG("MAP fit finished after {} iterations, log posterior {}", result.iterations,
	               result.log_posterior);

	if (options.use_laplace) {
		const Eigen::MatrixXd hessian = numericHessian(posterior, outcome.mode);
		std::mt19937_64 rng(options.seed);
		const auto samples = backend_->sampleGaussian(outcome.mode, hessian, options.laplace_samples, rng);
		result.draws.reserve(samples.size());
		for (const auto &sample : samples) {
			result.draws.push_back(posterior.layout().unpack(sample));
		}
		GLAMCAST_DEBUG("Drew {} Laplace samples", result.draws.size());
	}
	return result;
}

} // namespace glamcast::fitting
