#pragma once

#include "glamcast/fitting/backend.hpp"
#include "glamcast/fitting/log_posterior.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace glamcast::fitting {

enum class FitMode {
	MaximumAPosteriori
};

struct FitOptions {
	FitMode mode = FitMode::MaximumAPosteriori;
	bool use_laplace = false;
	int laplace_samples = 500;
	std::uint64_t seed = 0;
	int max_iterations = 1000;
};

/**
 * @struct FitResult
 * @brief Posterior representation produced by a fit.
 */
struct FitResult {
	FittedParameters map;
	/// Laplace draws; empty unless sampling was requested.
	std::vector<FittedParameters> draws;
	double log_posterior = 0.0;
	int iterations = 0;
};

/**
 * @class PosteriorFitter
 * @brief Drives MAP optimization and optional Laplace sampling.
 *
 * The fitter owns no model state: it evaluates the posterior of the supplied
 * inputs and either returns a complete result or throws.
 */
class PosteriorFitter {
public:
	explicit PosteriorFitter(std::shared_ptr<const IPosteriorBackend> backend = std::make_shared<LbfgsBackend>());

	/**
	 * @throws core::OptimizationError when the optimizer does not reach a usable mode.
	 * @throws core::NumericalError when Laplace sampling is requested and the curvature is unusable.
	 */
	FitResult fit(const design::DesignMatrix &design, const design::TrendBasis &basis,
	              const families::Family &family, const PriorSpec &priors, const FitData &data,
	              const FitOptions &options) const;

	/// Central-difference Hessian of the negative log posterior.
	static Eigen::MatrixXd numericHessian(const LogPosterior &posterior, const Eigen::VectorXd &theta);

private:
	std::shared_ptr<const IPosteriorBackend> backend_;
};

} // namespace glamcast::fitting
