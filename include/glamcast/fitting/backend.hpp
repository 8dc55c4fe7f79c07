#pragma once

#include "glamcast/optimization/lbfgs_optimizer.hpp"

#include <Eigen/Dense>
#include <random>
#include <string>
#include <vector>

namespace glamcast::fitting {

/// Outcome of a minimization run.
struct OptimizationOutcome {
	Eigen::VectorXd mode;
	double objective = 0.0;
	int iterations = 0;
	bool converged = false;
	std::string message;
};

/**
 * @class IPosteriorBackend
 * @brief Numeric capabilities the fitting orchestrator relies on.
 *
 * A backend minimizes the negative log posterior and draws samples from
 * the Gaussian approximation at its mode.
 */
class IPosteriorBackend {
public:
	virtual ~IPosteriorBackend() = default;

	virtual OptimizationOutcome minimize(const optimization::LBFGSOptimizer::Objective &objective,
	                                     const Eigen::VectorXd &start, int max_iterations) const = 0;

	/**
	 * @brief Draws from N(mode, hessian^-1).
	 * @param hessian Curvature of the negative log posterior at the mode.
	 * @throws core::NumericalError when the curvature is not positive definite.
	 */
	virtual std::vector<Eigen::VectorXd> sampleGaussian(const Eigen::VectorXd &mode, const Eigen::MatrixXd &hessian,
	                                                    int draws, std::mt19937_64 &rng) const = 0;
};

/**
 * @class LbfgsBackend
 * @brief Default backend: L-BFGS minimization and Cholesky-based Gaussian draws.
 *
 * A curvature matrix that fails the Cholesky factorization receives a
 * growing diagonal jitter for a bounded number of attempts.
 */
class LbfgsBackend final : public IPosteriorBackend {
public:
	OptimizationOutcome minimize(const optimization::LBFGSOptimizer::Objective &objective,
	                             const Eigen::VectorXd &start, int max_iterations) const override;

	std::vector<Eigen::VectorXd> sampleGaussian(const Eigen::VectorXd &mode, const Eigen::MatrixXd &hessian,
	                                            int draws, std::mt19937_64 &rng) const override;
};

} // namespace glamcast::fitting
