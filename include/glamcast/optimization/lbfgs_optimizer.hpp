#pragma once

#include <Eigen/Dense>
#include <functional>
#include <string>

namespace glamcast::optimization {

/**
 * @brief L-BFGS-B optimizer for smooth objectives with optional box constraints
 *
 * Wrapper around the LBFGS++ library. Bounds may be infinite for
 * unconstrained coordinates.
 */
class LBFGSOptimizer {
public:
	using Objective = std::function<double(const Eigen::VectorXd &, Eigen::VectorXd &)>;

	struct Result {
		Eigen::VectorXd x;     // Final parameters
		double fx = 0.0;       // Final objective value
		int iterations = 0;    // Number of iterations
		bool converged = false;
		std::string message;   // Status message
	};

	struct Options {
		int max_iterations;
		double epsilon;           // Absolute gradient tolerance
		double epsilon_rel;       // Gradient tolerance relative to |x|
		int m;                    // Number of corrections (L-BFGS memory)
		double ftol;              // Sufficient decrease tolerance of the line search
		int max_linesearch;

		Options()
		    : max_iterations(1000), epsilon(1e-6), epsilon_rel(1e-6), m(10), ftol(1e-4), max_linesearch(50) {
		}
	};

	/**
	 * @brief Minimize objective function with box constraints
	 *
	 * @param objective Function that computes f(x) and writes the gradient
	 * @param x0 Initial parameters
	 * @param lower Lower bounds for each parameter
	 * @param upper Upper bounds for each parameter
	 * @param options Optimization options
	 * @return Result containing the last iterate and diagnostics; never throws on solver failure
	 */
	static Result minimize(const Objective &objective, const Eigen::VectorXd &x0, const Eigen::VectorXd &lower,
	                       const Eigen::VectorXd &upper, const Options &options = Options());

	/// Unconstrained minimization (infinite bounds).
	static Result minimize(const Objective &objective, const Eigen::VectorXd &x0,
	                       const Options &options = Options());
};

} // namespace glamcast::optimization
