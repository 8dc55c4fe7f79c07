#include "glamcast/optimization/lbfgs_optimizer.hpp"
#include "glamcast/utils/logging.hpp"

#include <LBFGSB.h>
#include <limits>
#include <stdexcept>

namespace glamcast::optimization {

using namespace LBFGSpp;

LBFGSOptimizer::Result LBFGSOptimizer::minimize(const Objective &objective, const Eigen::VectorXd &x0,
                                                const Eigen::VectorXd &lower, const Eigen::VectorXd &upper,
                                                const Options &options) {
	if (lower.size() != x0.size() || upper.size() != x0.size()) {
		throw std::invalid_argument("Bounds must match the number of parameters.");
	}

	Result result;

	// Project initial point onto feasible region
	Eigen::VectorXd x = x0.cwiseMax(lower).cwiseMin(upper);

	LBFGSBParam<double> param;
	param.max_iterations = options.max_iterations;
	param.epsilon = options.epsilon;
	param.epsilon_rel = options.epsilon_rel;
	param.m = options.m;
	param.ftol = options.ftol;
	param.wolfe = 0.9;
	param.max_linesearch = options.max_linesearch;

	LBFGSBSolver<double> solver(param);

	auto wrapped = [&objective](const Eigen::VectorXd &point, Eigen::VectorXd &grad) {
		return objective(point, grad);
	};

	double fx = std::numeric_limits<double>::quiet_NaN();
	try {
		result.iterations = solver.minimize(wrapped, x, fx, lower, upper);
		result.converged = result.iterations < options.max_iterations;
		result.message = result.converged ? "Converged" : "Maximum number of iterations reached";
		GLAMCAST_DEBUG("[LBFGS] {} after {} iterations, f = {}", result.message, result.iterations, fx);
	} catch (const std::exception &e) {
		result.converged = false;
		result.message = std::string("Failed: ") + e.what();
		GLAMCAST_DEBUG("[LBFGS] {}", result.message);
	}

	// Ensure feasibility of the returned iterate
	result.x = x.cwiseMax(lower).cwiseMin(upper);
	result.fx = fx;
	return result;
}

LBFGSOptimizer::Result LBFGSOptimizer::minimize(const Objective &objective, const Eigen::VectorXd &x0,
                                                const Options &options) {
	const double inf = std::numeric_limits<double>::infinity();
	return minimize(objective, x0, Eigen::VectorXd::Constant(x0.size(), -inf),
	                Eigen::VectorXd::Constant(x0.size(), inf), options);
}

} // namespace glamcast::optimization
