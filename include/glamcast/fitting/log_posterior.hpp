#pragma once

#include "glamcast/design/changepoints.hpp"
#include "glamcast/design/design_matrix.hpp"
#include "glamcast/families/family.hpp"
#include "glamcast/fitting/parameters.hpp"

#include <Eigen/Dense>
#include <vector>

namespace glamcast::fitting {

/// Prior scales of every parameter group.
struct PriorSpec {
	double k_scale = 5.0;
	double m_scale = 5.0;
	double changepoint_prior_scale = 0.05;
	/// One normal prior scale per design-matrix column.
	std::vector<double> beta_scales;
	double dispersion_prior_scale = 3.0;
};

/// Observed metric values with the link scaling of the fit.
struct FitData {
	std::vector<double> y;
	design::LinkScaling link;
};

/**
 * @class LogPosterior
 * @brief Negative log posterior of the model and its analytic gradient.
 *
 * The linked predictor of row i is
 * `link.offset + link.scale * (trend_i + X_i beta)`. Rate adjustments get a
 * double-exponential prior (smoothed at the origin so the objective stays
 * differentiable) combined with a normal prior of the same scale.
 *
 * The object keeps references to its inputs; they must outlive it.
 */
class LogPosterior {
public:
	LogPosterior(const design::TrendBasis &basis, const design::DesignMatrix &design,
	             const families::Family &family, const PriorSpec &priors, const FitData &data);

	const ParameterLayout &layout() const {
		return layout_;
	}

	/// Negative log posterior; writes its gradient into @p gradient.
	double operator()(const Eigen::VectorXd &theta, Eigen::VectorXd &gradient) const;

	/// Log posterior (up to a constant) without the gradient.
	double logDensity(const Eigen::VectorXd &theta) const;

	/// Linked predictor for every training row.
	Eigen::VectorXd linkedPredictor(const Eigen::VectorXd &theta) const;

	/// Starting point: least-squares line through the linked data, zero elsewhere.
	Eigen::VectorXd initialPoint() const;

private:
	const design::TrendBasis &basis_;
	const design::DesignMatrix &design_;
	const families::Family &family_;
	const PriorSpec &priors_;
	const FitData &data_;
	ParameterLayout layout_;
};

} // namespace glamcast::fitting
