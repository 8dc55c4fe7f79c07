#pragma once

#include <Eigen/Dense>

namespace glamcast::fitting {

/**
 * @struct FittedParameters
 * @brief Model parameters in normalized space.
 */
struct FittedParameters {
	double k = 0.0;
	double m = 0.0;
	Eigen::VectorXd delta;
	Eigen::VectorXd beta;
	/// Unconstrained dispersion value; unused by families without dispersion.
	double dispersion_raw = 0.0;
};

/**
 * @class ParameterLayout
 * @brief Position of each parameter in the flat optimizer vector.
 *
 * Order: k, m, delta (one per changepoint), beta (one per design column),
 * then the raw dispersion when the family has one.
 */
class ParameterLayout {
public:
	ParameterLayout(Eigen::Index n_changepoints, Eigen::Index n_columns, bool has_dispersion)
	    : n_changepoints_(n_changepoints), n_columns_(n_columns), has_dispersion_(has_dispersion) {
	}

	static constexpr Eigen::Index kIndex = 0;
	static constexpr Eigen::Index mIndex = 1;

	Eigen::Index deltaOffset() const {
		return 2;
	}
	Eigen::Index betaOffset() const {
		return 2 + n_changepoints_;
	}
	Eigen::Index dispersionIndex() const {
		return 2 + n_changepoints_ + n_columns_;
	}
	Eigen::Index size() const {
		return dispersionIndex() + (has_dispersion_ ? 1 : 0);
	}

	Eigen::Index changepoints() const {
		return n_changepoints_;
	}
	Eigen::Index columns() const {
		return n_columns_;
	}
	bool hasDispersion() const {
		return has_dispersion_;
	}

	FittedParameters unpack(const Eigen::VectorXd &theta) const {
		FittedParameters params;
		params.k = theta[kIndex];
		params.m = theta[mIndex];
		params.delta = theta.segment(deltaOffset(), n_changepoints_);
		params.beta = theta.segment(betaOffset(), n_columns_);
		params.dispersion_raw = has_dispersion_ ? theta[dispersionIndex()] : 0.0;
		return params;
	}

	Eigen::VectorXd pack(const FittedParameters &params) const {
		Eigen::VectorXd theta(size());
		theta[kIndex] = params.k;
		theta[mIndex] = params.m;
		theta.segment(deltaOffset(), n_changepoints_) = params.delta;
		theta.segment(betaOffset(), n_columns_) = params.beta;
		if (has_dispersion_) {
			theta[dispersionIndex()] = params.dispersion_raw;
		}
		return theta;
	}

private:
	Eigen::Index n_changepoints_;
	Eigen::Index n_columns_;
	bool has_dispersion_;
};

} // namespace glamcast::fitting
