#pragma once

#include "glamcast/families/family.hpp"

#include <limits>

namespace glamcast::families {

/**
 * @class NormalFamily
 * @brief Gaussian noise with identity link.
 *
 * The standard deviation is `link_scale * exp(raw)`; the raw value carries a
 * half-normal prior on the normalized standard deviation.
 */
class NormalFamily final : public Family {
public:
	FamilyKind kind() const override {
		return FamilyKind::Normal;
	}
	bool isDiscrete() const override {
		return false;
	}
	bool hasDispersion() const override {
		return true;
	}

	void validateObservations(const std::vector<double> &values) const override;

	double linkData(double value) const override {
		return value;
	}
	double mean(double linked) const override {
		return linked;
	}
	double link(double value) const override {
		return value;
	}

	double initialDispersion(const std::vector<double> &values, const std::vector<double> &linked,
	                         const design::LinkScaling &scaling) const override;
	double dispersion(double raw, const design::LinkScaling &scaling) const override;
	double logDispersionPrior(double raw, double prior_scale, double &gradient) const override;
	LikelihoodTerm logLikelihood(double value, double linked, double raw,
	                             const design::LinkScaling &scaling) const override;
	double quantile(double level, double linked, double raw, const design::LinkScaling &scaling) const override;

	double lowerBound() const override {
		return -std::numeric_limits<double>::infinity();
	}
	double upperBound() const override {
		return std::numeric_limits<double>::infinity();
	}
};

} // namespace glamcast::families
