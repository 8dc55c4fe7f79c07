#pragma once

#include "glamcast/families/family.hpp"

#include <limits>

namespace glamcast::families {

/**
 * @class NegativeBinomialFamily
 * @brief Over-dispersed counts with log link.
 *
 * The dispersion proxy kappa = logistic(raw) sets the variance to
 * mean / kappa, so kappa near 1 approaches the Poisson case.
 */
class NegativeBinomialFamily final : public Family {
public:
	FamilyKind kind() const override {
		return FamilyKind::NegativeBinomial;
	}
	bool isDiscrete() const override {
		return true;
	}
	bool hasDispersion() const override {
		return true;
	}

	void validateObservations(const std::vector<double> &values) const override;

	double linkData(double value) const override;
	double mean(double linked) const override;
	double link(double value) const override;

	double dispersion(double raw, const design::LinkScaling &scaling) const override;
	LikelihoodTerm logLikelihood(double value, double linked, double raw,
	                             const design::LinkScaling &scaling) const override;
	double quantile(double level, double linked, double raw, const design::LinkScaling &scaling) const override;

	double lowerBound() const override {
		return 0.0;
	}
	double upperBound() const override {
		return std::numeric_limits<double>::infinity();
	}
};

} // namespace glamcast::families
