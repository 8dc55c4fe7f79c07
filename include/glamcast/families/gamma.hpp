#pragma once

#include "glamcast/families/family.hpp"

#include <limits>

namespace glamcast::families {

/**
 * @class GammaFamily
 * @brief Positive continuous observations with log link.
 *
 * With kappa = exp(raw) the shape is kappa^2 and the scale mean / kappa^2,
 * i.e. a coefficient of variation of 1 / kappa. Unlike the beta family the
 * implied variance is not bounded by a maximum.
 */
class GammaFamily final : public Family {
public:
	FamilyKind kind() const override {
		return FamilyKind::Gamma;
	}
	bool isDiscrete() const override {
		return false;
	}
	bool hasDispersion() const override {
		return true;
	}

	void validateObservations(const std::vector<double> &values) const override;

	double linkData(double value) const override;
	double mean(double linked) const override;
	double link(double value) const override;

	double initialDispersion(const std::vector<double> &values, const std::vector<double> &linked,
	                         const design::LinkScaling &scaling) const override;
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
