#pragma once

#include "glamcast/families/family.hpp"

namespace glamcast::families {

/**
 * @class BetaFamily
 * @brief Proportions in [0, 1] with logit link.
 *
 * The dispersion proxy kappa = logistic(raw) sets the variance to
 * kappa * variance_max. For every row kappa is clamped below the value at
 * which that variance would reach mean * (1 - mean), the largest variance a
 * beta distribution with that mean can have.
 */
class BetaFamily final : public Family {
public:
	static constexpr double kDefaultVarianceMax = 0.25;

	explicit BetaFamily(double variance_max = kDefaultVarianceMax);

	FamilyKind kind() const override {
		return FamilyKind::Beta;
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
		return 1.0;
	}

	double varianceMax() const {
		return variance_max_;
	}

	/// Row-wise clamped dispersion proxy for a mean.
	double effectiveKappa(double kappa, double mu) const;

private:
	double variance_max_;
};

} // namespace glamcast::families
