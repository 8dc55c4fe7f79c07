#pragma once

#include "glamcast/families/family.hpp"

namespace glamcast::families {

/**
 * @class BetaBinomialFamily
 * @brief Over-dispersed successes out of a fixed number of trials.
 *
 * The success probability follows a beta distribution with mean
 * logistic(linked); kappa = logistic(raw) is its intra-class correlation,
 * so the variance is capacity * p (1 - p) (1 + (capacity - 1) kappa).
 */
class BetaBinomialFamily final : public Family {
public:
	explicit BetaBinomialFamily(int capacity);

	FamilyKind kind() const override {
		return FamilyKind::BetaBinomial;
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
		return static_cast<double>(capacity_);
	}

	int capacity() const {
		return capacity_;
	}

private:
	int capacity_;
};

} // namespace glamcast::families
