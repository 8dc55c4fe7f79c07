#pragma once

#include "glamcast/families/family.hpp"

namespace glamcast::families {

/// Successes out of a fixed number of trials, logit link on the success probability.
class BinomialFamily final : public Family {
public:
	explicit BinomialFamily(int capacity);

	FamilyKind kind() const override {
		return FamilyKind::Binomial;
	}
	bool isDiscrete() const override {
		return true;
	}

	void validateObservations(const std::vector<double> &values) const override;

	double linkData(double value) const override;
	double mean(double linked) const override;
	double link(double value) const override;

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
