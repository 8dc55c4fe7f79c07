#pragma once

#include <algorithm>
#include <cmath>

namespace glamcast::families {

/// Proportions are kept this far from 0 and 1 before logit or quantile evaluation.
constexpr double kProportionEpsilon = 1e-6;

/// Bound on the linked predictor of exponential links, keeps exp() finite.
constexpr double kMaxLogLinked = 50.0;

inline double logistic(double x) {
	if (x >= 0.0) {
		return 1.0 / (1.0 + std::exp(-x));
	}
	const double e = std::exp(x);
	return e / (1.0 + e);
}

inline double clipProportion(double p) {
	return std::clamp(p, kProportionEpsilon, 1.0 - kProportionEpsilon);
}

inline double logit(double p) {
	const double clipped = clipProportion(p);
	return std::log(clipped / (1.0 - clipped));
}

inline double boundedExp(double linked) {
	return std::exp(std::clamp(linked, -kMaxLogLinked, kMaxLogLinked));
}

inline bool isNonNegativeInteger(double value) {
	return value >= 0.0 && std::floor(value) == value;
}

/// log of the binomial coefficient n choose k.
inline double logChoose(double n, double k) {
	return std::lgamma(n + 1.0) - std::lgamma(k + 1.0) - std::lgamma(n - k + 1.0);
}

} // namespace glamcast::families
