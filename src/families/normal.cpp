#include "glamcast/families/normal.hpp"
#include "glamcast/core/errors.hpp"
#include "glamcast/families/link.hpp"

#include <boost/math/distributions/normal.hpp>
#include <algorithm>
#include <cmath>

namespace glamcast::families {

namespace {

constexpr double kLogSqrtTwoPi = 0.91893853320467274178;
constexpr double kMinNormalizedSigma = 1e-3;

} // namespace

void NormalFamily::validateObservations(const std::vector<double> &values) const {
	for (double y : values) {
		if (!std::isfinite(y)) {
			throw core::ConfigurationError(core::ConfigErrorKind::DomainMismatch,
			                               "normal family requires finite observations.");
		}
	}
}

double NormalFamily::initialDispersion(const std::vector<double> &values, const std::vector<double> &linked,
                                       const design::LinkScaling &scaling) const {
	if (values.size() < 2 || values.size() != linked.size()) {
		return 0.0;
	}
	double sum_sq = 0.0;
	for (std::size_t i = 0; i < values.size(); ++i) {
		const double residual = (values[i] - linked[i]) / scaling.scale;
		sum_sq += residual * residual;
	}
	const double sigma = std::sqrt(sum_sq / static_cast<double>(values.size() - 1));
	return std::log(std::max(sigma, kMinNormalizedSigma));
}

double NormalFamily::dispersion(double raw, const design::LinkScaling &scaling) const {
	return scaling.scale * boundedExp(raw);
}

double NormalFamily::logDispersionPrior(double raw, double prior_scale, double &gradient) const {
	// Half-normal on the normalized standard deviation exp(raw).
	const double sigma = boundedExp(raw);
	const double variance = prior_scale * prior_scale;
	gradient = -sigma * sigma / variance;
	return -0.5 * sigma * sigma / variance;
}

LikelihoodTerm NormalFamily::logLikelihood(double value, double linked, double raw,
                                           const design::LinkScaling &scaling) const {
	const double sigma = dispersion(raw, scaling);
	const double z = (value - linked) / sigma;
	LikelihoodTerm term;
	term.value = -kLogSqrtTwoPi - std::log(sigma) - 0.5 * z * z;
	term.d_linked = z / sigma;
	term.d_dispersion = z * z - 1.0;
	return term;
}

double NormalFamily::quantile(double level, double linked, double raw, const design::LinkScaling &scaling) const {
	const boost::math::normal_distribution<> distribution(linked, dispersion(raw, scaling));
	return boost::math::quantile(distribution, level);
}

} // namespace glamcast::families
