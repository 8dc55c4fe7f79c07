#include "glamcast/families/beta.hpp"
#include "glamcast/core/errors.hpp"
#include "glamcast/families/link.hpp"

#include <boost/math/distributions/beta.hpp>
#include <boost/math/special_functions/digamma.hpp>
#include <algorithm>
#include <cmath>

namespace glamcast::families {

namespace {

// Keeps the implied variance strictly below mean * (1 - mean).
constexpr double kVarianceMargin = 1e-3;

} // namespace

BetaFamily::BetaFamily(double variance_max) : variance_max_(variance_max) {
	if (!(variance_max_ > 0.0)) {
		throw core::ConfigurationError(core::ConfigErrorKind::InvalidParameter,
		                               "beta family requires a positive variance_max.");
	}
}

void BetaFamily::validateObservations(const std::vector<double> &values) const {
	for (double y : values) {
		if (!(y >= 0.0 && y <= 1.0)) {
			throw core::ConfigurationError(core::ConfigErrorKind::DomainMismatch,
			                               "beta family requires observations in [0, 1].");
		}
	}
}

double BetaFamily::linkData(double value) const {
	return logit(value);
}

double BetaFamily::mean(double linked) const {
	return clipProportion(logistic(linked));
}

double BetaFamily::link(double value) const {
	return logit(value);
}

double BetaFamily::effectiveKappa(double kappa, double mu) const {
	const double ceiling = (1.0 - kVarianceMargin) * mu * (1.0 - mu) / variance_max_;
	return std::min(kappa, ceiling);
}

double BetaFamily::initialDispersion(const std::vector<double> &values, const std::vector<double> &linked,
                                     const design::LinkScaling &) const {
	if (values.size() < 2 || values.size() != linked.size()) {
		return 0.0;
	}
	double sum_sq = 0.0;
	for (std::size_t i = 0; i < values.size(); ++i) {
		const double residual = values[i] - mean(linked[i]);
		sum_sq += residual * residual;
	}
	const double variance = sum_sq / static_cast<double>(values.size() - 1);
	return logit(std::clamp(variance / variance_max_, 0.01, 0.99));
}

double BetaFamily::dispersion(double raw, const design::LinkScaling &) const {
	return logistic(raw);
}

LikelihoodTerm BetaFamily::logLikelihood(double value, double linked, double raw,
                                         const design::LinkScaling &) const {
	using boost::math::digamma;
	const double y = clipProportion(value);
	const double mu = mean(linked);
	const double spread = mu * (1.0 - mu);
	const double kappa = logistic(raw);
	const double kappa_eff = effectiveKappa(kappa, mu);
	const bool clamped = kappa_eff < kappa;

	const double nu = spread / (kappa_eff * variance_max_) - 1.0;
	const double a = mu * nu;
	const double b = (1.0 - mu) * nu;
	const double log_y = std::log(y);
	const double log_1my = std::log1p(-y);

	LikelihoodTerm term;
	term.value = std::lgamma(nu) - std::lgamma(a) - std::lgamma(b) + (a - 1.0) * log_y + (b - 1.0) * log_1my;

	const double d_a = digamma(nu) - digamma(a) + log_y;
	const double d_b = digamma(nu) - digamma(b) + log_1my;
	const double d_nu_d_mu = clamped ? 0.0 : (1.0 - 2.0 * mu) / (kappa * variance_max_);
	const double d_nu_d_kappa = clamped ? 0.0 : -spread / (kappa * kappa * variance_max_);

	const double d_mu = d_a * (nu + mu * d_nu_d_mu) + d_b * (-nu + (1.0 - mu) * d_nu_d_mu);
	term.d_linked = d_mu * spread;
	term.d_dispersion = (d_a * mu + d_b * (1.0 - mu)) * d_nu_d_kappa * kappa * (1.0 - kappa);
	return term;
}

double BetaFamily::quantile(double level, double linked, double raw, const design::LinkScaling &) const {
	const double mu = mean(linked);
	const double kappa_eff = effectiveKappa(logistic(raw), mu);
	const double nu = mu * (1.0 - mu) / (kappa_eff * variance_max_) - 1.0;
	const boost::math::beta_distribution<> distribution(mu * nu, (1.0 - mu) * nu);
	return boost::math::quantile(distribution, level);
}

} // namespace glamcast::families
