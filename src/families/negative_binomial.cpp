#include "glamcast/families/negative_binomial.hpp"
#include "glamcast/core/errors.hpp"
#include "glamcast/families/link.hpp"

#include <boost/math/distributions/negative_binomial.hpp>
#include <boost/math/special_functions/digamma.hpp>
#include <algorithm>
#include <cmath>

namespace glamcast::families {

void NegativeBinomialFamily::validateObservations(const std::vector<double> &values) const {
	for (double y : values) {
		if (!isNonNegativeInteger(y)) {
			throw core::ConfigurationError(core::ConfigErrorKind::DomainMismatch,
			                               "negative_binomial family requires non-negative integer observations.");
		}
	}
}

double NegativeBinomialFamily::linkData(double value) const {
	return std::log(std::max(value, 0.5));
}

double NegativeBinomialFamily::mean(double linked) const {
	return boundedExp(linked);
}

double NegativeBinomialFamily::link(double value) const {
	return std::log(std::max(value, kProportionEpsilon));
}

double NegativeBinomialFamily::dispersion(double raw, const design::LinkScaling &) const {
	return logistic(raw);
}

LikelihoodTerm NegativeBinomialFamily::logLikelihood(double value, double linked, double raw,
                                                     const design::LinkScaling &) const {
	using boost::math::digamma;
	const double mu = mean(linked);
	// size = mu * rho with rho = kappa / (1 - kappa) = exp(raw)
	const double rho = boundedExp(raw);
	const double size = mu * rho;
	const double log_kappa = -std::log1p(1.0 / rho);
	const double log_one_minus_kappa = -std::log1p(rho);

	LikelihoodTerm term;
	term.value = std::lgamma(value + size) - std::lgamma(size) - std::lgamma(value + 1.0) + size * log_kappa +
	             value * log_one_minus_kappa;

	const double ratio = (size + value) / (size + mu);
	const double d_mu = value / mu - ratio;
	const double d_size = digamma(value + size) - digamma(size) + log_kappa + 1.0 - ratio;
	term.d_linked = mu * (d_mu + rho * d_size);
	term.d_dispersion = size * d_size;
	return term;
}

double NegativeBinomialFamily::quantile(double level, double linked, double raw, const design::LinkScaling &) const {
	const double mu = mean(linked);
	const double kappa = logistic(raw);
	const double size = mu * boundedExp(raw);
	const boost::math::negative_binomial_distribution<> distribution(size, clipProportion(kappa));
	return boost::math::quantile(distribution, level);
}

} // namespace glamcast::families
