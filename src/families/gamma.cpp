#include "glamcast/families/gamma.hpp"
#include "glamcast/core/errors.hpp"
#include "glamcast/families/link.hpp"

#include <boost/math/distributions/gamma.hpp>
#include <boost/math/special_functions/digamma.hpp>
#include <algorithm>
#include <cmath>

namespace glamcast::families {

void GammaFamily::validateObservations(const std::vector<double> &values) const {
	for (double y : values) {
		if (!(y > 0.0)) {
			throw core::ConfigurationError(core::ConfigErrorKind::DomainMismatch,
			                               "gamma family requires strictly positive observations.");
		}
	}
}

double GammaFamily::linkData(double value) const {
	return std::log(value);
}

double GammaFamily::mean(double linked) const {
	return boundedExp(linked);
}

double GammaFamily::link(double value) const {
	return std::log(std::max(value, kProportionEpsilon));
}

double GammaFamily::initialDispersion(const std::vector<double> &values, const std::vector<double> &linked,
                                      const design::LinkScaling &) const {
	if (values.size() < 2 || values.size() != linked.size()) {
		return 0.0;
	}
	// The log of a gamma variable has a standard deviation of about 1 / kappa.
	double sum_sq = 0.0;
	for (std::size_t i = 0; i < values.size(); ++i) {
		const double residual = std::log(values[i]) - linked[i];
		sum_sq += residual * residual;
	}
	const double deviation = std::sqrt(sum_sq / static_cast<double>(values.size() - 1));
	return -std::log(std::max(deviation, 1e-3));
}

double GammaFamily::dispersion(double raw, const design::LinkScaling &) const {
	return boundedExp(raw);
}

LikelihoodTerm GammaFamily::logLikelihood(double value, double linked, double raw,
                                          const design::LinkScaling &) const {
	const double mu = mean(linked);
	const double kappa = boundedExp(raw);
	const double shape = kappa * kappa;
	const double scale = mu / shape;
	const double log_scale = std::log(scale);
	const double log_value = std::log(value);

	LikelihoodTerm term;
	term.value = -std::lgamma(shape) - shape * log_scale + (shape - 1.0) * log_value - value / scale;
	term.d_linked = shape * (value / mu - 1.0);
	term.d_dispersion =
	    2.0 * shape * (-boost::math::digamma(shape) - log_scale + log_value - value / mu + 1.0);
	return term;
}

double GammaFamily::quantile(double level, double linked, double raw, const design::LinkScaling &) const {
	const double kappa = boundedExp(raw);
	const double shape = kappa * kappa;
	const boost::math::gamma_distribution<> distribution(shape, mean(linked) / shape);
	return boost::math::quantile(distribution, level);
}

} // namespace glamcast::families
