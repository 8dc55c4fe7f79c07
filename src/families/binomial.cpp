#include "glamcast/families/binomial.hpp"
#include "glamcast/core/errors.hpp"
#include "glamcast/families/link.hpp"

#include <boost/math/distributions/binomial.hpp>
#include <cmath>

namespace glamcast::families {

BinomialFamily::BinomialFamily(int capacity) : capacity_(capacity) {
	if (capacity_ < 1) {
		throw core::ConfigurationError(core::ConfigErrorKind::InvalidParameter,
		                               "binomial family requires a capacity of at least 1.");
	}
}

void BinomialFamily::validateObservations(const std::vector<double> &values) const {
	for (double y : values) {
		if (!isNonNegativeInteger(y) || y > capacity_) {
			throw core::ConfigurationError(core::ConfigErrorKind::DomainMismatch,
			                               "binomial family requires integer observations in [0, capacity].");
		}
	}
}

double BinomialFamily::linkData(double value) const {
	return logit(value / capacity_);
}

double BinomialFamily::mean(double linked) const {
	return capacity_ * clipProportion(logistic(linked));
}

double BinomialFamily::link(double value) const {
	return logit(value / capacity_);
}

LikelihoodTerm BinomialFamily::logLikelihood(double value, double linked, double, const design::LinkScaling &) const {
	const double p = clipProportion(logistic(linked));
	const double n = static_cast<double>(capacity_);
	LikelihoodTerm term;
	term.value = logChoose(n, value) + value * std::log(p) + (n - value) * std::log1p(-p);
	term.d_linked = value - n * p;
	return term;
}

double BinomialFamily::quantile(double level, double linked, double, const design::LinkScaling &) const {
	const boost::math::binomial_distribution<> distribution(static_cast<double>(capacity_),
	                                                        clipProportion(logistic(linked)));
	return boost::math::quantile(distribution, level);
}

} // namespace glamcast::families
