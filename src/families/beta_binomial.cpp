#include "glamcast/families/beta_binomial.hpp"
#include "glamcast/core/errors.hpp"
#include "glamcast/families/link.hpp"

#include <boost/math/special_functions/digamma.hpp>
#include <cmath>

namespace glamcast::families {

namespace {

double logBeta(double a, double b) {
	return std::lgamma(a) + std::lgamma(b) - std::lgamma(a + b);
}

struct Shape {
	double a;
	double b;
	double sum;
};

Shape shapeFor(double linked, double raw) {
	const double p = clipProportion(logistic(linked));
	const double rho = clipProportion(logistic(raw));
	const double sum = 1.0 / rho - 1.0;
	return Shape{p * sum, (1.0 - p) * sum, sum};
}

} // namespace

BetaBinomialFamily::BetaBinomialFamily(int capacity) : capacity_(capacity) {
	if (capacity_ < 1) {
		throw core::ConfigurationError(core::ConfigErrorKind::InvalidParameter,
		                               "beta_binomial family requires a capacity of at least 1.");
	}
}

void BetaBinomialFamily::validateObservations(const std::vector<double> &values) const {
	for (double y : values) {
		if (!isNonNegativeInteger(y) || y > capacity_) {
			throw core::ConfigurationError(core::ConfigErrorKind::DomainMismatch,
			                               "beta_binomial family requires integer observations in [0, capacity].");
		}
	}
}

double BetaBinomialFamily::linkData(double value) const {
	return logit(value / capacity_);
}

double BetaBinomialFamily::mean(double linked) const {
	return capacity_ * clipProportion(logistic(linked));
}

double BetaBinomialFamily::link(double value) const {
	return logit(value / capacity_);
}

double BetaBinomialFamily::initialDispersion(const std::vector<double> &, const std::vector<double> &,
                                             const design::LinkScaling &) const {
	return logit(0.1);
}

double BetaBinomialFamily::dispersion(double raw, const design::LinkScaling &) const {
	return logistic(raw);
}

LikelihoodTerm BetaBinomialFamily::logLikelihood(double value, double linked, double raw,
                                                 const design::LinkScaling &) const {
	using boost::math::digamma;
	const double n = static_cast<double>(capacity_);
	const Shape shape = shapeFor(linked, raw);
	const double p = shape.a / shape.sum;

	LikelihoodTerm term;
	term.value = logChoose(n, value) + logBeta(value + shape.a, n - value + shape.b) - logBeta(shape.a, shape.b);

	const double common = digamma(shape.sum) - digamma(n + shape.sum);
	const double d_a = digamma(value + shape.a) - digamma(shape.a) + common;
	const double d_b = digamma(n - value + shape.b) - digamma(shape.b) + common;
	term.d_linked = (d_a - d_b) * shape.sum * p * (1.0 - p);
	// d sum / d raw = -sum, so d a / d raw = -a and d b / d raw = -b.
	term.d_dispersion = -(d_a * shape.a + d_b * shape.b);
	return term;
}

double BetaBinomialFamily::quantile(double level, double linked, double raw, const design::LinkScaling &) const {
	const Shape shape = shapeFor(linked, raw);
	const double log_norm = logBeta(shape.a, shape.b);
	const double n = static_cast<double>(capacity_);
	double cumulative = 0.0;
	for (int k = 0; k < capacity_; ++k) {
		const double kd = static_cast<double>(k);
		cumulative += std::exp(logChoose(n, kd) + logBeta(kd + shape.a, n - kd + shape.b) - log_norm);
		if (cumulative >= level) {
			return kd;
		}
	}
	return n;
}

} // namespace glamcast::families
