#include "glamcast/families/poisson.hpp"
#include "glamcast/core/errors.hpp"
#include "glamcast/families/link.hpp"

#include <boost/math/distributions/poisson.hpp>
#include <algorithm>
#include <cmath>

namespace glamcast::families {

void PoissonFamily::validateObservations(const std::vector<double> &values) const {
	for (double y : values) {
		if (!isNonNegativeInteger(y)) {
			throw core::ConfigurationError(core::ConfigErrorKind::DomainMismatch,
			                               "poisson family requires non-negative integer observations.");
		}
	}
}

double PoissonFamily::linkData(double value) const {
	// Zero counts are lifted to 0.5 so the log stays finite.
	return std::log(std::max(value, 0.5));
}

double PoissonFamily::mean(double linked) const {
	return boundedExp(linked);
}

double PoissonFamily::link(double value) const {
	return std::log(std::max(value, kProportionEpsilon));
}

LikelihoodTerm PoissonFamily::logLikelihood(double value, double linked, double, const design::LinkScaling &) const {
	const double eta = std::clamp(linked, -kMaxLogLinked, kMaxLogLinked);
	const double rate = std::exp(eta);
	LikelihoodTerm term;
	term.value = value * eta - rate - std::lgamma(value + 1.0);
	term.d_linked = value - rate;
	return term;
}

double PoissonFamily::quantile(double level, double linked, double, const design::LinkScaling &) const {
	const boost::math::poisson_distribution<> distribution(mean(linked));
	return boost::math::quantile(distribution, level);
}

} // namespace glamcast::families
