#include "glamcast/families/family.hpp"
#include "glamcast/core/errors.hpp"
#include "glamcast/families/beta.hpp"
#include "glamcast/families/beta_binomial.hpp"
#include "glamcast/families/binomial.hpp"
#include "glamcast/families/gamma.hpp"
#include "glamcast/families/negative_binomial.hpp"
#include "glamcast/families/normal.hpp"
#include "glamcast/families/poisson.hpp"

#include <algorithm>
#include <cctype>

namespace glamcast::families {

using core::ConfigErrorKind;
using core::ConfigurationError;

FamilyKind familyFromString(const std::string &name) {
	std::string key(name);
	std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
		return c == ' ' || c == '-' ? '_' : static_cast<char>(std::tolower(c));
	});
	if (key == "normal") {
		return FamilyKind::Normal;
	}
	if (key == "poisson") {
		return FamilyKind::Poisson;
	}
	if (key == "gamma") {
		return FamilyKind::Gamma;
	}
	if (key == "beta") {
		return FamilyKind::Beta;
	}
	if (key == "negative_binomial" || key == "negbinomial") {
		return FamilyKind::NegativeBinomial;
	}
	if (key == "beta_binomial") {
		return FamilyKind::BetaBinomial;
	}
	if (key == "binomial") {
		return FamilyKind::Binomial;
	}
	throw ConfigurationError(ConfigErrorKind::InvalidFamily, "Unknown family '" + name + "'.");
}

std::string toString(FamilyKind kind) {
	switch (kind) {
	case FamilyKind::Normal:
		return "normal";
	case FamilyKind::Poisson:
		return "poisson";
	case FamilyKind::Gamma:
		return "gamma";
	case FamilyKind::Beta:
		return "beta";
	case FamilyKind::NegativeBinomial:
		return "negative_binomial";
	case FamilyKind::BetaBinomial:
		return "beta_binomial";
	case FamilyKind::Binomial:
		return "binomial";
	}
	return "unknown";
}

double Family::initialDispersion(const std::vector<double> &, const std::vector<double> &,
                                 const design::LinkScaling &) const {
	return 0.0;
}

double Family::dispersion(double, const design::LinkScaling &) const {
	return 0.0;
}

double Family::logDispersionPrior(double raw, double prior_scale, double &gradient) const {
	const double variance = prior_scale * prior_scale;
	gradient = -raw / variance;
	return -0.5 * raw * raw / variance;
}

namespace {

int requireCapacity(FamilyKind kind, const FamilyOptions &options) {
	if (!options.capacity || *options.capacity < 1) {
		throw ConfigurationError(ConfigErrorKind::InvalidParameter,
		                         toString(kind) + " family requires a capacity of at least 1.");
	}
	return *options.capacity;
}

} // namespace

std::unique_ptr<Family> makeFamily(FamilyKind kind, const FamilyOptions &options) {
	switch (kind) {
	case FamilyKind::Normal:
		return std::make_unique<NormalFamily>();
	case FamilyKind::Poisson:
		return std::make_unique<PoissonFamily>();
	case FamilyKind::Gamma:
		return std::make_unique<GammaFamily>();
	case FamilyKind::Beta:
		return std::make_unique<BetaFamily>(options.variance_max.value_or(BetaFamily::kDefaultVarianceMax));
	case FamilyKind::NegativeBinomial:
		return std::make_unique<NegativeBinomialFamily>();
	case FamilyKind::BetaBinomial:
		return std::make_unique<BetaBinomialFamily>(requireCapacity(kind, options));
	case FamilyKind::Binomial:
		return std::make_unique<BinomialFamily>(requireCapacity(kind, options));
	}
	throw ConfigurationError(ConfigErrorKind::InvalidFamily, "Unsupported family.");
}

} // namespace glamcast::families
