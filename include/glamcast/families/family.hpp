#pragma once

#include "glamcast/design/scaling.hpp"
#include "glamcast/families/family_kind.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace glamcast::families {

/**
 * @struct LikelihoodTerm
 * @brief Log-density of one observation and its partial derivatives.
 */
struct LikelihoodTerm {
	double value = 0.0;
	double d_linked = 0.0;     ///< derivative with respect to the linked predictor
	double d_dispersion = 0.0; ///< derivative with respect to the raw dispersion parameter
};

/// Settings some families need beyond the linked predictor.
struct FamilyOptions {
	std::optional<int> capacity;
	std::optional<double> variance_max;
};

/**
 * @class Family
 * @brief An observation-noise distribution in generalized-linear form.
 *
 * A family maps the linked predictor to the distribution's location, owns
 * the parameterization of its dispersion through an unconstrained raw
 * value, and exposes the quantile function used for data-variability
 * bounds. The engine only talks to this interface; adding a family means
 * adding one subclass and one registry entry.
 */
class Family {
public:
	virtual ~Family() = default;

	virtual FamilyKind kind() const = 0;

	std::string name() const {
		return toString(kind());
	}

	/// Discrete families observe and generate unsigned integers only.
	virtual bool isDiscrete() const = 0;

	/// Whether the family carries one raw dispersion parameter.
	virtual bool hasDispersion() const {
		return false;
	}

	/**
	 * @brief Checks that every observation lies in the family's domain.
	 * @throws core::ConfigurationError(DomainMismatch) on the first offending value.
	 */
	virtual void validateObservations(const std::vector<double> &values) const = 0;

	/// Observation mapped to the linked scale, used to derive the link scaling.
	virtual double linkData(double value) const = 0;

	/// Expected observation for a linked predictor (inverse link).
	virtual double mean(double linked) const = 0;

	/// Original-scale value mapped to the linked scale, clipped away from singularities.
	virtual double link(double value) const = 0;

	/// Raw dispersion to start the optimizer from.
	virtual double initialDispersion(const std::vector<double> &values, const std::vector<double> &linked,
	                                 const design::LinkScaling &scaling) const;

	/// Natural dispersion value for reporting (sigma, kappa, ...). Zero for families without one.
	virtual double dispersion(double raw, const design::LinkScaling &scaling) const;

	/// Log prior of the raw dispersion; @p gradient receives its derivative.
	virtual double logDispersionPrior(double raw, double prior_scale, double &gradient) const;

	virtual LikelihoodTerm logLikelihood(double value, double linked, double raw,
	                                     const design::LinkScaling &scaling) const = 0;

	/**
	 * @brief Percent-point function of the observation distribution.
	 * @param level Probability in (0, 1).
	 */
	virtual double quantile(double level, double linked, double raw, const design::LinkScaling &scaling) const = 0;

	/// Lower and upper bound of the observation domain.
	virtual double lowerBound() const = 0;
	virtual double upperBound() const = 0;
};

/**
 * @brief Creates the family for a tag.
 * @throws core::ConfigurationError when required options (capacity) are missing or invalid.
 */
std::unique_ptr<Family> makeFamily(FamilyKind kind, const FamilyOptions &options = {});

} // namespace glamcast::families
