#pragma once

#include <string>

namespace glamcast::families {

/**
 * @brief Observation-noise families supported by the engine.
 */
enum class FamilyKind {
	Normal,
	Poisson,
	Gamma,
	Beta,
	NegativeBinomial,
	BetaBinomial,
	Binomial
};

/// Parses a family tag such as "poisson" or "beta_binomial".
/// @throws core::ConfigurationError for unknown tags.
FamilyKind familyFromString(const std::string &name);

std::string toString(FamilyKind kind);

/// Binomial-type families need a capacity (number of trials per row).
inline bool requiresCapacity(FamilyKind kind) {
	return kind == FamilyKind::Binomial || kind == FamilyKind::BetaBinomial;
}

} // namespace glamcast::families
