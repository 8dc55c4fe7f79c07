#pragma once

#include <stdexcept>
#include <string>

namespace glamcast::core {

/**
 * @brief Identifies which precondition a configuration error violated.
 */
enum class ConfigErrorKind {
	InvalidFamily,
	InvalidParameter,
	NegativeChangepoints,
	DomainMismatch,
	DegenerateSeries,
	MissingRegressor
};

inline const char *toString(ConfigErrorKind kind) {
	switch (kind) {
	case ConfigErrorKind::InvalidFamily:
		return "invalid family";
	case ConfigErrorKind::InvalidParameter:
		return "invalid parameter";
	case ConfigErrorKind::NegativeChangepoints:
		return "negative changepoint count";
	case ConfigErrorKind::DomainMismatch:
		return "domain mismatch";
	case ConfigErrorKind::DegenerateSeries:
		return "degenerate series";
	case ConfigErrorKind::MissingRegressor:
		return "missing regressor";
	}
	return "unknown";
}

/**
 * @class ConfigurationError
 * @brief Raised before any optimization when inputs or settings are unusable.
 */
class ConfigurationError : public std::invalid_argument {
public:
	ConfigurationError(ConfigErrorKind kind, const std::string &message)
	    : std::invalid_argument(std::string(toString(kind)) + ": " + message), kind_(kind) {
	}

	ConfigErrorKind kind() const noexcept {
		return kind_;
	}

private:
	ConfigErrorKind kind_;
};

/// The optimizer did not reach a usable mode.
class OptimizationError : public std::runtime_error {
public:
	explicit OptimizationError(const std::string &message) : std::runtime_error(message) {
	}
};

/// A numerical quantity left its domain and no safe clamp exists.
class NumericalError : public std::runtime_error {
public:
	explicit NumericalError(const std::string &message) : std::runtime_error(message) {
	}
};

/// Prediction or parameter access on a model that has not been fitted.
class NotFittedError : public std::logic_error {
public:
	explicit NotFittedError(const std::string &message) : std::logic_error(message) {
	}
};

} // namespace glamcast::core
