#pragma once

#include "glamcast/core/prediction.hpp"
#include "glamcast/design/design_matrix.hpp"
#include "glamcast/design/scaling.hpp"
#include "glamcast/families/family.hpp"
#include "glamcast/fitting/posterior_fitter.hpp"

#include <cstdint>
#include <vector>

namespace glamcast::model {

struct PredictionOptions {
	double interval_width = 0.8;
	int trend_samples = 1000;
	std::uint64_t seed = 0;
};

/**
 * @class PredictionAssembler
 * @brief Turns a fit into decomposed prediction records.
 *
 * Holds references to the fitted state of a model and never modifies it, so
 * one assembler may serve any number of calls.
 */
class PredictionAssembler {
public:
	PredictionAssembler(const families::Family &family, const design::ScalingContext &scaling,
	                    const fitting::FitResult &fit, const Eigen::VectorXd &changepoints);

	/**
	 * @param timestamps Times to predict, in any order and at any distance from training.
	 * @param design Design matrix evaluated at @p timestamps with the training scaling.
	 */
	core::Prediction assemble(const std::vector<core::TimePoint> &timestamps, const design::DesignMatrix &design,
	                          const PredictionOptions &options) const;

private:
	/// Linked predictor of one parameter set at normalized times.
	Eigen::VectorXd linkedPredictor(const Eigen::VectorXd &t, const design::DesignMatrix &design,
	                                const fitting::FittedParameters &params) const;

	const families::Family &family_;
	const design::ScalingContext &scaling_;
	const fitting::FitResult &fit_;
	const Eigen::VectorXd &changepoints_;
};

} // namespace glamcast::model
