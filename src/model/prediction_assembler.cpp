#include "glamcast/model/prediction_assembler.hpp"
#include "glamcast/trend/piecewise_linear.hpp"
#include "glamcast/uncertainty/data_variability.hpp"
#include "glamcast/uncertainty/trend_simulation.hpp"
#include "glamcast/utils/logging.hpp"
#include "glamcast/utils/statistics.hpp"

#include <stdexcept>

namespace glamcast::model {

namespace {

std::vector<double> toStd(const Eigen::VectorXd &values) {
	return std::vector<double>(values.data(), values.data() + values.size());
}

std::vector<double> meanOf(const families::Family &family, const Eigen::VectorXd &linked) {
	std::vector<double> result(static_cast<std::size_t>(linked.size()));
	for (Eigen::Index i = 0; i < linked.size(); ++i) {
		result[static_cast<std::size_t>(i)] = family.mean(linked[i]);
	}
	return result;
}

} // namespace

PredictionAssembler::PredictionAssembler(const families::Family &family, const design::ScalingContext &scaling,
                                         const fitting::FitResult &fit, const Eigen::VectorXd &changepoints)
    : family_(family), scaling_(scaling), fit_(fit), changepoints_(changepoints) {
}

Eigen::VectorXd PredictionAssembler::linkedPredictor(const Eigen::VectorXd &t, const design::DesignMatrix &design,
                                                     const fitting::FittedParameters &params) const {
	const Eigen::VectorXd trend = trend::piecewiseLinear(t, params.k, params.m, params.delta, changepoints_);
	Eigen::VectorXd normalized = trend;
	if (design.columns() > 0) {
		normalized += design.X * params.beta;
	}
	return ((normalized * scaling_.link.scale).array() + scaling_.link.offset).matrix();
}

core::Prediction PredictionAssembler::assemble(const std::vector<core::TimePoint> &timestamps,
                                               const design::DesignMatrix &design,
                                               const PredictionOptions &options) const {
	if (design.X.rows() != static_cast<Eigen::Index>(timestamps.size())) {
		throw std::invalid_argument("Design matrix rows must match the number of timestamps.");
	}
	if (design.columns() != fit_.map.beta.size()) {
		throw std::invalid_argument("Design matrix columns do not match the fitted coefficients.");
	}

	const Eigen::VectorXd t = scaling_.time.normalize(timestamps);
	const auto &link = scaling_.link;
	const auto toLinked = [&link](const Eigen::VectorXd &normalized) -> Eigen::VectorXd {
		return ((normalized * link.scale).array() + link.offset).matrix();
	};

	const Eigen::VectorXd trend_normalized =
	    trend::piecewiseLinear(t, fit_.map.k, fit_.map.m, fit_.map.delta, changepoints_);
	const Eigen::VectorXd eta = linkedPredictor(t, design, fit_.map);

	Eigen::VectorXd eta_lower = eta;
	Eigen::VectorXd eta_upper = eta;
	const double tail = (1.0 - options.interval_width) / 2.0;
	if (!fit_.draws.empty()) {
		Eigen::MatrixXd draws(t.size(), static_cast<Eigen::Index>(fit_.draws.size()));
		for (std::size_t d = 0; d < fit_.draws.size(); ++d) {
			draws.col(static_cast<Eigen::Index>(d)) = linkedPredictor(t, design, fit_.draws[d]);
		}
		eta_lower = utils::Statistics::rowPercentile(draws, tail);
		eta_upper = utils::Statistics::rowPercentile(draws, 1.0 - tail);
	}

	uncertainty::TrendSimulationOptions simulation;
	simulation.samples = options.trend_samples;
	simulation.interval_width = options.interval_width;
	simulation.seed = options.seed;
	const auto trend_band =
	    uncertainty::simulateTrendUncertainty(t, fit_, changepoints_, trend_normalized, simulation);
	const auto variability =
	    uncertainty::dataVariability(family_, eta, fit_.map.dispersion_raw, link, options.interval_width);

	core::Prediction prediction;
	prediction.timestamps = timestamps;

	prediction.yhat_linked = toStd(eta);
	prediction.yhat_lower_linked = toStd(eta_lower);
	prediction.yhat_upper_linked = toStd(eta_upper);
	prediction.yhat = meanOf(family_, eta);
	prediction.yhat_lower = meanOf(family_, eta_lower);
	prediction.yhat_upper = meanOf(family_, eta_upper);

	const Eigen::VectorXd trend_linked = toLinked(trend_normalized);
	const Eigen::VectorXd trend_lower_linked = toLinked(trend_band.lower);
	const Eigen::VectorXd trend_upper_linked = toLinked(trend_band.upper);
	prediction.trend_linked = toStd(trend_linked);
	prediction.trend_lower_linked = toStd(trend_lower_linked);
	prediction.trend_upper_linked = toStd(trend_upper_linked);
	prediction.trend = meanOf(family_, trend_linked);
	prediction.trend_lower = meanOf(family_, trend_lower_linked);
	prediction.trend_upper = meanOf(family_, trend_upper_linked);

	prediction.observed_lower = toStd(variability.lower);
	prediction.observed_upper = toStd(variability.upper);
	prediction.observed_lower_linked = toStd(variability.lower_linked);
	prediction.observed_upper_linked = toStd(variability.upper_linked);

	for (const auto &component : design.components) {
		const Eigen::VectorXd contribution =
		    design.X.middleCols(component.first_column, component.columns) *
		    fit_.map.beta.segment(component.first_column, component.columns) * link.scale;
		prediction.components.emplace(component.name, toStd(contribution));
	}

	GLAMCAST_DEBUG("Assembled prediction with {} rows and {} components", prediction.size(),
	               prediction.components.size());
	return prediction;
}

} // namespace glamcast::model
