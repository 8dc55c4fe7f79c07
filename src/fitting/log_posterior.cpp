#include "glamcast/fitting/log_posterior.hpp"

#include <cmath>
#include <stdexcept>

namespace glamcast::fitting {

namespace {

// Width of the quadratic region replacing |delta| near zero.
constexpr double kLaplaceSmoothing = 1e-3;

double normalLogPrior(double value, double scale, double &gradient) {
	const double variance = scale * scale;
	gradient = -value / variance;
	return -0.5 * value * value / variance;
}

} // namespace

LogPosterior::LogPosterior(const design::TrendBasis &basis, const design::DesignMatrix &design,
                           const families::Family &family, const PriorSpec &priors, const FitData &data)
    : basis_(basis), design_(design), family_(family), priors_(priors), data_(data),
      layout_(basis.changepoints.size(), design.X.cols(), family.hasDispersion()) {
	const auto rows = basis_.t.size();
	if (static_cast<std::size_t>(rows) != data_.y.size() || design_.X.rows() != rows ||
	    basis_.indicator.rows() != rows) {
		throw std::invalid_argument("Trend basis, design matrix and observations must have the same rows.");
	}
	if (basis_.indicator.cols() != basis_.changepoints.size()) {
		throw std::invalid_argument("Indicator matrix must have one column per changepoint.");
	}
	if (priors_.beta_scales.size() != static_cast<std::size_t>(design_.X.cols())) {
		throw std::invalid_argument("One prior scale is required per design column.");
	}
}

Eigen::VectorXd LogPosterior::linkedPredictor(const Eigen::VectorXd &theta) const {
	const FittedParameters params = layout_.unpack(theta);
	const Eigen::VectorXd rate = ((basis_.indicator * params.delta).array() + params.k).matrix();
	const Eigen::VectorXd shift = basis_.indicator * basis_.changepoints.cwiseProduct(params.delta);
	Eigen::VectorXd normalized = rate.cwiseProduct(basis_.t) - shift;
	normalized.array() += params.m;
	if (design_.X.cols() > 0) {
		normalized += design_.X * params.beta;
	}
	return (data_.link.offset + data_.link.scale * normalized.array()).matrix();
}

double LogPosterior::operator()(const Eigen::VectorXd &theta, Eigen::VectorXd &gradient) const {
	const FittedParameters params = layout_.unpack(theta);
	const Eigen::VectorXd linked = linkedPredictor(theta);
	const auto rows = linked.size();

	// Likelihood and its derivative with respect to the normalized predictor.
	double log_density = 0.0;
	double d_dispersion = 0.0;
	Eigen::VectorXd d_normalized(rows);
	for (Eigen::Index i = 0; i < rows; ++i) {
		const auto term = family_.logLikelihood(data_.y[static_cast<std::size_t>(i)], linked[i],
		                                        params.dispersion_raw, data_.link);
		log_density += term.value;
		d_normalized[i] = term.d_linked * data_.link.scale;
		d_dispersion += term.d_dispersion;
	}

	gradient.setZero(layout_.size());
	gradient[ParameterLayout::kIndex] = d_normalized.dot(basis_.t);
	gradient[ParameterLayout::mIndex] = d_normalized.sum();
	if (layout_.changepoints() > 0) {
		const Eigen::VectorXd weighted = basis_.indicator.transpose() * d_normalized.cwiseProduct(basis_.t);
		const Eigen::VectorXd plain = basis_.indicator.transpose() * d_normalized;
		gradient.segment(layout_.deltaOffset(), layout_.changepoints()) =
		    weighted - basis_.changepoints.cwiseProduct(plain);
	}
	if (layout_.columns() > 0) {
		gradient.segment(layout_.betaOffset(), layout_.columns()) = design_.X.transpose() * d_normalized;
	}

	// Priors
	double prior_gradient = 0.0;
	log_density += normalLogPrior(params.k, priors_.k_scale, prior_gradient);
	gradient[ParameterLayout::kIndex] += prior_gradient;
	log_density += normalLogPrior(params.m, priors_.m_scale, prior_gradient);
	gradient[ParameterLayout::mIndex] += prior_gradient;

	const double tau = priors_.changepoint_prior_scale;
	for (Eigen::Index j = 0; j < layout_.changepoints(); ++j) {
		const double d = params.delta[j];
		const double smooth_abs = std::sqrt(d * d + kLaplaceSmoothing * kLaplaceSmoothing);
		log_density -= smooth_abs / tau;
		gradient[layout_.deltaOffset() + j] -= d / (smooth_abs * tau);
		log_density += normalLogPrior(d, tau, prior_gradient);
		gradient[layout_.deltaOffset() + j] += prior_gradient;
	}
	for (Eigen::Index j = 0; j < layout_.columns(); ++j) {
		log_density +=
		    normalLogPrior(params.beta[j], priors_.beta_scales[static_cast<std::size_t>(j)], prior_gradient);
		gradient[layout_.betaOffset() + j] += prior_gradient;
	}
	if (layout_.hasDispersion()) {
		log_density += family_.logDispersionPrior(params.dispersion_raw, priors_.dispersion_prior_scale,
		                                          prior_gradient);
		gradient[layout_.dispersionIndex()] = d_dispersion + prior_gradient;
	}

	gradient = -gradient;
	return -log_density;
}

double LogPosterior::logDensity(const Eigen::VectorXd &theta) const {
	Eigen::VectorXd gradient;
	return -(*this)(theta, gradient);
}

Eigen::VectorXd LogPosterior::initialPoint() const {
	const auto rows = basis_.t.size();
	Eigen::MatrixXd line(rows, 2);
	Eigen::VectorXd target(rows);
	for (Eigen::Index i = 0; i < rows; ++i) {
		line(i, 0) = basis_.t[i];
		line(i, 1) = 1.0;
		target[i] = data_.link.toNormalized(family_.linkData(data_.y[static_cast<std::size_t>(i)]));
	}
	const Eigen::Vector2d coefficients = line.colPivHouseholderQr().solve(target);

	FittedParameters start;
	start.k = coefficients[0];
	start.m = coefficients[1];
	start.delta = Eigen::VectorXd::Zero(layout_.changepoints());
	start.beta = Eigen::VectorXd::Zero(layout_.columns());
	if (layout_.hasDispersion()) {
		std::vector<double> linked(static_cast<std::size_t>(rows));
		for (Eigen::Index i = 0; i < rows; ++i) {
			linked[static_cast<std::size_t>(i)] = data_.link.toLinked(start.k * basis_.t[i] + start.m);
		}
		start.dispersion_raw = family_.initialDispersion(data_.y, linked, data_.link);
	}
	return layout_.pack(start);
}

} // namespace glamcast::fitting
