#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "glamcast/design/changepoints.hpp"
#include "glamcast/design/design_matrix.hpp"
#include "glamcast/families/family.hpp"
#include "glamcast/fitting/log_posterior.hpp"
#include "common/time_series_helpers.hpp"

#include <cmath>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

using namespace glamcast;
using Catch::Approx;
using families::FamilyKind;

namespace {

struct Problem {
	design::TrendBasis basis;
	design::DesignMatrix design;
	std::unique_ptr<families::Family> family;
	fitting::PriorSpec priors;
	fitting::FitData data;
};

Problem makeProblem(FamilyKind kind, std::vector<double> values) {
	Problem problem;
	families::FamilyOptions options;
	options.capacity = 40;
	problem.family = families::makeFamily(kind, options);

	const auto timestamps = tests::helpers::makeTimestamps(values.size());
	design::ScalingContext scaling;
	scaling.time = design::computeTimeScaling(timestamps);
	scaling.link = design::computeLinkScaling(values, *problem.family);

	const Eigen::VectorXd t = scaling.time.normalize(timestamps);
	problem.basis = design::makeTrendBasis(t, design::placeChangepoints(t, 4, 0.8));
	const design::DesignMatrixBuilder builder({design::SeasonalitySpec{"weekly", 7.0, 2, {}}}, {}, {}, 10.0, 10.0);
	problem.design = builder.build(timestamps, {}, scaling);
	problem.priors.beta_scales = problem.design.prior_scales;
	problem.data.y = std::move(values);
	problem.data.link = scaling.link;
	return problem;
}

Eigen::VectorXd testPoint(const fitting::ParameterLayout &layout) {
	Eigen::VectorXd theta(layout.size());
	for (Eigen::Index i = 0; i < theta.size(); ++i) {
		theta[i] = 0.15 * std::sin(1.3 * static_cast<double>(i) + 0.4);
	}
	theta[fitting::ParameterLayout::mIndex] = 0.4;
	return theta;
}

} // namespace

TEST_CASE("Log posterior gradient matches finite differences", "[fitting][log_posterior]") {
	const std::vector<std::pair<FamilyKind, std::vector<double>>> problems = {
	    {FamilyKind::Normal, tests::helpers::weeklySeries(40, 10.0, 0.2, 2.0, 0.5, 3)},
	    {FamilyKind::Poisson, tests::helpers::poissonCounts(40, 12.0, 5)},
	    {FamilyKind::NegativeBinomial, tests::helpers::poissonCounts(40, 6.0, 7)},
	    {FamilyKind::Binomial, tests::helpers::poissonCounts(40, 10.0, 11)},
	};
	for (const auto &entry : problems) {
		const auto problem = makeProblem(entry.first, entry.second);
		INFO("family " << problem.family->name());
		const fitting::LogPosterior posterior(problem.basis, problem.design, *problem.family, problem.priors,
		                                      problem.data);
		const auto theta = testPoint(posterior.layout());

		Eigen::VectorXd gradient;
		const double value = posterior(theta, gradient);
		REQUIRE(std::isfinite(value));
		REQUIRE(gradient.size() == posterior.layout().size());

		const double h = 1e-6;
		Eigen::VectorXd scratch;
		for (Eigen::Index j = 0; j < theta.size(); ++j) {
			Eigen::VectorXd up = theta;
			Eigen::VectorXd down = theta;
			up[j] += h;
			down[j] -= h;
			const double numeric = (posterior(up, scratch) - posterior(down, scratch)) / (2.0 * h);
			INFO("parameter " << j);
			REQUIRE(gradient[j] == Approx(numeric).epsilon(1e-4).margin(1e-5));
		}
	}
}

TEST_CASE("Parameter layout packs and unpacks every group", "[fitting][log_posterior]") {
	const fitting::ParameterLayout layout(3, 4, true);
	REQUIRE(layout.size() == 10);
	REQUIRE(layout.betaOffset() == 5);
	REQUIRE(layout.dispersionIndex() == 9);

	Eigen::VectorXd theta = Eigen::VectorXd::LinSpaced(10, 0.0, 9.0);
	const auto params = layout.unpack(theta);
	REQUIRE(params.k == 0.0);
	REQUIRE(params.m == 1.0);
	REQUIRE(params.delta[2] == 4.0);
	REQUIRE(params.beta[0] == 5.0);
	REQUIRE(params.dispersion_raw == 9.0);
	REQUIRE(layout.pack(params) == theta);

	const fitting::ParameterLayout no_dispersion(0, 0, false);
	REQUIRE(no_dispersion.size() == 2);
}

TEST_CASE("Initial point fits a line through the linked data", "[fitting][log_posterior]") {
	std::vector<double> values(30);
	for (std::size_t i = 0; i < values.size(); ++i) {
		values[i] = 5.0 + 0.5 * static_cast<double>(i);
	}
	const auto problem = makeProblem(FamilyKind::Normal, values);
	const fitting::LogPosterior posterior(problem.basis, problem.design, *problem.family, problem.priors,
	                                      problem.data);
	const auto start = posterior.layout().unpack(posterior.initialPoint());
	REQUIRE(start.k == Approx(1.0).margin(1e-9));
	REQUIRE(start.m == Approx(0.0).margin(1e-9));
	REQUIRE(start.delta.isZero());
	REQUIRE(std::isfinite(start.dispersion_raw));
}

TEST_CASE("Log posterior rejects mismatched inputs", "[fitting][log_posterior]") {
	auto problem = makeProblem(FamilyKind::Normal, tests::helpers::weeklySeries(20, 1.0, 0.0, 1.0, 0.1, 1));
	problem.data.y.pop_back();
	REQUIRE_THROWS_AS(fitting::LogPosterior(problem.basis, problem.design, *problem.family, problem.priors,
	                                        problem.data),
	                  std::invalid_argument);
}
