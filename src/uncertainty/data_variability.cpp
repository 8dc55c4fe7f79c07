#include "glamcast/uncertainty/data_variability.hpp"

#include <stdexcept>

namespace glamcast::uncertainty {

VariabilityBand dataVariability(const families::Family &family, const Eigen::VectorXd &linked,
                                double dispersion_raw, const design::LinkScaling &scaling, double interval_width) {
	if (!(interval_width > 0.0 && interval_width < 1.0)) {
		throw std::invalid_argument("interval_width must lie in (0, 1).");
	}
	const double lower_level = (1.0 - interval_width) / 2.0;
	const double upper_level = (1.0 + interval_width) / 2.0;

	const auto n = linked.size();
	VariabilityBand band;
	band.lower.resize(n);
	band.upper.resize(n);
	band.lower_linked.resize(n);
	band.upper_linked.resize(n);
	for (Eigen::Index i = 0; i < n; ++i) {
		band.lower[i] = family.quantile(lower_level, linked[i], dispersion_raw, scaling);
		band.upper[i] = family.quantile(upper_level, linked[i], dispersion_raw, scaling);
		band.lower_linked[i] = family.link(band.lower[i]);
		band.upper_linked[i] = family.link(band.upper[i]);
	}
	return band;
}

} // namespace glamcast::uncertainty
