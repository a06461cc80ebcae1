#pragma once

#include <optional>
#include <utility>
#include <vector>

namespace coastvi::cvi::core {

double mean(const std::vector<double>& v);
double median(std::vector<double> values); //!< 0 for empty input.
double product(const std::vector<double>& v);

//! Values that are present, in input order.
std::vector<double> presentValues(const std::vector<std::optional<double>>& v);

//! (min, max) of the present values. Empty if no value is present.
std::optional<std::pair<double, double>> presentMinMax(const std::vector<std::optional<double>>& v);

} // namespace coastvi::cvi::core
