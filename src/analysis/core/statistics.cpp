#include "statistics.hpp"

#include <cmath>
#include <numeric>

namespace gridlens::analysis::core {

double mean(const std::vector<double>& v) {
	if (v.empty()) {
		return 0.0;
	}
	return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

double shannonEntropy(const std::map<int, int>& counts) {
	double total = 0.0;
	for (const auto& [value, count]: counts) {
		total += static_cast<double>(count);
	}
	if (total <= 0.0) {
		return 0.0;
	}

	double entropy = 0.0;
	for (const auto& [value, count]: counts) {
		if (count <= 0) {
			continue;
		}
		const double p = static_cast<double>(count) / total;
		entropy -= p * std::log2(p);
	}

	// A single colour yields -1 * log2(1) = -0.0.
	return entropy == 0.0 ? 0.0 : entropy;
}

} // namespace gridlens::analysis::core
