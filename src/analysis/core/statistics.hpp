#pragma once

#include <map>
#include <vector>

namespace gridlens::analysis::core {

double mean(const std::vector<double>& v);

//! Shannon entropy in bits of a count distribution. Zero counts are ignored.
double shannonEntropy(const std::map<int, int>& counts);

} // namespace gridlens::analysis::core
