#include "aw/allocation/glide_path.hpp"

#include <cmath>

namespace aw::allocation {

namespace {
// ordre significatif : premier jeton trouvé = glide path retenue
const std::vector<GlidePath> kTable = {
  {"2020", 0.20, 0.30, 0.50},
  {"2030", 0.30, 0.27, 0.43},
  {"2040", 0.40, 0.23, 0.37},
  {"2050", 0.50, 0.19, 0.31},
  {"2060", 0.60, 0.15, 0.25},
  {"2070", 0.70, 0.11, 0.19},
  {"2080", 0.80, 0.08, 0.12},
  {"2090", 0.90, 0.04, 0.06},
};

const GlidePath kDefault{"default", 1.0, 0.0, 0.0};
} // namespace

double GlidePath::target_for(aw::market::FundRole role) const noexcept {
  switch (role) {
    case aw::market::FundRole::Bond:          return bond;
    case aw::market::FundRole::International: return intl;
    case aw::market::FundRole::National:      return natl;
  }
  return bond;
}

bool GlidePath::is_default() const noexcept {
  return std::string_view(token) == kDefault.token;
}

const std::vector<GlidePath>& glide_path_table() {
  return kTable;
}

const GlidePath& default_glide_path() noexcept {
  return kDefault;
}

const GlidePath& select_glide_path(std::string_view label) {
  for (const auto& g : kTable) {
    if (label.find(g.token) != std::string_view::npos) return g;
  }
  return kDefault;
}

bool sums_to_one(const GlidePath& g, double tol) noexcept {
  return std::abs(g.bond + g.intl + g.natl - 1.0) <= tol;
}

} // namespace aw::allocation
