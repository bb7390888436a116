#include <aw/market/portfolio.hpp>

#include <cmath>
#include <stdexcept>
#include <utility>

namespace aw {
namespace market {

const char* role_name(FundRole role) noexcept {
  switch (role) {
    case FundRole::Bond:          return "Bond";
    case FundRole::International: return "International";
    case FundRole::National:      return "National";
  }
  return "Bond";
}

FundRole role_at(std::size_t i) {
  switch (i) {
    case 0: return FundRole::Bond;
    case 1: return FundRole::International;
    case 2: return FundRole::National;
    default: break;
  }
  throw std::out_of_range("role_at: index must be < 3");
}

PortfolioSnapshot::PortfolioSnapshot(std::array<FundPosition, kTrackedFunds> tracked_,
                                     FundPosition money_market_,
                                     std::string source_)
    : tracked(std::move(tracked_)),
      money_market(std::move(money_market_)),
      source(std::move(source_)) {
  for (const auto& p : tracked) {
    if (!std::isfinite(p.balance)) {
      throw std::invalid_argument("PortfolioSnapshot: balance of " + p.symbol + " is not finite");
    }
  }
}

const FundPosition& PortfolioSnapshot::position(FundRole role) const noexcept {
  return tracked[static_cast<std::size_t>(role)];
}

double PortfolioSnapshot::invested_total() const noexcept {
  double total = 0.0;
  for (const auto& p : tracked) total += p.balance;
  return total;
}

double PortfolioSnapshot::current_allocation(FundRole role) const noexcept {
  const double total = invested_total();
  if (total == 0.0) return 0.0; // rien d'investi : pas d'allocation définie
  return position(role).balance / total;
}

} // namespace market
} // namespace aw
