#include "aw/rebalance/rebalance.hpp"
#include "aw/core/money.hpp"

#include <cmath>
#include <stdexcept>

namespace aw::rebalance {

TradeAction decide_action(double target_pct,
                          double total,
                          double current,
                          double new_money,
                          const aw::config::RebalanceConfig& cfg)
{
  const double target = total * target_pct;

  if (current == 0.0) {
    if (target == 0.0) return {ActionKind::Hold, 0.0};
    // pas de ratio défini : on achète la cible entière (ou on vend si cible < 0)
    return { target > 0.0 ? ActionKind::Buy : ActionKind::Sell,
             aw::core::round_cents(std::abs(target)) };
  }

  const double ratio = target / current;
  if (cfg.hold_low < ratio && ratio < cfg.hold_high && new_money == 0.0) {
    return {ActionKind::Hold, 0.0};
  }

  const double amount = aw::core::round_cents(std::abs(target - current));
  return { ratio > 1.0 ? ActionKind::Buy : ActionKind::Sell, amount };
}

StrategyResult compute_strategy(const aw::market::PortfolioSnapshot& snapshot,
                                double new_money,
                                const aw::allocation::GlidePath& glide_path,
                                const aw::config::RebalanceConfig& cfg)
{
  if (!std::isfinite(new_money)) {
    throw std::invalid_argument("compute_strategy: new money must be finite");
  }

  StrategyResult res{glide_path, new_money, snapshot.invested_total(), 0.0, {}};
  res.total = res.invested_total + new_money;
  if (res.total < 0.0) {
    throw std::invalid_argument("compute_strategy: withdrawal exceeds portfolio value");
  }

  for (std::size_t i = 0; i < aw::market::kTrackedFunds; ++i) {
    const auto role = aw::market::role_at(i);
    const auto& pos = snapshot.position(role);

    FundTarget& ft  = res.funds[i];
    ft.role         = role;
    ft.symbol       = pos.symbol;
    ft.current      = pos.balance;
    ft.target_pct   = glide_path.target_for(role);
    ft.target_value = res.total * ft.target_pct;
    ft.action       = decide_action(ft.target_pct, res.total, pos.balance, new_money, cfg);
  }
  return res;
}

const char* action_name(ActionKind kind) noexcept {
  switch (kind) {
    case ActionKind::Hold: return "Hold";
    case ActionKind::Buy:  return "Buy";
    case ActionKind::Sell: return "Sell";
  }
  return "Hold";
}

} // namespace aw::rebalance
