#pragma once
/**
 * @file rebalance.hpp
 * @brief Décision acheter / vendre / conserver par fonds, à partir d'une glide path.
 *
 * # Algorithme (par fonds suivi)
 * 1. total  = somme des soldes suivis + argent nouveau
 * 2. cible  = total * part cible
 * 3. ratio  = cible / solde courant
 * 4. Hold si hold_low < ratio < hold_high ET argent nouveau == 0
 * 5. sinon Buy si ratio > 1, Sell sinon, montant = |cible - courant| arrondi au cent
 *
 * # Solde courant nul
 * - cible > 0  : Buy(cible) (achat de la totalité de la cible)
 * - cible == 0 : Hold
 *
 * Fonctions pures : aucun état, aucun effet de bord.
 */

#include <array>
#include <string>

#include <aw/allocation/glide_path.hpp>
#include <aw/config/rebalance_config.hpp>
#include <aw/market/portfolio.hpp>

namespace aw::rebalance {

enum class ActionKind { Hold, Buy, Sell };

struct TradeAction {
  ActionKind kind{ActionKind::Hold};
  double amount{0.0}; // en dollars, >= 0, arrondi au cent ; 0 pour Hold
};

struct FundTarget {
  aw::market::FundRole role{aw::market::FundRole::Bond};
  std::string symbol;
  double current{0.0};      // solde courant
  double target_pct{0.0};   // part cible (fraction)
  double target_value{0.0}; // valeur cible (non arrondie)
  TradeAction action;
};

struct StrategyResult {
  aw::allocation::GlidePath glide_path;
  double new_money{0.0};
  double invested_total{0.0}; // soldes suivis, avant argent nouveau
  double total{0.0};          // invested_total + new_money
  std::array<FundTarget, aw::market::kTrackedFunds> funds;
};

// Décision pour un fonds. Pure.
TradeAction decide_action(double target_pct,
                          double total,
                          double current,
                          double new_money,
                          const aw::config::RebalanceConfig& cfg = aw::config::RebalanceConfig{});

// Stratégie complète pour un compte.
// Lève std::invalid_argument si new_money n'est pas fini ou si le total devient négatif
// (retrait supérieur aux avoirs).
StrategyResult compute_strategy(const aw::market::PortfolioSnapshot& snapshot,
                                double new_money,
                                const aw::allocation::GlidePath& glide_path,
                                const aw::config::RebalanceConfig& cfg = aw::config::RebalanceConfig{});

const char* action_name(ActionKind kind) noexcept;

} // namespace aw::rebalance
