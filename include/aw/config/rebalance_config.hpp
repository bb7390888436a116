#pragma once
/**
 * @file rebalance_config.hpp
 * @brief Paramètres de la décision acheter / vendre / conserver.
 *
 * # Règle
 * ratio = cible / solde courant. Conserver si hold_low < ratio < hold_high
 * ET aucun argent nouveau ; sinon acheter (ratio > 1) ou vendre l'écart exact.
 * Toute somme nouvelle non nulle force un ordre, même dans la bande.
 */

#include <stdexcept> // std::invalid_argument

namespace aw {
namespace config {

/// @brief Bande de tolérance autour de la cible (bornes exclues).
struct RebalanceConfig {
  double hold_low;  ///< Borne basse du ratio (exclue).
  double hold_high; ///< Borne haute du ratio (exclue).

  /// @throws std::invalid_argument si la bande est vide ou ne contient pas 1.
  explicit RebalanceConfig(double hold_low = 0.95, double hold_high = 1.05)
      : hold_low(hold_low), hold_high(hold_high) {
    if (!(hold_low < 1.0 && 1.0 < hold_high)) {
      throw std::invalid_argument("RebalanceConfig: band must satisfy low < 1 < high");
    }
  }
};

} // namespace config
} // namespace aw
