#pragma once
/**
 * @file positions_layout.hpp
 * @brief Emplacement des données utiles dans un export de positions (CSV courtier).
 *
 * # Contenu
 * - first_tracked_row  : ligne (0 = en-tête) de la première position suivie ;
 *                        les trois positions suivies sont consécutives.
 * - money_market_row   : ligne du fonds monétaire (ignoré dans les totaux).
 * - symbol_col         : colonne du symbole.
 * - value_col          : colonne de la valeur courante ("$1,234.56").
 *
 * # Domaine valide
 * - min_rows() lignes au minimum dans le fichier (en-tête compris).
 * - Les exports changent de colonnes selon les versions : d'où la surcharge
 *   possible de symbol_col / value_col depuis la ligne de commande.
 */

#include <cstddef> // std::size_t

namespace aw {
namespace config {

/// @brief Positions (ligne/colonne) des champs lus dans le CSV.
struct PositionsLayout {
  std::size_t first_tracked_row; ///< Ligne de la position obligataire.
  std::size_t money_market_row;  ///< Ligne du fonds monétaire.
  std::size_t symbol_col;        ///< Colonne "Symbol".
  std::size_t value_col;         ///< Colonne "Current Value".

  /// @brief Construit une disposition avec valeurs par défaut (export Fidelity).
  PositionsLayout(std::size_t first_tracked_row = 2,
                  std::size_t money_market_row = 1,
                  std::size_t symbol_col = 1,
                  std::size_t value_col = 6) noexcept
      : first_tracked_row(first_tracked_row),
        money_market_row(money_market_row),
        symbol_col(symbol_col),
        value_col(value_col) {}

  /// @return Nombre minimal de lignes pour atteindre la dernière position suivie.
  std::size_t min_rows() const noexcept { return first_tracked_row + 3; }
};

} // namespace config
} // namespace aw
