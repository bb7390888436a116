#pragma once
/**
 * @file glide_path.hpp
 * @brief Glide path : pourcentages cibles fixes (obligataire / international / national)
 *        choisis d'après une année cible présente dans un libellé (nom de fichier).
 *
 * # Sélection
 * - recherche de sous-chaîne de chaque jeton ("2020", "2030", ... "2090"),
 *   dans l'ordre de la table ; le premier trouvé gagne.
 * - aucun jeton => défaut 100 % obligataire.
 *
 * # Invariant
 * - bond + intl + natl == 1.0 pour chaque ligne et pour le défaut.
 */

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <aw/market/portfolio.hpp>

namespace aw::allocation {

/// @brief Une ligne de la table : jeton d'année et triple de pourcentages.
struct GlidePath {
  const char* token; ///< "2020".."2090", ou "default".
  double bond;       ///< Part obligataire (fraction).
  double intl;       ///< Part indice international.
  double natl;       ///< Part indice national.

  /// @return Part cible du rôle demandé.
  double target_for(aw::market::FundRole role) const noexcept;
  bool is_default() const noexcept;
};

/// @return Table ordonnée des glide paths (hors défaut).
const std::vector<GlidePath>& glide_path_table();

/// @return Glide path par défaut (100 % obligataire).
const GlidePath& default_glide_path() noexcept;

/// @brief Premier jeton contenu dans label, sinon défaut.
const GlidePath& select_glide_path(std::string_view label);

/// @brief Vérifie bond+intl+natl == 1 à tol près.
[[nodiscard]] bool sums_to_one(const GlidePath& g, double tol = 1e-9) noexcept;

} // namespace aw::allocation
