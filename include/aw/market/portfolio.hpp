#pragma once
/**
 * @file portfolio.hpp
 * @brief Photo immuable d'un compte : trois fonds suivis + un fonds monétaire ignoré.
 *
 * # Contenu
 * - positions suivies, dans l'ordre du fichier : obligataire, indice international,
 *   indice national.
 * - position monétaire (ex. SPAXX) : conservée pour affichage, jamais incluse
 *   dans les totaux ni dans l'allocation.
 * - source : chemin du fichier chargé (sert à choisir la glide path).
 *
 * # Domaine valide
 * - soldes finis. Aucun autre contrôle (un solde nul est légal).
 */

#include <array>
#include <cstddef>
#include <string>

namespace aw {
namespace market {

/// @brief Rôle d'un fonds suivi dans l'allocation.
enum class FundRole {
  Bond,          ///< Fonds obligataire.
  International, ///< Indice actions internationales.
  National       ///< Indice actions domestiques.
};

inline constexpr std::size_t kTrackedFunds = 3;

/// @brief Libellé court d'un rôle ("Bond", "International", "National").
const char* role_name(FundRole role) noexcept;

/// @brief Rôle de la i-ème position suivie (0..2).
FundRole role_at(std::size_t i);

/// @brief Une ligne de position : symbole et solde courant en dollars.
struct FundPosition {
  std::string symbol;
  double balance{0.0};
};

/**
 * @brief Photo d'un compte, immuable après construction.
 *
 * Remplacée en bloc à chaque chargement ; passée par valeur/référence au calcul.
 */
struct PortfolioSnapshot {
public:
  const std::array<FundPosition, kTrackedFunds> tracked; ///< Bond, International, National.
  const FundPosition money_market;                       ///< Ignoré dans les totaux.
  const std::string source;                              ///< Chemin du fichier d'origine.

  /// @throws std::invalid_argument si un solde n'est pas fini.
  PortfolioSnapshot(std::array<FundPosition, kTrackedFunds> tracked,
                    FundPosition money_market,
                    std::string source);

  /// @return Position du rôle demandé.
  const FundPosition& position(FundRole role) const noexcept;

  /// @return Somme des trois soldes suivis (hors monétaire).
  [[nodiscard]] double invested_total() const noexcept;

  /// @return Part courante du fonds dans invested_total() ; 0 si total nul.
  [[nodiscard]] double current_allocation(FundRole role) const noexcept;
};

} // namespace market
} // namespace aw
