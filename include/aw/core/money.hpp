#pragma once
/**
 * @file money.hpp
 * @brief Montants en dollars : parsing des exports courtier, saisie utilisateur, arrondi.
 *
 * # Formats acceptés par parse_dollar
 * - "$1,234.56", "1234.56", "  $12 "
 * - négatifs : "-$12.00", "$-12.00", "(12.00)"
 * - guillemets résiduels autour du champ
 *
 * # Convention
 * - Les montants sont des double ; l'arrondi au cent se fait au moment
 *   d'afficher ou de comparer une quantité à trader (round_cents).
 */

#include <optional>
#include <string>

namespace aw::core {

/// @brief Parse un montant au format courtier. nullopt si vide ou non numérique.
std::optional<double> parse_dollar(const std::string& text);

/// @brief Parse le champ "montant à investir". Vide => 0.0, invalide => nullopt.
std::optional<double> parse_amount(const std::string& text);

/// @brief Arrondi au cent (demi-unité loin de zéro).
[[nodiscard]] double round_cents(double x) noexcept;

/// @brief Rendu "1234.50" : deux décimales, pas de séparateur de milliers.
std::string format_money(double x);

/// @brief Rendu "20.00%" d'une fraction (0.2).
std::string format_percent(double fraction);

} // namespace aw::core
