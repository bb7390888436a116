#pragma once
#include <stdexcept>
#include <string>
#include <vector>

#include <aw/config/positions_layout.hpp>
#include <aw/market/portfolio.hpp>

namespace aw::io {

// Fichier absent, illisible ou mal formé (trop peu de lignes, montant invalide...).
class ParseError : public std::runtime_error {
public:
  explicit ParseError(const std::string& what) : std::runtime_error(what) {}
};

// Découpe une ligne CSV (champs "..." avec "" échappé). Champs trimés.
std::vector<std::string> split_csv_line(const std::string& line);

// Lit l'export de positions : trois positions suivies à partir de
// layout.first_tracked_row (bond, international, national) + la ligne monétaire.
// Les lignes sont comptées telles quelles (en-tête = 0, lignes vides comprises).
// Lève ParseError si le fichier est absent ou si une position suivie est inexploitable.
// warnings est optionnel (ligne monétaire illisible, colonnes en trop, etc.).
aw::market::PortfolioSnapshot
read_positions_csv(const std::string& path,
                   const aw::config::PositionsLayout& layout = aw::config::PositionsLayout{},
                   std::vector<std::string>* warnings = nullptr);

} // namespace aw::io
