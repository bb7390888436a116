#pragma once
#include <string>

#include <aw/rebalance/rebalance.hpp>

namespace aw::report {

// "Buy $40.00 FXNAX" / "Sell $10.00 FZILX" / "Looks good for FZROX"
std::string format_recommendation(const aw::rebalance::FundTarget& fund);

// Concatène toutes les sous-chaînes numériques (\d+(?:\.\d+)?) du texte.
// "Buy $40.0 Bond Fund" -> "40.0" ; "Looks good for X" -> "".
std::string extract_amount(const std::string& text);

// Tableau à largeur fixe : Symbol | Current Value | Current Allocation |
// Target value | Target Allocation, une ligne par fonds suivi.
std::string render_report(const aw::rebalance::StrategyResult& result);

// Une ligne "Glide path 2030: 30.00% / 27.00% / 43.00%".
std::string describe_glide_path(const aw::allocation::GlidePath& g);

} // namespace aw::report
