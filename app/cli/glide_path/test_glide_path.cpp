#include "aw/allocation/glide_path.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <string>

using aw::allocation::select_glide_path;

int main() {
  const auto& table = aw::allocation::glide_path_table();

  // 1) Table : 8 jetons dans l'ordre, chaque triple somme à 1
  const char* tokens[] = {"2020","2030","2040","2050","2060","2070","2080","2090"};
  assert(table.size() == 8);
  for (std::size_t i = 0; i < table.size(); ++i) {
    assert(std::string(table[i].token) == tokens[i]);
    assert(aw::allocation::sums_to_one(table[i]));
    assert(!table[i].is_default());
  }
  assert(aw::allocation::sums_to_one(aw::allocation::default_glide_path()));
  assert(aw::allocation::default_glide_path().is_default());

  // 2) Sélection par sous-chaîne
  const auto& g2020 = select_glide_path("Portfolio_Positions_2020.csv");
  assert(std::string(g2020.token) == "2020");
  assert(g2020.bond == 0.20 && g2020.intl == 0.30 && g2020.natl == 0.50);

  const auto& g2080 = select_glide_path("/home/me/exports/roth-2080-jun.csv");
  assert(std::string(g2080.token) == "2080");
  assert(g2080.bond == 0.80 && g2080.intl == 0.08 && g2080.natl == 0.12);

  assert(std::string(select_glide_path("acct_2090").token) == "2090");
  assert(std::string(select_glide_path("x2050x").token) == "2050");

  // 3) Aucun jeton => 100 % obligataire
  const auto& def = select_glide_path("Portfolio_Positions.csv");
  assert(def.is_default());
  assert(def.bond == 1.0 && def.intl == 0.0 && def.natl == 0.0);
  assert(select_glide_path("").is_default());
  assert(select_glide_path("2025").is_default());

  // 4) Ordre préservé : premier jeton de la table gagne, pas le premier du texte
  assert(std::string(select_glide_path("2090_then_2030").token) == "2030");

  // 5) target_for suit le rôle
  assert(g2020.target_for(aw::market::FundRole::Bond) == 0.20);
  assert(g2020.target_for(aw::market::FundRole::International) == 0.30);
  assert(g2020.target_for(aw::market::FundRole::National) == 0.50);

  std::cout << "Glide path OK\n";
  return 0;
}
