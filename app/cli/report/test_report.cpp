#include "aw/report/report.hpp"
#include <cassert>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using aw::rebalance::ActionKind;
using aw::market::FundPosition;

static std::vector<std::string> lines_of(const std::string& s) {
  std::vector<std::string> out;
  std::istringstream is(s);
  std::string l;
  while (std::getline(is, l)) out.push_back(l);
  return out;
}

int main() {
  // 1) Extraction presse-papiers
  assert(aw::report::extract_amount("Buy $40.0 Bond Fund") == "40.0");
  assert(aw::report::extract_amount("Sell $1578.21 FXNAX") == "1578.21");
  assert(aw::report::extract_amount("Looks good for FZROX") == "");
  assert(aw::report::extract_amount("") == "");

  // 2) Texte des recommandations
  aw::rebalance::FundTarget f;
  f.symbol = "FXNAX";
  f.action = {ActionKind::Sell, 40.0};
  assert(aw::report::format_recommendation(f) == "Sell $40.00 FXNAX");
  f.action = {ActionKind::Buy, 1234.5};
  assert(aw::report::format_recommendation(f) == "Buy $1234.50 FXNAX");
  f.action = {ActionKind::Hold, 0.0};
  assert(aw::report::format_recommendation(f) == "Looks good for FXNAX");
  f.action = {ActionKind::Buy, 40.0};
  assert(aw::report::extract_amount(aw::report::format_recommendation(f)) == "40.00");

  // 3) Tableau : [100,100,100] en 2020
  aw::market::PortfolioSnapshot snap({FundPosition{"FXNAX", 100.0},
                                      FundPosition{"FZILX", 100.0},
                                      FundPosition{"FZROX", 100.0}},
                                     FundPosition{"SPAXX**", 0.0}, "p_2020.csv");
  auto res = aw::rebalance::compute_strategy(snap, 0.0, aw::allocation::select_glide_path("2020"));
  const std::string table = aw::report::render_report(res);
  auto lines = lines_of(table);
  assert(lines.size() == 7);
  assert(lines[0] == "Values From CSV: ");
  assert(lines[1].empty());
  assert(lines[2].rfind("|Symbol              |Current Value       |", 0) == 0);
  assert(lines[3].find_first_not_of('-') == std::string::npos);
  assert(lines[3].size() == lines[2].size());
  // int(0.85 * longueur de "Values From CSV: \n\n|" + en-tête) = int(0.85 * 125)
  assert(lines[3].size() == 106);
  assert(lines[4] == "|FXNAX               |100.00              |33.33%              |60.00               |20.00%              |");
  assert(lines[6].find("|150.00              |50.00%              |") != std::string::npos);

  // 4) Total investi nul : allocation courante 0.00 %
  aw::market::PortfolioSnapshot empty({FundPosition{"FXNAX", 0.0},
                                       FundPosition{"FZILX", 0.0},
                                       FundPosition{"FZROX", 0.0}},
                                      FundPosition{}, "p.csv");
  auto res0 = aw::rebalance::compute_strategy(empty, 100.0, aw::allocation::default_glide_path());
  assert(res0.funds[0].action.kind == ActionKind::Buy);
  assert(aw::report::render_report(res0).find("|0.00%") != std::string::npos);

  // 5) Description de glide path
  assert(aw::report::describe_glide_path(aw::allocation::select_glide_path("2030"))
         == "Glide path 2030: 30.00% / 27.00% / 43.00%");

  std::cout << "Report OK\n";
  return 0;
}
