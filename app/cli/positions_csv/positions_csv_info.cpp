#include "aw/io/positions_csv.hpp"
#include "aw/core/money.hpp"
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

// Index de colonne/ligne : entier décimal non signé, chaîne entière consommée.
static std::size_t parse_index(const std::string& s) {
  if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) {
    throw std::invalid_argument("not a column index: " + s);
  }
  return static_cast<std::size_t>(std::stoul(s));
}

static void print_usage() {
  std::cout << "Usage: positions_csv_info -f <file.csv> [-w] [--symbol-col N] [--value-col N]\n";
}

int main(int argc, char** argv) {
  std::string path;
  bool show_warnings = false;
  aw::config::PositionsLayout layout;

  try {
    for (int i=1;i<argc;++i) {
      std::string a = argv[i];
      if ((a=="-f" || a=="--file") && i+1<argc) { path = argv[++i]; }
      else if (a=="-w" || a=="--show-warnings") { show_warnings = true; }
      else if (a=="--symbol-col" && i+1<argc)   { layout.symbol_col = parse_index(argv[++i]); }
      else if (a=="--value-col" && i+1<argc)    { layout.value_col  = parse_index(argv[++i]); }
      else if (a=="-h" || a=="--help")          { print_usage(); return 0; }
      else if (path.empty())                    { path = a; }
    }
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    print_usage();
    return 2;
  }
  if (path.empty()) {
    std::cerr << "Please provide a CSV path (-f <file.csv>).\n";
    return 2;
  }

  std::vector<std::string> warnings;
  try {
    auto snap = aw::io::read_positions_csv(path, layout, &warnings);
    std::cout << "File: " << path << "\n";
    for (std::size_t i = 0; i < snap.tracked.size(); ++i) {
      const auto& p = snap.tracked[i];
      std::cout << aw::market::role_name(aw::market::role_at(i)) << ": " << p.symbol
                << " $" << aw::core::format_money(p.balance)
                << " (" << aw::core::format_percent(snap.current_allocation(aw::market::role_at(i))) << ")\n";
    }
    std::cout << "Money market (ignored): " << snap.money_market.symbol
              << " $" << aw::core::format_money(snap.money_market.balance) << "\n";
    std::cout << "Invested total: $" << aw::core::format_money(snap.invested_total()) << "\n";
  } catch (const aw::io::ParseError& e) {
    std::cerr << "Parse error: " << e.what() << "\n";
    return 3;
  }

  if (show_warnings) {
    for (auto& w : warnings) std::cerr << "[warn] " << w << "\n";
  }
  return 0;
}
