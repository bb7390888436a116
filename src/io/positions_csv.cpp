#include "aw/io/positions_csv.hpp"
#include "aw/core/money.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <optional>

namespace {

// --- helpers texte ---
static inline std::string trim(std::string s) {
  auto notsp = [](int ch){ return !std::isspace(ch); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), notsp));
  s.erase(std::find_if(s.rbegin(), s.rend(), notsp).base(), s.end());
  return s;
}

static inline void strip_bom(std::string& line) {
  static const std::string BOM = "\xEF\xBB\xBF";
  if (line.compare(0, BOM.size(), BOM) == 0) line.erase(0, BOM.size());
}

static std::string cell(const std::vector<std::string>& cells, std::size_t i) {
  return i < cells.size() ? cells[i] : std::string();
}

} // namespace

namespace aw::io {

std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> out;
  std::string field;
  bool in_quotes = false;
  for (size_t i=0;i<line.size();++i) {
    char c = line[i];
    if (c == '"') {
      if (in_quotes && i+1<line.size() && line[i+1] == '"') { field.push_back('"'); ++i; }
      else { in_quotes = !in_quotes; }
    } else if (c == ',' && !in_quotes) {
      out.push_back(trim(field)); field.clear();
    } else {
      field.push_back(c);
    }
  }
  out.push_back(trim(field));
  return out;
}

aw::market::PortfolioSnapshot
read_positions_csv(const std::string& path,
                   const aw::config::PositionsLayout& layout,
                   std::vector<std::string>* warnings)
{
  std::ifstream f(path);
  if (!f) throw ParseError("Cannot open positions file: " + path);

  // On ne lit que jusqu'à la dernière ligne utile.
  const std::size_t needed = std::max(layout.min_rows(), layout.money_market_row + 1);
  std::vector<std::vector<std::string>> rows;
  std::string line;
  while (rows.size() < needed && std::getline(f, line)) {
    if (!line.empty() && line.back()=='\r') line.pop_back();
    if (rows.empty()) strip_bom(line);
    rows.push_back(split_csv_line(line));
  }
  if (f.bad()) throw ParseError("Read error on positions file: " + path);

  if (rows.size() < layout.min_rows()) {
    throw ParseError("Positions file has " + std::to_string(rows.size()) +
                     " rows, expected at least " + std::to_string(layout.min_rows()));
  }

  std::array<aw::market::FundPosition, aw::market::kTrackedFunds> tracked;
  for (std::size_t k = 0; k < aw::market::kTrackedFunds; ++k) {
    const std::size_t r = layout.first_tracked_row + k;
    const auto& cells = rows[r];
    const std::string row_tag = "row " + std::to_string(r) + " (" +
                                aw::market::role_name(aw::market::role_at(k)) + ")";

    if (layout.symbol_col >= cells.size() || layout.value_col >= cells.size()) {
      throw ParseError(row_tag + ": missing columns (" + std::to_string(cells.size()) + " found)");
    }
    const std::string symbol = cells[layout.symbol_col];
    if (symbol.empty()) throw ParseError(row_tag + ": empty symbol");

    const auto value = aw::core::parse_dollar(cells[layout.value_col]);
    if (!value) {
      throw ParseError(row_tag + ": invalid value '" + cells[layout.value_col] + "'");
    }
    tracked[k] = aw::market::FundPosition{symbol, *value};
  }

  // Ligne monétaire : tolérante, jamais bloquante.
  aw::market::FundPosition mm;
  if (layout.money_market_row < rows.size()) {
    const auto& cells = rows[layout.money_market_row];
    mm.symbol = cell(cells, layout.symbol_col);
    const auto v = aw::core::parse_dollar(cell(cells, layout.value_col));
    if (v) {
      mm.balance = *v;
    } else if (warnings) {
      warnings->push_back("Money market row " + std::to_string(layout.money_market_row) +
                          ": no usable value, recorded as 0");
    }
  } else if (warnings) {
    warnings->push_back("Money market row absent");
  }

  if (warnings) {
    for (const auto& p : tracked) {
      if (p.balance == 0.0) warnings->push_back("Zero balance for " + p.symbol);
      if (p.balance < 0.0)  warnings->push_back("Negative balance for " + p.symbol);
    }
  }

  return aw::market::PortfolioSnapshot(tracked, mm, path);
}

} // namespace aw::io
