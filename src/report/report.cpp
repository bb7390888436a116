#include "aw/report/report.hpp"
#include "aw/core/money.hpp"

#include <regex>
#include <sstream>
#include <vector>

namespace {

constexpr std::size_t kCellWidth = 20;

// cellule justifiée à gauche sur kCellWidth, fermée par '|'
std::string cell(const std::string& s) {
  std::string out = s;
  if (out.size() < kCellWidth) out.append(kCellWidth - out.size(), ' ');
  out.push_back('|');
  return out;
}

} // namespace

namespace aw::report {

std::string format_recommendation(const aw::rebalance::FundTarget& fund) {
  using aw::rebalance::ActionKind;
  switch (fund.action.kind) {
    case ActionKind::Hold:
      return "Looks good for " + fund.symbol;
    case ActionKind::Buy:
      return "Buy $" + aw::core::format_money(fund.action.amount) + " " + fund.symbol;
    case ActionKind::Sell:
      return "Sell $" + aw::core::format_money(fund.action.amount) + " " + fund.symbol;
  }
  return "Looks good for " + fund.symbol;
}

std::string extract_amount(const std::string& text) {
  static const std::regex numbers(R"(\d+(?:\.\d+)?)");
  std::string out;
  for (auto it = std::sregex_iterator(text.begin(), text.end(), numbers);
       it != std::sregex_iterator(); ++it) {
    out += it->str();
  }
  return out;
}

std::string render_report(const aw::rebalance::StrategyResult& result) {
  static const std::vector<std::string> headers = {
    "Symbol", "Current Value", "Current Allocation", "Target value", "Target Allocation"
  };

  std::ostringstream os;
  os << "Values From CSV: \n\n|";
  std::string head;
  for (const auto& h : headers) head += cell(h);
  os << head << "\n";
  os << std::string(head.size() + 1, '-');

  for (const auto& f : result.funds) {
    const double cur_alloc = result.invested_total != 0.0 ? f.current / result.invested_total : 0.0;
    os << "\n|"
       << cell(f.symbol)
       << cell(aw::core::format_money(f.current))
       << cell(aw::core::format_percent(cur_alloc))
       << cell(aw::core::format_money(f.target_value))
       << cell(aw::core::format_percent(f.target_pct));
  }
  os << "\n";
  return os.str();
}

std::string describe_glide_path(const aw::allocation::GlidePath& g) {
  std::ostringstream os;
  os << "Glide path " << g.token << ": "
     << aw::core::format_percent(g.bond) << " / "
     << aw::core::format_percent(g.intl) << " / "
     << aw::core::format_percent(g.natl);
  return os.str();
}

} // namespace aw::report
