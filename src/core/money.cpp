#include <aw/core/money.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <locale>
#include <regex>
#include <sstream>

namespace {

std::string trim(std::string s) {
  auto notsp = [](int ch){ return !std::isspace(ch); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), notsp));
  s.erase(std::find_if(s.rbegin(), s.rend(), notsp).base(), s.end());
  return s;
}

// décimal simple, point comme séparateur : pas d'hexa, pas d'exposant, pas d'inf/nan
const std::regex kPlainNumber(R"(^[-+]?(?:\d+(?:\.\d*)?|\.\d+)$)");

// saisie utilisateur : virgule uniquement comme séparateur de milliers (groupes de 3)
const std::regex kAmountInput(
    R"(^[-+]?\$?(?:\d{1,3}(?:,\d{3})+(?:\.\d*)?|\d+(?:\.\d*)?|\.\d+)$)");

// Parse en locale "C" quelle que soit la locale du processus (QApplication
// appelle setlocale(LC_ALL, "") sous Unix).
std::optional<double> parse_plain(const std::string& s) {
  if (!std::regex_match(s, kPlainNumber)) return std::nullopt;
  std::istringstream is(s);
  is.imbue(std::locale::classic());
  double v = 0.0;
  is >> v;
  if (!is || !std::isfinite(v)) return std::nullopt;
  return v;
}

// retire '$' et les séparateurs de milliers ; gère "-$x" et "$-x"
std::string strip_currency(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (c == '$' || c == ',') continue;
    out.push_back(c);
  }
  return out;
}

std::string fixed2(double x) {
  std::ostringstream os;
  os.imbue(std::locale::classic());
  os << std::fixed << std::setprecision(2) << x;
  return os.str();
}

} // namespace

namespace aw::core {

std::optional<double> parse_dollar(const std::string& text) {
  std::string s = trim(text);
  // guillemets laissés par un export mal échappé
  while (!s.empty() && s.front() == '"') s.erase(s.begin());
  while (!s.empty() && s.back()  == '"') s.pop_back();
  s = trim(s);
  if (s.empty()) return std::nullopt;

  bool negative = false;
  if (s.size() >= 2 && s.front() == '(' && s.back() == ')') {
    negative = true;
    s = trim(s.substr(1, s.size() - 2));
  }

  // "+" explicite (certains exports l'utilisent pour les gains)
  if (!s.empty() && s.front() == '+') s.erase(s.begin());

  auto v = parse_plain(strip_currency(s));
  if (!v) return std::nullopt;
  return negative ? -*v : *v;
}

std::optional<double> parse_amount(const std::string& text) {
  const std::string s = trim(text);
  if (s.empty()) return 0.0;
  if (!std::regex_match(s, kAmountInput)) return std::nullopt;
  return parse_plain(strip_currency(s));
}

double round_cents(double x) noexcept {
  return std::round(x * 100.0) / 100.0;
}

std::string format_money(double x) {
  double r = round_cents(x);
  if (r == 0.0) r = 0.0; // évite "-0.00"
  return fixed2(r);
}

std::string format_percent(double fraction) {
  double r = round_cents(100.0 * fraction);
  if (r == 0.0) r = 0.0;
  return fixed2(r) + "%";
}

} // namespace aw::core
