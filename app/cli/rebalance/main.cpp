#include <aw/config/positions_layout.hpp>
#include <aw/config/rebalance_config.hpp>
#include <aw/report/report.hpp>
#include <aw/session/session.hpp>

#include <iostream>
#include <stdexcept>
#include <string>

// Index de colonne/ligne : entier décimal non signé, chaîne entière consommée.
static std::size_t parse_index(const std::string& s) {
  if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) {
    throw std::invalid_argument("not a column index: " + s);
  }
  return static_cast<std::size_t>(std::stoul(s));
}

static void print_usage(const char* prog) {
  std::cerr << "Usage:\n  " << prog
            << " -f <positions.csv> [-a AMOUNT] [--label TEXT]"
            << " [--symbol-col N] [--value-col N] [--first-row N]"
            << " [--band LOW HIGH] [-w]\n";
}

int main(int argc, char** argv) {
  std::string path;
  std::string amount;
  std::string label;
  bool show_warnings = false;
  aw::config::PositionsLayout layout;
  double band_low = 0.95, band_high = 1.05;

  try {
    for (int i=1;i<argc;++i) {
      std::string a = argv[i];
      if ((a=="-f" || a=="--file") && i+1<argc)        { path = argv[++i]; }
      else if ((a=="-a" || a=="--amount") && i+1<argc) { amount = argv[++i]; }
      else if (a=="--label" && i+1<argc)               { label = argv[++i]; }
      else if (a=="--symbol-col" && i+1<argc)          { layout.symbol_col = parse_index(argv[++i]); }
      else if (a=="--value-col" && i+1<argc)           { layout.value_col  = parse_index(argv[++i]); }
      else if (a=="--first-row" && i+1<argc)           { layout.first_tracked_row = parse_index(argv[++i]); }
      else if (a=="--band" && i+2<argc) {
        band_low  = std::stod(argv[++i]);
        band_high = std::stod(argv[++i]);
      }
      else if (a=="-w" || a=="--show-warnings")        { show_warnings = true; }
      else if (a=="-h" || a=="--help")                 { print_usage(argv[0]); return 0; }
      else if (path.empty())                           { path = a; }
      else { print_usage(argv[0]); return 2; }
    }
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    print_usage(argv[0]);
    return 2;
  }
  if (path.empty()) {
    print_usage(argv[0]);
    return 2;
  }

  aw::config::RebalanceConfig cfg(0.95, 1.05);
  try {
    cfg = aw::config::RebalanceConfig(band_low, band_high);
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }

  aw::session::Session session(layout, cfg);

  auto loaded = session.load(path);
  if (show_warnings) {
    for (auto& w : session.warnings()) std::cerr << "[warn] " << w << "\n";
  }
  if (!loaded.ok()) {
    std::cerr << loaded.message << " (" << loaded.detail << ")\n";
    return 3;
  }

  auto calc = session.calculate(amount, label);
  if (!calc.ok()) {
    std::cerr << calc.message << " (" << calc.detail << ")\n";
    return calc.status == aw::session::Status::InputError ? 4 : 3;
  }

  const auto& res = *session.last_result();
  std::cout << "File: " << path << "\n";
  std::cout << aw::report::describe_glide_path(res.glide_path) << "\n";
  std::cout << calc.message << "\n\n";
  for (const auto& f : res.funds) {
    std::cout << "  " << aw::report::format_recommendation(f) << "\n";
  }
  std::cout << "\n" << aw::report::render_report(res);
  return 0;
}
