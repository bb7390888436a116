#include "aw/session/session.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <string>

using aw::session::Session;
using aw::session::Status;
using aw::rebalance::ActionKind;

static bool near(double a, double b, double eps = 1e-9) { return std::abs(a - b) < eps; }

int main(int argc, char** argv) {
  const std::string dir = (argc>1 ? argv[1] : "data/position_samples");
  const std::string good    = dir + "/Portfolio_Positions_2030.csv";
  const std::string nokey   = dir + "/Portfolio_Positions.csv";
  const std::string shortf  = dir + "/short_positions_2020.csv";
  const std::string zerof   = dir + "/zero_intl_2020.csv";

  // 1) Calcul sans fichier => FileError
  {
    Session s;
    auto out = s.calculate("");
    assert(out.status == Status::FileError);
    assert(out.message == "you did not enter a csv file");
    assert(!s.last_result());
  }

  // 2) Fichier trop court => FileError, aucun compte chargé
  {
    Session s;
    auto out = s.load(shortf);
    assert(out.status == Status::FileError);
    assert(out.message == aw::session::kFileErrorMessage);
    assert(!out.detail.empty());
    assert(!s.has_portfolio());
  }

  // 3) Chargement + calcul : 2030, 0 $ => tout "Looks good" ; 1000 $ => trois achats
  {
    Session s;
    auto out = s.load(good);
    assert(out.ok());
    assert(s.loaded_file_name() == "Portfolio_Positions_2030.csv");

    out = s.calculate("");
    assert(out.ok() && out.message == "Strategy Calculated");
    const auto& r0 = *s.last_result();
    assert(std::string(r0.glide_path.token) == "2030");
    for (const auto& f : r0.funds) assert(f.action.kind == ActionKind::Hold);

    out = s.calculate("1000");
    assert(out.ok());
    const auto& r1 = *s.last_result();
    assert(near(r1.total, 10935.11, 1e-6));
    assert(r1.funds[0].action.kind == ActionKind::Buy && near(r1.funds[0].action.amount, 254.02));
    assert(r1.funds[1].action.kind == ActionKind::Buy && near(r1.funds[1].action.amount, 258.88));
    assert(r1.funds[2].action.kind == ActionKind::Buy && near(r1.funds[2].action.amount, 487.10));

    // 4) Montant invalide => InputError, état conservé
    out = s.calculate("abc");
    assert(out.status == Status::InputError);
    assert(out.message == "You did not enter a valid amount");
    assert(s.has_portfolio());
    assert(s.last_result() && near(s.last_result()->new_money, 1000.0));

    // Retrait supérieur aux avoirs => InputError, état conservé
    out = s.calculate("-20000");
    assert(out.status == Status::InputError);
    assert(near(s.last_result()->new_money, 1000.0));

    // 5) Rechargement raté => retour à "aucune donnée"
    out = s.load(dir + "/missing.csv");
    assert(out.status == Status::FileError);
    assert(!s.has_portfolio());
    assert(!s.last_result());
    assert(s.calculate("").status == Status::FileError);
  }

  // 5b) Fichier trop court par-dessus un compte chargé : aucun état partiel
  {
    Session s;
    assert(s.load(good).ok());
    assert(s.calculate("250").ok());
    assert(s.has_portfolio() && s.last_result());

    auto out = s.load(shortf);
    assert(out.status == Status::FileError);
    assert(out.message == aw::session::kFileErrorMessage);
    assert(!s.has_portfolio());
    assert(!s.last_result());
    assert(s.loaded_file_name().empty());
    assert(s.warnings().empty());
  }

  // 5c) Sélection annulée (chemin vide) : même traitement qu'un fichier invalide
  {
    Session s;
    assert(s.load(good).ok());
    assert(s.calculate("").ok());
    auto out = s.load("");
    assert(out.status == Status::FileError);
    assert(out.message == "you did not enter a csv file");
    assert(!s.has_portfolio());
    assert(!s.last_result());
  }

  // 6) Nom sans jeton => 100 % obligataire ; libellé explicite prioritaire
  {
    Session s;
    assert(s.load(nokey).ok());
    assert(s.calculate("0").ok());
    assert(s.last_result()->glide_path.is_default());
    assert(s.last_result()->funds[0].action.kind == ActionKind::Buy);
    assert(s.last_result()->funds[1].action.kind == ActionKind::Sell);
    assert(near(s.last_result()->funds[1].action.amount, 2693.60));

    assert(s.calculate("0", "target-2030").ok());
    assert(std::string(s.last_result()->glide_path.token) == "2030");
  }

  // 7) Solde nul : achat de la cible entière (pas de division par zéro)
  {
    Session s;
    assert(s.load(zerof).ok());
    assert(!s.warnings().empty());
    assert(s.calculate("").ok());
    const auto& r = *s.last_result();
    assert(r.funds[1].action.kind == ActionKind::Buy);
    assert(near(r.funds[1].action.amount, 2172.45));
    assert(r.funds[0].action.kind == ActionKind::Sell);
    assert(near(r.funds[0].action.amount, 1578.21));
  }

  std::cout << "Session OK\n";
  return 0;
}
