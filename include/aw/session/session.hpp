#pragma once
/**
 * @file session.hpp
 * @brief État d'une séance : dernier compte chargé + dernière stratégie calculée.
 *
 * # Erreurs (récupérables, rapportées par statut)
 * - FileError  : fichier absent/illisible/mal formé. Le compte chargé est remis
 *                à "aucune donnée".
 * - InputError : montant non numérique. Le calcul est abandonné, l'état
 *                précédent est conservé.
 *
 * Aucun accès UI : le formulaire Qt et le CLI s'appuient tous deux dessus.
 */

#include <optional>
#include <string>
#include <vector>

#include <aw/config/positions_layout.hpp>
#include <aw/config/rebalance_config.hpp>
#include <aw/market/portfolio.hpp>
#include <aw/rebalance/rebalance.hpp>

namespace aw::session {

enum class Status { Ok, FileError, InputError };

inline constexpr const char* kFileErrorMessage  = "you did not enter a csv file";
inline constexpr const char* kInputErrorMessage = "You did not enter a valid amount";
inline constexpr const char* kCalculatedMessage = "Strategy Calculated";

struct Outcome {
  Status status{Status::Ok};
  std::string message; // texte court pour la barre de statut
  std::string detail;  // cause technique (journal), vide si Ok
  bool ok() const noexcept { return status == Status::Ok; }
};

class Session {
public:
  explicit Session(aw::config::PositionsLayout layout = aw::config::PositionsLayout{},
                   aw::config::RebalanceConfig cfg = aw::config::RebalanceConfig{});

  // Remplace le compte chargé. Sur échec (chemin vide compris) : compte remis
  // à vide, FileError.
  Outcome load(const std::string& path);

  // Calcule la stratégie pour le montant saisi (vide = 0).
  // glide_label vide => nom du fichier chargé.
  Outcome calculate(const std::string& amount_text, const std::string& glide_label = std::string());

  bool has_portfolio() const noexcept { return snapshot_.has_value(); }
  const std::optional<aw::market::PortfolioSnapshot>& portfolio() const noexcept { return snapshot_; }
  const std::optional<aw::rebalance::StrategyResult>& last_result() const noexcept { return result_; }
  const std::vector<std::string>& warnings() const noexcept { return warnings_; }

  // Nom de fichier (sans dossier) du compte chargé, vide sinon.
  std::string loaded_file_name() const;

private:
  aw::config::PositionsLayout layout_;
  aw::config::RebalanceConfig cfg_;
  std::optional<aw::market::PortfolioSnapshot> snapshot_;
  std::optional<aw::rebalance::StrategyResult> result_;
  std::vector<std::string> warnings_;
};

} // namespace aw::session
