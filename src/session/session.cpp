#include "aw/session/session.hpp"

#include <filesystem>
#include <stdexcept>
#include <utility>

#include "aw/allocation/glide_path.hpp"
#include "aw/core/money.hpp"
#include "aw/io/positions_csv.hpp"

namespace aw::session {

Session::Session(aw::config::PositionsLayout layout, aw::config::RebalanceConfig cfg)
    : layout_(layout), cfg_(cfg) {}

Outcome Session::load(const std::string& path) {
  std::vector<std::string> warns;
  if (path.empty()) {
    snapshot_.reset();
    result_.reset();
    warnings_.clear();
    return {Status::FileError, kFileErrorMessage, "no file selected"};
  }
  try {
    auto snap = aw::io::read_positions_csv(path, layout_, &warns);
    snapshot_.reset();
    snapshot_.emplace(std::move(snap));
  } catch (const aw::io::ParseError& e) {
    snapshot_.reset();
    result_.reset();
    warnings_.clear();
    return {Status::FileError, kFileErrorMessage, e.what()};
  }
  result_.reset();
  warnings_ = std::move(warns);
  return {Status::Ok, std::filesystem::path(path).filename().string(), {}};
}

Outcome Session::calculate(const std::string& amount_text, const std::string& glide_label) {
  const auto amount = aw::core::parse_amount(amount_text);
  if (!amount) {
    return {Status::InputError, kInputErrorMessage, "not a number: '" + amount_text + "'"};
  }
  if (!snapshot_) {
    return {Status::FileError, kFileErrorMessage, "no positions loaded"};
  }

  const std::string label = glide_label.empty() ? loaded_file_name() : glide_label;
  const auto& glide = aw::allocation::select_glide_path(label);
  try {
    result_ = aw::rebalance::compute_strategy(*snapshot_, *amount, glide, cfg_);
  } catch (const std::invalid_argument& e) {
    return {Status::InputError, kInputErrorMessage, e.what()};
  }
  return {Status::Ok, kCalculatedMessage, {}};
}

std::string Session::loaded_file_name() const {
  if (!snapshot_) return {};
  return std::filesystem::path(snapshot_->source).filename().string();
}

} // namespace aw::session
