#include "settlesim/core/errors.h"

namespace settlesim {
namespace {

std::string summarize(const std::string& id, const std::vector<std::string>& problems) {
  std::string msg = "Settlement " + id + " failed validation";
  if (problems.empty()) return msg;
  msg += ": " + problems.front();
  if (problems.size() > 1) msg += " (+" + std::to_string(problems.size() - 1) + " more)";
  return msg;
}

} // namespace

ValidationError::ValidationError(const std::string& settlement_id, std::vector<std::string> problems)
    : std::runtime_error(summarize(settlement_id, problems)),
      settlement_id_(settlement_id),
      problems_(std::move(problems)) {}

} // namespace settlesim
