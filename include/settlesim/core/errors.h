#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace settlesim {

// Malformed catalog / config / terrain document. Raised at load time only; runtime
// lookups that miss degrade to zero contribution instead of throwing.
class ConfigurationError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// A repository read or write failed. The settlement being processed is left unchanged
// and the phase is retried on its next due occurrence.
class PersistenceError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// A settlement aggregate failed validation at the repository boundary.
class ValidationError : public std::runtime_error {
 public:
  ValidationError(const std::string& settlement_id, std::vector<std::string> problems);

  const std::string& settlement_id() const { return settlement_id_; }
  const std::vector<std::string>& problems() const { return problems_; }

 private:
  std::string settlement_id_;
  std::vector<std::string> problems_;
};

} // namespace settlesim
