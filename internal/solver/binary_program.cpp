#include "binary_program.hpp"

#include <stdexcept>
#include <utility>

namespace trustnet::solver {

BinaryProgram::BinaryProgram(std::string name) : name_(std::move(name)) {
}

std::size_t BinaryProgram::AddVariable(std::string name, double objective) {
  variable_names_.push_back(std::move(name));
  objective_.push_back(objective);
  return objective_.size() - 1;
}

void BinaryProgram::AddLessEqual(std::string name, std::vector<LinearTerm> terms, double rhs) {
  for (const auto& term : terms) {
    if (term.variable >= objective_.size()) {
      throw std::out_of_range("constraint " + name + " references unknown variable " + std::to_string(term.variable));
    }
  }
  constraints_.push_back(LinearConstraint{std::move(name), std::move(terms), rhs});
}

double BinaryProgram::Evaluate(const std::vector<std::uint8_t>& values) const {
  double total = 0.0;
  for (std::size_t i = 0; i < objective_.size() && i < values.size(); ++i) {
    if (values[i]) total += objective_[i];
  }
  return total;
}

bool BinaryProgram::IsFeasible(const std::vector<std::uint8_t>& values, double tolerance) const {
  if (values.size() != objective_.size()) return false;
  for (const auto& constraint : constraints_) {
    double activity = 0.0;
    for (const auto& term : constraint.terms) {
      if (values[term.variable]) activity += term.coefficient;
    }
    if (activity > constraint.rhs + tolerance) return false;
  }
  return true;
}

} // namespace trustnet::solver
