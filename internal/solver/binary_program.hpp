#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace trustnet::solver {

struct LinearTerm {
  std::size_t variable{0};
  double      coefficient{0.0};
};

// sum(terms) <= rhs
struct LinearConstraint {
  std::string             name;
  std::vector<LinearTerm> terms;
  double                  rhs{0.0};
};

/*
  Maximization program over binary variables.

  Built by the exact selectors and handed to an IntegerProgramBackend; the
  program itself knows nothing about nodes or budgets.
*/
class BinaryProgram {
 public:
  explicit BinaryProgram(std::string name);

  std::size_t AddVariable(std::string name, double objective);

  // Throws std::out_of_range for unknown variables.
  void AddLessEqual(std::string name, std::vector<LinearTerm> terms, double rhs);

  const std::string& Name() const {
    return name_;
  }

  std::size_t VariableCount() const {
    return objective_.size();
  }

  const std::string& VariableName(std::size_t variable) const {
    return variable_names_.at(variable);
  }

  double Objective(std::size_t variable) const {
    return objective_.at(variable);
  }

  const std::vector<LinearConstraint>& Constraints() const {
    return constraints_;
  }

  double Evaluate(const std::vector<std::uint8_t>& values) const;
  bool   IsFeasible(const std::vector<std::uint8_t>& values, double tolerance = 1e-9) const;

 private:
  std::string                   name_;
  std::vector<std::string>      variable_names_;
  std::vector<double>           objective_;
  std::vector<LinearConstraint> constraints_;
};

} // namespace trustnet::solver
