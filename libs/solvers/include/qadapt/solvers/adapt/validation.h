/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#pragma once

#include "adapt_protocol.h"
#include "optimization_protocol.h"

namespace qadapt::solvers::adapt {

enum class check_status { passed, failed, not_implemented, error, skipped };

/// @brief Printable name of a check status.
std::string to_string(check_status status);

/// @brief Outcome of one named validation check.
struct check_result {
  std::string category;
  std::string name;
  check_status status;
  std::string message;
};

/// @brief All checks performed by `validate`, in execution order.
struct validation_report {
  std::vector<check_result> checks;

  /// @brief True if no check failed, errored or was not implemented.
  bool passed() const;

  /// @brief Number of checks with the given status.
  std::size_t count(check_status status) const;

  /// @brief The check called `name` in `category`, or nullptr.
  const check_result *find(const std::string &category,
                           const std::string &name) const;

  std::string to_string() const;
};

/// @brief Check that ADAPT works correctly with the given combination of
/// types.
///
/// @details The input ansatz is cloned and extended by `pool[0]` at angle 1
/// so evolution is nontrivial. Three groups of checks run:
///  - "runtime": every core operation executes. Missing implementations
///    are reported as `not_implemented`, other exceptions as `error`. This
///    runs one round of ADAPT, so keep the pool and observable small.
///  - "consistency": different routes to the same quantity agree (copy vs
///    in-place evolution, gradient vs partials, all scores vs single scores,
///    getters vs setters).
///  - "brute_force": evolution, evaluation, gradient and scores match dense
///    linear algebra. Skipped above "max_brute_force_qubits".
/// Consistency and brute-force checks only run if every runtime check
/// passed.
///
/// Supported options:
///  - "tolerance" (double): default tolerance [1e-10]
///  - "evolution", "evaluation", "gradient", "scores" (double): per-check
///    tolerances [tolerance]
///  - "skip" (std::vector<std::string>): names of brute-force checks to skip
///  - "max_brute_force_qubits" (std::size_t): [10]
/// @throw std::runtime_error for an empty pool
validation_report validate(const abstract_ansatz &ansatz,
                           adapt_protocol &adapt,
                           optimization_protocol &optimization,
                           const generator_pool &pool, const observable &H,
                           const quantum_state &reference,
                           const heterogeneous_map &options = {});

} // namespace qadapt::solvers::adapt
