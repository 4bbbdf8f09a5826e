/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "quantum_state.h"

namespace qadapt::solvers::adapt {

/// @brief The Hermitian operator G of a parameterized rotation exp(-i θ G).
///
/// @details Generators are immutable once constructed and compared by value.
/// `evolve` is the in-place primitive the whole engine is built on;
/// `differential_action` supplies the costate used by the analytic gradient.
class generator {
public:
  virtual ~generator() = default;

  /// @brief Number of qubits the generator acts on.
  virtual std::size_t num_qubits() const = 0;

  /// @brief state = exp(-i θ G) state
  virtual void evolve(parameter theta, quantum_state &state) const = 0;

  /// @brief Undo `evolve(theta, state)`. Equal to `evolve(-theta, state)` for
  /// a true exponential.
  virtual void unevolve(parameter theta, quantum_state &state) const {
    evolve(-theta, state);
  }

  /// @brief out = G in. `out` must not alias `in`.
  virtual void apply(const quantum_state &in, quantum_state &out) const = 0;

  /// @brief out = d/dθ [exp(-i θ G)] in, evaluated at `theta`.
  /// @details `scratch` is a work state of the same representation and size
  /// as `in`, overwritten by the call. `in`, `out` and `scratch` must be
  /// distinct. The default uses d/dθ exp(-iθG) = -iG exp(-iθG), exact
  /// whenever `evolve` is the true exponential.
  virtual void differential_action(parameter theta, const quantum_state &in,
                                   quantum_state &out,
                                   quantum_state &scratch) const;

  /// @brief As above, with a temporary work state.
  void differential_action(parameter theta, const quantum_state &in,
                           quantum_state &out) const;

  /// @brief Bit mask of the qubits acted on non-trivially.
  virtual std::uint64_t support_mask() const = 0;

  /// @brief The qubits acted on non-trivially, ascending.
  std::vector<std::size_t> support() const;

  /// @brief Human readable form, e.g. "+1.0 XXI".
  virtual std::string to_string() const = 0;

  /// @brief Value equality.
  virtual bool equals(const generator &other) const = 0;
};

/// Generators are shared, read-only, between pools and ansatze.
using generator_ptr = std::shared_ptr<const generator>;

/// @brief The fixed candidate set considered at each adaptation.
using generator_pool = std::vector<generator_ptr>;

} // namespace qadapt::solvers::adapt
