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

#include "quantum_state.h"

#include "cudaq/spin_op.h"

namespace qadapt::solvers::adapt {

/// @brief A real-valued cost function C(ψ) of a state.
///
/// @details Besides the value, an observable provides the gradient seed λ
/// with the property that, for any variation dψ of the state,
/// dC = 2 Re <dψ|λ>. For a Hermitian operator H this is λ = H|ψ>.
class observable {
public:
  virtual ~observable() = default;

  /// @brief Number of qubits the observable is defined on.
  virtual std::size_t num_qubits() const = 0;

  /// @brief The real cost of `state`.
  virtual energy evaluate(const quantum_state &state) const = 0;

  /// @brief out = λ(state)
  virtual void gradient_seed(const quantum_state &state,
                             quantum_state &out) const = 0;

  /// @brief out = M in, for the operator M whose expectation value is the
  /// cost, when such an operator exists.
  /// @throw not_implemented_error by default
  virtual void apply(const quantum_state &in, quantum_state &out) const;

  /// @brief Human readable form.
  virtual std::string to_string() const = 0;
};

/// @brief The expectation value <ψ|H|ψ> of a Hermitian sum of Pauli words.
class pauli_observable : public observable {
private:
  std::size_t numQubits;
  std::vector<pauli_term> terms;

public:
  /// @throw std::invalid_argument if `op` is not Hermitian or does not fit
  /// on `num_qubits` qubits
  pauli_observable(const cudaq::spin_op &op, std::size_t num_qubits);

  const std::vector<pauli_term> &get_terms() const { return terms; }

  std::size_t num_qubits() const override { return numQubits; }
  energy evaluate(const quantum_state &state) const override;
  void gradient_seed(const quantum_state &state,
                     quantum_state &out) const override;
  void apply(const quantum_state &in, quantum_state &out) const override;
  std::string to_string() const override;
};

/// @brief The infidelity 1 - |<Φ|ψ>|² with respect to a fixed target Φ.
class infidelity : public observable {
private:
  std::unique_ptr<quantum_state> target;

public:
  /// @brief Keep a copy of `target`.
  explicit infidelity(const quantum_state &target);

  const quantum_state &get_target() const { return *target; }

  std::size_t num_qubits() const override { return target->num_qubits(); }
  energy evaluate(const quantum_state &state) const override;
  /// @brief λ = -Φ <Φ|ψ>
  void gradient_seed(const quantum_state &state,
                     quantum_state &out) const override;
  /// @brief out = (1 - |Φ><Φ|) in
  void apply(const quantum_state &in, quantum_state &out) const override;
  std::string to_string() const override;
};

} // namespace qadapt::solvers::adapt
