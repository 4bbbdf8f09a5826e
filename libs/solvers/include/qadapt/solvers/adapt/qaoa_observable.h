/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#pragma once

#include "generator.h"
#include "observable.h"

namespace qadapt::solvers::adapt {

/// @brief A diagonal cost Hamiltonian H = Σ c_j Z-words that doubles as the
/// generator of the QAOA phase separator exp(-i γ H).
///
/// @details Since H is diagonal, evolution multiplies the amplitude of |k>
/// by exp(-i γ E(k)) with E(k) = Σ c_j (-1)^{|z_j & k|}. Identity terms are
/// kept and contribute a constant to E.
class qaoa_observable : public generator, public observable {
private:
  std::size_t numQubits;
  std::vector<double> coefficients;
  std::vector<std::uint64_t> masks;

public:
  /// @throw std::invalid_argument if `op` contains X or Y factors, has
  /// complex coefficients or does not fit on `num_qubits` qubits
  qaoa_observable(const cudaq::spin_op &op, std::size_t num_qubits);

  /// @brief E(k), the diagonal entry of H on basis state |k>.
  double energy_of(std::uint64_t k) const;

  /// @brief All 2^n diagonal entries of H.
  std::vector<double> diagonal() const;

  std::size_t num_qubits() const override { return numQubits; }

  // generator
  void evolve(parameter gamma, quantum_state &state) const override;
  void apply(const quantum_state &in, quantum_state &out) const override;
  std::uint64_t support_mask() const override;
  bool equals(const generator &other) const override;

  // observable
  energy evaluate(const quantum_state &state) const override;
  void gradient_seed(const quantum_state &state,
                     quantum_state &out) const override;

  std::string to_string() const override;
};

} // namespace qadapt::solvers::adapt
