/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#pragma once

#include "quantum_state.h"

namespace qadapt::solvers::adapt {

/// @brief A state vector stored as 2^n contiguous amplitudes indexed by the
/// computational basis index.
class dense_state : public quantum_state {
private:
  std::size_t numQubits = 0;
  std::vector<amplitude> amplitudes;

public:
  /// @brief The basis state |basis_index> on `num_qubits` qubits.
  dense_state(std::size_t num_qubits, std::uint64_t basis_index = 0);

  /// @brief Take ownership of an amplitude vector.
  /// @throw std::invalid_argument if the length is not a power of two
  explicit dense_state(std::vector<amplitude> data);

  /// @brief The uniform superposition |+>^n.
  static dense_state uniform_superposition(std::size_t num_qubits);

  amplitude &operator[](std::uint64_t k) { return amplitudes[k]; }
  const amplitude &operator[](std::uint64_t k) const { return amplitudes[k]; }

  std::vector<amplitude> &data() { return amplitudes; }
  const std::vector<amplitude> &data() const { return amplitudes; }

  std::size_t num_qubits() const override { return numQubits; }
  std::unique_ptr<quantum_state> clone() const override;
  std::unique_ptr<quantum_state> zeros_like() const override;
  void assign(const quantum_state &other) override;
  void set_zero() override;
  void scale(amplitude factor) override;
  void add(amplitude factor, const quantum_state &other) override;
  amplitude inner(const quantum_state &other) const override;
  void apply_pauli(const pauli_word &word, amplitude factor,
                   quantum_state &out) const override;
  void rotate(const pauli_word &word, double angle) override;
  void apply_phases(
      const std::function<amplitude(std::uint64_t)> &phase) override;
  std::vector<amplitude> to_vector() const override { return amplitudes; }
  bool equals(const quantum_state &other) const override;
};

} // namespace qadapt::solvers::adapt
