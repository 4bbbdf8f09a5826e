/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#pragma once

#include <unordered_map>

#include "quantum_state.h"

namespace qadapt::solvers::adapt {

/// @brief A state vector stored as a map from basis index to amplitude.
/// Suited to states with few non-zero amplitudes, e.g. a reference
/// determinant evolved by a short ansatz.
class sparse_state : public quantum_state {
private:
  std::size_t numQubits = 0;
  std::unordered_map<std::uint64_t, amplitude> amplitudes;

  /// Drop amplitudes whose magnitude falls below `clip_threshold`.
  void clip();

public:
  /// Amplitudes with smaller magnitude are removed after each rotation.
  static constexpr double clip_threshold = 1e-16;

  /// @brief The basis state |basis_index> on `num_qubits` qubits.
  sparse_state(std::size_t num_qubits, std::uint64_t basis_index = 0);

  /// @brief Build from explicit (basis index, amplitude) entries.
  sparse_state(std::size_t num_qubits,
               std::unordered_map<std::uint64_t, amplitude> entries);

  /// @brief Amplitude of |k>, zero if absent.
  amplitude operator[](std::uint64_t k) const;

  /// @brief Number of stored amplitudes.
  std::size_t num_entries() const { return amplitudes.size(); }

  const std::unordered_map<std::uint64_t, amplitude> &data() const {
    return amplitudes;
  }

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
  std::vector<amplitude> to_vector() const override;
  bool equals(const quantum_state &other) const override;
};

} // namespace qadapt::solvers::adapt
