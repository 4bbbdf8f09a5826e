/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#pragma once

#include <bit>
#include <complex>
#include <cstdint>
#include <string>
#include <vector>

#include "cudaq/spin_op.h"

namespace qadapt::solvers {

/// @brief Maximum number of qubits representable by a pauli_word.
inline constexpr std::size_t max_pauli_qubits = 64;

/// @brief A tensor product of single-qubit Pauli operators in symplectic
/// form. Qubit `q` corresponds to bit `q` of both masks and of the
/// computational basis index: X sets the x bit, Z the z bit, Y both.
struct pauli_word {
  std::uint64_t x_mask = 0;
  std::uint64_t z_mask = 0;

  /// @brief Parse a word such as "XIZY", character `q` acting on qubit `q`.
  /// @throw std::invalid_argument on characters other than I, X, Y, Z or
  /// words longer than 64 qubits
  static pauli_word from_string(const std::string &word);

  /// @brief Render as a string of length `num_qubits`.
  std::string to_string(std::size_t num_qubits) const;

  bool is_identity() const { return (x_mask | z_mask) == 0; }

  /// @brief True if the word contains only I and Z.
  bool is_diagonal() const { return x_mask == 0; }

  /// @brief Bit mask of the qubits acted on non-trivially.
  std::uint64_t support_mask() const { return x_mask | z_mask; }

  /// @brief The qubits acted on non-trivially, ascending.
  std::vector<std::size_t> support() const;

  /// @brief The phase `c` in `P|k> = c |k ^ x_mask>`.
  std::complex<double> phase(std::uint64_t k) const {
    // i^{#Y} from Y = iXZ, then the sign picked up by the Z factors
    static constexpr std::complex<double> powers[4] = {
        {1.0, 0.0}, {0.0, 1.0}, {-1.0, 0.0}, {0.0, -1.0}};
    auto c = powers[std::popcount(x_mask & z_mask) % 4];
    return (std::popcount(z_mask & k) % 2) ? -c : c;
  }

  /// @brief The real sign `(-1)^{|z & k|}` of a diagonal word on `|k>`.
  double sign(std::uint64_t k) const {
    return (std::popcount(z_mask & k) % 2) ? -1.0 : 1.0;
  }

  bool operator==(const pauli_word &) const = default;
};

/// @brief True if the two words commute.
inline bool commutes(const pauli_word &a, const pauli_word &b) {
  return (std::popcount(a.x_mask & b.z_mask) +
          std::popcount(a.z_mask & b.x_mask)) %
             2 ==
         0;
}

/// @brief A weighted Pauli word.
struct pauli_term {
  std::complex<double> coefficient;
  pauli_word word;
};

/// @brief Decompose a `cudaq::spin_op` into weighted Pauli words over
/// `num_qubits` qubits.
/// @throw std::invalid_argument if the operator acts on a qubit outside
/// [0, num_qubits) or `num_qubits` exceeds 64
std::vector<pauli_term> to_pauli_terms(const cudaq::spin_op &op,
                                       std::size_t num_qubits);

} // namespace qadapt::solvers
