/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#pragma once

#include <cmath>
#include <complex>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include "qadapt/solvers/operators/pauli_word.h"

namespace qadapt::solvers::adapt {

/// Numeric aliases used throughout the ADAPT engine.
using parameter = double;
using energy = double;
using score = double;
using amplitude = std::complex<double>;

/// @brief A mutable state vector over `num_qubits()` qubits.
///
/// @details Concrete representations (dense array, sparse map) implement the
/// vector-space operations and the elementary Pauli actions that generators
/// and observables are built from. Binary operations between two different
/// representations raise `not_implemented_error`. Norm is never enforced;
/// unitary evolution simply preserves it.
class quantum_state {
public:
  virtual ~quantum_state() = default;

  /// @brief Number of qubits.
  virtual std::size_t num_qubits() const = 0;

  /// @brief Dimension of the Hilbert space, 2^n.
  std::uint64_t dimension() const { return std::uint64_t(1) << num_qubits(); }

  /// @brief Deep copy.
  virtual std::unique_ptr<quantum_state> clone() const = 0;

  /// @brief A zero vector of the same representation and shape.
  virtual std::unique_ptr<quantum_state> zeros_like() const = 0;

  /// @brief Overwrite this state with `other`, reusing storage.
  virtual void assign(const quantum_state &other) = 0;

  /// @brief Set every amplitude to zero.
  virtual void set_zero() = 0;

  /// @brief this *= factor
  virtual void scale(amplitude factor) = 0;

  /// @brief this += factor * other
  virtual void add(amplitude factor, const quantum_state &other) = 0;

  /// @brief The inner product <this|other>.
  virtual amplitude inner(const quantum_state &other) const = 0;

  /// @brief The Euclidean norm.
  double norm() const { return std::sqrt(std::abs(inner(*this).real())); }

  /// @brief out += factor * P|this>
  virtual void apply_pauli(const pauli_word &word, amplitude factor,
                           quantum_state &out) const = 0;

  /// @brief this = exp(-i angle P)|this> for a Pauli word P.
  virtual void rotate(const pauli_word &word, double angle) = 0;

  /// @brief Multiply the amplitude of each basis state |k> by phase(k).
  virtual void
  apply_phases(const std::function<amplitude(std::uint64_t)> &phase) = 0;

  /// @brief Dense amplitude vector of length 2^n.
  virtual std::vector<amplitude> to_vector() const = 0;

  /// @brief Exact, element-wise equality with a state of the same
  /// representation.
  virtual bool equals(const quantum_state &other) const = 0;
};

} // namespace qadapt::solvers::adapt
