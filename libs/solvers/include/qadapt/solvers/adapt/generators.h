/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#pragma once

#include "generator.h"
#include "qadapt/solvers/operators/pauli_word.h"

#include "cudaq/spin_op.h"

namespace qadapt::solvers::adapt {

/// @brief A real-weighted Pauli word c·P, evolved exactly as
/// cos(cθ) - i sin(cθ) P.
class pauli_generator : public generator {
private:
  std::size_t numQubits;
  double coefficient;
  pauli_word word;

public:
  /// @throw std::invalid_argument for the identity word
  pauli_generator(std::size_t num_qubits, double coefficient, pauli_word word);

  double get_coefficient() const { return coefficient; }
  const pauli_word &get_word() const { return word; }

  std::size_t num_qubits() const override { return numQubits; }
  void evolve(parameter theta, quantum_state &state) const override;
  void apply(const quantum_state &in, quantum_state &out) const override;
  std::uint64_t support_mask() const override { return word.support_mask(); }
  std::string to_string() const override;
  bool equals(const generator &other) const override;
};

/// @brief An ordered vector of real-weighted Pauli words, evolved by applying
/// each word in turn with the same θ.
///
/// @details When the words commute pairwise the product is the exact
/// exponential of their sum. The differential action is the exact derivative
/// of the ordered product in either case, accumulated in one forward pass:
/// with D_0 = 0, D_k = U_k D_(k-1) - i c_k P_k U_k ... U_1 in.
class commuting_generator : public generator {
private:
  std::size_t numQubits;
  std::vector<double> coefficients;
  std::vector<pauli_word> words;

public:
  /// @throw std::invalid_argument for an empty vector, mismatched lengths or
  /// identity words
  commuting_generator(std::size_t num_qubits, std::vector<double> coefficients,
                      std::vector<pauli_word> words);

  std::size_t num_terms() const { return words.size(); }
  const std::vector<double> &get_coefficients() const { return coefficients; }
  const std::vector<pauli_word> &get_words() const { return words; }

  /// @brief True if all words commute pairwise.
  bool is_commuting() const;

  std::size_t num_qubits() const override { return numQubits; }
  void evolve(parameter theta, quantum_state &state) const override;
  void unevolve(parameter theta, quantum_state &state) const override;
  void apply(const quantum_state &in, quantum_state &out) const override;
  using generator::differential_action;
  void differential_action(parameter theta, const quantum_state &in,
                           quantum_state &out,
                           quantum_state &scratch) const override;
  std::uint64_t support_mask() const override;
  std::string to_string() const override;
  bool equals(const generator &other) const override;
};

/// @brief A general Hermitian sum of real-weighted Pauli words whose
/// exponential is applied exactly through a Krylov subspace projection.
/// Evolution is only available for `dense_state`.
class pauli_sum_generator : public generator {
private:
  std::size_t numQubits;
  std::vector<pauli_term> terms;

public:
  /// @throw std::invalid_argument for an empty sum or complex coefficients
  pauli_sum_generator(std::size_t num_qubits, std::vector<pauli_term> terms);

  const std::vector<pauli_term> &get_terms() const { return terms; }

  std::size_t num_qubits() const override { return numQubits; }
  /// @throw not_implemented_error for states other than `dense_state`
  void evolve(parameter theta, quantum_state &state) const override;
  void apply(const quantum_state &in, quantum_state &out) const override;
  std::uint64_t support_mask() const override;
  std::string to_string() const override;
  bool equals(const generator &other) const override;
};

/// @brief Build the cheapest exact generator for a Hermitian `spin_op`:
/// a `pauli_generator` for one term, a `commuting_generator` when all terms
/// commute, a `pauli_sum_generator` otherwise. Identity terms only contribute
/// a global phase and are dropped.
/// @throw std::invalid_argument if the operator has complex coefficients or
/// no non-identity terms
generator_ptr make_generator(const cudaq::spin_op &op, std::size_t num_qubits);

/// @brief Convert operators to generators, dropping value-equal duplicates
/// and keeping first occurrences in order.
generator_pool make_pool(const std::vector<cudaq::spin_op> &ops,
                         std::size_t num_qubits);

} // namespace qadapt::solvers::adapt
