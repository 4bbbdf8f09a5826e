/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#pragma once

#include <memory>
#include <utility>
#include <vector>

#include "generator.h"

namespace qadapt::solvers::adapt {

/// @brief One (generator, parameter) pair of an ansatz.
using ansatz_element = std::pair<generator_ptr, parameter>;

/// @brief The progress of an ADAPT run: an ordered sequence of
/// (generator, parameter) pairs, applied to the reference lowest index
/// first, together with the `optimized` and `converged` flags.
///
/// @details The flags are independent. Adding a generator clears
/// `optimized` but leaves `converged` alone; otherwise they are only changed
/// through the setters, by protocols and callbacks.
class abstract_ansatz {
protected:
  std::size_t numQubits;
  bool optimized = true;
  bool converged = false;

public:
  explicit abstract_ansatz(std::size_t num_qubits) : numQubits(num_qubits) {}
  virtual ~abstract_ansatz() = default;

  std::size_t num_qubits() const { return numQubits; }

  /// @brief Number of (generator, parameter) pairs.
  virtual std::size_t size() const = 0;
  bool empty() const { return size() == 0; }

  /// @throw std::out_of_range for `i >= size()`
  virtual ansatz_element get(std::size_t i) const = 0;

  /// @brief Overwrite the pair at `i`.
  /// @throw std::out_of_range for `i >= size()`
  virtual void set(std::size_t i, const ansatz_element &element) = 0;

  /// @brief Append a generator with initial parameter `theta` and clear the
  /// `optimized` flag.
  /// @throw std::invalid_argument on a qubit count mismatch
  virtual void add_generator(generator_ptr g, parameter theta = 0.0) = 0;

  /// @brief Append a batch of generators selected together. By default each
  /// one is added in turn with `add_generator`.
  /// @throw std::invalid_argument if the two vectors differ in length
  virtual void add_generators(const std::vector<generator_ptr> &batch,
                              const std::vector<parameter> &thetas);

  /// @brief Truncate to the first `n` pairs.
  /// @throw std::invalid_argument if `n` exceeds the current size
  virtual void resize(std::size_t n) = 0;

  /// @brief The full parameter vector, `angles()[i] == get(i).second`.
  virtual std::vector<parameter> angles() const;

  /// @brief Overwrite every parameter in place, keeping the structure.
  /// @throw std::invalid_argument if `x.size() != size()`
  virtual void bind(const std::vector<parameter> &x);

  /// @brief Deep copy, flags included. Generators are shared.
  virtual std::unique_ptr<abstract_ansatz> clone() const = 0;

  /// @brief The state on which candidate generators are scored: by default
  /// the evolved reference U|ψ0>.
  virtual std::unique_ptr<quantum_state>
  prepare_scoring_state(const quantum_state &reference) const;

  bool is_optimized() const { return optimized; }
  void set_optimized(bool flag) { optimized = flag; }
  bool is_converged() const { return converged; }
  void set_converged(bool flag) { converged = flag; }
};

/// @brief The plain ADAPT ansatz, a list of (generator, parameter) pairs.
class ansatz : public abstract_ansatz {
private:
  std::vector<generator_ptr> generators;
  std::vector<parameter> parameters;

public:
  /// @brief An empty ansatz, optimized and not converged.
  explicit ansatz(std::size_t num_qubits) : abstract_ansatz(num_qubits) {}

  std::size_t size() const override { return generators.size(); }
  ansatz_element get(std::size_t i) const override;
  void set(std::size_t i, const ansatz_element &element) override;
  void add_generator(generator_ptr g, parameter theta = 0.0) override;
  void resize(std::size_t n) override;
  std::vector<parameter> angles() const override { return parameters; }
  void bind(const std::vector<parameter> &x) override;
  std::unique_ptr<abstract_ansatz> clone() const override;
};

} // namespace qadapt::solvers::adapt
