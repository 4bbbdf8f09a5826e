/*******************************************************************************
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#include "qadapt/solvers/adapt/dense_state.h"
#include "qadapt/solvers/adapt/errors.h"

#include <algorithm>
#include <bit>
#include <type_traits>

namespace qadapt::solvers::adapt {

namespace {
template <typename State>
auto &as_dense(State &other, std::size_t numQubits, const char *what) {
  using target = std::conditional_t<std::is_const_v<State>,
                                    const dense_state, dense_state>;
  auto *ptr = dynamic_cast<target *>(&other);
  if (!ptr)
    throw not_implemented_error(std::string(what) +
                                " - only defined between dense states.");
  check_num_qubits(numQubits, ptr->num_qubits(), what);
  return *ptr;
}
} // namespace

dense_state::dense_state(std::size_t num_qubits, std::uint64_t basis_index)
    : numQubits(num_qubits) {
  if (num_qubits >= max_pauli_qubits)
    throw std::invalid_argument("dense_state - too many qubits.");
  amplitudes.assign(std::uint64_t(1) << num_qubits, 0.0);
  if (basis_index >= amplitudes.size())
    throw std::out_of_range("dense_state - basis index out of range.");
  amplitudes[basis_index] = 1.0;
}

dense_state::dense_state(std::vector<amplitude> data)
    : amplitudes(std::move(data)) {
  if (amplitudes.empty() || !std::has_single_bit(amplitudes.size()))
    throw std::invalid_argument(
        "dense_state - amplitude vector length must be a power of two.");
  numQubits = std::countr_zero(amplitudes.size());
}

dense_state dense_state::uniform_superposition(std::size_t num_qubits) {
  dense_state state(num_qubits);
  const double a = 1.0 / std::sqrt(static_cast<double>(state.dimension()));
  std::fill(state.amplitudes.begin(), state.amplitudes.end(), amplitude(a));
  return state;
}

std::unique_ptr<quantum_state> dense_state::clone() const {
  return std::make_unique<dense_state>(*this);
}

std::unique_ptr<quantum_state> dense_state::zeros_like() const {
  auto ret = std::make_unique<dense_state>(*this);
  ret->set_zero();
  return ret;
}

void dense_state::assign(const quantum_state &other) {
  const auto &o = as_dense(other, numQubits, "dense_state::assign");
  std::copy(o.amplitudes.begin(), o.amplitudes.end(), amplitudes.begin());
}

void dense_state::set_zero() {
  std::fill(amplitudes.begin(), amplitudes.end(), amplitude(0.0));
}

void dense_state::scale(amplitude factor) {
  for (auto &a : amplitudes)
    a *= factor;
}

void dense_state::add(amplitude factor, const quantum_state &other) {
  const auto &o = as_dense(other, numQubits, "dense_state::add");
  for (std::size_t k = 0; k < amplitudes.size(); k++)
    amplitudes[k] += factor * o.amplitudes[k];
}

amplitude dense_state::inner(const quantum_state &other) const {
  const auto &o = as_dense(other, numQubits, "dense_state::inner");
  amplitude sum = 0.0;
  for (std::size_t k = 0; k < amplitudes.size(); k++)
    sum += std::conj(amplitudes[k]) * o.amplitudes[k];
  return sum;
}

void dense_state::apply_pauli(const pauli_word &word, amplitude factor,
                              quantum_state &out) const {
  auto &o = as_dense(out, numQubits, "dense_state::apply_pauli");
  if (&o == this)
    throw std::invalid_argument(
        "dense_state::apply_pauli - output must not alias the input.");
  for (std::uint64_t k = 0; k < amplitudes.size(); k++)
    o.amplitudes[k ^ word.x_mask] += factor * word.phase(k) * amplitudes[k];
}

void dense_state::rotate(const pauli_word &word, double angle) {
  const double c = std::cos(angle);
  const amplitude mis(0.0, -std::sin(angle));

  if (word.is_diagonal()) {
    for (std::uint64_t k = 0; k < amplitudes.size(); k++)
      amplitudes[k] *= c + mis * word.sign(k);
    return;
  }

  // Pairs (k, k ^ x) are closed under P; visit each pair once.
  for (std::uint64_t k = 0; k < amplitudes.size(); k++) {
    const std::uint64_t j = k ^ word.x_mask;
    if (j < k)
      continue;
    const amplitude a = amplitudes[k], b = amplitudes[j];
    // P|k> = phase(k)|j> and P|j> = phase(j)|k>
    amplitudes[k] = c * a + mis * word.phase(j) * b;
    amplitudes[j] = c * b + mis * word.phase(k) * a;
  }
}

void dense_state::apply_phases(
    const std::function<amplitude(std::uint64_t)> &phase) {
  for (std::uint64_t k = 0; k < amplitudes.size(); k++)
    amplitudes[k] *= phase(k);
}

bool dense_state::equals(const quantum_state &other) const {
  auto *o = dynamic_cast<const dense_state *>(&other);
  return o && o->numQubits == numQubits && o->amplitudes == amplitudes;
}

} // namespace qadapt::solvers::adapt
