/*******************************************************************************
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#include "qadapt/solvers/adapt/sparse_state.h"
#include "qadapt/solvers/adapt/errors.h"

#include <cmath>
#include <type_traits>

namespace qadapt::solvers::adapt {

namespace {
template <typename State>
auto &as_sparse(State &other, std::size_t numQubits, const char *what) {
  using target = std::conditional_t<std::is_const_v<State>,
                                    const sparse_state, sparse_state>;
  auto *ptr = dynamic_cast<target *>(&other);
  if (!ptr)
    throw not_implemented_error(std::string(what) +
                                " - only defined between sparse states.");
  check_num_qubits(numQubits, ptr->num_qubits(), what);
  return *ptr;
}
} // namespace

sparse_state::sparse_state(std::size_t num_qubits, std::uint64_t basis_index)
    : numQubits(num_qubits) {
  if (num_qubits > max_pauli_qubits)
    throw std::invalid_argument("sparse_state - too many qubits.");
  if (num_qubits < max_pauli_qubits && (basis_index >> num_qubits) != 0)
    throw std::out_of_range("sparse_state - basis index out of range.");
  amplitudes[basis_index] = 1.0;
}

sparse_state::sparse_state(
    std::size_t num_qubits,
    std::unordered_map<std::uint64_t, amplitude> entries)
    : numQubits(num_qubits), amplitudes(std::move(entries)) {
  if (num_qubits > max_pauli_qubits)
    throw std::invalid_argument("sparse_state - too many qubits.");
  if (num_qubits < max_pauli_qubits)
    for (auto &[k, a] : amplitudes)
      if ((k >> num_qubits) != 0)
        throw std::out_of_range("sparse_state - basis index out of range.");
}

void sparse_state::clip() {
  std::erase_if(amplitudes, [](const auto &entry) {
    return std::abs(entry.second) < clip_threshold;
  });
}

amplitude sparse_state::operator[](std::uint64_t k) const {
  auto iter = amplitudes.find(k);
  return iter == amplitudes.end() ? amplitude(0.0) : iter->second;
}

std::unique_ptr<quantum_state> sparse_state::clone() const {
  return std::make_unique<sparse_state>(*this);
}

std::unique_ptr<quantum_state> sparse_state::zeros_like() const {
  return std::make_unique<sparse_state>(
      numQubits, std::unordered_map<std::uint64_t, amplitude>{});
}

void sparse_state::assign(const quantum_state &other) {
  amplitudes = as_sparse(other, numQubits, "sparse_state::assign").amplitudes;
}

void sparse_state::set_zero() { amplitudes.clear(); }

void sparse_state::scale(amplitude factor) {
  for (auto &[k, a] : amplitudes)
    a *= factor;
}

void sparse_state::add(amplitude factor, const quantum_state &other) {
  const auto &o = as_sparse(other, numQubits, "sparse_state::add");
  for (auto &[k, a] : o.amplitudes)
    amplitudes[k] += factor * a;
}

amplitude sparse_state::inner(const quantum_state &other) const {
  const auto &o = as_sparse(other, numQubits, "sparse_state::inner");
  amplitude sum = 0.0;
  if (amplitudes.size() <= o.amplitudes.size()) {
    for (auto &[k, a] : amplitudes) {
      auto iter = o.amplitudes.find(k);
      if (iter != o.amplitudes.end())
        sum += std::conj(a) * iter->second;
    }
  } else {
    for (auto &[k, b] : o.amplitudes) {
      auto iter = amplitudes.find(k);
      if (iter != amplitudes.end())
        sum += std::conj(iter->second) * b;
    }
  }
  return sum;
}

void sparse_state::apply_pauli(const pauli_word &word, amplitude factor,
                               quantum_state &out) const {
  auto &o = as_sparse(out, numQubits, "sparse_state::apply_pauli");
  if (&o == this)
    throw std::invalid_argument(
        "sparse_state::apply_pauli - output must not alias the input.");
  for (auto &[k, a] : amplitudes)
    o.amplitudes[k ^ word.x_mask] += factor * word.phase(k) * a;
}

void sparse_state::rotate(const pauli_word &word, double angle) {
  const double c = std::cos(angle);
  const amplitude mis(0.0, -std::sin(angle));

  if (word.is_diagonal()) {
    for (auto &[k, a] : amplitudes)
      a *= c + mis * word.sign(k);
    clip();
    return;
  }

  std::unordered_map<std::uint64_t, amplitude> branch;
  branch.reserve(amplitudes.size());
  for (auto &[k, a] : amplitudes)
    branch[k ^ word.x_mask] += mis * word.phase(k) * a;

  scale(c);
  for (auto &[k, b] : branch)
    amplitudes[k] += b;
  clip();
}

void sparse_state::apply_phases(
    const std::function<amplitude(std::uint64_t)> &phase) {
  for (auto &[k, a] : amplitudes)
    a *= phase(k);
  clip();
}

std::vector<amplitude> sparse_state::to_vector() const {
  if (numQubits >= 32)
    throw std::invalid_argument(
        "sparse_state::to_vector - state too large for a dense vector.");
  std::vector<amplitude> ret(dimension(), 0.0);
  for (auto &[k, a] : amplitudes)
    ret[k] = a;
  return ret;
}

bool sparse_state::equals(const quantum_state &other) const {
  auto *o = dynamic_cast<const sparse_state *>(&other);
  return o && o->numQubits == numQubits && o->amplitudes == amplitudes;
}

} // namespace qadapt::solvers::adapt
