/*******************************************************************************
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#include "qadapt/solvers/adapt/observable.h"
#include "qadapt/solvers/adapt/errors.h"

#include <algorithm>
#include <sstream>

namespace qadapt::solvers::adapt {

void observable::apply(const quantum_state &, quantum_state &) const {
  throw not_implemented_error("observable::apply - " + to_string() +
                              " has no operator form.");
}

pauli_observable::pauli_observable(const cudaq::spin_op &op,
                                   std::size_t num_qubits)
    : numQubits(num_qubits) {
  for (auto &t : to_pauli_terms(op, num_qubits)) {
    auto iter = std::find_if(terms.begin(), terms.end(),
                             [&](const auto &e) { return e.word == t.word; });
    if (iter != terms.end())
      iter->coefficient += t.coefficient;
    else
      terms.push_back(t);
  }

  // Pauli words are Hermitian, so the sum is Hermitian iff every merged
  // coefficient is real.
  for (const auto &t : terms)
    if (std::abs(t.coefficient.imag()) > 1e-12)
      throw std::invalid_argument(
          "pauli_observable - operator is not Hermitian.");
  for (auto &t : terms)
    t.coefficient = t.coefficient.real();
}

energy pauli_observable::evaluate(const quantum_state &state) const {
  auto h = state.zeros_like();
  apply(state, *h);
  return state.inner(*h).real();
}

void pauli_observable::gradient_seed(const quantum_state &state,
                                     quantum_state &out) const {
  apply(state, out);
}

void pauli_observable::apply(const quantum_state &in,
                             quantum_state &out) const {
  check_num_qubits(numQubits, in.num_qubits(), "pauli_observable::apply");
  out.set_zero();
  for (const auto &t : terms)
    in.apply_pauli(t.word, t.coefficient, out);
}

std::string pauli_observable::to_string() const {
  std::stringstream ss;
  for (std::size_t k = 0; k < terms.size(); k++)
    ss << (k ? " " : "") << std::showpos << terms[k].coefficient.real()
       << std::noshowpos << " " << terms[k].word.to_string(numQubits);
  return ss.str();
}

infidelity::infidelity(const quantum_state &target) : target(target.clone()) {}

energy infidelity::evaluate(const quantum_state &state) const {
  check_num_qubits(num_qubits(), state.num_qubits(), "infidelity::evaluate");
  return 1.0 - std::norm(target->inner(state));
}

void infidelity::gradient_seed(const quantum_state &state,
                               quantum_state &out) const {
  check_num_qubits(num_qubits(), state.num_qubits(),
                   "infidelity::gradient_seed");
  auto overlap = target->inner(state);
  out.assign(*target);
  out.scale(-overlap);
}

void infidelity::apply(const quantum_state &in, quantum_state &out) const {
  check_num_qubits(num_qubits(), in.num_qubits(), "infidelity::apply");
  auto overlap = target->inner(in);
  out.assign(in);
  out.add(-overlap, *target);
}

std::string infidelity::to_string() const {
  return "infidelity(" + std::to_string(num_qubits()) + " qubits)";
}

} // namespace qadapt::solvers::adapt
