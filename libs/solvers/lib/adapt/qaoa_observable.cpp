/*******************************************************************************
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#include "qadapt/solvers/adapt/qaoa_observable.h"
#include "qadapt/solvers/adapt/errors.h"

#include <sstream>

namespace qadapt::solvers::adapt {

qaoa_observable::qaoa_observable(const cudaq::spin_op &op,
                                 std::size_t num_qubits)
    : numQubits(num_qubits) {
  for (const auto &t : to_pauli_terms(op, num_qubits)) {
    if (!t.word.is_diagonal())
      throw std::invalid_argument(
          "qaoa_observable - operator must contain only I and Z factors.");
    if (std::abs(t.coefficient.imag()) > 1e-12)
      throw std::invalid_argument(
          "qaoa_observable - operator must have real coefficients.");
    coefficients.push_back(t.coefficient.real());
    masks.push_back(t.word.z_mask);
  }
  if (masks.empty())
    throw std::invalid_argument("qaoa_observable - operator has no terms.");
}

double qaoa_observable::energy_of(std::uint64_t k) const {
  double e = 0.0;
  for (std::size_t j = 0; j < masks.size(); j++)
    e += (std::popcount(masks[j] & k) % 2) ? -coefficients[j] : coefficients[j];
  return e;
}

std::vector<double> qaoa_observable::diagonal() const {
  std::vector<double> ret(std::uint64_t(1) << numQubits);
  for (std::uint64_t k = 0; k < ret.size(); k++)
    ret[k] = energy_of(k);
  return ret;
}

void qaoa_observable::evolve(parameter gamma, quantum_state &state) const {
  check_num_qubits(numQubits, state.num_qubits(), "qaoa_observable::evolve");
  state.apply_phases([&](std::uint64_t k) {
    return std::exp(amplitude(0.0, -gamma * energy_of(k)));
  });
}

void qaoa_observable::apply(const quantum_state &in, quantum_state &out) const {
  check_num_qubits(numQubits, in.num_qubits(), "qaoa_observable::apply");
  out.assign(in);
  out.apply_phases([&](std::uint64_t k) { return amplitude(energy_of(k)); });
}

std::uint64_t qaoa_observable::support_mask() const {
  std::uint64_t mask = 0;
  for (auto m : masks)
    mask |= m;
  return mask;
}

bool qaoa_observable::equals(const generator &other) const {
  auto *o = dynamic_cast<const qaoa_observable *>(&other);
  return o && o->numQubits == numQubits && o->coefficients == coefficients &&
         o->masks == masks;
}

energy qaoa_observable::evaluate(const quantum_state &state) const {
  auto h = state.zeros_like();
  apply(state, *h);
  return state.inner(*h).real();
}

void qaoa_observable::gradient_seed(const quantum_state &state,
                                    quantum_state &out) const {
  apply(state, out);
}

std::string qaoa_observable::to_string() const {
  std::stringstream ss;
  for (std::size_t j = 0; j < masks.size(); j++)
    ss << (j ? " " : "") << std::showpos << coefficients[j] << std::noshowpos
       << " " << pauli_word{0, masks[j]}.to_string(numQubits);
  return ss.str();
}

} // namespace qadapt::solvers::adapt
