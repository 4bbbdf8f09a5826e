/*******************************************************************************
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#include "qadapt/solvers/operators/pauli_word.h"

#include <stdexcept>

namespace qadapt::solvers {

pauli_word pauli_word::from_string(const std::string &word) {
  if (word.size() > max_pauli_qubits)
    throw std::invalid_argument("pauli_word - at most 64 qubits supported, " +
                                std::to_string(word.size()) + " requested.");

  pauli_word ret;
  for (std::size_t q = 0; q < word.size(); q++) {
    std::uint64_t bit = std::uint64_t(1) << q;
    switch (word[q]) {
    case 'I':
      break;
    case 'X':
      ret.x_mask |= bit;
      break;
    case 'Y':
      ret.x_mask |= bit;
      ret.z_mask |= bit;
      break;
    case 'Z':
      ret.z_mask |= bit;
      break;
    default:
      throw std::invalid_argument("pauli_word - invalid character in " + word);
    }
  }
  return ret;
}

std::string pauli_word::to_string(std::size_t num_qubits) const {
  std::string ret(num_qubits, 'I');
  for (std::size_t q = 0; q < num_qubits && q < max_pauli_qubits; q++) {
    bool x = (x_mask >> q) & 1, z = (z_mask >> q) & 1;
    if (x && z)
      ret[q] = 'Y';
    else if (x)
      ret[q] = 'X';
    else if (z)
      ret[q] = 'Z';
  }
  return ret;
}

std::vector<std::size_t> pauli_word::support() const {
  std::vector<std::size_t> qubits;
  auto mask = support_mask();
  for (std::size_t q = 0; mask; q++, mask >>= 1)
    if (mask & 1)
      qubits.push_back(q);
  return qubits;
}

std::vector<pauli_term> to_pauli_terms(const cudaq::spin_op &op,
                                       std::size_t num_qubits) {
  if (num_qubits > max_pauli_qubits)
    throw std::invalid_argument("to_pauli_terms - at most 64 qubits supported.");

  std::vector<pauli_term> terms;
  for (const auto &term : op) {
    auto str = term.get_pauli_word(num_qubits);
    if (str.size() > num_qubits &&
        str.find_first_not_of('I', num_qubits) != std::string::npos)
      throw std::invalid_argument("to_pauli_terms - operator " + str +
                                  " acts outside of " +
                                  std::to_string(num_qubits) + " qubits.");
    str.resize(std::min(str.size(), num_qubits));
    terms.push_back({term.evaluate_coefficient(), pauli_word::from_string(str)});
  }
  return terms;
}

} // namespace qadapt::solvers
