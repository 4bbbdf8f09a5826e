/*******************************************************************************
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/

#include "qadapt/solvers/operators/operator_pools/qaoa_operator_pool.h"

namespace qadapt::solvers {

std::vector<cudaq::spin_op>
qaoa_single_x_pool::generate(const heterogeneous_map &config) const {
  auto qubits_num = get_num_qubits(config, "qaoa_single_x");
  std::vector<cudaq::spin_op> op;
  for (std::size_t i = 0; i < qubits_num; ++i)
    op.push_back(cudaq::spin::x(i));
  return op;
}

std::vector<cudaq::spin_op>
qaoa_mixer_pool::generate(const heterogeneous_map &config) const {
  auto qubits_num = get_num_qubits(config, "qaoa_mixer");
  if (qubits_num == 0)
    return {};

  cudaq::spin_op mixer = cudaq::spin::x(0);
  for (std::size_t i = 1; i < qubits_num; ++i)
    mixer += cudaq::spin::x(i);
  return {mixer};
}

std::vector<cudaq::spin_op>
qaoa_double_ops_pool::generate(const heterogeneous_map &config) const {
  auto qubits_num = get_num_qubits(config, "qaoa_double_ops");
  if (qubits_num < 2)
    return {};

  std::vector<cudaq::spin_op> op;

  // XX terms
  for (std::size_t i = 0; i < qubits_num - 1; ++i)
    for (std::size_t j = i + 1; j < qubits_num; ++j)
      op.push_back(cudaq::spin::x(i) * cudaq::spin::x(j));

  // YY terms
  for (std::size_t i = 0; i < qubits_num - 1; ++i)
    for (std::size_t j = i + 1; j < qubits_num; ++j)
      op.push_back(cudaq::spin::y(i) * cudaq::spin::y(j));

  // YZ terms
  for (std::size_t i = 0; i < qubits_num - 1; ++i)
    for (std::size_t j = i + 1; j < qubits_num; ++j)
      op.push_back(cudaq::spin::y(i) * cudaq::spin::z(j));

  // ZY terms
  for (std::size_t i = 0; i < qubits_num - 1; ++i)
    for (std::size_t j = i + 1; j < qubits_num; ++j)
      op.push_back(cudaq::spin::z(i) * cudaq::spin::y(j));

  return op;
}

std::vector<cudaq::spin_op>
qaoa_double_pool::generate(const heterogeneous_map &config) const {
  auto op = qaoa_single_x_pool().generate(config);
  for (auto &mixer : qaoa_mixer_pool().generate(config))
    op.push_back(mixer);
  for (auto &pair : qaoa_double_ops_pool().generate(config))
    op.push_back(pair);
  return op;
}

} // namespace qadapt::solvers
