/*******************************************************************************
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/

#include "qadapt/solvers/operators/operator_pool.h"

QADAPT_INSTANTIATE_REGISTRY_NO_ARGS(qadapt::solvers::operator_pool)

namespace qadapt::solvers {

std::size_t operator_pool::get_num_qubits(const heterogeneous_map &config,
                                          const std::string &poolName) {
  std::vector<std::string> keys{"num-qubits", "num_qubits", "n-qubits",
                                "n_qubits"};
  if (!config.contains(keys))
    throw std::runtime_error("must provide num-qubits when constructing the " +
                             poolName + " operator pool.");
  return config.get<std::size_t>(keys);
}

std::vector<cudaq::spin_op>
get_operator_pool(const std::string &name, const heterogeneous_map &options) {
  return operator_pool::get(name)->generate(options);
}

} // namespace qadapt::solvers
