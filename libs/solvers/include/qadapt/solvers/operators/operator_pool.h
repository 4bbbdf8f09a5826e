/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/

#pragma once

#include "qadapt/core/extension_point.h"
#include "qadapt/core/heterogeneous_map.h"
#include "cudaq/spin_op.h"

namespace qadapt::solvers {

/// @brief Interface for generating operator pools for ADAPT.
/// @details Pools are produced as Hermitian `cudaq::spin_op`s. Convert them
/// to generators with `adapt::make_pool`.
class operator_pool : public qadapt::extension_point<operator_pool> {
public:
  operator_pool() = default;
  virtual ~operator_pool() {}

  /// @brief Generate the pool.
  /// @param config Options, at least "num-qubits" (aliases "num_qubits",
  /// "n-qubits", "n_qubits")
  virtual std::vector<cudaq::spin_op>
  generate(const heterogeneous_map &config) const = 0;

protected:
  /// @brief Read the register size from `config`.
  /// @throw std::runtime_error if no size is given
  static std::size_t get_num_qubits(const heterogeneous_map &config,
                                    const std::string &poolName);
};

/// @brief Instantiate the named operator pool and generate it.
/// @param name Registered pool name, e.g. "qaoa_double"
/// @param options Options forwarded to `operator_pool::generate`
std::vector<cudaq::spin_op> get_operator_pool(const std::string &name,
                                              const heterogeneous_map &options);

} // namespace qadapt::solvers
