/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/

#pragma once

#include "../operator_pool.h"

namespace qadapt::solvers {

/// @brief Single-qubit mixers X_i, one per qubit.
class qaoa_single_x_pool : public operator_pool {
public:
  std::vector<cudaq::spin_op>
  generate(const heterogeneous_map &config) const override;

  QADAPT_EXTENSION_CUSTOM_CREATOR_FUNCTION_WITH_NAME(
      qaoa_single_x_pool, "qaoa_single_x",
      static std::unique_ptr<operator_pool> create() {
        return std::make_unique<qaoa_single_x_pool>();
      })
};
QADAPT_REGISTER_TYPE(qaoa_single_x_pool)

/// @brief The standard QAOA mixer Σ_i X_i as a single operator.
class qaoa_mixer_pool : public operator_pool {
public:
  std::vector<cudaq::spin_op>
  generate(const heterogeneous_map &config) const override;

  QADAPT_EXTENSION_CUSTOM_CREATOR_FUNCTION_WITH_NAME(
      qaoa_mixer_pool, "qaoa_mixer",
      static std::unique_ptr<operator_pool> create() {
        return std::make_unique<qaoa_mixer_pool>();
      })
};
QADAPT_REGISTER_TYPE(qaoa_mixer_pool)

/// @brief Two-qubit mixers X_iX_j, Y_iY_j, Y_iZ_j and Z_iY_j for all i < j.
class qaoa_double_ops_pool : public operator_pool {
public:
  std::vector<cudaq::spin_op>
  generate(const heterogeneous_map &config) const override;

  QADAPT_EXTENSION_CUSTOM_CREATOR_FUNCTION_WITH_NAME(
      qaoa_double_ops_pool, "qaoa_double_ops",
      static std::unique_ptr<operator_pool> create() {
        return std::make_unique<qaoa_double_ops_pool>();
      })
};
QADAPT_REGISTER_TYPE(qaoa_double_ops_pool)

/// @brief The ADAPT-QAOA pool: `qaoa_single_x`, then `qaoa_mixer`, then
/// `qaoa_double_ops`.
/// @details With n qubits this holds n + 1 + 2n(n-1) operators.
class qaoa_double_pool : public operator_pool {
public:
  std::vector<cudaq::spin_op>
  generate(const heterogeneous_map &config) const override;

  QADAPT_EXTENSION_CUSTOM_CREATOR_FUNCTION_WITH_NAME(
      qaoa_double_pool, "qaoa_double",
      static std::unique_ptr<operator_pool> create() {
        return std::make_unique<qaoa_double_pool>();
      })
};
QADAPT_REGISTER_TYPE(qaoa_double_pool)

} // namespace qadapt::solvers
