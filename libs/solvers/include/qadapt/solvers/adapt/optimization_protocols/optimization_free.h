/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#pragma once

#include "../optimization_protocol.h"

namespace qadapt::solvers::adapt {

/// @brief Leave the parameters where they are: evaluate the energy once,
/// call the callbacks once and flag the ansatz optimized.
class optimization_free : public optimization_protocol {
public:
  optimization_free() = default;
  explicit optimization_free(const heterogeneous_map &) {}

  std::string name() const override { return "optimization_free"; }

  bool optimize(abstract_ansatz &ansatz, trace &tr, const observable &H,
                const quantum_state &reference,
                const callback_list &callbacks) override;

  QADAPT_EXTENSION_CUSTOM_CREATOR_FUNCTION_WITH_NAME(
      optimization_free, "optimization_free",
      static std::unique_ptr<optimization_protocol> create(
          const heterogeneous_map &options) {
        return std::make_unique<optimization_free>(options);
      })
};
QADAPT_REGISTER_TYPE(optimization_free)

} // namespace qadapt::solvers::adapt
