/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#pragma once

#include "../adapt_protocol.h"

namespace qadapt::solvers::adapt {

/// @brief ADAPT-VQE: append the single candidate with the largest score,
/// the first one on ties.
class vanilla : public adapt_protocol {
protected:
  /// @brief Index of the candidate to append.
  virtual std::size_t select_index(const std::vector<score> &scores);

public:
  vanilla() = default;
  explicit vanilla(const heterogeneous_map &) {}

  std::string name() const override { return "vanilla"; }

  bool adapt(abstract_ansatz &ansatz, trace &tr, const generator_pool &pool,
             const observable &H, const quantum_state &reference,
             const callback_list &callbacks) override;

  QADAPT_EXTENSION_CUSTOM_CREATOR_FUNCTION_WITH_NAME(
      vanilla, "vanilla",
      static std::unique_ptr<adapt_protocol> create(
          const heterogeneous_map &options) {
        return std::make_unique<vanilla>(options);
      })
};
QADAPT_REGISTER_TYPE(vanilla)

} // namespace qadapt::solvers::adapt
