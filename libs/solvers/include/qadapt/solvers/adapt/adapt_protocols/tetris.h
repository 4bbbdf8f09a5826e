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

/// @brief TETRIS-ADAPT: append several candidates with pairwise disjoint
/// qubit support in one step.
///
/// @details The largest-scoring candidate is always selected. Remaining
/// candidates are visited in decreasing score order and selected when their
/// support is disjoint from everything selected so far, until the next
/// score does not exceed the threshold or the whole register is covered.
///
/// Options:
/// - "threshold" (double, default 1e-3): minimum score of the additional
///   candidates
///
/// The data passed to the callbacks holds vectors under "selected_index"
/// (`std::vector<std::size_t>`), "selected_score" and "selected_parameter"
/// (`std::vector<double>`) and "selected_generator"
/// (`std::vector<generator_ptr>`).
class tetris : public adapt_protocol {
private:
  double threshold = 1e-3;

public:
  tetris() = default;
  explicit tetris(const heterogeneous_map &options);

  std::string name() const override { return "tetris"; }

  /// @brief Indices selected from `scores`, in selection order.
  std::vector<std::size_t> select(const std::vector<score> &scores,
                                  const generator_pool &pool,
                                  std::size_t num_qubits) const;

  bool adapt(abstract_ansatz &ansatz, trace &tr, const generator_pool &pool,
             const observable &H, const quantum_state &reference,
             const callback_list &callbacks) override;

  QADAPT_EXTENSION_CUSTOM_CREATOR_FUNCTION_WITH_NAME(
      tetris, "tetris",
      static std::unique_ptr<adapt_protocol> create(
          const heterogeneous_map &options) {
        return std::make_unique<tetris>(options);
      })
};
QADAPT_REGISTER_TYPE(tetris)

} // namespace qadapt::solvers::adapt
