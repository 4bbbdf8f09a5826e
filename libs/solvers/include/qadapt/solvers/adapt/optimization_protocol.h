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

#include "callbacks.h"

namespace qadapt::solvers::adapt {

/// @brief Strategy for refining the parameters of the current ansatz.
///
/// @details Registered protocols: "vqe" and "optimization_free".
class optimization_protocol
    : public extension_point<optimization_protocol, const heterogeneous_map &> {
public:
  virtual ~optimization_protocol() = default;

  /// @brief Registered name of the protocol.
  virtual std::string name() const = 0;

  /// @brief Move the ansatz parameters towards a local minimum of
  /// evaluate(ansatz, H, reference), calling `on_iteration` of the
  /// callbacks once per accepted iterate.
  ///
  /// @details On normal convergence the ansatz is flagged optimized. If a
  /// callback requests termination the flag is left alone, unless the
  /// callback itself set it.
  /// @return the `optimized` flag of the ansatz afterwards
  virtual bool optimize(abstract_ansatz &ansatz, trace &tr,
                        const observable &H, const quantum_state &reference,
                        const callback_list &callbacks) = 0;
};

} // namespace qadapt::solvers::adapt
