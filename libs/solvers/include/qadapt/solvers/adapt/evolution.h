/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#pragma once

#include "ansatz.h"
#include "observable.h"

namespace qadapt::solvers::adapt {

/// @brief exp(-i θ G)|state> on a copy; `state` is not modified.
std::unique_ptr<quantum_state> evolve_state(const generator &G, parameter theta,
                                            const quantum_state &state);

/// @brief state = exp(-i θ G)|state>
/// @return `state`
quantum_state &evolve_state_inplace(const generator &G, parameter theta,
                                    quantum_state &state);

/// @brief U|reference> on a copy, applying the ansatz lowest index first.
std::unique_ptr<quantum_state> evolve_state(const abstract_ansatz &ansatz,
                                            const quantum_state &reference);

/// @brief state = U|state>
/// @return `state`
quantum_state &evolve_state_inplace(const abstract_ansatz &ansatz,
                                    quantum_state &state);

/// @brief The cost of `state`.
energy evaluate(const observable &H, const quantum_state &state);

/// @brief The cost of U|reference>.
energy evaluate(const abstract_ansatz &ansatz, const observable &H,
                const quantum_state &reference);

} // namespace qadapt::solvers::adapt
