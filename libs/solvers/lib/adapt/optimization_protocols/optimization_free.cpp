/*******************************************************************************
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#include "qadapt/solvers/adapt/optimization_protocols/optimization_free.h"
#include "qadapt/solvers/adapt/evolution.h"

namespace qadapt::solvers::adapt {

bool optimization_free::optimize(abstract_ansatz &ansatz, trace &tr,
                                 const observable &H,
                                 const quantum_state &reference,
                                 const callback_list &callbacks) {
  heterogeneous_map data;
  data.insert("energy", evaluate(ansatz, H, reference));
  run_iteration_callbacks(callbacks, data, ansatz, tr, *this, H, reference);
  ansatz.set_optimized(true);
  return true;
}

} // namespace qadapt::solvers::adapt
