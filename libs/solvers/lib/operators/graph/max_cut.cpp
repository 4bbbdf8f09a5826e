/*******************************************************************************
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/

#include "qadapt/solvers/operators/graph/max_cut.h"

namespace qadapt::solvers {

cudaq::spin_op get_maxcut_hamiltonian(const qadapt::graph &graph) {
  auto edges = graph.get_edges();
  if (edges.empty())
    return cudaq::spin_op();

  cudaq::spin_op hamiltonian;
  for (const auto &[u, v, weight] : edges)
    hamiltonian += weight * 0.5 * (cudaq::spin::z(u) * cudaq::spin::z(v) - 1.0);

  return hamiltonian.canonicalize().trim();
}

} // namespace qadapt::solvers
