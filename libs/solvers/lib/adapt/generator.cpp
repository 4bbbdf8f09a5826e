/*******************************************************************************
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#include "qadapt/solvers/adapt/generator.h"

namespace qadapt::solvers::adapt {

void generator::differential_action(parameter theta, const quantum_state &in,
                                    quantum_state &out,
                                    quantum_state &scratch) const {
  scratch.assign(in);
  evolve(theta, scratch);
  apply(scratch, out);
  out.scale(amplitude(0.0, -1.0));
}

void generator::differential_action(parameter theta, const quantum_state &in,
                                    quantum_state &out) const {
  auto scratch = in.zeros_like();
  differential_action(theta, in, out, *scratch);
}

std::vector<std::size_t> generator::support() const {
  return pauli_word{support_mask(), 0}.support();
}

} // namespace qadapt::solvers::adapt
