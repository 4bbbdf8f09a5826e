/*******************************************************************************
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#include "qadapt/solvers/adapt/trace.h"

#include <xtensor/xbuilder.hpp>
#include <xtensor/xview.hpp>

namespace qadapt::solvers::adapt {

std::vector<std::string> trace::keys() const {
  std::vector<std::string> ret;
  for (const auto &[key, _] : entries)
    ret.push_back(key);
  return ret;
}

void trace::push_parameters(const std::vector<double> &x) {
  const std::size_t rows = parameterMatrix.shape(0);
  const std::size_t cols = std::max(parameterMatrix.shape(1), x.size());

  xt::xtensor<double, 2> grown = xt::zeros<double>({rows + 1, cols});
  xt::view(grown, xt::range(0, rows),
           xt::range(0, parameterMatrix.shape(1))) = parameterMatrix;
  for (std::size_t j = 0; j < x.size(); j++)
    grown(rows, j) = x[j];
  parameterMatrix = std::move(grown);
}

} // namespace qadapt::solvers::adapt
