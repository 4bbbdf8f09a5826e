/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#pragma once

#include <tuple>
#include <utility>

namespace qadapt {

/// @brief Invoke `f` on every element of the tuple, in order.
template <typename TupleType, typename FunctionType>
void tuple_for_each(TupleType &&t, FunctionType f) {
  std::apply([&](auto &&...elements) { (f(elements), ...); },
             std::forward<TupleType>(t));
}

} // namespace qadapt
