/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#pragma once

#include <cstddef>
#include <cstdint>
#include <tuple>
#include <type_traits>

namespace qadapt {

/// @brief Map a type to the tuple of types a stored value may be converted
/// from when it is requested as that type, e.g. an option inserted as `int`
/// but read back as `std::size_t`.
template <typename T>
struct RelatedTypesMap {
  using types = std::tuple<>;
};

template <>
struct RelatedTypesMap<int> {
  using types = std::tuple<std::size_t, long, short, unsigned>;
};

template <>
struct RelatedTypesMap<std::size_t> {
  using types = std::tuple<int, long, short, unsigned>;
};

template <>
struct RelatedTypesMap<long> {
  using types = std::tuple<int, std::size_t, short, unsigned>;
};

template <>
struct RelatedTypesMap<short> {
  using types = std::tuple<int, long, std::size_t, unsigned>;
};

template <>
struct RelatedTypesMap<unsigned> {
  using types = std::tuple<int, long, std::size_t, short>;
};

template <>
struct RelatedTypesMap<double> {
  using types = std::tuple<float, int, std::size_t>;
};

template <>
struct RelatedTypesMap<float> {
  using types = std::tuple<double>;
};

/// @brief True for `char[N]`, `const char *` and `char *`, all of which are
/// stored as `std::string`.
template <typename T>
struct is_bounded_char_array : std::false_type {};

template <std::size_t N>
struct is_bounded_char_array<char[N]> : std::true_type {};

template <std::size_t N>
struct is_bounded_char_array<const char[N]> : std::true_type {};

template <>
struct is_bounded_char_array<const char *> : std::true_type {};

template <>
struct is_bounded_char_array<char *> : std::true_type {};

} // namespace qadapt
