/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#pragma once

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace qadapt {

/// @brief An extension_point is a base class for runtime-extensible types.
/// Concrete sub-types register a creator function under a string name and can
/// then be instantiated by that name through `get(name, args...)`.
///
/// The registry itself is defined once per extension type in a library
/// translation unit with `QADAPT_INSTANTIATE_REGISTRY` or
/// `QADAPT_INSTANTIATE_REGISTRY_NO_ARGS`.
/// @tparam T The extension base type
/// @tparam CtorArgs Arguments forwarded to the registered creator functions
template <typename T, typename... CtorArgs>
class extension_point {
protected:
  using creator_function = std::function<std::unique_ptr<T>(CtorArgs...)>;

  /// @brief Return the registry of creator functions for this extension
  /// point.
  static std::unordered_map<std::string, creator_function> &get_registry();

public:
  virtual ~extension_point() = default;

  /// @brief Create the extension registered under `name`.
  /// @throw std::runtime_error if no such extension is registered
  static std::unique_ptr<T> get(const std::string &name, CtorArgs... args) {
    auto &registry = get_registry();
    auto iter = registry.find(name);
    if (iter == registry.end())
      throw std::runtime_error("Cannot find extension with name = " + name);

    return iter->second(std::forward<CtorArgs>(args)...);
  }

  /// @brief Return the names of all registered extensions.
  static std::vector<std::string> get_registered() {
    std::vector<std::string> names;
    for (auto &[name, creator] : get_registry())
      names.push_back(name);
    return names;
  }

  /// @brief Return true if an extension is registered under `name`.
  static bool is_registered(const std::string &name) {
    return get_registry().contains(name);
  }
};

} // namespace qadapt

/// Define the registry storage for an extension point whose creators take
/// the given constructor arguments.
#define QADAPT_INSTANTIATE_REGISTRY(TYPE, ...)                                 \
  template <>                                                                  \
  std::unordered_map<                                                          \
      std::string, std::function<std::unique_ptr<TYPE>(__VA_ARGS__)>> &        \
  qadapt::extension_point<TYPE, __VA_ARGS__>::get_registry() {                 \
    static std::unordered_map<                                                 \
        std::string, std::function<std::unique_ptr<TYPE>(__VA_ARGS__)>>        \
        registry;                                                              \
    return registry;                                                           \
  }

/// Define the registry storage for an extension point with no constructor
/// arguments.
#define QADAPT_INSTANTIATE_REGISTRY_NO_ARGS(TYPE)                              \
  template <>                                                                  \
  std::unordered_map<std::string, std::function<std::unique_ptr<TYPE>()>> &   \
  qadapt::extension_point<TYPE>::get_registry() {                              \
    static std::unordered_map<std::string,                                     \
                              std::function<std::unique_ptr<TYPE>()>>          \
        registry;                                                              \
    return registry;                                                           \
  }

/// Declare the registration hooks of an extension named NAME whose creator
/// function is given as the trailing argument.
#define QADAPT_EXTENSION_CUSTOM_CREATOR_FUNCTION_WITH_NAME(TYPE, NAME, ...)    \
  static inline bool register_type() {                                         \
    auto &registry = get_registry();                                           \
    registry[NAME] = TYPE::create;                                             \
    return true;                                                               \
  }                                                                            \
  static const bool registered_;                                               \
  static inline const std::string class_identifier = NAME;                     \
  __VA_ARGS__

/// Same as above, using the type name as the extension name.
#define QADAPT_EXTENSION_CUSTOM_CREATOR_FUNCTION(TYPE, ...)                    \
  QADAPT_EXTENSION_CUSTOM_CREATOR_FUNCTION_WITH_NAME(TYPE, #TYPE, __VA_ARGS__)

/// Default-constructible extension named after its type.
#define QADAPT_EXTENSION_CREATOR_FUNCTION(BASE, TYPE)                          \
  QADAPT_EXTENSION_CUSTOM_CREATOR_FUNCTION(                                    \
      TYPE, static std::unique_ptr<BASE> create() {                            \
        return std::make_unique<TYPE>();                                       \
      })

/// Register the extension with its extension point at load time.
#define QADAPT_REGISTER_TYPE(TYPE)                                             \
  inline const bool TYPE::registered_ = TYPE::register_type();
