/*******************************************************************************
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#include "qadapt/core/extension_point.h"
#include "qadapt/core/graph.h"
#include "qadapt/core/heterogeneous_map.h"

#include <algorithm>
#include <tuple>

#include <gtest/gtest.h>

namespace qadapt::testing {

// Define a new extension point for the framework
class MyExtensionPoint : public qadapt::extension_point<MyExtensionPoint> {
public:
  virtual std::string parrotBack(const std::string &msg) const = 0;
  virtual ~MyExtensionPoint() = default;
};

} // namespace qadapt::testing

QADAPT_INSTANTIATE_REGISTRY_NO_ARGS(qadapt::testing::MyExtensionPoint)

namespace qadapt::testing {

class RepeatBackOne : public MyExtensionPoint {
public:
  std::string parrotBack(const std::string &msg) const override {
    return msg + " from RepeatBackOne.";
  }

  QADAPT_EXTENSION_CREATOR_FUNCTION(MyExtensionPoint, RepeatBackOne)
};
QADAPT_REGISTER_TYPE(RepeatBackOne)

class RepeatBackTwo : public MyExtensionPoint {
public:
  std::string parrotBack(const std::string &msg) const override {
    return msg + " from RepeatBackTwo.";
  }
  QADAPT_EXTENSION_CUSTOM_CREATOR_FUNCTION_WITH_NAME(
      RepeatBackTwo, "repeat_two",
      static std::unique_ptr<MyExtensionPoint> create() {
        return std::make_unique<RepeatBackTwo>();
      })
};
QADAPT_REGISTER_TYPE(RepeatBackTwo)

} // namespace qadapt::testing

TEST(CoreTester, checkSimpleExtensionPoint) {
  auto registeredNames = qadapt::testing::MyExtensionPoint::get_registered();
  EXPECT_EQ(registeredNames.size(), 2);
  EXPECT_TRUE(std::find(registeredNames.begin(), registeredNames.end(),
                        "repeat_two") != registeredNames.end());
  EXPECT_TRUE(std::find(registeredNames.begin(), registeredNames.end(),
                        "RepeatBackOne") != registeredNames.end());
  EXPECT_FALSE(qadapt::testing::MyExtensionPoint::is_registered("RepeatBackTwo"));

  {
    auto var = qadapt::testing::MyExtensionPoint::get("RepeatBackOne");
    EXPECT_EQ(var->parrotBack("Hello World"),
              "Hello World from RepeatBackOne.");
  }
  {
    auto var = qadapt::testing::MyExtensionPoint::get("repeat_two");
    EXPECT_EQ(var->parrotBack("Hello World"),
              "Hello World from RepeatBackTwo.");
  }

  EXPECT_THROW(qadapt::testing::MyExtensionPoint::get("RepeatBackThree"),
               std::runtime_error);
}

namespace qadapt::testing {

class MyExtensionPointWithArgs
    : public qadapt::extension_point<MyExtensionPointWithArgs,
                                     const qadapt::heterogeneous_map &> {
protected:
  int i;
  double d;

public:
  MyExtensionPointWithArgs(const qadapt::heterogeneous_map &options)
      : i(options.get("i", 0)), d(options.get("d", 0.0)) {}
  virtual std::tuple<int, double, std::string> parrotBack() const = 0;
  virtual ~MyExtensionPointWithArgs() = default;
};

} // namespace qadapt::testing

QADAPT_INSTANTIATE_REGISTRY(qadapt::testing::MyExtensionPointWithArgs,
                            const qadapt::heterogeneous_map &)

namespace qadapt::testing {

class RepeatBackOneWithArgs : public MyExtensionPointWithArgs {
public:
  using MyExtensionPointWithArgs::MyExtensionPointWithArgs;
  std::tuple<int, double, std::string> parrotBack() const override {
    return std::make_tuple(i, d, "RepeatBackOne");
  }

  QADAPT_EXTENSION_CUSTOM_CREATOR_FUNCTION(
      RepeatBackOneWithArgs,
      static std::unique_ptr<MyExtensionPointWithArgs> create(
          const qadapt::heterogeneous_map &options) {
        return std::make_unique<RepeatBackOneWithArgs>(options);
      })
};
QADAPT_REGISTER_TYPE(RepeatBackOneWithArgs)

} // namespace qadapt::testing

TEST(CoreTester, checkSimpleExtensionPointWithArgs) {
  auto registeredNames =
      qadapt::testing::MyExtensionPointWithArgs::get_registered();
  EXPECT_EQ(registeredNames.size(), 1);

  auto var = qadapt::testing::MyExtensionPointWithArgs::get(
      "RepeatBackOneWithArgs", {{"i", 5}, {"d", 2.2}});
  auto [i, d, msg] = var->parrotBack();
  EXPECT_EQ(msg, "RepeatBackOne");
  EXPECT_EQ(i, 5);
  EXPECT_NEAR(d, 2.2, 1e-2);

  auto defaulted = qadapt::testing::MyExtensionPointWithArgs::get(
      "RepeatBackOneWithArgs", qadapt::heterogeneous_map());
  EXPECT_EQ(std::get<0>(defaulted->parrotBack()), 0);
}

TEST(HeterogeneousMapTest, checkSimple) {
  {
    qadapt::heterogeneous_map m;
    m.insert("hello", 2.2);
    m.insert("another", 1);
    m.insert("string", "string");
    EXPECT_EQ(3, m.size());
    EXPECT_NEAR(2.2, m.get<double>("hello"), 1e-3);
    EXPECT_EQ(1, m.get<int>("another"));
    // If the value is int-like, can get it as other int-like types
    EXPECT_EQ(1, m.get<std::size_t>("another"));
    EXPECT_NEAR(2.2, m.get<float>("hello"), 1e-3);
    EXPECT_EQ("string", m.get<std::string>("string"));
    EXPECT_EQ("defaulted", m.get<std::string>("key22", "defaulted"));
  }

  {
    qadapt::heterogeneous_map m({{"hello", 2.2}, {"string", "stringVal"}});
    EXPECT_EQ(2, m.size());
    EXPECT_NEAR(2.2, m.get<float>("hello"), 1e-3);
    EXPECT_EQ("stringVal", m.get<std::string>("string"));
  }
}

TEST(HeterogeneousMapTest, InsertOverwriteErase) {
  qadapt::heterogeneous_map map;
  map.insert("key", 10);
  EXPECT_EQ(map.get<int>("key"), 10);

  map.insert("key", 20);
  EXPECT_EQ(map.get<int>("key"), 20);

  map.erase("key");
  EXPECT_FALSE(map.contains("key"));
  EXPECT_EQ(map.size(), 0);
}

TEST(HeterogeneousMapTest, GetWithDefault) {
  qadapt::heterogeneous_map map;
  EXPECT_EQ(map.get("nonexistent_key", 100), 100);
  EXPECT_EQ(map.get("nonexistent_key", std::string("default")), "default");
}

TEST(HeterogeneousMapTest, AliasedKeys) {
  qadapt::heterogeneous_map map{{"num_qubits", 4}};

  EXPECT_TRUE(map.contains(std::vector<std::string>{"num-qubits", "num_qubits"}));
  EXPECT_FALSE(map.contains(
      std::vector<std::string>{"nonexistent_key1", "nonexistent_key2"}));
  EXPECT_EQ(map.get<std::size_t>(
                std::vector<std::string>{"num-qubits", "num_qubits"}),
            4);
  EXPECT_EQ(map.get<std::size_t>(std::vector<std::string>{"n-qubits"},
                                 std::size_t(7)),
            7);
  EXPECT_THROW(map.get<std::size_t>(std::vector<std::string>{"n-qubits"}),
               std::runtime_error);
}

TEST(HeterogeneousMapTest, Keys) {
  qadapt::heterogeneous_map map{{"b", 1}, {"a", 2}};
  auto keys = map.keys();
  std::sort(keys.begin(), keys.end());
  EXPECT_EQ(keys, (std::vector<std::string>{"a", "b"}));
  EXPECT_EQ(std::any_cast<int>(map.at("a")), 2);

  map.clear();
  EXPECT_EQ(map.size(), 0);
  EXPECT_TRUE(map.keys().empty());
}

TEST(HeterogeneousMapTest, RelatedTypes) {
  qadapt::heterogeneous_map map;
  map.insert("int_key", 42);

  EXPECT_EQ(map.get<std::size_t>("int_key"), 42);
  EXPECT_EQ(map.get<long>("int_key"), 42);
  EXPECT_EQ(map.get<short>("int_key"), 42);
}

TEST(HeterogeneousMapTest, CharArrayConversion) {
  qadapt::heterogeneous_map map;
  const char *cstr = "Hello";
  map.insert("char_array_key", cstr);

  EXPECT_EQ(map.get<std::string>("char_array_key"), "Hello");

  qadapt::heterogeneous_map literal{{"optimizer", "cobyla"}};
  EXPECT_EQ(literal.get<std::string>("optimizer"), "cobyla");
  EXPECT_EQ(literal.get<std::string>("optimizer", "lbfgs"), "cobyla");
}

TEST(HeterogeneousMapTest, ExceptionHandling) {
  qadapt::heterogeneous_map map;
  map.insert("int_key", 42);

  EXPECT_THROW(map.get<std::string>("int_key"), std::runtime_error);
  EXPECT_THROW(map.get<int>("nonexistent_key"), std::runtime_error);
}

TEST(HeterogeneousMapTest, VectorValues) {
  qadapt::heterogeneous_map map;
  map.insert("x", std::vector<double>{1.0, 2.0});
  auto x = map.get<std::vector<double>>("x");
  EXPECT_EQ(x.size(), 2);
  EXPECT_DOUBLE_EQ(x[1], 2.0);
}

TEST(GraphTester, AddEdge) {
  qadapt::graph g;
  g.add_edge(1, 2, 1.5);
  EXPECT_EQ(g.num_edges(), 1);
  EXPECT_EQ(g.get_edges(),
            (std::vector<std::tuple<int, int, double>>{{1, 2, 1.5}}));

  // Re-adding keeps the first weight
  g.add_edge(2, 1, 3.0);
  EXPECT_EQ(g.num_edges(), 1);
  EXPECT_DOUBLE_EQ(std::get<2>(g.get_edges()[0]), 1.5);

  EXPECT_THROW(g.add_edge(3, 3), std::invalid_argument);
}

TEST(GraphTester, GetEdges) {
  qadapt::graph g;
  g.add_edge(2, 3, 2.0);
  g.add_edge(1, 0, 0.5);
  g.add_node(7);

  std::vector<std::tuple<int, int, double>> expected{{0, 1, 0.5},
                                                      {2, 3, 2.0}};
  EXPECT_EQ(g.get_edges(), expected);
  EXPECT_EQ(g.num_edges(), 2);

  // Isolated nodes carry no edges
  g.add_node(3);
  EXPECT_EQ(g.get_edges(), expected);
}

TEST(GraphTester, ErdosRenyi) {
  auto empty = qadapt::erdos_renyi(5, 0.0, 3);
  EXPECT_EQ(empty.num_edges(), 0);
  EXPECT_TRUE(empty.get_edges().empty());

  auto complete = qadapt::erdos_renyi(5, 1.0, 3);
  EXPECT_EQ(complete.num_edges(), 10);
  EXPECT_EQ(std::get<0>(complete.get_edges().front()), 0);
  EXPECT_EQ(std::get<1>(complete.get_edges().back()), 4);

  // Same seed, same graph
  auto a = qadapt::erdos_renyi(8, 0.5, 42);
  auto b = qadapt::erdos_renyi(8, 0.5, 42);
  EXPECT_EQ(a.get_edges(), b.get_edges());
  for (auto &[u, v, w] : a.get_edges()) {
    EXPECT_LT(u, v);
    EXPECT_LT(v, 8);
    EXPECT_DOUBLE_EQ(w, 1.0);
  }

  EXPECT_THROW(qadapt::erdos_renyi(-1, 0.5), std::invalid_argument);
  EXPECT_THROW(qadapt::erdos_renyi(4, 1.5), std::invalid_argument);
}
