/*******************************************************************************
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#include "qadapt/solvers/adapt/validation.h"
#include "qadapt/solvers/adapt.h"
#include "qadapt/solvers/adapt/matrix.h"

#include "common/Logger.h"

#include <fmt/core.h>
#include <xtensor-blas/xlinalg.hpp>
#include <xtensor/xcomplex.hpp>
#include <xtensor/xmath.hpp>

#include <algorithm>
#include <functional>
#include <sstream>

namespace qadapt::solvers::adapt {

std::string to_string(check_status status) {
  switch (status) {
  case check_status::passed:
    return "passed";
  case check_status::failed:
    return "failed";
  case check_status::not_implemented:
    return "not implemented";
  case check_status::error:
    return "error";
  case check_status::skipped:
    return "skipped";
  }
  return "unknown";
}

bool validation_report::passed() const {
  return count(check_status::failed) == 0 && count(check_status::error) == 0 &&
         count(check_status::not_implemented) == 0;
}

std::size_t validation_report::count(check_status status) const {
  return std::count_if(checks.begin(), checks.end(),
                       [&](const auto &c) { return c.status == status; });
}

const check_result *validation_report::find(const std::string &category,
                                             const std::string &name) const {
  auto iter = std::find_if(checks.begin(), checks.end(), [&](const auto &c) {
    return c.category == category && c.name == name;
  });
  return iter == checks.end() ? nullptr : &*iter;
}

std::string validation_report::to_string() const {
  std::stringstream ss;
  for (const auto &c : checks) {
    ss << fmt::format("[{}] {}: {}", c.category, c.name,
                      adapt::to_string(c.status));
    if (!c.message.empty())
      ss << " (" << c.message << ")";
    ss << "\n";
  }
  return ss.str();
}

namespace {

/// A check returns an empty string on success, otherwise the failure.
using check_fn = std::function<std::string()>;

class checker {
  validation_report &report;
  std::string category;

public:
  checker(validation_report &r, std::string c)
      : report(r), category(std::move(c)) {}

  void run(const std::string &name, const check_fn &fn) {
    check_result result{category, name, check_status::passed, ""};
    try {
      result.message = fn();
      if (!result.message.empty())
        result.status = check_status::failed;
    } catch (const not_implemented_error &e) {
      result.status = check_status::not_implemented;
      result.message = e.what();
    } catch (const std::exception &e) {
      result.status = check_status::error;
      result.message = e.what();
    }
    cudaq::debug("[validate] {} / {}: {}", category, name,
                 adapt::to_string(result.status));
    report.checks.push_back(std::move(result));
  }

  void skip(const std::string &name, const std::string &why) {
    report.checks.push_back({category, name, check_status::skipped, why});
  }
};

std::string expect(bool condition, const std::string &message) {
  return condition ? std::string() : message;
}

std::string within(double difference, double tolerance,
                   const std::string &what) {
  if (difference <= tolerance)
    return "";
  return fmt::format("{} differs by {:.3e}, tolerance {:.3e}", what,
                     difference, tolerance);
}

double max_difference(const std::vector<double> &a,
                      const std::vector<double> &b) {
  if (a.size() != b.size())
    return std::numeric_limits<double>::infinity();
  double diff = 0.0;
  for (std::size_t i = 0; i < a.size(); i++)
    diff = std::max(diff, std::abs(a[i] - b[i]));
  return diff;
}

double vector_distance(const complex_vector &a, const complex_vector &b) {
  return std::sqrt(xt::sum(xt::norm(a - b))());
}

/// <ψ|A|φ>
amplitude braket(const complex_vector &psi, const complex_matrix &A,
                 const complex_vector &phi) {
  complex_vector Aphi = xt::linalg::dot(A, phi);
  return xt::linalg::vdot(psi, Aphi);
}

void validate_runtime(checker &check, const abstract_ansatz &ansatz,
                      adapt_protocol &adapt,
                      optimization_protocol &optimization,
                      const generator_pool &pool, const observable &H,
                      const quantum_state &reference) {
  const auto &G = *pool.front();
  parameter angle = 1.0;
  callback_list callbacks{std::make_shared<parameter_stopper>(1)};

  check.run("evolve_state(ansatz)", [&] {
    evolve_state(ansatz, reference);
    return std::string();
  });
  check.run("evolve_state(generator)", [&] {
    evolve_state(G, angle, reference);
    return std::string();
  });
  check.run("evolve_state_inplace(ansatz)", [&] {
    auto state = reference.clone();
    evolve_state_inplace(ansatz, *state);
    return std::string();
  });
  check.run("evolve_state_inplace(generator)", [&] {
    auto state = reference.clone();
    evolve_state_inplace(G, angle, *state);
    return std::string();
  });
  check.run("evaluate(ansatz)", [&] {
    evaluate(ansatz, H, reference);
    return std::string();
  });
  check.run("evaluate(state)", [&] {
    evaluate(H, reference);
    return std::string();
  });
  check.run("partial", [&] {
    partial(0, ansatz, H, reference);
    return std::string();
  });
  check.run("gradient", [&] {
    gradient(ansatz, H, reference);
    return std::string();
  });
  check.run("gradient_inplace", [&] {
    std::vector<energy> result(ansatz.size());
    gradient_workspace ws;
    gradient_inplace(result, ansatz, H, reference, ws);
    return std::string();
  });
  check.run("ansatz accessors", [&] {
    auto copy = ansatz.clone();
    copy->set_optimized(copy->is_optimized());
    copy->set_converged(copy->is_converged());
    copy->bind(std::vector<parameter>(copy->size(), 0.0));
    copy->set(copy->size() - 1, copy->get(copy->size() - 1));
    return std::string();
  });
  check.run("calculate_score", [&] {
    adapt.calculate_score(ansatz, G, H, reference);
    return std::string();
  });
  check.run("calculate_scores", [&] {
    adapt.calculate_scores(ansatz, pool, H, reference);
    return std::string();
  });
  check.run("adapt", [&] {
    auto copy = ansatz.clone();
    trace tr;
    adapt.adapt(*copy, tr, pool, H, reference, callbacks);
    return std::string();
  });
  check.run("optimize", [&] {
    auto copy = ansatz.clone();
    trace tr;
    optimization.optimize(*copy, tr, H, reference, callbacks);
    return std::string();
  });
  check.run("run", [&] {
    auto copy = ansatz.clone();
    trace tr;
    run(*copy, tr, adapt, optimization, pool, H, reference, callbacks);
    return std::string();
  });
}

void validate_consistency(checker &check, abstract_ansatz &ansatz,
                          adapt_protocol &adapt, const generator_pool &pool,
                          const observable &H,
                          const quantum_state &reference) {
  const auto &G = *pool.front();
  parameter angle = 1.0;

  check.run("evolution by ansatz", [&] {
    auto original = reference.clone();
    auto evolved = evolve_state(ansatz, reference);
    if (!original->equals(reference))
      return std::string("evolve_state modified its input");
    auto &inplace = evolve_state_inplace(ansatz, *original);
    if (&inplace != original.get())
      return std::string("evolve_state_inplace returned another state");
    return expect(evolved->equals(inplace),
                  "evolve_state and evolve_state_inplace disagree");
  });

  check.run("evolution by generator", [&] {
    auto original = reference.clone();
    auto evolved = evolve_state(G, angle, reference);
    if (!original->equals(reference))
      return std::string("evolve_state modified its input");
    auto &inplace = evolve_state_inplace(G, angle, *original);
    if (&inplace != original.get())
      return std::string("evolve_state_inplace returned another state");
    return expect(evolved->equals(inplace),
                  "evolve_state and evolve_state_inplace disagree");
  });

  check.run("observable estimation", [&] {
    auto expval = evaluate(ansatz, H, reference);
    auto evolved = evolve_state(ansatz, reference);
    return expect(expval == evaluate(H, *evolved),
                  "evaluate(ansatz) and evaluate(evolved state) disagree");
  });

  check.run("gradient", [&] {
    auto grad = gradient(ansatz, H, reference);
    std::vector<energy> inplace(grad.size());
    gradient_workspace ws;
    if (&gradient_inplace(inplace, ansatz, H, reference, ws) != &inplace)
      return std::string("gradient_inplace returned another vector");
    if (grad != inplace)
      return std::string("gradient and gradient_inplace disagree");

    std::vector<energy> partials;
    for (std::size_t i = 0; i < ansatz.size(); i++)
      partials.push_back(partial(i, ansatz, H, reference));
    return within(max_difference(grad, partials), 1e-10,
                  "gradient vs partials");
  });

  check.run("ansatz behavior", [&] {
    auto x = ansatz.angles();
    for (std::size_t i = 0; i < ansatz.size(); i++)
      if (ansatz.get(i).second != x[i])
        return fmt::format("angles()[{}] differs from get({})", i, i);

    std::vector<parameter> negated(x.size());
    std::transform(x.begin(), x.end(), negated.begin(),
                   [](parameter v) { return -v; });
    ansatz.bind(negated);
    bool bound = ansatz.angles() == negated;
    ansatz.bind(x);
    if (!bound)
      return std::string("bind does not round trip through angles");

    bool optimized = ansatz.is_optimized();
    ansatz.set_optimized(!optimized);
    bool flipped = ansatz.is_optimized() == !optimized;
    ansatz.set_optimized(optimized);
    if (!flipped)
      return std::string("set_optimized is not reflected by is_optimized");

    bool converged = ansatz.is_converged();
    ansatz.set_converged(!converged);
    flipped = ansatz.is_converged() == !converged;
    ansatz.set_converged(converged);
    return expect(flipped, "set_converged is not reflected by is_converged");
  });

  check.run("scores", [&] {
    auto scores = adapt.calculate_scores(ansatz, pool, H, reference);
    std::vector<score> each;
    for (const auto &g : pool)
      each.push_back(adapt.calculate_score(ansatz, *g, H, reference));
    return expect(scores == each,
                  "calculate_scores and calculate_score disagree");
  });
}

void validate_brute_force(checker &check, const abstract_ansatz &ansatz,
                          adapt_protocol &adapt, const generator_pool &pool,
                          const observable &H, const quantum_state &reference,
                          const heterogeneous_map &options) {
  auto tolerance = options.get("tolerance", 1e-10);
  auto skip = options.get("skip", std::vector<std::string>{});
  auto skipped = [&](const std::string &name) {
    if (std::find(skip.begin(), skip.end(), name) == skip.end())
      return false;
    check.skip(name, "skipped by request");
    return true;
  };

  if (!skipped("evolution"))
    check.run("evolution", [&] {
      const auto &G = *pool.front();
      parameter angle = 1.0;
      auto state = evolve_state(G, angle, reference);
      complex_vector psi =
          xt::linalg::dot(evolution_matrix(G, angle), state_vector(reference));
      return within(vector_distance(psi, state_vector(*state)),
                    options.get("evolution", tolerance), "evolved state");
    });

  if (!skipped("evaluation"))
    check.run("evaluation", [&] {
      auto A = observable_matrix(H);
      auto ref = state_vector(reference);
      auto E = braket(ref, A, ref).real();
      auto tol = options.get("evaluation", tolerance);
      auto msg = within(std::abs(E - evaluate(H, reference)), tol,
                        "reference energy");
      if (!msg.empty())
        return msg;

      complex_vector psi =
          xt::linalg::dot(ansatz_unitary(ansatz), state_vector(reference));
      return within(std::abs(braket(psi, A, psi).real() -
                             evaluate(ansatz, H, reference)),
                    tol, "ansatz energy");
    });

  if (!skipped("gradient"))
    check.run("gradient", [&] {
      auto A = observable_matrix(H);
      auto ref = state_vector(reference);
      complex_vector psi = xt::linalg::dot(ansatz_unitary(ansatz), ref);

      // dψ/dθ_k = U_n ... U_{k+1} (-iG_k) U_k ... U_1 |ref>
      std::vector<energy> dense(ansatz.size());
      for (std::size_t k = 0; k < ansatz.size(); k++) {
        complex_vector phi = ref;
        for (std::size_t i = 0; i < ansatz.size(); i++) {
          auto [G, theta] = ansatz.get(i);
          phi = xt::linalg::dot(evolution_matrix(*G, theta), phi);
          if (i == k)
            phi = amplitude(0.0, -1.0) * xt::linalg::dot(generator_matrix(*G),
                                                         phi);
        }
        dense[k] = 2.0 * braket(psi, A, phi).real();
      }
      return within(max_difference(gradient(ansatz, H, reference), dense),
                    options.get("gradient", tolerance), "gradient");
    });

  if (!skipped("scores"))
    check.run("scores", [&] {
      auto scores = adapt.calculate_scores(ansatz, pool, H, reference);
      std::vector<score> partials;
      for (const auto &g : pool) {
        auto candidate = ansatz.clone();
        candidate->add_generator(g, 0.0);
        partials.push_back(std::abs(
            partial(candidate->size() - 1, *candidate, H, reference)));
      }
      return within(max_difference(scores, partials),
                    options.get("scores", tolerance),
                    "scores vs partials of appended candidates");
    });
}

} // namespace

validation_report validate(const abstract_ansatz &ansatz,
                           adapt_protocol &adapt,
                           optimization_protocol &optimization,
                           const generator_pool &pool, const observable &H,
                           const quantum_state &reference,
                           const heterogeneous_map &options) {
  if (pool.empty())
    throw std::runtime_error("Cannot validate ADAPT with an empty pool.");

  auto candidate = ansatz.clone();
  candidate->add_generator(pool.front(), 1.0);

  validation_report report;
  checker runtime(report, "runtime");
  validate_runtime(runtime, *candidate, adapt, optimization, pool, H,
                   reference);
  if (!report.passed()) {
    cudaq::info("[validate] runtime validation failed, skipping the rest.");
    return report;
  }

  checker consistency(report, "consistency");
  validate_consistency(consistency, *candidate, adapt, pool, H, reference);

  checker bruteForce(report, "brute_force");
  auto maxQubits = options.get<std::size_t>("max_brute_force_qubits", 10);
  if (reference.num_qubits() > maxQubits) {
    for (const auto *name : {"evolution", "evaluation", "gradient", "scores"})
      bruteForce.skip(name, fmt::format("more than {} qubits", maxQubits));
  } else {
    validate_brute_force(bruteForce, *candidate, adapt, pool, H, reference,
                         options);
  }

  cudaq::info("[validate] {} checks, {} passed", report.checks.size(),
              report.count(check_status::passed));
  return report;
}

} // namespace qadapt::solvers::adapt
