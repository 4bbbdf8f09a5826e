/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#pragma once

#include "ansatz.h"
#include "qaoa_observable.h"

namespace qadapt::solvers::adapt {

/// @brief ADAPT-QAOA: every adapted batch of mixer generators is preceded by
/// a phase separator exp(-i γ_l H) built from the cost observable.
///
/// @details As a list the ansatz holds, per layer l, the element (H, γ_l)
/// followed by the layer's mixers (G, β). `add_generator` appends a layer
/// with a single mixer, so the plain ADAPT-QAOA list is (H, γ1), (G1, β1),
/// (H, γ2), (G2, β2), ... and `angles`/`bind` use that interleaved order.
/// `add_generators` appends one layer holding a whole batch, as selected by
/// TETRIS. New layers start with γ = `next_gamma()`, which is γ0 here, and
/// candidates are scored on exp(-i next_gamma() H) U|ψ0>, the state they
/// would act on once appended.
class qaoa_ansatz : public abstract_ansatz {
private:
  std::shared_ptr<const qaoa_observable> costObservable;
  parameter gamma0;
  std::vector<ansatz_element> elements;
  /// Ascending indices of the phase separator elements, one per layer
  std::vector<std::size_t> phaseSlots;

  bool is_phase_slot(std::size_t i) const;

protected:
  /// @brief The γ given to the next layer.
  virtual parameter next_gamma() const { return gamma0; }

public:
  qaoa_ansatz(std::shared_ptr<const qaoa_observable> cost,
              parameter gamma0 = 0.1);

  /// @brief Number of layers, each one phase separator and its mixers.
  std::size_t num_layers() const { return phaseSlots.size(); }
  parameter get_gamma0() const { return gamma0; }
  const qaoa_observable &get_observable() const { return *costObservable; }
  /// @brief One γ per layer.
  std::vector<parameter> get_gammas() const;
  /// @brief The mixer parameters, in list order.
  std::vector<parameter> get_betas() const;

  std::size_t size() const override { return elements.size(); }
  ansatz_element get(std::size_t i) const override;
  /// @throw std::invalid_argument if a phase separator slot is given a
  /// generator other than the cost observable
  void set(std::size_t i, const ansatz_element &element) override;
  /// @brief Append a layer (H, next_gamma()), (g, beta).
  void add_generator(generator_ptr g, parameter beta = 0.0) override;
  /// @brief Append a single layer (H, next_gamma()) followed by every
  /// generator of the batch. An empty batch appends nothing.
  void add_generators(const std::vector<generator_ptr> &batch,
                      const std::vector<parameter> &betas) override;
  /// @throw std::invalid_argument if `n` exceeds the size or does not fall
  /// on a layer boundary
  void resize(std::size_t n) override;
  std::vector<parameter> angles() const override;
  void bind(const std::vector<parameter> &x) override;
  std::unique_ptr<abstract_ansatz> clone() const override;
  std::unique_ptr<quantum_state>
  prepare_scoring_state(const quantum_state &reference) const override;
};

/// @brief ADAPT-QAOA where each new layer inherits the optimized γ of the
/// previous layer. Only the first layer starts from γ0.
class plastic_qaoa_ansatz : public qaoa_ansatz {
protected:
  parameter next_gamma() const override;

public:
  using qaoa_ansatz::qaoa_ansatz;
  std::unique_ptr<abstract_ansatz> clone() const override;
};

} // namespace qadapt::solvers::adapt
