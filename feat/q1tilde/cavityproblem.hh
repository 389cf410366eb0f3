// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#ifndef FEAT_Q1TILDE_CAVITYPROBLEM_HH
#define FEAT_Q1TILDE_CAVITYPROBLEM_HH

#include <memory>
#include <vector>

#include <dune/common/parametertree.hh>

#include <feat/assembledsystem.hh>
#include <feat/filters.hh>
#include <feat/systemvector.hh>
#include <feat/q1tilde/rectanglegrid.hh>

namespace Feat {
namespace Q1Tilde {

  /**
              @addtogroup FeatCore
              @{
   */

  /**
   * \brief Driven cavity on a rectangle, discretized with Q1~/Q0.
   *
   * The velocity is prescribed on the whole boundary: the lid (the upper
   * boundary) moves with the lid velocity in x direction, all other walls
   * are at rest. The pressure is therefore only determined up to a
   * constant.
   *
   * \code
   * [CC-DISCRETISATION]
   * NLMIN = 1
   * NLMAX = 3
   * RE = 1000
   *
   * [CAVITY]
   * width = 1.0
   * height = 1.0
   * nx = 2       # cells in x direction on level 1
   * ny = 2
   * lidVelocity = 1.0
   * \endcode
   *
   * Level l has nx 2^(l-1) times ny 2^(l-1) cells.
   */
  class CavityProblem : public AssembledSystem
  {
  public:
    /**
     * \param config the complete parameter tree
     *
     * \throws ConfigurationError for an empty level range or grid
     */
    explicit CavityProblem(const Dune::ParameterTree& config);

    int minLevel() const override { return minLevel_; }
    int maxLevel() const override { return maxLevel_; }

    Level& level(int l) override { return levels_[l - minLevel_]; }
    const Level& level(int l) const override { return levels_[l - minLevel_]; }

    bool hasNeumannBoundary() const override { return false; }

    void assembleConvection(int l, const ConvectionTerm& term, const SystemVector& velocity,
                            ConvectionContribution& target) const override;

    std::unique_ptr<InterlevelTransfer> createTransfer(const TransferParameters& params) const override;

    const RectangleGrid& grid(int l) const { return grids_[l - minLevel_]; }

    double viscosity() const { return nu_; }

    //! right hand side on the finest level with the boundary values implemented
    SystemVector rightHandSide() const;

    //! zero initial iterate on the finest level with the boundary values implemented
    SystemVector initialSolution() const;

  private:
    void setupLevel(int l);

    int minLevel_;
    int maxLevel_;
    double nu_;
    double lidVelocity_;
    std::vector<RectangleGrid> grids_;
    std::vector<Level> levels_;
  };

  /** @} end documentation */

} // end namespace Q1Tilde
} // end namespace Feat

#endif
