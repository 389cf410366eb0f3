// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#ifndef FEAT_LINEARIZATION_HH
#define FEAT_LINEARIZATION_HH

#include <dune/common/parametertree.hh>

#include <feat/assembledsystem.hh>
#include <feat/coreequation.hh>
#include <feat/interleveltransfer.hh>
#include <feat/systemvector.hh>

/** \file
 * \brief Assembly of the linearized system matrices on all levels.
 */

namespace Feat {

  /**
              @addtogroup FeatCore
              @{
   */

  /**
   * \brief Builds the Oseen matrices of the hierarchy at a given iterate.
   *
   * Block (1,1) of every level becomes
   * \f$ \alpha M + \theta L + \gamma N(u) \f$ plus the stabilization.
   * The finest level is linearized at the iterate itself, every coarser
   * level at the interpolation of the point of the next finer level.
   */
  class MatrixAssembler
  {
  public:
    /**
     * \param system the discretization
     * \param stabilization convection stabilization
     * \param discretization parameter section with bdecoupledXY and
     *                       bfilterInterpolatedSolution
     */
    MatrixAssembler(AssembledSystem& system, const Stabilization& stabilization,
                    const Dune::ParameterTree& discretization);

    void setCoreEquation(const CoreEquationParameters& params) { equation_ = params; }
    const CoreEquationParameters& coreEquation() const { return equation_; }

    const Stabilization& stabilization() const { return stabilization_; }

    //! transfer and scratch buffer used to interpolate the iterate, needed with more than one level
    void setTransfer(const InterlevelTransfer* transfer, ScalarVector* scratch)
    {
      transfer_ = transfer;
      scratch_ = scratch;
    }

    void setAdaptiveRestriction(AdaptiveMatrixMode mode, double threshold)
    {
      adaptiveMode_ = mode;
      adaptiveThreshold_ = threshold;
    }

    bool decoupledVelocity() const { return decoupledXY_; }

    /**
     * \brief Assemble the matrices at x.
     *
     * \param x the iterate on the finest level
     * \param allLevels assemble the whole hierarchy or the finest level only
     * \param boundaryConditions implement the linear boundary conditions
     * \param nonlinearBoundaryConditions implement slip conditions
     */
    void assemble(const SystemVector& x, bool allLevels,
                  bool boundaryConditions, bool nonlinearBoundaryConditions);

    //! d -= gamma N(x) x plus stabilization, on the finest level
    void subtractConvection(const SystemVector& x, SystemVector& d) const;

    //! number of calls to assemble()
    unsigned int assemblyCount() const { return assemblyCount_; }

  private:
    void assembleLevel(int l, const SystemVector& point,
                       bool boundaryConditions, bool nonlinearBoundaryConditions);

    AssembledSystem& system_;
    Stabilization stabilization_;
    CoreEquationParameters equation_;
    bool decoupledXY_;
    bool filterInterpolated_;
    AdaptiveMatrixMode adaptiveMode_ = AdaptiveMatrixMode::off;
    double adaptiveThreshold_ = 20.0;
    const InterlevelTransfer* transfer_ = nullptr;
    ScalarVector* scratch_ = nullptr;
    unsigned int assemblyCount_ = 0;
  };

  /** @} end documentation */

} // end namespace

#endif
