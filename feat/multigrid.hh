// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#ifndef FEAT_MULTIGRID_HH
#define FEAT_MULTIGRID_HH

#include <vector>

#include <dune/common/parametertree.hh>

#include <feat/directsolver.hh>
#include <feat/linearsolver.hh>
#include <feat/vanka.hh>

namespace Feat {

  /**
              @addtogroup FeatCore
              @{
   */

  /**
   * \brief Geometric multigrid for saddle point systems.
   *
   * Vanka smoothing on all levels above the coarsest one and a direct
   * solver on the coarsest level. Defects are restricted, corrections
   * prolongated by the interlevel transfer of the hierarchy.
   */
  class Multigrid : public LinearSolverBackend
  {
  public:
    struct Parameters
    {
      //! maximum number of cycles
      int maxIterations = 10;
      //! relative defect reduction to achieve
      double reduction = 1e-6;
      //! 0: V cycle, 1: W cycle
      int cycle = 0;
      //! number of pre- and of postsmoothing steps
      int smoothingSteps = 4;
      VankaSmoother::Variant variant = VankaSmoother::Variant::full;
      double smootherDamping = 1.0;
      int verbose = 0;

      Parameters() = default;

      explicit Parameters(const Dune::ParameterTree& config);
    };

    explicit Multigrid(const Parameters& params);

    MatrixCompatibility compatibility(const std::vector<const SystemMatrix*>& matrices) const override;
    void setMatrices(const LinearSolverLevels& levels) override;
    void factorizeSymbolic() override;
    void factorizeNumeric() override;
    void precondition(SystemVector& d, Dune::InverseOperatorResult& res) override;
    void release() override;

    using LinearSolverBackend::apply;

    //! multigrid cycles until the defect is reduced by the given factor
    void apply(SystemVector& x, SystemVector& b, double reduction, Dune::InverseOperatorResult& res) override;

    unsigned int symbolicFactorizations() const override { return coarseSolver_.symbolicFactorizations(); }
    unsigned int numericFactorizations() const override { return coarseSolver_.numericFactorizations(); }

  private:
    void iterate(SystemVector& d, double reduction, Dune::InverseOperatorResult& res);
    void mgCycle(std::size_t l);
    void filterDefect(std::size_t l, SystemVector& v) const;

    Parameters params_;
    LinearSolverLevels levels_;
    std::vector<VankaSmoother> smoothers_;
    SaddlePointDirectSolver coarseSolver_;
    std::vector<SystemVector> x_, b_, d_;
  };

  /** @} end documentation */

} // end namespace

#endif
