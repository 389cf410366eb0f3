// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#ifndef FEAT_LINEARSOLVER_HH
#define FEAT_LINEARSOLVER_HH

#include <memory>
#include <vector>

#include <dune/common/parametertree.hh>
#include <dune/istl/solver.hh>
#include <dune/istl/solvercategory.hh>

#include <feat/filters.hh>
#include <feat/interleveltransfer.hh>
#include <feat/systemmatrix.hh>
#include <feat/systemvector.hh>

/** \file

      \brief Interface of the linear solvers used as preconditioner
             of the nonlinear iteration.
 */

namespace Feat {

  /**
              @addtogroup FeatCore
              @{
   */

  //! Whether assembled matrices fit the needs of a solver.
  enum class MatrixCompatibility {
    ok,          //!< the matrices can be used as they are
    transposed,  //!< the B^T blocks must be physically transposed
    incompatible //!< the solver cannot work with the matrices
  };

  //! The operator of one level as seen by a linear solver.
  struct LevelOperator
  {
    SystemMatrix* matrix = nullptr;
    //! filter for defects and corrections of this level
    const Filter* filter = nullptr;
  };

  /**
   * \brief The level hierarchy handed to a linear solver.
   *
   * levels[0] is the coarsest level minLevel, levels.back() the finest.
   */
  struct LinearSolverLevels
  {
    int minLevel = 0;
    std::vector<LevelOperator> levels;
    const InterlevelTransfer* transfer = nullptr;
    ScalarVector* scratch = nullptr;
    //! the pressure is only determined up to a constant
    bool pressureIndefinite = false;

    const LevelOperator& finest() const { return levels.back(); }
  };

  /**
   * \brief A linear solver that approximately inverts the system matrix.
   *
   * The solver is used in defect correction form: precondition()
   * overwrites a defect by the correction. Factorizations are split into
   * a symbolic part that only depends on the matrix structure and a
   * numeric part that is repeated whenever the entries change.
   *
   * As a Dune::InverseOperator, apply() solves A x = b for attached
   * matrices starting from a zero correction.
   */
  class LinearSolverBackend
    : public Dune::InverseOperator<SystemVector, SystemVector>
  {
  public:
    //! check whether the solver can work on the matrices of the hierarchy
    virtual MatrixCompatibility compatibility(const std::vector<const SystemMatrix*>& matrices) const = 0;

    //! attach the matrices, they must stay alive until release()
    virtual void setMatrices(const LinearSolverLevels& levels) = 0;

    //! everything that only depends on the matrix structure
    virtual void factorizeSymbolic() = 0;

    //! everything that depends on the matrix entries
    virtual void factorizeNumeric() = 0;

    //! overwrite d by the (approximate) solution of A c = d
    virtual void precondition(SystemVector& d, Dune::InverseOperatorResult& res) = 0;

    //! free all factorizations and detach the matrices
    virtual void release() = 0;

    //! number of symbolic factorizations performed since construction
    virtual unsigned int symbolicFactorizations() const = 0;

    //! number of numeric factorizations performed since construction
    virtual unsigned int numericFactorizations() const = 0;

    void apply(SystemVector& x, SystemVector& b, Dune::InverseOperatorResult& res) override
    {
      x = b;
      precondition(x, res);
    }

    //! the reduction is ignored unless the solver iterates
    void apply(SystemVector& x, SystemVector& b, [[maybe_unused]] double reduction, Dune::InverseOperatorResult& res) override
    {
      apply(x, b, res);
    }

    Dune::SolverCategory::Category category() const override
    {
      return Dune::SolverCategory::sequential;
    }
  };

  /**
   * \brief Create a linear solver from its parameter section.
   *
   * isolverType selects the solver: 0 is the direct solver on the finest
   * level, 1 the multigrid solver with Vanka smoothing.
   *
   * \throws ConfigurationError for unknown solver types
   */
  std::unique_ptr<LinearSolverBackend> createLinearSolver(const Dune::ParameterTree& config);

  /** @} end documentation */

} // end namespace

#endif
