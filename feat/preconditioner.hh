// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#ifndef FEAT_PRECONDITIONER_HH
#define FEAT_PRECONDITIONER_HH

#include <memory>
#include <string>
#include <vector>

#include <dune/common/parametertree.hh>

#include <feat/assembledsystem.hh>
#include <feat/filters.hh>
#include <feat/finalassembly.hh>
#include <feat/interleveltransfer.hh>
#include <feat/linearsolver.hh>

/** \file
 * \brief Preconditioner of the nonlinear defect correction.
 */

namespace Feat {

  /**
              @addtogroup FeatCore
              @{
   */

  //! Preconditioner types, numbered as in the parameter files.
  enum class PreconditionerType {
    none = 0,         //!< no preconditioning, not supported
    linearSolver = 1, //!< a linear solver for the linearized system
    newton = 2        //!< Newton linearization, not supported
  };

  /**
   * \brief Scratch vectors shared by assembly and damping.
   *
   * Allocated once when the preconditioner is prepared, the content has
   * no meaning between two calls.
   */
  struct ScratchPool
  {
    //! interlevel transfer scratch, max(transfer memory, NEQ) entries
    ScalarVector transfer;
    //! two vectors on the finest level used by the damping computation
    SystemVector damping1;
    SystemVector damping2;

    void allocate(std::size_t transferEntries, const BlockStructure& finest)
    {
      transfer.resize(transferEntries);
      transfer = 0.0;
      damping1.resize(finest);
      damping2.resize(finest);
    }

    void release()
    {
      transfer.resize(0);
      damping1.resize(BlockStructure());
      damping2.resize(BlockStructure());
    }
  };

  /**
   * \brief Linear solver based preconditioner for the nonlinear iteration.
   *
   * The constructor reads the preconditioner type and the linear solver,
   * builds the interlevel projection and the filter chains. prepare()
   * attaches the matrices of all levels and performs the symbolic
   * factorization; every call to precondition() performs a new numeric
   * factorization because the matrices change in each nonlinear step.
   *
   * \code
   * [CC2D-NONLINEAR]
   * itypePreconditioning = 1
   * slinearSolver = CC-LINEARSOLVER
   * \endcode
   */
  class NonlinearPreconditioner
  {
  public:
    /**
     * \param system the discretization
     * \param config the complete parameter tree
     * \param section name of the nonlinear solver section
     *
     * \throws ConfigurationError for unsupported preconditioners or a
     *         missing linear solver section
     */
    NonlinearPreconditioner(AssembledSystem& system, const Dune::ParameterTree& config,
                            const std::string& section);

    ~NonlinearPreconditioner();

    PreconditionerType type() const { return type_; }

    /**
     * \brief Check whether the linear solver accepts the assembled matrices.
     *
     * Collects the structural adjustments of the final assembly: physical
     * transposition of B and the adaptive matrix restriction of
     * iAdaptiveMatrix / dAdMatThreshold in the discretization section.
     *
     * \throws MatrixCompatibilityError if no adjustment makes the matrices usable
     */
    FinalAssemblyInfo checkAssembly(const Dune::ParameterTree& discretization) const;

    //! allocate scratch memory, attach matrices, symbolic factorization
    void prepare();

    //! overwrite d by the preconditioned defect
    void precondition(SystemVector& d, Dune::InverseOperatorResult& res);

    //! free everything allocated by prepare()
    void release();

    bool prepared() const { return prepared_; }

    const InterlevelTransfer& transfer() const { return *transfer_; }
    ScratchPool& scratch() { return scratch_; }

    //! filter for defects on level l
    const FilterChain& filterChain(int l) const { return filters_[l - system_.minLevel()]; }

    LinearSolverBackend& linearSolver() { return *solver_; }

  private:
    AssembledSystem& system_;
    PreconditionerType type_;
    std::unique_ptr<LinearSolverBackend> solver_;
    std::unique_ptr<InterlevelTransfer> transfer_;
    std::vector<FilterChain> filters_;
    ScratchPool scratch_;
    bool prepared_ = false;
  };

  /** @} end documentation */

} // end namespace

#endif
