// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#ifndef FEAT_NONLINEARCORE_HH
#define FEAT_NONLINEARCORE_HH

#include <array>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include <dune/common/parametertree.hh>

#include <feat/assembledsystem.hh>
#include <feat/coreequation.hh>
#include <feat/dampingsearch.hh>
#include <feat/finalassembly.hh>
#include <feat/linearization.hh>
#include <feat/linearsolver.hh>
#include <feat/preconditioner.hh>
#include <feat/systemvector.hh>

/** \file
 * \brief Nonlinear defect correction for saddle point problems.
 */

namespace Feat {

  /**
              @addtogroup FeatCore
              @{
   */

  //! Phases of the nonlinear iteration.
  enum class NonlinearState {
    init,
    iterateDefect,
    precondition,
    lineSearch,
    update,
    checkConvergence,
    converged,
    diverged,
    maxIterReached
  };

  //! Outcome of a single convergence check.
  enum class ConvergenceStatus {
    iterate,
    converged,
    diverged
  };

  //! Relative defect norms RESU, RESDIV and RESTOT.
  struct ResidualNorms
  {
    double velocity = 0.0;
    double divergence = 0.0;
    double total = 0.0;
  };

  //! Stopping criteria, the order of the entries is fixed.
  enum StoppingCriterion {
    epsUR = 0,  //!< relative change of the velocity
    epsPR = 1,  //!< relative change of the pressure
    epsD = 2,   //!< velocity defect
    epsDiv = 3, //!< divergence defect
    dmpD = 4    //!< reduction of the total defect
  };

  /**
   * \brief Everything the nonlinear iteration carries from one step to the next.
   *
   * Solution and right hand side are referenced, not owned.
   */
  struct NonlinearIterationState
  {
    SystemVector* solution = nullptr;
    const SystemVector* rhs = nullptr;

    int minLevel = 0;
    int maxLevel = 0;

    PreconditionerType preconditioner = PreconditionerType::linearSolver;
    FinalAssemblyInfo finalAssembly;
    CoreEquationParameters equation;

    //! RESU and RESDIV of iteration 0
    std::array<double, 2> residualInit = {{0.0, 0.0}};
    //! RESU and RESDIV of the last iteration
    std::array<double, 2> residualOld = {{0.0, 0.0}};
    //! max norms of the blocks of the last preconditioned defect
    std::array<double, 3> residualCorr = {{0.0, 0.0, 0.0}};
    //! indexed by StoppingCriterion
    std::array<double, 5> epsNL = {{0.1, 0.1, 0.1, 0.1, 0.1}};

    double omegaMin = 0.0;
    double omegaMax = 0.0;
    double omega = 1.0;

    int minIterations = 1;
    int maxIterations = 10;
    int outputLevel = 0;

    int iteration = 0;
    NonlinearState state = NonlinearState::init;
    Dune::InverseOperatorResult lastLinearSolve;
  };

  //! Caller owned storage for a saved iteration state.
  struct IterationContext
  {
    NonlinearIterationState state;
    bool valid = false;
  };

  //! Derived quantities of a convergence check, used for output.
  struct ConvergenceCheck
  {
    ConvergenceStatus status = ConvergenceStatus::iterate;
    double relativeVelocityChange = 0.0;
    double relativePressureChange = 0.0;
    double rate = 0.0;
  };

  /**
   * \brief The convergence and divergence criteria of the defect correction.
   *
   * In iteration 0 the residuals are recorded as initial residuals and the
   * iteration never stops. Afterwards the iteration diverges if the total
   * residual grew by a factor of 100 or is not a number, and converges if
   * all criteria of state.epsNL hold. The residual history in state is
   * updated.
   *
   * \param state the iteration state
   * \param ite the iteration counter
   * \param residuals RESU, RESDIV, RESTOT of the current iterate
   * \param solutionMaxNorms max norms of the blocks of the current iterate
   */
  ConvergenceCheck evaluateConvergence(NonlinearIterationState& state, int ite,
                                       const ResidualNorms& residuals,
                                       const std::array<double, 3>& solutionMaxNorms);

  /**
      \brief Statistics about a nonlinear solve.
   */
  struct NonlinearSolverResult
  {
    //! number of nonlinear steps
    int iterations = 0;
    //! RESTOT of the initial iterate
    double initialDefect = 0.0;
    //! RESTOT of the final iterate
    double finalDefect = 0.0;
    //! nonlinear convergence rate of the last step
    double conv_rate = 0.0;
    bool converged = false;
    NonlinearState state = NonlinearState::init;
    //! RESTOT of every iterate, starting with iteration 0
    std::vector<double> defects;
    double elapsed = 0.0;
  };

  std::ostream& operator<<(std::ostream& s, NonlinearState state);

  /**
   * \brief Nonlinear defect correction with a multilevel preconditioner.
   *
   * Solves the saddle point problem by
   * \f[ x_{k+1} = x_k + \omega_k P^{-1}(b - T(x_k) x_k) \f]
   * where \f$ T(x) \f$ is the Oseen matrix linearized at x and P the
   * linear solver on the linearized system of all levels.
   *
   * \code
   * [CC2D-NONLINEAR]
   * nminIterations = 1
   * nmaxIterations = 10
   * ioutputLevel = 0
   * depsUR = 0.1
   * depsPR = 0.1
   * depsD = 0.1
   * depsDiv = 0.1
   * ddmpD = 0.1
   * domegaIni = 1.0
   * domegaMin = 0.0
   * domegaMax = 2.0
   * itypePreconditioning = 1
   * slinearSolver = CC-LINEARSOLVER
   * \endcode
   */
  class NonlinearIterationController
  {
  public:
    /**
     * \param system the discretization, its level matrices are bound here
     * \param x the initial iterate, overwritten by the solution
     * \param b the right hand side
     * \param config the complete parameter tree
     * \param section name of the nonlinear solver section
     * \param discretizationSection name of the discretization section
     *
     * \throws ConfigurationError if the nonlinear section is missing or
     *         describes an unsupported setup
     */
    NonlinearIterationController(AssembledSystem& system, SystemVector& x, const SystemVector& b,
                                 const Dune::ParameterTree& config,
                                 const std::string& section = "CC2D-NONLINEAR",
                                 const std::string& discretizationSection = "CC-DISCRETISATION");

    ~NonlinearIterationController();

    NonlinearIterationController(const NonlinearIterationController&) = delete;
    NonlinearIterationController& operator=(const NonlinearIterationController&) = delete;

    //! alpha M + theta L + gamma N(u)
    void setupCoreEquation(double alpha, double theta, double gamma);

    //! final assembly of the matrices and symbolic factorization
    void preparePreconditioner();

    //! undo preparePreconditioner()
    void releasePreconditioner();

    //! d = b - T(x) x, filtered
    void computeDefect(const SystemVector& x, const SystemVector& b, SystemVector& d) const;

    /**
     * \brief Overwrite d by the preconditioned defect.
     *
     * Linearizes all levels at the current iterate, solves and computes
     * the damping parameter for the next update.
     */
    void precondition(SystemVector& d);

    //! x += omega d
    void update(SystemVector& x, const SystemVector& d, double omega) const;

    //! RESU, RESDIV and RESTOT of a defect
    ResidualNorms residualNorms(const SystemVector& x, const SystemVector& b, const SystemVector& d) const;

    //! check the stopping criteria in iteration ite, prints a line of the convergence table
    ConvergenceStatus checkConvergence(int ite, const SystemVector& x, const SystemVector& b,
                                       const SystemVector& d);

    //! run the defect correction starting from the bound iterate
    NonlinearSolverResult solve();

    void save(IterationContext& context) const;

    //! \throws Dune::InvalidStateException if context holds no saved state
    void restore(const IterationContext& context);

    const NonlinearIterationState& state() const { return state_; }

    const ResidualNorms& lastResiduals() const { return lastResiduals_; }

    MatrixAssembler& assembler() { return assembler_; }
    NonlinearPreconditioner& preconditioner() { return *preconditioner_; }

  private:
    void printIteration(std::ostream& s, int ite, const ConvergenceCheck& check) const;

    AssembledSystem& system_;
    Dune::ParameterTree discretization_;
    NonlinearIterationState state_;
    MatrixAssembler assembler_;
    std::unique_ptr<NonlinearPreconditioner> preconditioner_;
    std::unique_ptr<FinalAssemblyAdapter> finalAssembly_;
    SystemVector defect_;
    ResidualNorms lastResiduals_;
  };

  /** @} end documentation */

} // end namespace

#endif
