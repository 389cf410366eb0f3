// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#include <config.h>

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <iomanip>
#include <iostream>

#include <dune/common/exceptions.hh>
#include <dune/common/ios_state.hh>
#include <dune/common/stdstreams.hh>
#include <dune/common/timer.hh>

#include <feat/featexception.hh>
#include <feat/nonlinearcore.hh>

namespace Feat {

  namespace {

    const Dune::ParameterTree& subOrEmpty(const Dune::ParameterTree& config, const std::string& section)
    {
      static const Dune::ParameterTree empty;
      return config.hasSub(section) ? config.sub(section) : empty;
    }

    const Dune::ParameterTree& requiredSub(const Dune::ParameterTree& config, const std::string& section)
    {
      if (!config.hasSub(section))
        DUNE_THROW(ConfigurationError, "Nonlinear solver section [" << section << "] not found");
      return config.sub(section);
    }

    enum { iterationSpacing = 3, normSpacing = 10 };

  }

  ConvergenceCheck evaluateConvergence(NonlinearIterationState& state, int ite,
                                       const ResidualNorms& residuals,
                                       const std::array<double, 3>& solutionMaxNorms)
  {
    ConvergenceCheck check;

    if (ite == 0) {
      state.residualInit = {{residuals.velocity, residuals.divergence}};
      state.residualOld = state.residualInit;
      return check;
    }

    const double resOld = std::sqrt(state.residualOld[0]*state.residualOld[0]
                                    + state.residualOld[1]*state.residualOld[1]);
    const double resInit = std::sqrt(state.residualInit[0]*state.residualInit[0]
                                     + state.residualInit[1]*state.residualInit[1]);

    const double ratio = residuals.total/resOld;
    check.rate = std::pow(ratio, 1.0/ite);

    const double normU = std::max(std::max(solutionMaxNorms[0], solutionMaxNorms[1]), 1e-8);
    const double normP = std::max(solutionMaxNorms[2], 1e-8);
    check.relativeVelocityChange = std::max(state.residualCorr[0], state.residualCorr[1])/normU;
    check.relativePressureChange = state.residualCorr[2]/normP;

    const double depsUR = state.epsNL[epsUR];
    const double depsPR = state.epsNL[epsPR];
    const double depsD = state.epsNL[epsD];
    const double depsDiv = state.epsNL[epsDiv];
    const double depsRES = state.epsNL[dmpD]*resInit;

    state.residualOld = {{residuals.velocity, residuals.divergence}};

    // written as a negation so that NaN diverges
    const bool diverged = !(ratio < 1e2);

    // the divergence criterion compares depsDiv with itself and always holds
    const bool converged = check.relativeVelocityChange <= depsUR
                           && check.relativePressureChange <= depsPR
                           && residuals.velocity <= depsD
                           && depsDiv <= depsDiv
                           && residuals.total <= depsRES;

    if (diverged)
      check.status = ConvergenceStatus::diverged;
    else if (converged)
      check.status = ConvergenceStatus::converged;
    return check;
  }

  std::ostream& operator<<(std::ostream& s, NonlinearState state)
  {
    switch (state) {
    case NonlinearState::init :             return s << "init";
    case NonlinearState::iterateDefect :    return s << "iterateDefect";
    case NonlinearState::precondition :     return s << "precondition";
    case NonlinearState::lineSearch :       return s << "lineSearch";
    case NonlinearState::update :           return s << "update";
    case NonlinearState::checkConvergence : return s << "checkConvergence";
    case NonlinearState::converged :        return s << "converged";
    case NonlinearState::diverged :         return s << "diverged";
    case NonlinearState::maxIterReached :   return s << "maxIterReached";
    }
    return s;
  }

  NonlinearIterationController::NonlinearIterationController(AssembledSystem& system, SystemVector& x,
                                                             const SystemVector& b,
                                                             const Dune::ParameterTree& config,
                                                             const std::string& section,
                                                             const std::string& discretizationSection)
    : system_(system),
      discretization_(subOrEmpty(config, discretizationSection)),
      assembler_(system, Stabilization(discretization_), discretization_)
  {
    const Dune::ParameterTree& nonlinear = requiredSub(config, section);

    state_.solution = &x;
    state_.rhs = &b;
    state_.minLevel = system_.minLevel();
    state_.maxLevel = system_.maxLevel();

    state_.omegaMin = nonlinear.get("domegaMin", 0.0);
    state_.omegaMax = nonlinear.get("domegaMax", 0.0);
    state_.omega = nonlinear.get("domegaIni", 1.0);
    state_.minIterations = nonlinear.get("nminIterations", 1);
    state_.maxIterations = nonlinear.get("nmaxIterations", 10);
    state_.outputLevel = nonlinear.get("ioutputLevel", 0);

    state_.epsNL[epsUR] = nonlinear.get("depsUR", 0.1);
    state_.epsNL[epsPR] = nonlinear.get("depsPR", 0.1);
    state_.epsNL[epsD] = nonlinear.get("depsD", 0.1);
    state_.epsNL[epsDiv] = nonlinear.get("depsDiv", 0.1);
    state_.epsNL[dmpD] = nonlinear.get("ddmpD", 0.1);

    // canonical system matrices on all levels
    for (int l = state_.minLevel; l <= state_.maxLevel; ++l)
      system_.level(l).setupSystemMatrix(assembler_.decoupledVelocity());

    preconditioner_ = std::make_unique<NonlinearPreconditioner>(system_, config, section);
    state_.preconditioner = preconditioner_->type();

    defect_.resize(system_.level(state_.maxLevel).structure);
  }

  NonlinearIterationController::~NonlinearIterationController()
  {
    if (preconditioner_ && preconditioner_->prepared())
      releasePreconditioner();
  }

  void NonlinearIterationController::setupCoreEquation(double alpha, double theta, double gamma)
  {
    state_.equation.alpha = alpha;
    state_.equation.theta = theta;
    state_.equation.gamma = gamma;
    assembler_.setCoreEquation(state_.equation);
  }

  void NonlinearIterationController::preparePreconditioner()
  {
    state_.finalAssembly = preconditioner_->checkAssembly(discretization_);
    finalAssembly_ = std::make_unique<FinalAssemblyAdapter>(state_.finalAssembly);
    finalAssembly_->finalize(system_);

    assembler_.setAdaptiveRestriction(state_.finalAssembly.adaptiveMatrixMode,
                                      state_.finalAssembly.adaptiveThreshold);
    preconditioner_->prepare();
    assembler_.setTransfer(&preconditioner_->transfer(), &preconditioner_->scratch().transfer);
  }

  void NonlinearIterationController::releasePreconditioner()
  {
    assembler_.setTransfer(nullptr, nullptr);
    preconditioner_->release();
    if (finalAssembly_)
      finalAssembly_->unfinalize(system_, true);
    finalAssembly_.reset();
  }

  void NonlinearIterationController::computeDefect(const SystemVector& x, const SystemVector& b,
                                                   SystemVector& d) const
  {
    const int top = state_.maxLevel;
    const Level& level = system_.level(top);
    const CoreEquationParameters& eq = state_.equation;

    d = b;

    // linear part of the velocity blocks
    if (eq.theta != 0.0) {
      SystemMatrix velocity(level.structure);
      velocity(0, 0) = level.stokes.duplicate(DuplicationMode::share);
      velocity(1, 1) = level.stokes.duplicate(DuplicationMode::share);
      velocity.setScaling(0, 0, eq.theta);
      velocity.setScaling(1, 1, eq.theta);
      velocity.mmv(x, d);
    }
    if (eq.alpha != 0.0) {
      SystemMatrix velocity(level.structure);
      velocity(0, 0) = level.mass.duplicate(DuplicationMode::share);
      velocity(1, 1) = level.mass.duplicate(DuplicationMode::share);
      velocity.setScaling(0, 0, eq.alpha);
      velocity.setScaling(1, 1, eq.alpha);
      velocity.mmv(x, d);
    }

    assembler_.subtractConvection(x, d);

    // coupling part, the velocity blocks are masked out
    SystemMatrix coupling = level.systemMatrix.duplicate(DuplicationMode::share);
    for (std::size_t i = 0; i < 2; ++i)
      for (std::size_t j = 0; j < 2; ++j)
        coupling.release(i, j);
    coupling.mmv(x, d);

    preconditioner_->filterChain(top).apply(d, FilterKind::defect);
    system_.applyNonlinearBoundaryFilter(top, d, FilterKind::defect);
  }

  void NonlinearIterationController::precondition(SystemVector& d)
  {
    if (!preconditioner_->prepared())
      DUNE_THROW(Dune::InvalidStateException, "Preconditioner used before preparePreconditioner()");

    SystemVector& x = *state_.solution;
    const SystemVector& b = *state_.rhs;

    state_.state = NonlinearState::precondition;
    assembler_.assemble(x, true, true, true);
    preconditioner_->precondition(d, state_.lastLinearSolve);

    state_.state = NonlinearState::lineSearch;
    DampingLineSearch damping(system_, assembler_, preconditioner_->filterChain(state_.maxLevel),
                              state_.omegaMin, state_.omegaMax);
    ScratchPool& scratch = preconditioner_->scratch();
    state_.omega = damping.compute(x, b, d, state_.omega, scratch.damping1, scratch.damping2);

    for (std::size_t i = 0; i < 3; ++i)
      state_.residualCorr[i] = d[i].infinity_norm();
  }

  void NonlinearIterationController::update(SystemVector& x, const SystemVector& d, double omega) const
  {
    x.axpy(omega, d);
  }

  ResidualNorms NonlinearIterationController::residualNorms(const SystemVector& x, const SystemVector& b,
                                                           const SystemVector& d) const
  {
    ResidualNorms res;

    double dresF = std::max(b[0].two_norm(), b[1].two_norm());
    if (dresF < 1e-8)
      dresF = 1.0;
    res.velocity = d.velocity_two_norm()/dresF;

    double normU = x.velocity_two_norm();
    if (normU < 1e-8)
      normU = 1.0;
    res.divergence = d[2].two_norm()/normU;

    res.total = std::sqrt(res.velocity*res.velocity + res.divergence*res.divergence);
    return res;
  }

  ConvergenceStatus NonlinearIterationController::checkConvergence(int ite, const SystemVector& x,
                                                                   const SystemVector& b,
                                                                   const SystemVector& d)
  {
    state_.state = NonlinearState::checkConvergence;
    state_.iteration = ite;
    lastResiduals_ = residualNorms(x, b, d);

    std::array<double, 3> maxNorms;
    for (std::size_t i = 0; i < 3; ++i)
      maxNorms[i] = x[i].infinity_norm();

    const ConvergenceCheck check = evaluateConvergence(state_, ite, lastResiduals_, maxNorms);
    if (state_.outputLevel >= 2)
      printIteration(std::cout, ite, check);
    return check.status;
  }

  void NonlinearIterationController::printIteration(std::ostream& s, int ite, const ConvergenceCheck& check) const
  {
    Dune::ios_base_all_saver saver(s);
    const std::string separator(3 + 9*normSpacing, '-');

    if (ite == 0) {
      s << separator << std::endl;
      s << std::setw(iterationSpacing) << "IT";
      for (const char* column : {"RELU", "RELP", "DEF-U", "DEF-DIV", "DEF-TOT", "RHONL", "OMEGNL", "RHOMG"})
        s << std::setw(normSpacing) << column;
      s << std::endl << separator << std::endl;
      s << std::setw(iterationSpacing) << 0 << std::setw(2*normSpacing) << "";
      s << std::scientific << std::setprecision(2);
      s << std::setw(normSpacing) << lastResiduals_.velocity
        << std::setw(normSpacing) << lastResiduals_.divergence
        << std::setw(normSpacing) << lastResiduals_.total << std::endl;
      s << separator << std::endl;
      return;
    }

    s << std::setw(iterationSpacing) << ite << std::scientific << std::setprecision(2);
    s << std::setw(normSpacing) << check.relativeVelocityChange
      << std::setw(normSpacing) << check.relativePressureChange
      << std::setw(normSpacing) << lastResiduals_.velocity
      << std::setw(normSpacing) << lastResiduals_.divergence
      << std::setw(normSpacing) << lastResiduals_.total
      << std::setw(normSpacing) << check.rate
      << std::setw(normSpacing) << state_.omega
      << std::setw(normSpacing) << state_.lastLinearSolve.conv_rate << std::endl;
  }

  NonlinearSolverResult NonlinearIterationController::solve()
  {
    NonlinearSolverResult result;
    Dune::Timer watch;

    const bool ownPreparation = !preconditioner_->prepared();
    if (ownPreparation)
      preparePreconditioner();

    SystemVector& x = *state_.solution;
    const SystemVector& b = *state_.rhs;
    const int top = state_.maxLevel;

    system_.applyBoundaryFilter(top, x, FilterKind::solution);

    state_.state = NonlinearState::iterateDefect;
    computeDefect(x, b, defect_);
    checkConvergence(0, x, b, defect_);
    result.initialDefect = lastResiduals_.total;
    result.defects.push_back(lastResiduals_.total);

    state_.state = NonlinearState::maxIterReached;
    double rate = 0.0;
    int ite = 1;
    for (; ite <= state_.maxIterations; ++ite) {
      precondition(defect_);

      state_.state = NonlinearState::update;
      update(x, defect_, state_.omega);

      state_.state = NonlinearState::iterateDefect;
      computeDefect(x, b, defect_);

      const ConvergenceStatus status = checkConvergence(ite, x, b, defect_);
      result.defects.push_back(lastResiduals_.total);
      rate = std::pow(result.initialDefect > 0.0 ? lastResiduals_.total/result.initialDefect : 0.0, 1.0/ite);

      if (status == ConvergenceStatus::diverged) {
        state_.state = NonlinearState::diverged;
        break;
      }
      if (status == ConvergenceStatus::converged && ite >= state_.minIterations) {
        state_.state = NonlinearState::converged;
        break;
      }
      state_.state = NonlinearState::maxIterReached;
    }

    result.iterations = std::min(ite, state_.maxIterations);
    result.finalDefect = lastResiduals_.total;
    result.conv_rate = rate;
    result.converged = (state_.state == NonlinearState::converged);
    result.state = state_.state;
    result.elapsed = watch.elapsed();

    if (ownPreparation)
      releasePreconditioner();

    if (state_.outputLevel >= 1)
      std::cout << "=== Nonlinear solver: " << result.state
                << ", rate=" << result.conv_rate
                << ", T=" << result.elapsed
                << ", IT=" << result.iterations << std::endl;
    Dune::dinfo << "Nonlinear solver finished after " << result.iterations
                << " iterations, RESTOT " << result.initialDefect
                << " -> " << result.finalDefect << std::endl;
    return result;
  }

  void NonlinearIterationController::save(IterationContext& context) const
  {
    context.state = state_;
    context.valid = true;
  }

  void NonlinearIterationController::restore(const IterationContext& context)
  {
    if (!context.valid)
      DUNE_THROW(Dune::InvalidStateException, "Restoring an iteration context that was never saved");
    if (context.state.minLevel != system_.minLevel() || context.state.maxLevel != system_.maxLevel())
      DUNE_THROW(Dune::InvalidStateException, "Iteration context belongs to a different level hierarchy");
    state_ = context.state;
    assembler_.setCoreEquation(state_.equation);
  }

} // end namespace Feat
