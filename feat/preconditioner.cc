// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#include <config.h>

#include <algorithm>

#include <dune/common/exceptions.hh>
#include <dune/common/stdstreams.hh>

#include <feat/featexception.hh>
#include <feat/preconditioner.hh>

namespace Feat {

  NonlinearPreconditioner::NonlinearPreconditioner(AssembledSystem& system,
                                                   const Dune::ParameterTree& config,
                                                   const std::string& section)
    : system_(system)
  {
    if (!config.hasSub(section))
      DUNE_THROW(ConfigurationError, "Nonlinear solver section [" << section << "] not found");
    const Dune::ParameterTree& nonlinear = config.sub(section);

    const int type = nonlinear.get("itypePreconditioning", 1);
    switch (type) {
    case 1 :
      type_ = PreconditionerType::linearSolver;
      break;
    case 0 :
    case 2 :
      DUNE_THROW(ConfigurationError, "Unsupported preconditioner " << type);
    default :
      DUNE_THROW(ConfigurationError, "Unknown preconditioner " << type);
    }

    const std::string solverSection = nonlinear.get<std::string>("slinearSolver", "");
    if (solverSection.empty() || !config.hasSub(solverSection))
      DUNE_THROW(ConfigurationError, "No linear subsolver!");

    // projection for the multigrid transfer and the multilevel assembly
    const Dune::ParameterTree emptySection;
    const Dune::ParameterTree& prolrest = config.hasSub("CC-PROLREST") ? config.sub("CC-PROLREST") : emptySection;
    transfer_ = system_.createTransfer(TransferParameters(prolrest));

    filters_.resize(system_.maxLevel() - system_.minLevel() + 1);
    for (int l = system_.minLevel(); l <= system_.maxLevel(); ++l) {
      FilterChain& chain = filters_[l - system_.minLevel()];
      const Level& level = system_.level(l);
      if (level.dirichlet)
        chain.add(level.dirichlet);
      if (level.fictitious)
        chain.add(level.fictitious);
      // pure Dirichlet problems determine the pressure up to a constant
      if (!system_.hasNeumannBoundary())
        chain.add(std::make_shared<const PressureMeanFilter>());
    }

    solver_ = createLinearSolver(config.sub(solverSection));
  }

  NonlinearPreconditioner::~NonlinearPreconditioner()
  {
    if (prepared_)
      release();
  }

  FinalAssemblyInfo NonlinearPreconditioner::checkAssembly(const Dune::ParameterTree& discretization) const
  {
    std::vector<const SystemMatrix*> matrices;
    for (int l = system_.minLevel(); l <= system_.maxLevel(); ++l)
      matrices.push_back(&system_.level(l).systemMatrix);

    FinalAssemblyInfo info;
    switch (solver_->compatibility(matrices)) {
    case MatrixCompatibility::ok :
      break;
    case MatrixCompatibility::transposed :
      info.transposeB = true;
      break;
    case MatrixCompatibility::incompatible :
      DUNE_THROW(MatrixCompatibilityError, "Preconditioner incompatible to the matrices");
    }

    const int adaptive = discretization.get("iAdaptiveMatrix", 0);
    if (adaptive == 0)
      info.adaptiveMatrixMode = AdaptiveMatrixMode::off;
    else if (adaptive == 1)
      info.adaptiveMatrixMode = AdaptiveMatrixMode::threshold;
    else
      DUNE_THROW(ConfigurationError, "Unknown adaptive matrix mode " << adaptive);
    info.adaptiveThreshold = discretization.get("dAdMatThreshold", 20.0);
    return info;
  }

  void NonlinearPreconditioner::prepare()
  {
    const int top = system_.maxLevel();
    const BlockStructure& finest = system_.level(top).structure;

    transfer_->init();
    scratch_.allocate(std::max(transfer_->memoryRequirement(top), finest.total()), finest);

    LinearSolverLevels levels;
    levels.minLevel = system_.minLevel();
    for (int l = system_.minLevel(); l <= top; ++l) {
      LevelOperator op;
      op.matrix = &system_.level(l).systemMatrix;
      op.filter = &filters_[l - system_.minLevel()];
      levels.levels.push_back(op);
    }
    levels.transfer = transfer_.get();
    levels.scratch = &scratch_.transfer;
    levels.pressureIndefinite = !system_.hasNeumannBoundary();

    solver_->setMatrices(levels);
    solver_->factorizeSymbolic();
    prepared_ = true;

    Dune::dverb << "Preconditioner prepared on levels " << system_.minLevel()
                << " to " << top << ", " << scratch_.transfer.size()
                << " scratch entries" << std::endl;
  }

  void NonlinearPreconditioner::precondition(SystemVector& d, Dune::InverseOperatorResult& res)
  {
    if (!prepared_)
      DUNE_THROW(Dune::InvalidStateException, "Preconditioner used before prepare()");
    solver_->factorizeNumeric();
    solver_->precondition(d, res);
  }

  void NonlinearPreconditioner::release()
  {
    solver_->release();
    transfer_->done();
    scratch_.release();
    prepared_ = false;
  }

} // end namespace Feat
