// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#include <config.h>

#include <cmath>
#include <iostream>

#include <dune/common/exceptions.hh>
#include <dune/common/timer.hh>

#include <feat/featexception.hh>
#include <feat/multigrid.hh>

namespace Feat {

  Multigrid::Parameters::Parameters(const Dune::ParameterTree& config)
  {
    maxIterations = config.get("nmaxIterations", maxIterations);
    reduction = config.get("depsRel", reduction);
    cycle = config.get("icycle", cycle);
    smoothingSteps = config.get("nsmoothingSteps", smoothingSteps);
    smootherDamping = config.get("domegaSmoother", smootherDamping);
    verbose = config.get("ioutputLevel", verbose);

    int smoother = config.get("ismootherType", 0);
    if (smoother == 0)
      variant = VankaSmoother::Variant::full;
    else if (smoother == 1)
      variant = VankaSmoother::Variant::diagonal;
    else
      DUNE_THROW(ConfigurationError, "Unknown smoother type " << smoother);
    if (maxIterations < 1)
      DUNE_THROW(ConfigurationError, "Multigrid needs at least one cycle");
    if (cycle != 0 && cycle != 1)
      DUNE_THROW(ConfigurationError, "Unknown multigrid cycle " << cycle);
  }

  Multigrid::Multigrid(const Parameters& params)
    : params_(params), coarseSolver_(params.verbose > 2 ? 1 : 0)
  {}

  MatrixCompatibility Multigrid::compatibility(const std::vector<const SystemMatrix*>& matrices) const
  {
    MatrixCompatibility result = MatrixCompatibility::ok;
    // the coarsest level is solved directly and accepts any layout,
    // but all levels are finalized together
    for (const SystemMatrix* A : matrices) {
      MatrixCompatibility c = VankaSmoother::compatibility(*A);
      if (c == MatrixCompatibility::incompatible)
        return c;
      if (c == MatrixCompatibility::transposed)
        result = c;
    }
    return result;
  }

  void Multigrid::setMatrices(const LinearSolverLevels& levels)
  {
    if (levels.levels.empty())
      DUNE_THROW(Dune::InvalidStateException, "No level given to the multigrid solver");
    if (levels.levels.size() > 1 && (!levels.transfer || !levels.scratch))
      DUNE_THROW(Dune::InvalidStateException, "Multigrid needs an interlevel transfer");
    levels_ = levels;

    smoothers_.assign(levels.levels.size(), VankaSmoother(params_.variant, params_.smootherDamping));
    coarseSolver_.setMatrix(levels.levels[0].matrix, levels.pressureIndefinite);

    x_.resize(levels.levels.size());
    b_.resize(levels.levels.size());
    d_.resize(levels.levels.size());
    for (std::size_t l = 0; l < levels.levels.size(); ++l) {
      const BlockStructure& s = levels.levels[l].matrix->structure();
      x_[l].resize(s);
      b_[l].resize(s);
      d_[l].resize(s);
    }
  }

  void Multigrid::factorizeSymbolic()
  {
    for (std::size_t l = 1; l < levels_.levels.size(); ++l)
      smoothers_[l].setMatrix(levels_.levels[l].matrix);
    coarseSolver_.factorizeSymbolic();
  }

  void Multigrid::factorizeNumeric()
  {
    coarseSolver_.factorizeNumeric();
  }

  void Multigrid::filterDefect(std::size_t l, SystemVector& v) const
  {
    if (levels_.levels[l].filter)
      levels_.levels[l].filter->apply(v, FilterKind::defect);
  }

  void Multigrid::mgCycle(std::size_t l)
  {
    if (l == 0) {
      coarseSolver_.solve(x_[0], b_[0]);
      filterDefect(0, x_[0]);
      return;
    }

    const SystemMatrix& A = *levels_.levels[l].matrix;
    const int coarseLevel = levels_.minLevel + static_cast<int>(l) - 1;

    smoothers_[l].apply(x_[l], b_[l], params_.smoothingSteps);

    d_[l] = b_[l];
    A.mmv(x_[l], d_[l]);
    filterDefect(l, d_[l]);

    levels_.transfer->restrictDefect(coarseLevel, d_[l], b_[l-1], *levels_.scratch);
    filterDefect(l-1, b_[l-1]);

    x_[l-1] = 0.0;
    const int visits = (params_.cycle == 1) ? 2 : 1;
    for (int k = 0; k < visits; ++k)
      mgCycle(l-1);

    levels_.transfer->prolongate(coarseLevel, x_[l-1], d_[l], *levels_.scratch);
    filterDefect(l, d_[l]);
    x_[l] += d_[l];

    smoothers_[l].apply(x_[l], b_[l], params_.smoothingSteps);
  }

  void Multigrid::precondition(SystemVector& d, Dune::InverseOperatorResult& res)
  {
    iterate(d, params_.reduction, res);
  }

  void Multigrid::apply(SystemVector& x, SystemVector& b, double reduction, Dune::InverseOperatorResult& res)
  {
    x = b;
    iterate(x, reduction, res);
  }

  void Multigrid::iterate(SystemVector& d, double reduction, Dune::InverseOperatorResult& res)
  {
    res.clear();
    Dune::Timer watch;
    const std::size_t top = levels_.levels.size()-1;
    const SystemMatrix& A = *levels_.levels[top].matrix;

    b_[top] = d;
    x_[top] = 0.0;
    double def0 = d.two_norm();
    double def = def0;

    if (params_.verbose > 1) {
      std::cout << "=== Multigrid" << std::endl;
      printHeader(std::cout);
      printOutput(std::cout, 0, def0);
    }

    int i = 1;
    for (; i <= params_.maxIterations; ++i) {
      mgCycle(top);
      SystemVector& r = d_[top];
      r = b_[top];
      A.mmv(x_[top], r);
      filterDefect(top, r);
      double defNew = r.two_norm();
      if (params_.verbose > 1)
        printOutput(std::cout, i, defNew, def);
      def = defNew;
      if (def < def0*reduction || def < 1e-30 || !std::isfinite(def))
        break;
    }
    if (i > params_.maxIterations)
      i = params_.maxIterations;

    d = x_[top];
    filterDefect(top, d);

    res.iterations = i;
    res.reduction = (def0 > 0.0) ? def/def0 : 0.0;
    res.converged = (def < def0*reduction || def < 1e-30);
    res.conv_rate = std::pow(res.reduction, 1.0/i);
    res.elapsed = watch.elapsed();

    if (params_.verbose > 0)
      std::cout << "=== rate=" << res.conv_rate
                << ", T=" << res.elapsed
                << ", TIT=" << res.elapsed/i
                << ", IT=" << i << std::endl;
  }

  void Multigrid::release()
  {
    coarseSolver_.release();
    smoothers_.clear();
    x_.clear();
    b_.clear();
    d_.clear();
    levels_ = LinearSolverLevels();
  }

} // end namespace Feat
