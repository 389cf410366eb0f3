// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#include <config.h>

#include <dune/common/exceptions.hh>
#include <dune/common/stdstreams.hh>

#include <feat/linearization.hh>

namespace Feat {

  MatrixAssembler::MatrixAssembler(AssembledSystem& system, const Stabilization& stabilization,
                                   const Dune::ParameterTree& discretization)
    : system_(system), stabilization_(stabilization),
      decoupledXY_(discretization.get("bdecoupledXY", false)),
      filterInterpolated_(discretization.get("bfilterInterpolatedSolution", false))
  {}

  void MatrixAssembler::assemble(const SystemVector& x, bool allLevels,
                                 bool boundaryConditions, bool nonlinearBoundaryConditions)
  {
    ++assemblyCount_;
    const int top = system_.maxLevel();
    const int bottom = allLevels ? system_.minLevel() : top;

    if (bottom < top && (!transfer_ || !scratch_))
      DUNE_THROW(Dune::InvalidStateException, "Assembling a level hierarchy needs an interlevel transfer");

    Dune::dverb << "Assembling linearized matrices on levels "
                << bottom << " to " << top << std::endl;

    // each coarser level interpolates the point of the next finer level
    const SystemVector* point = &x;
    for (int l = top; l >= bottom; --l) {
      if (l < top) {
        Level& coarse = system_.level(l);
        transfer_->interpolate(l, coarse.tempVector, *point, *scratch_);
        // off by default, the coarse matrices are built from the raw interpolant
        if (filterInterpolated_)
          system_.applyBoundaryFilter(l, coarse.tempVector, FilterKind::solution);
        point = &coarse.tempVector;
      }
      assembleLevel(l, *point, boundaryConditions, nonlinearBoundaryConditions);
    }
  }

  void MatrixAssembler::assembleLevel(int l, const SystemVector& point,
                                      bool boundaryConditions, bool nonlinearBoundaryConditions)
  {
    Level& level = system_.level(l);
    SystemMatrix& S = level.systemMatrix;
    SparseMatrix& A = S(0, 0);

    if (equation_.alpha != 0.0 || equation_.theta != 0.0) {
      A.copyValuesFrom(level.stokes);
      if (equation_.alpha != 0.0) {
        A.scale(equation_.theta);
        A.axpy(equation_.alpha, level.mass);
      }
      else if (equation_.theta != 1.0)
        A.scale(equation_.theta);
    }
    else
      A.clear();

    ConvectionContribution target;
    target.mode = ConvectionMode::matrix;
    target.matrix = &A;
    for (const ConvectionTerm& term : stabilization_.terms(equation_.gamma))
      system_.assembleConvection(l, term, point, target);

    if (l < system_.maxLevel() && adaptiveMode_ != AdaptiveMatrixMode::off)
      transfer_->restrictMatrix(system_.level(l+1), level, adaptiveMode_, adaptiveThreshold_);

    if (decoupledXY_)
      S(1, 1).copyValuesFrom(A);

    if (boundaryConditions)
      system_.applyBoundaryFilter(l, S);
    if (nonlinearBoundaryConditions)
      system_.applyNonlinearBoundaryFilter(l, S);
  }

  void MatrixAssembler::subtractConvection(const SystemVector& x, SystemVector& d) const
  {
    ConvectionContribution target;
    target.mode = ConvectionMode::defect;
    target.solution = &x;
    target.defect = &d;
    for (const ConvectionTerm& term : stabilization_.terms(equation_.gamma))
      system_.assembleConvection(system_.maxLevel(), term, x, target);
  }

} // end namespace Feat
