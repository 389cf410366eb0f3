// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#include <config.h>

#include <dune/common/exceptions.hh>
#include <dune/common/stdstreams.hh>

#include <feat/featexception.hh>
#include <feat/q1tilde/cavityproblem.hh>
#include <feat/q1tilde/matrixassembly.hh>
#include <feat/q1tilde/transfer.hh>

namespace Feat {
namespace Q1Tilde {

  CavityProblem::CavityProblem(const Dune::ParameterTree& config)
  {
    const Dune::ParameterTree empty;
    const Dune::ParameterTree& discretization =
      config.hasSub("CC-DISCRETISATION") ? config.sub("CC-DISCRETISATION") : empty;
    const Dune::ParameterTree& cavity = config.hasSub("CAVITY") ? config.sub("CAVITY") : empty;

    minLevel_ = discretization.get("NLMIN", 1);
    maxLevel_ = discretization.get("NLMAX", 3);
    nu_ = 1.0/discretization.get("RE", 1000.0);
    lidVelocity_ = cavity.get("lidVelocity", 1.0);

    if (minLevel_ < 1 || maxLevel_ < minLevel_)
      DUNE_THROW(ConfigurationError, "Invalid level range [" << minLevel_ << "," << maxLevel_ << "]");

    const int nx = cavity.get("nx", 1);
    const int ny = cavity.get("ny", 1);
    const double width = cavity.get("width", 1.0);
    const double height = cavity.get("height", 1.0);
    if (nx < 1 || ny < 1 || width <= 0.0 || height <= 0.0)
      DUNE_THROW(ConfigurationError, "Invalid cavity " << width << "x" << height
                 << " with " << nx << "x" << ny << " cells");

    RectangleGrid grid(nx, ny, width, height);
    for (int l = 1; l < minLevel_; ++l)
      grid = grid.refined();
    for (int l = minLevel_; l <= maxLevel_; ++l) {
      grids_.push_back(grid);
      grid = grid.refined();
    }

    levels_.resize(maxLevel_ - minLevel_ + 1);
    for (int l = minLevel_; l <= maxLevel_; ++l)
      setupLevel(l);
  }

  void CavityProblem::setupLevel(int l)
  {
    const RectangleGrid& g = grid(l);
    Level& lev = level(l);

    lev.index = l;
    lev.structure.velocity = g.edges();
    lev.structure.pressure = g.cells();
    lev.element = VelocityElement::q1tilde;

    lev.stokes = SparseMatrix(velocityPattern(g));
    lev.mass = lev.stokes.duplicate(DuplicationMode::shareStructure);
    assembleLaplace(g, nu_, lev.stokes);
    assembleMass(g, lev.mass);

    lev.b1 = SparseMatrix(divergencePattern(g));
    lev.b2 = lev.b1.duplicate(DuplicationMode::shareStructure);
    assembleDivergence(g, lev.b1, lev.b2);

    auto dirichlet = std::make_shared<DirichletFilter>();
    for (RectangleGrid::size_type e = 0; e < g.edges(); ++e) {
      if (!g.isBoundaryEdge(e))
        continue;
      const bool lid = g.isHorizontal(e) && e / g.nx() == g.ny();
      dirichlet->add(0, e, lid ? lidVelocity_ : 0.0);
      dirichlet->add(1, e, 0.0);
    }

    // the momentum equations of constrained velocities do not see the pressure
    for (RectangleGrid::size_type c = 0; c < 2; ++c)
      for (const auto& constraint : dirichlet->constraints(c))
        (c == 0 ? lev.b1 : lev.b2).clearRow(constraint.first);

    lev.dirichlet = dirichlet;
    lev.tempVector.resize(lev.structure);

    Dune::dverb << "Level " << l << ": " << g.nx() << "x" << g.ny() << " cells, "
                << lev.structure.total() << " unknowns" << std::endl;
  }

  void CavityProblem::assembleConvection(int l, const ConvectionTerm& term, const SystemVector& velocity,
                                         ConvectionContribution& target) const
  {
    Q1Tilde::assembleConvection(grid(l), nu_, term, velocity, target);
  }

  std::unique_ptr<InterlevelTransfer> CavityProblem::createTransfer(const TransferParameters& params) const
  {
    return std::make_unique<Transfer>(grids_, minLevel_, params);
  }

  SystemVector CavityProblem::rightHandSide() const
  {
    const Level& top = level(maxLevel_);
    SystemVector b(top.structure);
    FilterTargets targets;
    targets.applyToRHS = true;
    implementBoundaryConditions(*top.dirichlet, targets, nullptr, &b, nullptr);
    return b;
  }

  SystemVector CavityProblem::initialSolution() const
  {
    const Level& top = level(maxLevel_);
    SystemVector x(top.structure);
    FilterTargets targets;
    targets.applyToSolution = true;
    implementBoundaryConditions(*top.dirichlet, targets, &x, nullptr, nullptr);
    return x;
  }

} // end namespace Q1Tilde
} // end namespace Feat
