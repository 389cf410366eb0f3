// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#include <config.h>

#include <cmath>
#include <cstddef>
#include <iostream>

#include <dune/common/test/testsuite.hh>
#include <dune/istl/solver.hh>
#include <dune/istl/solvercategory.hh>

#include <feat/filters.hh>
#include <feat/nonlinearcore.hh>
#include <feat/q1tilde/cavityproblem.hh>
#include <feat/test/cavitysetup.hh>

using namespace Feat;

Dune::TestSuite testStokesDirect()
{
  Dune::TestSuite t("Stokes, direct solver");

  Dune::ParameterTree config = cavityConfig(1, 2, 1.0, 0);
  config["CC2D-NONLINEAR.depsUR"] = "10.0";
  config["CC2D-NONLINEAR.depsPR"] = "10.0";
  config["CC2D-NONLINEAR.depsD"] = "1e-10";
  config["CC2D-NONLINEAR.ddmpD"] = "1e-8";

  Q1Tilde::CavityProblem problem(config);
  SystemVector x = problem.initialSolution();
  const SystemVector b = problem.rightHandSide();

  NonlinearIterationController controller(problem, x, b, config);
  controller.setupCoreEquation(0.0, 1.0, 0.0);
  const NonlinearSolverResult result = controller.solve();

  t.check(result.converged) << "Stokes problem did not converge, state " << result.state;
  t.check(result.iterations == 1) << "direct Stokes solve needed " << result.iterations << " iterations";
  t.check(controller.lastResiduals().velocity < 1e-10) << "velocity defect " << controller.lastResiduals().velocity;
  t.check(controller.lastResiduals().divergence < 1e-10) << "divergence defect " << controller.lastResiduals().divergence;
  t.check(result.defects.size() == 2) << "defect history incomplete";
  t.check(!controller.preconditioner().prepared()) << "solve() did not release its preparation";

  // the lid drives the flow to the right in the upper cell row
  const Q1Tilde::RectangleGrid& grid = problem.grid(2);
  double topFlow = 0.0;
  for (std::size_t i = 1; i < grid.nx(); ++i)
    topFlow += x[0][grid.verticalEdge(i, grid.ny() - 1)];
  t.check(topFlow > 0.0) << "no flow in lid direction below the lid";
  t.check(x[0][grid.horizontalEdge(0, grid.ny())] == 1.0) << "lid velocity lost";

  return t;
}

Dune::TestSuite testNavierStokes()
{
  Dune::TestSuite t("Navier-Stokes, direct solver");

  Dune::ParameterTree config = cavityConfig(1, 2, 10.0, 0);
  config["CC2D-NONLINEAR.depsD"] = "1e-7";
  config["CC2D-NONLINEAR.ddmpD"] = "1e-6";
  config["CC2D-NONLINEAR.depsUR"] = "1e-5";
  config["CC2D-NONLINEAR.depsPR"] = "1e-4";

  Q1Tilde::CavityProblem problem(config);
  SystemVector x = problem.initialSolution();
  const SystemVector b = problem.rightHandSide();

  NonlinearIterationController controller(problem, x, b, config);
  controller.setupCoreEquation(0.0, 1.0, 1.0);
  const NonlinearSolverResult result = controller.solve();

  t.check(result.converged) << "Navier-Stokes problem did not converge, state " << result.state;
  t.check(result.iterations <= 20) << "too many nonlinear iterations";
  bool monotone = true;
  for (std::size_t k = 1; k < result.defects.size(); ++k)
    monotone = monotone && result.defects[k] <= result.defects[k-1];
  t.check(monotone) << "total defect increased";
  t.check(result.conv_rate < 1.0) << "nonlinear rate " << result.conv_rate;

  return t;
}

Dune::TestSuite testMultigrid()
{
  Dune::TestSuite t("multigrid against direct solver");

  SystemVector solutions[2];
  for (int solverType = 0; solverType < 2; ++solverType) {
    Dune::ParameterTree config = cavityConfig(1, 2, 1.0, solverType);
    config["CC2D-NONLINEAR.depsD"] = "1e-9";
    config["CC2D-NONLINEAR.ddmpD"] = "1e-9";
    config["CC2D-NONLINEAR.depsUR"] = "1e-6";
    config["CC2D-NONLINEAR.depsPR"] = "1e-4";

    Q1Tilde::CavityProblem problem(config);
    solutions[solverType] = problem.initialSolution();
    const SystemVector b = problem.rightHandSide();

    NonlinearIterationController controller(problem, solutions[solverType], b, config);
    controller.setupCoreEquation(0.0, 1.0, 0.0);
    const NonlinearSolverResult result = controller.solve();
    t.check(result.converged) << "solver type " << solverType << " did not converge";

    PressureMeanFilter().subtractMean(solutions[solverType][2]);
  }

  SystemVector difference = solutions[1];
  difference -= solutions[0];
  t.check(difference[0].infinity_norm() < 1e-6 && difference[1].infinity_norm() < 1e-6)
    << "velocities differ by " << difference.velocity_two_norm();
  t.check(difference[2].infinity_norm() < 1e-4) << "pressures differ by " << difference[2].infinity_norm();

  return t;
}

Dune::TestSuite testFactorizationCount()
{
  Dune::TestSuite t("factorizations");

  Dune::ParameterTree config = cavityConfig(1, 2, 10.0, 0);
  config["CC2D-NONLINEAR.nminIterations"] = "2";
  config["CC2D-NONLINEAR.nmaxIterations"] = "2";

  Q1Tilde::CavityProblem problem(config);
  SystemVector x = problem.initialSolution();
  const SystemVector b = problem.rightHandSide();

  NonlinearIterationController controller(problem, x, b, config);
  controller.setupCoreEquation(0.0, 1.0, 1.0);
  controller.preparePreconditioner();
  const NonlinearSolverResult result = controller.solve();

  // the pattern is analysed once, every step factorizes new values
  LinearSolverBackend& solver = controller.preconditioner().linearSolver();
  t.check(result.iterations == 2) << "wrong number of iterations";
  t.check(solver.symbolicFactorizations() == 1) << solver.symbolicFactorizations() << " symbolic factorizations";
  t.check(solver.numericFactorizations() == 2) << solver.numericFactorizations() << " numeric factorizations";
  t.check(controller.preconditioner().prepared()) << "solve() released a preparation it did not own";

  controller.releasePreconditioner();
  t.check(!controller.preconditioner().prepared()) << "preconditioner not released";
  t.check(problem.level(2).systemMatrix(2, 0).isVirtuallyTransposed()) << "canonical matrix not restored";

  return t;
}

// the linear solvers used as Dune::InverseOperator on the finest level
Dune::TestSuite testInverseOperator(int solverType)
{
  Dune::TestSuite t(solverType == 0 ? "direct solver as inverse operator" : "multigrid as inverse operator");

  Dune::ParameterTree config = cavityConfig(1, 2, 1.0, solverType);
  config["CC2D-NONLINEAR.nminIterations"] = "1";
  config["CC2D-NONLINEAR.nmaxIterations"] = "1";

  Q1Tilde::CavityProblem problem(config);
  SystemVector x = problem.initialSolution();
  const SystemVector b = problem.rightHandSide();

  NonlinearIterationController controller(problem, x, b, config);
  controller.setupCoreEquation(0.0, 1.0, 0.0);
  controller.preparePreconditioner();
  controller.solve();

  NonlinearPreconditioner& preconditioner = controller.preconditioner();
  const SystemMatrix& A = problem.level(2).systemMatrix;
  const BlockStructure& s = A.structure();

  // a consistent right hand side with known solution
  SystemVector exact(s);
  for (std::size_t blk = 0; blk < 3; ++blk)
    for (std::size_t i = 0; i < exact[blk].size(); ++i)
      exact[blk][i] = std::sin(0.3 + 1.7*i + 5.0*blk);
  preconditioner.filterChain(2).apply(exact, FilterKind::defect);
  SystemVector rhs(s);
  A.mv(exact, rhs);

  Dune::InverseOperator<SystemVector, SystemVector>& inverse = preconditioner.linearSolver();
  t.check(inverse.category() == Dune::SolverCategory::sequential) << "linear solver is not sequential";

  SystemVector c(s), right = rhs;
  Dune::InverseOperatorResult res;
  inverse.apply(c, right, res);
  t.check(res.converged) << "inverse operator did not converge";
  c -= exact;
  t.check(c.two_norm() < 1e-6*exact.two_norm()) << "inverse operator error " << c.two_norm();

  if (solverType == 1) {
    // a weak reduction stops the cycles earlier
    right = rhs;
    Dune::InverseOperatorResult weak;
    inverse.apply(c, right, 1e-2, weak);
    t.check(weak.converged && weak.reduction < 1e-2) << "reduction " << weak.reduction << " not reached";
    t.check(weak.iterations < res.iterations) << "requested reduction ignored";
  }
  else
    t.check(res.iterations == 1) << "direct solver iterated";

  controller.releasePreconditioner();
  return t;
}

int main() try
{
#if HAVE_SUITESPARSE_UMFPACK
  Dune::TestSuite t;

  t.subTest(testStokesDirect());
  t.subTest(testNavierStokes());
  t.subTest(testMultigrid());
  t.subTest(testFactorizationCount());
  t.subTest(testInverseOperator(0));
  t.subTest(testInverseOperator(1));

  return t.exit();
#else
  std::cerr << "You need SuiteSparse's UMFPack to run this test." << std::endl;
  return 77;
#endif
}
catch (std::exception& e)
{
  std::cout << "ERROR: " << e.what() << std::endl;
  return 1;
}
