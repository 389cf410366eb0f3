// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#include <config.h>

#include <cmath>
#include <cstddef>
#include <iostream>
#include <memory>

#include <dune/common/test/testsuite.hh>

#include <feat/dampingsearch.hh>
#include <feat/featexception.hh>
#include <feat/filters.hh>
#include <feat/q1tilde/cavityproblem.hh>
#include <feat/test/cavitysetup.hh>

using namespace Feat;

// a single level cavity with the Stokes matrix assembled at the initial iterate
struct DampingSetup
{
  Q1Tilde::CavityProblem problem;
  MatrixAssembler assembler;
  FilterChain filter;
  SystemVector x, b, d, temp1, temp2;

  DampingSetup()
    : problem(cavityConfig(1, 1, 10.0, 0)),
      assembler(problem, Stabilization(0, 0.0), Dune::ParameterTree())
  {
    const int top = problem.maxLevel();
    problem.level(top).setupSystemMatrix(false);

    // defect filter of the preconditioner for a pure Dirichlet problem
    filter.add(problem.level(top).dirichlet);
    filter.add(std::make_shared<const PressureMeanFilter>());

    CoreEquationParameters stokes;
    assembler.setCoreEquation(stokes);

    x = problem.initialSolution();
    b = problem.rightHandSide();
    assembler.assemble(x, true, true, false);

    // the defect as search direction
    d = b;
    problem.level(top).systemMatrix.mmv(x, d);
    filter.apply(d, FilterKind::defect);

    temp1.resize(x.structure());
    temp2.resize(x.structure());
  }

  //! the unrestricted optimal damping parameter
  double optimalOmega() const
  {
    const int top = problem.maxLevel();
    const SystemMatrix& A = problem.level(top).systemMatrix;
    SystemVector r = b, Td(x.structure());
    A.mmv(x, r);
    filter.apply(r, FilterKind::defect);
    A.mv(d, Td);
    filter.apply(Td, FilterKind::defect);
    return Td.dot(r)/Td.dot(Td);
  }
};

Dune::TestSuite testBounds()
{
  Dune::TestSuite t("bounds");

  DampingSetup s;
  const double omega = s.optimalOmega();
  t.check(std::isfinite(omega)) << "optimal damping parameter undefined";

  DampingLineSearch disabled(s.problem, s.assembler, s.filter, 1.0, 1.0);
  t.check(disabled.disabled()) << "equal bounds do not disable the search";
  t.check(disabled.compute(s.x, s.b, s.d, 0.5, s.temp1, s.temp2) == 1.0) << "disabled search does not return omegaMin";

  DampingLineSearch unbounded(s.problem, s.assembler, s.filter, -100.0, 100.0);
  t.check(std::abs(unbounded.compute(s.x, s.b, s.d, 1.0, s.temp1, s.temp2) - omega) < 1e-12*(1.0 + std::abs(omega)))
    << "wrong optimal damping parameter";

  DampingLineSearch above(s.problem, s.assembler, s.filter, omega + 1.0, omega + 2.0);
  t.check(above.compute(s.x, s.b, s.d, 1.0, s.temp1, s.temp2) == omega + 1.0) << "lower bound not applied";

  DampingLineSearch below(s.problem, s.assembler, s.filter, omega - 2.0, omega - 1.0);
  t.check(below.compute(s.x, s.b, s.d, 1.0, s.temp1, s.temp2) == omega - 1.0) << "upper bound not applied";

  return t;
}

Dune::TestSuite testDegenerate()
{
  Dune::TestSuite t("degenerate");

  DampingSetup s;
  SystemVector zero(s.x.structure());
  DampingLineSearch search(s.problem, s.assembler, s.filter, 0.0, 2.0);

  bool thrown = false;
  try {
    search.compute(s.x, s.b, zero, 1.0, s.temp1, s.temp2);
  }
  catch (const NumericalDegeneracy&) {
    thrown = true;
  }
  t.check(thrown) << "vanishing direction accepted";

  return t;
}

Dune::TestSuite testRelinearization()
{
  Dune::TestSuite t("relinearization");

  DampingSetup s;
  DampingLineSearch search(s.problem, s.assembler, s.filter, 0.0, 2.0);

  // a linear problem keeps its matrix
  const unsigned int before = s.assembler.assemblyCount();
  search.compute(s.x, s.b, s.d, 1.0, s.temp1, s.temp2);
  t.check(s.assembler.assemblyCount() == before) << "Stokes matrix reassembled";

  CoreEquationParameters navierStokes;
  navierStokes.gamma = 1.0;
  s.assembler.setCoreEquation(navierStokes);
  const double omega = search.compute(s.x, s.b, s.d, 1.0, s.temp1, s.temp2);
  t.check(s.assembler.assemblyCount() == before + 1) << "no linearization at the damped point";
  t.check(omega >= 0.0 && omega <= 2.0) << "damping parameter outside of the bounds";

  return t;
}

Dune::TestSuite testPressureMean()
{
  Dune::TestSuite t("pressure mean");

  DampingSetup s;
  DampingLineSearch search(s.problem, s.assembler, s.filter, -100.0, 100.0);
  const double omega = search.compute(s.x, s.b, s.d, 1.0, s.temp1, s.temp2);

  // a constant pressure offset in the right hand side puts a nonzero
  // pressure mean into the defect b - T x, the L2_0 filter removes it
  SystemVector shifted = s.b;
  for (std::size_t T = 0; T < shifted[2].size(); ++T)
    shifted[2][T] += 1e3;
  const double omegaShifted = search.compute(s.x, shifted, s.d, 1.0, s.temp1, s.temp2);
  t.check(std::abs(omegaShifted - omega) < 1e-10*(1.0 + std::abs(omega)))
    << "pressure mean of the defect changes the damping parameter: " << omegaShifted << " vs. " << omega;

  return t;
}

int main() try
{
  Dune::TestSuite t;

  t.subTest(testBounds());
  t.subTest(testDegenerate());
  t.subTest(testRelinearization());
  t.subTest(testPressureMean());

  return t.exit();
}
catch (std::exception& e)
{
  std::cout << "ERROR: " << e.what() << std::endl;
  return 1;
}
