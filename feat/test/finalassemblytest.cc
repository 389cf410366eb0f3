// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#include <config.h>

#include <iostream>

#include <dune/common/test/testsuite.hh>

#include <feat/finalassembly.hh>
#include <feat/vanka.hh>
#include <feat/q1tilde/cavityproblem.hh>
#include <feat/test/cavitysetup.hh>

using namespace Feat;

SystemVector testVector(const BlockStructure& s)
{
  SystemVector x(s);
  for (std::size_t b = 0; b < 3; ++b)
    for (std::size_t i = 0; i < x[b].size(); ++i)
      x[b][i] = 1.0 + 0.1*i - 0.3*b;
  return x;
}

Dune::TestSuite testTransposition()
{
  Dune::TestSuite t("transposition");

  Q1Tilde::CavityProblem problem(cavityConfig(1, 2, 10.0, 0));
  Level& level = problem.level(2);
  level.setupSystemMatrix(false);
  level.systemMatrix(0, 0).copyValuesFrom(level.stokes);
  level.systemMatrix(1, 1).copyValuesFrom(level.stokes);

  const SystemVector x = testVector(level.structure);
  SystemVector before(level.structure), after(level.structure);
  level.systemMatrix.mv(x, before);

  FinalAssemblyInfo info;
  info.transposeB = true;
  FinalAssemblyAdapter adapter(info);

  adapter.finalize(level);
  const SystemMatrix& S = level.systemMatrix;
  t.check(!S(2, 0).isVirtuallyTransposed() && !S(2, 1).isVirtuallyTransposed())
    << "B^T still virtually transposed";
  t.check(S(2, 1).sharesStructureWith(S(2, 0))) << "transposed B matrices do not share their structure";
  t.check(!S(2, 0).sharesDataWith(level.b1)) << "physical transpose aliases B1";

  level.systemMatrix.mv(x, after);
  after -= before;
  t.check(after.two_norm() < 1e-13) << "finalize changes the operator";

  adapter.unfinalize(level, true);
  t.check(S(2, 0).isVirtuallyTransposed() && S(2, 0).sharesDataWith(level.b1))
    << "canonical view of B1 not restored";
  level.systemMatrix.mv(x, after);
  after -= before;
  t.check(after.two_norm() == 0.0) << "unfinalize does not restore the operator";

  // without data the views get fresh arrays
  adapter.finalize(level);
  adapter.unfinalize(level, false);
  t.check(S(2, 1).isVirtuallyTransposed() && S(2, 1).sharesStructureWith(level.b2)
          && !S(2, 1).sharesDataWith(level.b2)) << "restored structure shares the data";

  // unfinalizing a canonical matrix does nothing
  adapter.unfinalize(level, true);
  t.check(!S(2, 1).sharesDataWith(level.b2)) << "unfinalize of a canonical matrix changed it";

  FinalAssemblyAdapter noop{FinalAssemblyInfo()};
  level.setupSystemMatrix(false);
  noop.finalize(level);
  t.check(S(2, 0).isVirtuallyTransposed()) << "finalize transposes without being asked";

  return t;
}

Dune::TestSuite testVankaCompatibility()
{
  Dune::TestSuite t("vanka compatibility");

  Q1Tilde::CavityProblem problem(cavityConfig(1, 1, 10.0, 0));
  Level& level = problem.level(1);
  level.setupSystemMatrix(false);

  t.check(VankaSmoother::compatibility(level.systemMatrix) == MatrixCompatibility::transposed)
    << "views of B not detected";

  FinalAssemblyInfo info;
  info.transposeB = true;
  FinalAssemblyAdapter(info).finalize(level);
  t.check(VankaSmoother::compatibility(level.systemMatrix) == MatrixCompatibility::ok)
    << "finalized matrix rejected";

  level.systemMatrix.release(1, 2);
  t.check(VankaSmoother::compatibility(level.systemMatrix) == MatrixCompatibility::incompatible)
    << "missing gradient block accepted";

  return t;
}

int main() try
{
  Dune::TestSuite t;

  t.subTest(testTransposition());
  t.subTest(testVankaCompatibility());

  return t.exit();
}
catch (std::exception& e)
{
  std::cout << "ERROR: " << e.what() << std::endl;
  return 1;
}
