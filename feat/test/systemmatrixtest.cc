// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#include <config.h>

#include <cmath>
#include <iostream>

#include <dune/common/test/testsuite.hh>
#include <dune/istl/matrixindexset.hh>

#include <feat/featexception.hh>
#include <feat/systemmatrix.hh>

using namespace Feat;

// diagonal velocity blocks, B = (1 1)^T in both components
SystemMatrix smallSystem()
{
  BlockStructure s;
  s.velocity = 2;
  s.pressure = 1;
  SystemMatrix A(s);

  Dune::MatrixIndexSet diag(2, 2);
  diag.add(0, 0); diag.add(1, 1);
  A(0, 0) = SparseMatrix(diag);
  A(0, 0).entry(0, 0) = 2.0;
  A(0, 0).entry(1, 1) = 4.0;
  A(1, 1) = A(0, 0).duplicate(DuplicationMode::share);

  Dune::MatrixIndexSet column(2, 1);
  column.add(0, 0); column.add(1, 0);
  A(0, 2) = SparseMatrix(column);
  A(0, 2).entry(0, 0) = 1.0;
  A(0, 2).entry(1, 0) = 1.0;
  A(1, 2) = A(0, 2).duplicate(DuplicationMode::copy);
  A(2, 0) = A(0, 2).transposedView();
  A(2, 1) = A(1, 2).transposedView();
  return A;
}

Dune::TestSuite testApply()
{
  Dune::TestSuite t("apply");

  SystemMatrix A = smallSystem();
  SystemVector x(A.structure()), y(A.structure());
  x[0][0] = 1.0; x[0][1] = 2.0;
  x[1][0] = 3.0; x[1][1] = 4.0;
  x[2][0] = 5.0;

  A.mv(x, y);
  t.check(y[0][0] == 7.0 && y[0][1] == 13.0) << "wrong first momentum row";
  t.check(y[1][0] == 11.0 && y[1][1] == 21.0) << "wrong second momentum row";
  t.check(y[2][0] == 10.0) << "wrong continuity row";

  // release the pressure coupling and scale the velocity
  SystemMatrix velocity = A.duplicate(DuplicationMode::share);
  velocity.release(0, 2);
  velocity.release(1, 2);
  velocity.release(2, 0);
  velocity.release(2, 1);
  velocity.setScaling(0, 0, 0.5);
  velocity.setScaling(1, 1, 0.0);
  velocity.mv(x, y);
  t.check(y[0][0] == 1.0 && y[0][1] == 4.0) << "scaling not applied";
  t.check(y[1][0] == 0.0 && y[1][1] == 0.0) << "masked block applied";
  t.check(y[2][0] == 0.0) << "released block applied";
  t.check(A.active(0, 2) && A.scaling(0, 0) == 1.0) << "releasing a duplicate changes the original";

  SystemVector d(A.structure(), 1.0);
  A.mmv(x, d);
  t.check(d[2][0] == -9.0) << "mmv does not subtract";

  return t;
}

Dune::TestSuite testStructureMismatch()
{
  Dune::TestSuite t("structure");

  SystemMatrix A = smallSystem();
  BlockStructure other;
  other.velocity = 3;
  other.pressure = 1;
  SystemVector x(other), y(A.structure());

  bool thrown = false;
  try {
    A.mv(x, y);
  }
  catch (const FeatError&) {
    thrown = true;
  }
  t.check(thrown) << "vector with wrong block structure accepted";

  SystemVector v(A.structure());
  v[0][0] = 3.0; v[1][1] = 4.0; v[2][0] = 12.0;
  t.check(std::abs(v.velocity_two_norm() - 5.0) < 1e-14) << "wrong velocity norm";
  t.check(std::abs(v.two_norm() - 13.0) < 1e-14) << "wrong norm";

  return t;
}

int main() try
{
  Dune::TestSuite t;

  t.subTest(testApply());
  t.subTest(testStructureMismatch());

  return t.exit();
}
catch (std::exception& e)
{
  std::cout << "ERROR: " << e.what() << std::endl;
  return 1;
}
