// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#include <config.h>

#include <iostream>

#include <dune/common/test/testsuite.hh>
#include <dune/istl/matrixindexset.hh>

#include <feat/featexception.hh>
#include <feat/sparsematrix.hh>

using namespace Feat;

// 3x4 matrix
//  1 0 2 0
//  0 3 0 4
//  5 0 0 6
Dune::MatrixIndexSet examplePattern()
{
  Dune::MatrixIndexSet pattern(3, 4);
  pattern.add(0, 0); pattern.add(0, 2);
  pattern.add(1, 1); pattern.add(1, 3);
  pattern.add(2, 3); pattern.add(2, 0);
  return pattern;
}

SparseMatrix exampleMatrix()
{
  SparseMatrix A(examplePattern());
  A.entry(0, 0) = 1.0; A.entry(0, 2) = 2.0;
  A.entry(1, 1) = 3.0; A.entry(1, 3) = 4.0;
  A.entry(2, 0) = 5.0; A.entry(2, 3) = 6.0;
  return A;
}

Dune::TestSuite testPattern()
{
  Dune::TestSuite t("pattern");

  SparseMatrix A = exampleMatrix();
  const ScalarMatrix& m = A.stored();
  t.check(A.N() == 3 && A.M() == 4) << "wrong matrix size";
  t.check(A.nonzeroes() == 6) << "wrong number of nonzeroes";
  t.check(m.exists(2, 0) && !m.exists(1, 2)) << "wrong pattern";

  auto col = m[2].begin();
  t.check(col.index() == 0 && *col == 5.0) << "columns of a row are not sorted";
  t.check(A(1, 2) == 0.0) << "entry outside the pattern is not zero";

  bool thrown = false;
  try {
    A.entry(1, 2) = 1.0;
  }
  catch (const SparseMatrixError&) {
    thrown = true;
  }
  t.check(thrown) << "write outside of the pattern accepted";

  SparseMatrix empty;
  t.check(empty.empty() && empty.N() == 0 && empty.nonzeroes() == 0) << "empty handle has a size";
  thrown = false;
  try {
    empty.clear();
  }
  catch (const SparseMatrixError&) {
    thrown = true;
  }
  t.check(thrown) << "operation on an empty handle accepted";

  return t;
}

Dune::TestSuite testDuplication()
{
  Dune::TestSuite t("duplication");

  SparseMatrix A = exampleMatrix();

  SparseMatrix C = A.duplicate(DuplicationMode::copy);
  t.check(!C.sharesStructureWith(A) && !C.sharesDataWith(A)) << "copy shares memory";
  t.check(C.hasStructureOf(A)) << "copy has a different pattern";
  C.entry(0, 0) = 10.0;
  t.check(A(0, 0) == 1.0) << "changing a copy changes the original";

  SparseMatrix S = A.duplicate(DuplicationMode::shareStructure);
  t.check(S.sharesStructureWith(A) && !S.sharesDataWith(A)) << "shareStructure does not share exactly the structure";
  t.check(S(1, 3) == 0.0) << "shared structure comes with data";

  SparseMatrix F = A.duplicate(DuplicationMode::share);
  t.check(F.sharesStructureWith(A) && F.sharesDataWith(A)) << "share does not share everything";
  F.entry(1, 1) = 7.0;
  t.check(A(1, 1) == 7.0) << "fully shared matrix does not see changes";

  // equal sizes and nonzero count, different positions
  Dune::MatrixIndexSet shifted(3, 4);
  shifted.add(0, 1); shifted.add(0, 2);
  shifted.add(1, 1); shifted.add(1, 3);
  shifted.add(2, 3); shifted.add(2, 0);
  SparseMatrix other(shifted);
  t.check(!other.hasStructureOf(A) && !other.sharesStructureWith(A)) << "different patterns compare equal";

  SparseMatrix equal(examplePattern());
  t.check(equal.hasStructureOf(A) && !equal.sharesStructureWith(A)) << "equal patterns built twice";
  equal.copyValuesFrom(A);
  t.check(equal(2, 3) == 6.0 && equal(1, 1) == 7.0) << "values not copied";
  equal.shareStructureOf(A);
  t.check(equal.sharesStructureWith(A) && !equal.sharesDataWith(A)) << "structure not shared";
  t.check(equal(2, 0) == 5.0) << "sharing the structure lost the values";

  equal.axpy(-1.0, F);
  t.check(equal.stored().infinity_norm() == 0.0) << "axpy with an equal structure";

  bool thrown = false;
  try {
    A.axpy(1.0, other);
  }
  catch (const SparseMatrixError&) {
    thrown = true;
  }
  t.check(thrown) << "axpy with a different structure accepted";

  return t;
}

Dune::TestSuite testTranspose()
{
  Dune::TestSuite t("transpose");

  SparseMatrix A = exampleMatrix();
  ScalarVector x(3), y(4), z(4);
  x[0] = 1.0; x[1] = -2.0; x[2] = 0.5;

  SparseMatrix V = A.transposedView();
  t.check(V.isVirtuallyTransposed()) << "view is not marked as transposed";
  t.check(V.N() == 4 && V.M() == 3) << "wrong size of the view";
  t.check(V(3, 2) == 6.0 && V(0, 2) == 5.0) << "wrong entries of the view";
  t.check(V.sharesDataWith(A)) << "view does not share the data";

  SparseMatrix T = A.transposed();
  t.check(!T.isVirtuallyTransposed()) << "physical transpose is marked as view";
  V.mv(x, y);
  T.mv(x, z);
  z -= y;
  t.check(z.two_norm() < 1e-14) << "view and physical transpose differ";

  // the round trip reproduces every value bit by bit
  SparseMatrix R = T.transposed();
  t.check(R.hasStructureOf(A)) << "round trip changes the pattern";
  bool identical = true;
  for (auto row = A.stored().begin(); row != A.stored().end(); ++row)
    for (auto col = row->begin(); col != row->end(); ++col)
      identical = identical && R(row.index(), col.index()) == *col;
  t.check(identical) << "round trip changes the values";

  SparseMatrix S = A.transposed(TransposeMode::structureOnly);
  t.check(S.hasStructureOf(T) && S.stored().infinity_norm() == 0.0) << "structure only transpose carries data";

  ScalarVector wrong(4);
  bool sizeThrown = false;
  try {
    V.mv(wrong, y);
  }
  catch (const SparseMatrixError&) {
    sizeThrown = true;
  }
  t.check(sizeThrown) << "product with a vector of wrong size accepted";

  SparseMatrix W = A.transposedView(DuplicationMode::shareStructure);
  t.check(W.sharesStructureWith(A) && !W.sharesDataWith(A)) << "structure view has wrong sharing";
  t.check(W(0, 0) == 0.0) << "structure view carries data";

  bool thrown = false;
  try {
    V.transposed();
  }
  catch (const SparseMatrixError&) {
    thrown = true;
  }
  t.check(thrown) << "physical transpose of a view accepted";

  thrown = false;
  try {
    A.transposedView(DuplicationMode::copy);
  }
  catch (const SparseMatrixError&) {
    thrown = true;
  }
  t.check(thrown) << "transposed view owning its structure accepted";

  return t;
}

Dune::TestSuite testRows()
{
  Dune::TestSuite t("rows");

  Dune::MatrixIndexSet pattern(2, 2);
  pattern.add(0, 0); pattern.add(0, 1); pattern.add(1, 0);
  SparseMatrix A(pattern);
  A.entry(0, 0) = 2.0; A.entry(0, 1) = 3.0; A.entry(1, 0) = 4.0;

  A.unitRow(0);
  t.check(A(0, 0) == 1.0 && A(0, 1) == 0.0) << "unit row not set";
  t.check(A(1, 0) == 4.0) << "unit row changed another row";

  bool thrown = false;
  try {
    A.unitRow(1);
  }
  catch (const SparseMatrixError&) {
    thrown = true;
  }
  t.check(thrown) << "unit row without diagonal accepted";

  A.clearRow(1);
  t.check(A(1, 0) == 0.0) << "row not cleared";

  return t;
}

int main() try
{
  Dune::TestSuite t;

  t.subTest(testPattern());
  t.subTest(testDuplication());
  t.subTest(testTranspose());
  t.subTest(testRows());

  return t.exit();
}
catch (std::exception& e)
{
  std::cout << "ERROR: " << e.what() << std::endl;
  return 1;
}
