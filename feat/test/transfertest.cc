// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#include <config.h>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <vector>

#include <dune/common/exceptions.hh>
#include <dune/common/test/testsuite.hh>

#include <feat/featexception.hh>
#include <feat/q1tilde/cavityproblem.hh>
#include <feat/q1tilde/transfer.hh>
#include <feat/test/cavitysetup.hh>

using namespace Feat;
using namespace Feat::Q1Tilde;

SystemVector linearField(const RectangleGrid& grid)
{
  BlockStructure s;
  s.velocity = grid.edges();
  s.pressure = grid.cells();
  SystemVector v(s);
  for (std::size_t e = 0; e < grid.edges(); ++e) {
    const Point x = grid.edgeMidpoint(e);
    v[0][e] = 1.0 + 2.0*x[0] - x[1];
    v[1][e] = -0.5 + 0.3*x[0] + 4.0*x[1];
  }
  for (std::size_t c = 0; c < grid.cells(); ++c)
    v[2][c] = 3.0;
  return v;
}

std::vector<RectangleGrid> hierarchy()
{
  std::vector<RectangleGrid> grids;
  grids.push_back(RectangleGrid(2, 2, 1.0, 1.5));
  grids.push_back(grids.back().refined());
  return grids;
}

// bitwise equal entries on equal patterns
bool equalEntries(const SparseMatrix& A, const SparseMatrix& B)
{
  if (!A.hasStructureOf(B))
    return false;
  for (auto row = A.stored().begin(); row != A.stored().end(); ++row)
    for (auto col = row->begin(); col != row->end(); ++col)
      if (B(row.index(), col.index()) != *col)
        return false;
  return true;
}

Dune::TestSuite testVectors()
{
  Dune::TestSuite t("vectors");

  const std::vector<RectangleGrid> grids = hierarchy();
  Transfer transfer(grids, 1, TransferParameters());
  transfer.init();

  ScalarVector scratch;
  const SystemVector coarse = linearField(grids[0]);
  const SystemVector fine = linearField(grids[1]);

  SystemVector prolongated(fine.structure());
  transfer.prolongate(1, coarse, prolongated, scratch);
  prolongated -= fine;
  t.check(prolongated.two_norm() < 1e-12) << "prolongation does not reproduce linear functions";

  SystemVector interpolated(coarse.structure());
  transfer.interpolate(1, interpolated, fine, scratch);
  interpolated -= coarse;
  t.check(interpolated.two_norm() < 1e-12) << "interpolation does not reproduce linear functions";

  // restriction is the adjoint of prolongation
  SystemVector df(fine.structure()), dc(coarse.structure()), pc(fine.structure());
  for (std::size_t b = 0; b < 3; ++b)
    for (std::size_t i = 0; i < df[b].size(); ++i)
      df[b][i] = std::sin(1.0 + i + 7.0*b);
  transfer.restrictDefect(1, df, dc, scratch);
  transfer.prolongate(1, coarse, pc, scratch);
  t.check(std::abs(pc.dot(df) - coarse.dot(dc)) < 1e-12) << "restriction is not adjoint to prolongation";

  t.check(transfer.memoryRequirement(2) == 0) << "transfer asks for scratch memory";

  bool thrown = false;
  try {
    transfer.prolongate(2, coarse, pc, scratch);
  }
  catch (const Dune::RangeError&) {
    thrown = true;
  }
  t.check(thrown) << "transfer from the finest level accepted";

  transfer.done();
  thrown = false;
  try {
    transfer.prolongation(1);
  }
  catch (const Dune::InvalidStateException&) {
    thrown = true;
  }
  t.check(thrown) << "transfer used after done()";

  return t;
}

Dune::TestSuite testConstantProlongation()
{
  Dune::TestSuite t("constant prolongation");

  const std::vector<RectangleGrid> grids = hierarchy();
  TransferParameters params;
  params.velocityOrder = 0;
  Transfer transfer(grids, 1, params);
  transfer.init();

  // constants are kept, every fine value is a convex combination
  const SparseMatrix& P = transfer.prolongation(1);
  ScalarVector one(grids[0].edges()), y(grids[1].edges());
  one = 1.0;
  P.mv(one, y);
  bool constant = true;
  for (std::size_t e = 0; e < y.size(); ++e)
    constant = constant && std::abs(y[e] - 1.0) < 1e-14;
  t.check(constant) << "constant prolongation does not keep constants";

  // the adaptive variant switches to constant prolongation for thin cells
  TransferParameters adaptive;
  adaptive.velocityVariant = 2;
  adaptive.aspectRatioBound = 1.2;
  Transfer thin(grids, 1, adaptive);
  thin.init();
  t.check(equalEntries(thin.prolongation(1), P)) << "adaptive prolongation not constant";

  bool thrown = false;
  try {
    TransferParameters wrong;
    wrong.velocityOrder = 2;
    Transfer(grids, 1, wrong);
  }
  catch (const ConfigurationError&) {
    thrown = true;
  }
  t.check(thrown) << "unknown interpolation order accepted";

  return t;
}

Dune::TestSuite testMatrixRestriction()
{
  Dune::TestSuite t("matrix restriction");

  Dune::ParameterTree config = cavityConfig(1, 2, 100.0, 1);
  config["CAVITY.width"] = "4.0";
  CavityProblem problem(config);
  for (int l = 1; l <= 2; ++l) {
    Level& lev = problem.level(l);
    lev.setupSystemMatrix(false);
    lev.systemMatrix(0, 0).copyValuesFrom(lev.stokes);
  }
  Level& coarse = problem.level(1);
  const Level& fine = problem.level(2);

  TransferParameters params;
  auto transfer = problem.createTransfer(params);
  transfer->init();

  const SparseMatrix original = coarse.systemMatrix(0, 0).duplicate(DuplicationMode::copy);
  const double ratio = problem.grid(1).aspectRatio();

  // nothing happens below the threshold, without the mode or for other elements
  transfer->restrictMatrix(fine, coarse, AdaptiveMatrixMode::threshold, ratio + 1.0);
  transfer->restrictMatrix(fine, coarse, AdaptiveMatrixMode::off, 0.0);
  coarse.element = VelocityElement::other;
  transfer->restrictMatrix(fine, coarse, AdaptiveMatrixMode::threshold, 0.0);
  coarse.element = VelocityElement::q1tilde;

  t.check(equalEntries(coarse.systemMatrix(0, 0), original)) << "coarse matrix changed without restriction";

  transfer->restrictMatrix(fine, coarse, AdaptiveMatrixMode::threshold, 1.0);

  // compare with P0^T A P0 computed entry by entry
  TransferParameters constant;
  constant.velocityOrder = 0;
  Transfer reference(std::vector<RectangleGrid>{problem.grid(1), problem.grid(2)}, 1, constant);
  reference.init();
  const SparseMatrix& P = reference.prolongation(1);
  const SparseMatrix& Af = fine.systemMatrix(0, 0);
  const SparseMatrix& Ac = coarse.systemMatrix(0, 0);

  double error = 0.0;
  for (auto row = Ac.stored().begin(); row != Ac.stored().end(); ++row)
    for (auto col = row->begin(); col != row->end(); ++col) {
      const std::size_t k = row.index(), m = col.index();
      double sum = 0.0;
      for (std::size_t e = 0; e < Af.N(); ++e) {
        const double pek = P(e, k);
        if (pek == 0.0)
          continue;
        for (std::size_t f = 0; f < Af.M(); ++f)
          sum += pek*Af(e, f)*P(f, m);
      }
      error = std::max(error, std::abs(sum - Ac(k, m)));
    }
  t.check(error < 1e-12) << "restricted matrix is not the Galerkin product";

  return t;
}

int main() try
{
  Dune::TestSuite t;

  t.subTest(testVectors());
  t.subTest(testConstantProlongation());
  t.subTest(testMatrixRestriction());

  return t.exit();
}
catch (std::exception& e)
{
  std::cout << "ERROR: " << e.what() << std::endl;
  return 1;
}
