// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#include <config.h>

#include <iostream>

#include <dune/common/exceptions.hh>
#include <dune/common/timer.hh>

#include <feat/directsolver.hh>
#include <feat/featexception.hh>

namespace Feat {

  namespace {

    std::array<std::size_t, 3> blockOffsets(const BlockStructure& s)
    {
      return {{0, s.velocity, 2*s.velocity}};
    }

  }

  bool GlobalMatrixExporter::update(const SystemMatrix& A, size_type pinnedRow)
  {
    bool changed = global_.empty() || pinnedRow != pinnedRow_;
    for (size_type i = 0; i < 3; ++i)
      for (size_type j = 0; j < 3; ++j) {
        const SparseMatrix block = A.active(i, j) ? A(i, j) : SparseMatrix();
        if (!signature_[3*i+j].matches(block)) {
          signature_[3*i+j].block = block;
          changed = true;
        }
      }

    if (changed)
      rebuild(A, pinnedRow);

    global_.clear();
    for (size_type b = 0; b < 9; ++b) {
      const size_type i = b/3, j = b%3;
      if (!A.active(i, j))
        continue;
      const double s = A.scaling(i, j);
      const ScalarMatrix& block = A(i, j).stored();
      auto pos = positions_[b].begin();
      for (auto row = block.begin(); row != block.end(); ++row)
        for (auto col = row->begin(); col != row->end(); ++col, ++pos)
          **pos += s*(*col);
    }
    if (pinnedRow_ != noPinnedRow)
      global_.unitRow(pinnedRow_);
    return changed;
  }

  void GlobalMatrixExporter::rebuild(const SystemMatrix& A, size_type pinnedRow)
  {
    const auto offset = blockOffsets(A.structure());
    const size_type n = A.structure().total();
    pinnedRow_ = pinnedRow;

    Dune::MatrixIndexSet pattern(n, n);
    for (size_type i = 0; i < 3; ++i)
      for (size_type j = 0; j < 3; ++j) {
        if (!A.active(i, j))
          continue;
        const bool t = A(i, j).isVirtuallyTransposed();
        const ScalarMatrix& block = A(i, j).stored();
        for (auto row = block.begin(); row != block.end(); ++row)
          for (auto col = row->begin(); col != row->end(); ++col) {
            const size_type r = row.index(), c = col.index();
            pattern.add(offset[i] + (t ? c : r), offset[j] + (t ? r : c));
          }
      }
    if (pinnedRow_ != noPinnedRow)
      pattern.add(pinnedRow_, pinnedRow_);

    global_ = SparseMatrix(pattern);

    for (size_type i = 0; i < 3; ++i)
      for (size_type j = 0; j < 3; ++j) {
        std::vector<double*>& pos = positions_[3*i+j];
        pos.clear();
        if (!A.active(i, j))
          continue;
        const bool t = A(i, j).isVirtuallyTransposed();
        const ScalarMatrix& block = A(i, j).stored();
        pos.reserve(block.nonzeroes());
        for (auto row = block.begin(); row != block.end(); ++row)
          for (auto col = row->begin(); col != row->end(); ++col) {
            const size_type r = row.index(), c = col.index();
            pos.push_back(&global_.entry(offset[i] + (t ? c : r), offset[j] + (t ? r : c)));
          }
      }
  }

  void SaddlePointDirectSolver::setMatrix(const SystemMatrix* A, bool pressureIndefinite)
  {
    matrix_ = A;
    pressureIndefinite_ = pressureIndefinite;
    rhs_.resize(A->structure().total());
    sol_.resize(A->structure().total());
  }

  void SaddlePointDirectSolver::factorizeSymbolic()
  {
    if (!matrix_)
      DUNE_THROW(Dune::InvalidStateException, "Direct solver without matrix");
    const size_type pinned = pressureIndefinite_ ? 2*matrix_->structure().velocity : GlobalMatrixExporter::noPinnedRow;
    exporter_.update(*matrix_, pinned);
    umfpack_.factorizeSymbolic(exporter_.matrix());
  }

  void SaddlePointDirectSolver::factorizeNumeric()
  {
    if (!matrix_)
      DUNE_THROW(Dune::InvalidStateException, "Direct solver without matrix");
    const size_type pinned = pressureIndefinite_ ? 2*matrix_->structure().velocity : GlobalMatrixExporter::noPinnedRow;
    bool changed = exporter_.update(*matrix_, pinned);
    if (changed || !umfpack_.matchesPattern(exporter_.matrix()))
      umfpack_.factorizeSymbolic(exporter_.matrix());
    umfpack_.factorizeNumeric(exporter_.matrix());
  }

  void SaddlePointDirectSolver::solve(SystemVector& x, const SystemVector& b)
  {
    const BlockStructure& s = matrix_->structure();
    const auto offset = blockOffsets(s);
    for (size_type blk = 0; blk < 3; ++blk)
      for (size_type i = 0; i < s.size(blk); ++i)
        rhs_[offset[blk]+i] = b[blk][i];
    if (pressureIndefinite_ && s.pressure > 0)
      rhs_[offset[2]] = 0.0;

    umfpack_.apply(sol_, rhs_);

    for (size_type blk = 0; blk < 3; ++blk)
      for (size_type i = 0; i < s.size(blk); ++i)
        x[blk][i] = sol_[offset[blk]+i];
    if (pressureIndefinite_)
      meanFilter_.subtractMean(x[2]);
  }

  void SaddlePointDirectSolver::release()
  {
    umfpack_.free();
    exporter_ = GlobalMatrixExporter();
    matrix_ = nullptr;
  }

  MatrixCompatibility DirectSolver::compatibility(const std::vector<const SystemMatrix*>&) const
  {
    return MatrixCompatibility::ok;
  }

  void DirectSolver::setMatrices(const LinearSolverLevels& levels)
  {
    if (levels.levels.empty())
      DUNE_THROW(Dune::InvalidStateException, "No level given to the direct solver");
    solver_.setMatrix(levels.finest().matrix, levels.pressureIndefinite);
    filter_ = levels.finest().filter;
    correction_.resize(levels.finest().matrix->structure());
  }

  void DirectSolver::factorizeSymbolic()
  {
    solver_.factorizeSymbolic();
  }

  void DirectSolver::factorizeNumeric()
  {
    solver_.factorizeNumeric();
  }

  void DirectSolver::precondition(SystemVector& d, Dune::InverseOperatorResult& res)
  {
    res.clear();
    Dune::Timer watch;
    solver_.solve(correction_, d);
    d = correction_;
    if (filter_)
      filter_->apply(d, FilterKind::defect);
    res.iterations = 1;
    res.converged = true;
    res.conv_rate = 0.0;
    res.elapsed = watch.elapsed();
    if (verbose_ > 1)
      std::cout << "=== DirectSolver: solved in " << res.elapsed << " s" << std::endl;
  }

  void DirectSolver::release()
  {
    solver_.release();
    filter_ = nullptr;
  }

} // end namespace Feat
