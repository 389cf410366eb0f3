// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#include <config.h>

#include <utility>

#include <feat/featexception.hh>
#include <feat/sparsematrix.hh>

namespace Feat {

  namespace {

    typedef ScalarMatrix::size_type size_type;

    // index array of the first non-empty row identifies the column index storage
    const size_type* columnIndices(const ScalarMatrix& A)
    {
      for (auto row = A.begin(); row != A.end(); ++row)
        if (row->getsize() > 0)
          return row->getindexptr();
      return nullptr;
    }

    bool equalIndices(const ScalarMatrix& A, const ScalarMatrix& B)
    {
      if (A.N() != B.N() || A.M() != B.M() || A.nonzeroes() != B.nonzeroes())
        return false;
      auto rowB = B.begin();
      for (auto rowA = A.begin(); rowA != A.end(); ++rowA, ++rowB) {
        if (rowA->getsize() != rowB->getsize())
          return false;
        auto colB = rowB->begin();
        for (auto colA = rowA->begin(); colA != rowA->end(); ++colA, ++colB)
          if (colA.index() != colB.index())
            return false;
      }
      return true;
    }

    // both matrices have equal column indices
    void copyValues(const ScalarMatrix& from, ScalarMatrix& to)
    {
      auto rowTo = to.begin();
      for (auto row = from.begin(); row != from.end(); ++row, ++rowTo) {
        auto colTo = rowTo->begin();
        for (auto col = row->begin(); col != row->end(); ++col, ++colTo)
          *colTo = *col;
      }
    }

    std::shared_ptr<ScalarMatrix> exportPattern(const Dune::MatrixIndexSet& pattern)
    {
      auto matrix = std::make_shared<ScalarMatrix>();
      pattern.exportIdx(*matrix);
      *matrix = 0.0;
      return matrix;
    }

  } // end anonymous namespace

  SparseMatrix::SparseMatrix(const Dune::MatrixIndexSet& pattern)
    : matrix_(exportPattern(pattern))
  {}

  void SparseMatrix::checkHandle() const
  {
    if (!matrix_)
      DUNE_THROW(SparseMatrixError, "Operation on an empty matrix handle");
  }

  SparseMatrix::size_type SparseMatrix::N() const
  {
    if (!matrix_)
      return 0;
    return transposed_ ? matrix_->M() : matrix_->N();
  }

  SparseMatrix::size_type SparseMatrix::M() const
  {
    if (!matrix_)
      return 0;
    return transposed_ ? matrix_->N() : matrix_->M();
  }

  SparseMatrix::size_type SparseMatrix::nonzeroes() const
  {
    return matrix_ ? matrix_->nonzeroes() : 0;
  }

  ScalarMatrix& SparseMatrix::stored()
  {
    checkHandle();
    return *matrix_;
  }

  const ScalarMatrix& SparseMatrix::stored() const
  {
    checkHandle();
    return *matrix_;
  }

  double SparseMatrix::operator()(size_type i, size_type j) const
  {
    checkHandle();
    const auto& row = (*matrix_)[transposed_ ? j : i];
    auto pos = row.find(transposed_ ? i : j);
    return pos == row.end() ? 0.0 : *pos;
  }

  double& SparseMatrix::entry(size_type i, size_type j)
  {
    checkHandle();
    auto& row = (*matrix_)[transposed_ ? j : i];
    auto pos = row.find(transposed_ ? i : j);
    if (pos == row.end())
      DUNE_THROW(SparseMatrixError, "Entry (" << i << "," << j << ") is not part of the pattern");
    return *pos;
  }

  SparseMatrix SparseMatrix::duplicate(DuplicationMode mode) const
  {
    checkHandle();
    switch (mode) {
    case DuplicationMode::copy : {
      Dune::MatrixIndexSet pattern(matrix_->N(), matrix_->M());
      pattern.import(*matrix_);
      auto copy = exportPattern(pattern);
      copyValues(*matrix_, *copy);
      return SparseMatrix(std::move(copy), transposed_);
    }
    case DuplicationMode::shareStructure : {
      // the copy constructor of BCRSMatrix shares the column indices
      auto copy = std::make_shared<ScalarMatrix>(*matrix_);
      *copy = 0.0;
      return SparseMatrix(std::move(copy), transposed_);
    }
    case DuplicationMode::share :
      return *this;
    }
    DUNE_THROW(SparseMatrixError, "Unknown duplication mode");
  }

  SparseMatrix SparseMatrix::transposedView(DuplicationMode mode) const
  {
    if (mode == DuplicationMode::copy)
      DUNE_THROW(SparseMatrixError, "A transposed view cannot own its structure");
    SparseMatrix view = duplicate(mode);
    view.transposed_ = !transposed_;
    return view;
  }

  SparseMatrix SparseMatrix::transposed(TransposeMode mode) const
  {
    checkHandle();
    if (transposed_)
      DUNE_THROW(SparseMatrixError, "Cannot physically transpose a virtually transposed matrix");

    Dune::MatrixIndexSet pattern(matrix_->M(), matrix_->N());
    for (auto row = matrix_->begin(); row != matrix_->end(); ++row)
      for (auto col = row->begin(); col != row->end(); ++col)
        pattern.add(col.index(), row.index());

    auto result = exportPattern(pattern);
    if (mode == TransposeMode::all)
      for (auto row = matrix_->begin(); row != matrix_->end(); ++row)
        for (auto col = row->begin(); col != row->end(); ++col)
          (*result)[col.index()][row.index()] = *col;
    return SparseMatrix(std::move(result), false);
  }

  void SparseMatrix::shareStructureOf(const SparseMatrix& other)
  {
    checkHandle();
    other.checkHandle();
    if (!hasStructureOf(other))
      DUNE_THROW(SparseMatrixError, "Structures differ, cannot share");
    if (sharesStructureWith(other))
      return;
    auto shared = std::make_shared<ScalarMatrix>(*other.matrix_);
    copyValues(*matrix_, *shared);
    matrix_ = std::move(shared);
  }

  bool SparseMatrix::sharesStructureWith(const SparseMatrix& other) const
  {
    if (!matrix_ || !other.matrix_)
      return false;
    if (matrix_ == other.matrix_)
      return true;
    const size_type* indices = columnIndices(*matrix_);
    return indices && indices == columnIndices(*other.matrix_);
  }

  bool SparseMatrix::sharesDataWith(const SparseMatrix& other) const
  {
    return matrix_ && matrix_ == other.matrix_;
  }

  bool SparseMatrix::hasStructureOf(const SparseMatrix& other) const
  {
    if (!matrix_ || !other.matrix_ || transposed_ != other.transposed_)
      return false;
    return sharesStructureWith(other) || equalIndices(*matrix_, *other.matrix_);
  }

  void SparseMatrix::clear()
  {
    checkHandle();
    *matrix_ = 0.0;
  }

  void SparseMatrix::scale(double alpha)
  {
    checkHandle();
    *matrix_ *= alpha;
  }

  void SparseMatrix::axpy(double alpha, const SparseMatrix& other)
  {
    checkHandle();
    other.checkHandle();
    if (!hasStructureOf(other))
      DUNE_THROW(SparseMatrixError, "axpy needs matrices with equal structure");
    matrix_->axpy(alpha, *other.matrix_);
  }

  void SparseMatrix::copyValuesFrom(const SparseMatrix& other)
  {
    checkHandle();
    other.checkHandle();
    if (!hasStructureOf(other))
      DUNE_THROW(SparseMatrixError, "Copying values needs matrices with equal structure");
    if (matrix_ != other.matrix_)
      copyValues(*other.matrix_, *matrix_);
  }

  void SparseMatrix::mv(const ScalarVector& x, ScalarVector& y) const
  {
    y = 0.0;
    usmv(1.0, x, y);
  }

  void SparseMatrix::umv(const ScalarVector& x, ScalarVector& y) const
  {
    usmv(1.0, x, y);
  }

  void SparseMatrix::mmv(const ScalarVector& x, ScalarVector& y) const
  {
    usmv(-1.0, x, y);
  }

  void SparseMatrix::usmv(double alpha, const ScalarVector& x, ScalarVector& y) const
  {
    checkHandle();
    if (x.N() != M() || y.N() != N())
      DUNE_THROW(SparseMatrixError, "Size mismatch: M: " << N() << "x" << M()
                 << " x: " << x.N() << " y: " << y.N());
    if (transposed_)
      matrix_->usmtv(alpha, x, y);
    else
      matrix_->usmv(alpha, x, y);
  }

  void SparseMatrix::clearRow(size_type i)
  {
    checkHandle();
    auto& row = (*matrix_)[i];
    for (auto col = row.begin(); col != row.end(); ++col)
      *col = 0.0;
  }

  void SparseMatrix::unitRow(size_type i)
  {
    checkHandle();
    auto& row = (*matrix_)[i];
    auto diagonal = row.find(i);
    if (diagonal == row.end())
      DUNE_THROW(SparseMatrixError, "Row " << i << " has no diagonal entry");
    clearRow(i);
    *diagonal = 1.0;
  }

} // end namespace Feat
