// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#include <config.h>

#include <vector>

#include <dune/common/dynmatrix.hh>
#include <dune/common/dynvector.hh>
#include <dune/common/exceptions.hh>

#include <feat/featexception.hh>
#include <feat/vanka.hh>

namespace Feat {

  namespace {

    typedef SparseMatrix::size_type size_type;

    //! (A x)_row for a matrix in row storage
    double rowProduct(const SparseMatrix& A, size_type row, const ScalarVector& x)
    {
      const auto& r = A.stored()[row];
      double sum = 0.0;
      for (auto col = r.begin(); col != r.end(); ++col)
        sum += (*col)*x[col.index()];
      return sum;
    }

  }

  MatrixCompatibility VankaSmoother::compatibility(const SystemMatrix& A)
  {
    for (size_type c = 0; c < 2; ++c)
      if (!A.active(c, c) || !A.active(c, 2) || !A.active(2, c))
        return MatrixCompatibility::incompatible;
    if (A.active(2, 2))
      return MatrixCompatibility::incompatible;
    for (size_type i = 0; i < 3; ++i)
      for (size_type j = 0; j < 3; ++j)
        if (A.active(i, j) && A(i, j).isVirtuallyTransposed())
          return (i == 2) ? MatrixCompatibility::transposed : MatrixCompatibility::incompatible;
    // both transposed blocks are traversed with the pattern of block (3,1)
    if (!A(2, 0).hasStructureOf(A(2, 1)))
      return MatrixCompatibility::incompatible;
    return MatrixCompatibility::ok;
  }

  void VankaSmoother::setMatrix(const SystemMatrix* A)
  {
    if (compatibility(*A) != MatrixCompatibility::ok)
      DUNE_THROW(MatrixCompatibilityError, "Vanka needs physically transposed B matrices");
    matrix_ = A;
  }

  void VankaSmoother::apply(SystemVector& x, const SystemVector& b, int steps) const
  {
    if (!matrix_)
      DUNE_THROW(Dune::InvalidStateException, "Vanka smoother without matrix");
    for (int i = 0; i < steps; ++i)
      sweep(x, b);
  }

  void VankaSmoother::sweep(SystemVector& x, const SystemVector& b) const
  {
    const SystemMatrix& S = *matrix_;
    const SparseMatrix& BT1 = S(2, 0);
    const SparseMatrix& BT2 = S(2, 1);

    Dune::DynamicMatrix<double> local;
    Dune::DynamicVector<double> rhs, sol;
    std::vector<size_type> dofs;

    for (size_type T = 0; T < S.structure().pressure; ++T) {
      const auto& rowT1 = BT1.stored()[T];
      const auto& rowT2 = BT2.stored()[T];
      dofs.clear();
      for (auto col = rowT1.begin(); col != rowT1.end(); ++col)
        dofs.push_back(col.index());
      const size_type m = dofs.size();
      const size_type n = 2*m + 1;
      local.resize(n, n, 0.0);
      local = 0.0;
      rhs.resize(n, 0.0);
      sol.resize(n, 0.0);

      for (size_type c = 0; c < 2; ++c) {
        const SparseMatrix& A = S(c, c);
        const SparseMatrix& B = S(c, 2);
        const double sA = S.scaling(c, c);
        const double sB = S.scaling(c, 2);
        for (size_type a = 0; a < m; ++a) {
          const size_type row = dofs[a];

          // local defect of the momentum equation
          double defect = b[c][row] - sA*rowProduct(A, row, x[c]) - sB*rowProduct(B, row, x[2]);
          if (S.active(c, 1-c))
            defect -= S.scaling(c, 1-c)*rowProduct(S(c, 1-c), row, x[1-c]);
          rhs[c*m + a] = defect;

          for (size_type e = 0; e < m; ++e)
            if (variant_ == Variant::full || e == a)
              local[c*m + a][c*m + e] = sA*A(row, dofs[e]);
          if (variant_ == Variant::full && S.active(c, 1-c))
            for (size_type e = 0; e < m; ++e)
              local[c*m + a][(1-c)*m + e] = S.scaling(c, 1-c)*S(c, 1-c)(row, dofs[e]);
          local[c*m + a][2*m] = sB*B(row, T);
        }
      }

      // local defect of the continuity equation
      const double s1 = S.scaling(2, 0), s2 = S.scaling(2, 1);
      rhs[2*m] = b[2][T] - s1*rowProduct(BT1, T, x[0]) - s2*rowProduct(BT2, T, x[1]);
      auto bt1 = rowT1.begin();
      auto bt2 = rowT2.begin();
      for (size_type e = 0; e < m; ++e, ++bt1, ++bt2) {
        local[2*m][e] = s1*(*bt1);
        local[2*m][m + e] = s2*(*bt2);
      }

      local.solve(sol, rhs);

      for (size_type a = 0; a < m; ++a) {
        x[0][dofs[a]] += omega_*sol[a];
        x[1][dofs[a]] += omega_*sol[m + a];
      }
      x[2][T] += omega_*sol[2*m];
    }
  }

} // end namespace Feat
