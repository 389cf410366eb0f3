// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#ifndef FEAT_SYSTEMMATRIX_HH
#define FEAT_SYSTEMMATRIX_HH

#include <array>
#include <cstddef>

#include <feat/sparsematrix.hh>
#include <feat/systemvector.hh>

namespace Feat {

  /**
              @addtogroup FeatCore
              @{
   */

  /**
   * \brief 3x3 block matrix of a 2D saddle point problem.
   *
   * \f[
   * \begin{pmatrix} A_{11} & A_{12} & B_1 \\ A_{21} & A_{22} & B_2 \\ B_1^T & B_2^T & 0 \end{pmatrix}
   * \f]
   *
   * Blocks are sparse matrix handles and may be absent. Every block
   * carries a scaling factor that is applied in the matrix-vector
   * products. A duplicate with shared blocks where some blocks are
   * released is a cheap way to apply a part of the operator.
   */
  class SystemMatrix
  {
  public:
    typedef std::size_t size_type;

    enum { blocks = 3 };

    SystemMatrix() = default;

    explicit SystemMatrix(const BlockStructure& structure);

    const BlockStructure& structure() const { return structure_; }

    SparseMatrix& operator()(size_type i, size_type j) { return blocks_[i][j]; }
    const SparseMatrix& operator()(size_type i, size_type j) const { return blocks_[i][j]; }

    //! whether block (i,j) is present
    bool active(size_type i, size_type j) const { return !blocks_[i][j].empty(); }

    //! drop block (i,j) from this handle, shared data stays alive elsewhere
    void release(size_type i, size_type j);

    double scaling(size_type i, size_type j) const { return scale_[i][j]; }
    void setScaling(size_type i, size_type j, double s) { scale_[i][j] = s; }

    //! duplicate every present block with the given mode, scalings are copied
    SystemMatrix duplicate(DuplicationMode mode) const;

    //! y = A x
    void mv(const SystemVector& x, SystemVector& y) const;

    //! y += alpha A x
    void usmv(double alpha, const SystemVector& x, SystemVector& y) const;

    //! y -= A x
    void mmv(const SystemVector& x, SystemVector& y) const
    {
      usmv(-1.0, x, y);
    }

  private:
    BlockStructure structure_;
    std::array<std::array<SparseMatrix, blocks>, blocks> blocks_;
    std::array<std::array<double, blocks>, blocks> scale_ = {{{1.0,1.0,1.0},{1.0,1.0,1.0},{1.0,1.0,1.0}}};
  };

  /** @} end documentation */

} // end namespace

#endif
