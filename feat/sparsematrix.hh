// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#ifndef FEAT_SPARSEMATRIX_HH
#define FEAT_SPARSEMATRIX_HH

#include <cstddef>
#include <memory>
#include <utility>

#include <dune/istl/bcrsmatrix.hh>
#include <dune/istl/bvector.hh>
#include <dune/istl/matrixindexset.hh>

/** \file
 * \brief Scalar sparse matrix handle with explicit ownership of structure and data.
 */

namespace Feat {

  /**
              @addtogroup FeatCore
              @{
   */

  //! Scalar vector type used for all blocks of the system.
  typedef Dune::BlockVector<double> ScalarVector;

  //! Scalar compressed row matrix stored behind a SparseMatrix handle.
  typedef Dune::BCRSMatrix<double> ScalarMatrix;

  //! How a duplicate relates to its source.
  enum class DuplicationMode {
    copy,           //!< structure and data are owned copies
    shareStructure, //!< structure is shared, data is owned (and zero)
    share           //!< structure and data are shared
  };

  //! What a physical transposition produces.
  enum class TransposeMode {
    all,          //!< transpose structure and data
    structureOnly //!< transpose the structure, data is zero
  };

  /**
   * \brief Handle to a scalar Dune::BCRSMatrix.
   *
   * The matrix is held by a shared pointer so that several handles may
   * alias it. Which parts are shared is decided explicitly by
   * duplicate() and transposedView(); assignment of handles never copies
   * data. Structure sharing uses the column index sharing of
   * Dune::BCRSMatrix: a copy constructed matrix refers to the index
   * array of its source and owns its values.
   *
   * A handle may be virtually transposed: it then represents the
   * transpose of the stored matrix without relaying any data. Kernels
   * that need rows of the transposed matrix (like Vanka) require a
   * physical transpose, see transposed().
   */
  class SparseMatrix
  {
  public:
    typedef ScalarMatrix::size_type size_type;
    typedef double field_type;

    //! an empty handle without structure
    SparseMatrix() = default;

    //! allocate a zero matrix with the pattern collected in the index set
    explicit SparseMatrix(const Dune::MatrixIndexSet& pattern);

    bool empty() const { return !matrix_; }

    //! number of rows of the represented matrix
    size_type N() const;

    //! number of columns of the represented matrix
    size_type M() const;

    size_type nonzeroes() const;

    bool isVirtuallyTransposed() const { return transposed_; }

    //! the stored matrix; for a virtually transposed handle this is the matrix before transposition
    ScalarMatrix& stored();
    const ScalarMatrix& stored() const;

    //! entry (i,j) of the represented matrix, zero if not in the pattern
    double operator()(size_type i, size_type j) const;

    //! writable access to a stored entry of the represented matrix
    double& entry(size_type i, size_type j);

    SparseMatrix duplicate(DuplicationMode mode) const;

    /**
     * \brief A virtually transposed handle of this matrix.
     *
     * With DuplicationMode::share the view aliases structure and data;
     * with DuplicationMode::shareStructure it aliases the structure and
     * gets fresh zero values.
     */
    SparseMatrix transposedView(DuplicationMode mode = DuplicationMode::share) const;

    //! a physically transposed matrix with own structure
    SparseMatrix transposed(TransposeMode mode = TransposeMode::all) const;

    //! replace the structure by the (equal) structure of another matrix, values are kept
    void shareStructureOf(const SparseMatrix& other);

    bool sharesStructureWith(const SparseMatrix& other) const;
    bool sharesDataWith(const SparseMatrix& other) const;

    //! whether both stored matrices have equal size, orientation and column indices
    bool hasStructureOf(const SparseMatrix& other) const;

    //! set all entries to zero
    void clear();

    //! A *= alpha
    void scale(double alpha);

    //! A += alpha B, both matrices must have equal structure and orientation
    void axpy(double alpha, const SparseMatrix& other);

    //! overwrite the entries by those of a matrix with equal structure
    void copyValuesFrom(const SparseMatrix& other);

    //! y = A x
    void mv(const ScalarVector& x, ScalarVector& y) const;

    //! y += A x
    void umv(const ScalarVector& x, ScalarVector& y) const;

    //! y -= A x
    void mmv(const ScalarVector& x, ScalarVector& y) const;

    //! y += alpha A x
    void usmv(double alpha, const ScalarVector& x, ScalarVector& y) const;

    //! set all entries of stored row i to zero
    void clearRow(size_type i);

    //! replace stored row i by the corresponding row of the identity
    void unitRow(size_type i);

  private:
    SparseMatrix(std::shared_ptr<ScalarMatrix> matrix, bool transposed)
      : matrix_(std::move(matrix)), transposed_(transposed)
    {}

    void checkHandle() const;

    std::shared_ptr<ScalarMatrix> matrix_;
    bool transposed_ = false;
  };

  /** @} end documentation */

} // end namespace

#endif
