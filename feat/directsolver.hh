// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#ifndef FEAT_DIRECTSOLVER_HH
#define FEAT_DIRECTSOLVER_HH

#include <array>
#include <memory>
#include <vector>

#include <feat/filters.hh>
#include <feat/linearsolver.hh>
#include <feat/sparsematrix.hh>
#include <feat/systemmatrix.hh>
#include <feat/umfpack.hh>

namespace Feat {

  /**
              @addtogroup FeatCore
              @{
   */

  /**
   * \brief Merges the blocks of a system matrix into one scalar matrix.
   *
   * The merged pattern is kept as long as the block structures do not
   * change, later calls only refresh the values. Virtually transposed
   * blocks and block scalings are resolved.
   */
  class GlobalMatrixExporter
  {
  public:
    typedef SparseMatrix::size_type size_type;

    //! pinned row argument of update() that keeps all rows
    static constexpr size_type noPinnedRow = static_cast<size_type>(-1);

    /**
     * \brief Refresh the merged matrix.
     *
     * \param A the block matrix
     * \param pinnedRow unless noPinnedRow, this row is replaced by a unit row
     * \return true if the merged pattern was rebuilt
     */
    bool update(const SystemMatrix& A, size_type pinnedRow = noPinnedRow);

    const SparseMatrix& matrix() const { return global_; }

  private:
    //! shares the block it was taken from, which keeps its structure alive
    struct BlockSignature
    {
      SparseMatrix block;

      bool matches(const SparseMatrix& A) const
      {
        if (A.empty() || block.empty())
          return A.empty() && block.empty();
        return block.isVirtuallyTransposed() == A.isVirtuallyTransposed()
               && block.sharesStructureWith(A);
      }
    };

    void rebuild(const SystemMatrix& A, size_type pinnedRow);

    std::array<BlockSignature, 9> signature_;
    size_type pinnedRow_ = noPinnedRow;
    SparseMatrix global_;
    //! entries of the merged matrix in the storage order of each block
    std::array<std::vector<double*>, 9> positions_;
  };

  /**
   * \brief UMFPack applied to a saddle point system.
   *
   * If the pressure is only determined up to a constant, the first
   * pressure equation is replaced by p_0 = 0 and the pressure of the
   * solution is shifted to zero mean afterwards.
   */
  class SaddlePointDirectSolver
  {
  public:
    typedef std::size_t size_type;

    explicit SaddlePointDirectSolver(int verbose = 0)
      : umfpack_(verbose)
    {}

    void setMatrix(const SystemMatrix* A, bool pressureIndefinite);

    void factorizeSymbolic();
    void factorizeNumeric();

    //! x = A^{-1} b
    void solve(SystemVector& x, const SystemVector& b);

    void release();

    unsigned int symbolicFactorizations() const { return umfpack_.symbolicFactorizations(); }
    unsigned int numericFactorizations() const { return umfpack_.numericFactorizations(); }

  private:
    const SystemMatrix* matrix_ = nullptr;
    bool pressureIndefinite_ = false;
    GlobalMatrixExporter exporter_;
    UMFPack umfpack_;
    PressureMeanFilter meanFilter_;
    ScalarVector rhs_, sol_;
  };

  /**
   * \brief Linear solver that factorizes the finest level matrix.
   *
   * Works with virtually and physically transposed B matrices.
   */
  class DirectSolver : public LinearSolverBackend
  {
  public:
    explicit DirectSolver(int verbose = 0)
      : solver_(verbose), verbose_(verbose)
    {}

    MatrixCompatibility compatibility(const std::vector<const SystemMatrix*>& matrices) const override;
    void setMatrices(const LinearSolverLevels& levels) override;
    void factorizeSymbolic() override;
    void factorizeNumeric() override;
    void precondition(SystemVector& d, Dune::InverseOperatorResult& res) override;
    void release() override;

    unsigned int symbolicFactorizations() const override { return solver_.symbolicFactorizations(); }
    unsigned int numericFactorizations() const override { return solver_.numericFactorizations(); }

  private:
    SaddlePointDirectSolver solver_;
    const Filter* filter_ = nullptr;
    SystemVector correction_;
    int verbose_;
  };

  /** @} end documentation */

} // end namespace

#endif
