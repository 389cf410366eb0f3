// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#ifndef FEAT_Q1TILDE_TRANSFER_HH
#define FEAT_Q1TILDE_TRANSFER_HH

#include <vector>

#include <feat/assembledsystem.hh>
#include <feat/interleveltransfer.hh>
#include <feat/sparsematrix.hh>
#include <feat/q1tilde/rectanglegrid.hh>

namespace Feat {
namespace Q1Tilde {

  /**
              @addtogroup FeatCore
              @{
   */

  /**
   * \brief Grid transfer of the Q1~/Q0 pair between refined rectangle grids.
   *
   * Velocity prolongation either evaluates the coarse function in the
   * midpoints of the fine edges (order -1 or 1, the mean of both sides on
   * coarse edges) or distributes coarse edge values constantly (order 0).
   * The adaptive variant 2 falls back to the constant prolongation on
   * cells whose aspect ratio exceeds the bound. Restriction is the adjoint
   * of the prolongation. The solution is interpolated by averaging the
   * two halves of a coarse edge.
   *
   * Pressure is injected, restricted by summation and interpolated by
   * averaging over the four children.
   */
  class Transfer : public InterlevelTransfer
  {
  public:
    /**
     * \param grids the grids of all levels, coarsest first
     * \param minLevel the level of grids[0]
     * \param params prolongation/restriction configuration
     *
     * \throws ConfigurationError for an unknown velocity order or variant
     */
    Transfer(const std::vector<RectangleGrid>& grids, int minLevel, const TransferParameters& params);

    //! build the transfer matrices
    void init() override;

    //! free the transfer matrices
    void done() override;

    //! all scratch memory is held by the transfer matrices
    size_type memoryRequirement(int) const override { return 0; }

    void prolongate(int coarseLevel, const SystemVector& coarse, SystemVector& fine,
                    ScalarVector& scratch) const override;

    void restrictDefect(int coarseLevel, const SystemVector& fine, SystemVector& coarse,
                        ScalarVector& scratch) const override;

    void interpolate(int coarseLevel, SystemVector& coarse, const SystemVector& fine,
                     ScalarVector& scratch) const override;

    /**
     * \brief Galerkin restriction \f$ P_0^T A P_0 \f$ of the velocity block.
     *
     * Uses the constant prolongation \f$ P_0 \f$ and only writes entries
     * inside the coarse pattern. Applies to Q1~ levels whose cells have
     * an aspect ratio above threshold, otherwise nothing is done.
     */
    void restrictMatrix(const Level& fine, Level& coarse,
                        AdaptiveMatrixMode mode, double threshold) const override;

    //! the velocity prolongation from coarseLevel to coarseLevel+1
    const SparseMatrix& prolongation(int coarseLevel) const;

  private:
    SparseMatrix buildProlongation(const RectangleGrid& coarse, bool constant) const;
    SparseMatrix buildInterpolation(const RectangleGrid& coarse) const;
    size_type index(int coarseLevel) const;

    std::vector<RectangleGrid> grids_;
    int minLevel_;
    TransferParameters params_;
    std::vector<SparseMatrix> prolongation_;
    std::vector<SparseMatrix> constantProlongation_;
    std::vector<SparseMatrix> interpolation_;
  };

  /** @} end documentation */

} // end namespace Q1Tilde
} // end namespace Feat

#endif
