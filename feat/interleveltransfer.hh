// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#ifndef FEAT_INTERLEVELTRANSFER_HH
#define FEAT_INTERLEVELTRANSFER_HH

#include <cstddef>

#include <dune/common/parametertree.hh>

#include <feat/sparsematrix.hh>
#include <feat/systemvector.hh>

namespace Feat {

  /**
              @addtogroup FeatCore
              @{
   */

  //! Adaptive matrix restriction of the linearized velocity block.
  enum class AdaptiveMatrixMode {
    off = 0,      //!< coarse matrices are assembled directly
    threshold = 1 //!< rows of elements with large aspect ratio are restricted from the finer level
  };

  /**
   * \brief Parameters of prolongation and restriction.
   *
   * Read from the prolongation/restriction section of the parameter
   * file.
   */
  struct TransferParameters
  {
    //! -1 or 1: evaluate the coarse function, 0: piecewise constant transfer
    int velocityOrder = -1;
    //! the pressure is always transferred by injection and summation
    int pressureOrder = -1;
    int velocityVariant = 0;
    //! aspect ratio indicator of the adaptive prolongation, 0 = off
    int aspectRatioIndicator = 0;
    //! aspect ratio bound of the adaptive prolongation
    double aspectRatioBound = 20.0;

    TransferParameters() = default;

    explicit TransferParameters(const Dune::ParameterTree& config)
    {
      velocityOrder = config.get("iinterpolationOrderVel", -1);
      pressureOrder = config.get("iinterpolationOrderPress", -1);
      velocityVariant = config.get("iinterpolationVariantVel", 0);
      aspectRatioIndicator = config.get("iintARIndicatorEX3YVel", 0);
      aspectRatioBound = config.get("dintARboundEX3YVel", 20.0);
    }
  };

  struct Level;

  /**
   * \brief Transfer of vectors and matrices between multigrid levels.
   *
   * Solutions live in the primal space and are moved to coarser levels by
   * interpolation. Defects live in the dual space and are moved by
   * restriction, the transpose of prolongation.
   *
   * The level argument always names the coarse level of the pair
   * (coarseLevel, coarseLevel+1).
   */
  class InterlevelTransfer
  {
  public:
    typedef std::size_t size_type;

    virtual ~InterlevelTransfer() {}

    virtual void init() {}
    virtual void done() {}

    //! number of scratch entries needed by any transfer from the levels up to fineLevel
    virtual size_type memoryRequirement(int fineLevel) const = 0;

    //! fine = P coarse
    virtual void prolongate(int coarseLevel, const SystemVector& coarse, SystemVector& fine,
                            ScalarVector& scratch) const = 0;

    //! coarse = P^T fine
    virtual void restrictDefect(int coarseLevel, const SystemVector& fine, SystemVector& coarse,
                                ScalarVector& scratch) const = 0;

    //! interpolation of a fine solution to the coarse level
    virtual void interpolate(int coarseLevel, SystemVector& coarse, const SystemVector& fine,
                             ScalarVector& scratch) const = 0;

    /**
     * \brief Rebuild rows of the coarse velocity block from the fine one.
     *
     * Affected rows are recomputed by a Galerkin product with constant
     * transfer operators. Must be a no-op for elements it does not
     * support.
     */
    virtual void restrictMatrix(const Level& fine, Level& coarse,
                                AdaptiveMatrixMode mode, double threshold) const = 0;
  };

  /** @} end documentation */

} // end namespace

#endif
