// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#ifndef FEAT_VANKA_HH
#define FEAT_VANKA_HH

#include <cstddef>

#include <feat/linearsolver.hh>
#include <feat/systemmatrix.hh>
#include <feat/systemvector.hh>

namespace Feat {

  /**
              @addtogroup FeatCore
              @{
   */

  /**
   * \brief Vanka smoother for saddle point systems.
   *
   * For every pressure degree of freedom the velocity unknowns coupled to
   * it by \f$B^T\f$ are collected together with the pressure into a
   * small local system which is solved exactly. The local corrections
   * are applied one after another (multiplicative).
   *
   * The velocity unknowns of a pressure DOF are read from the rows of the
   * blocks (3,1), (3,2). These blocks must therefore be physically
   * transposed.
   */
  class VankaSmoother
  {
  public:
    typedef std::size_t size_type;

    enum class Variant {
      full,    //!< local velocity blocks as assembled
      diagonal //!< only the diagonal of the local velocity blocks
    };

    VankaSmoother(Variant variant, double omega)
      : variant_(variant), omega_(omega)
    {}

    //! whether the block layout of A can be smoothed
    static MatrixCompatibility compatibility(const SystemMatrix& A);

    void setMatrix(const SystemMatrix* A);

    //! steps sweeps over all pressure DOFs for A x = b
    void apply(SystemVector& x, const SystemVector& b, int steps) const;

  private:
    void sweep(SystemVector& x, const SystemVector& b) const;

    Variant variant_;
    double omega_;
    const SystemMatrix* matrix_ = nullptr;
  };

  /** @} end documentation */

} // end namespace

#endif
