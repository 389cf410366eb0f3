// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#ifndef FEAT_FEATEXCEPTION_HH
#define FEAT_FEATEXCEPTION_HH

#include <dune/common/exceptions.hh>

namespace Feat {

  /**
              @addtogroup FeatCore
              @{
   */

  //! derive error class from the base class in common
  class FeatError : public Dune::MathError {};

  //! Thrown when the parameter set does not describe a supported setup.
  /**
   * Examples are a missing parameter section, an unknown preconditioner
   * type or an unknown stabilization mode. The error is raised when the
   * object reading the parameter is constructed, never at first use.
   */
  class ConfigurationError : public FeatError {};

  //! Thrown when the damping parameter cannot be computed.
  /**
   * The search direction is numerically zero with respect to the system
   * matrix. This usually hints at a corrupted or degenerate mesh.
   */
  class NumericalDegeneracy : public FeatError {};

  //! Thrown when the direct solver fails to factorize a matrix.
  class SolverFactorizationFailure : public FeatError {};

  //! Thrown when the assembled matrices cannot be used by the linear solver.
  class MatrixCompatibilityError : public FeatError {};

  //! Error specific to the sparse matrix handle.
  class SparseMatrixError : public FeatError {};

  /** @} end documentation */

} // end namespace

#endif
