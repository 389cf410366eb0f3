// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#ifndef FEAT_Q1TILDE_MATRIXASSEMBLY_HH
#define FEAT_Q1TILDE_MATRIXASSEMBLY_HH

#include <dune/istl/matrixindexset.hh>

#include <feat/assembledsystem.hh>
#include <feat/coreequation.hh>
#include <feat/sparsematrix.hh>
#include <feat/systemvector.hh>
#include <feat/q1tilde/rectanglegrid.hh>

/** \file
 * \brief Finite element matrices of the Q1~/Q0 pair on rectangle grids.
 */

namespace Feat {
namespace Q1Tilde {

  /**
              @addtogroup FeatCore
              @{
   */

  /**
   * \brief Pattern of the velocity matrices.
   *
   * Couples all edges of a cell and, for the edge oriented jump
   * stabilization, all edges of two cells sharing an edge.
   */
  Dune::MatrixIndexSet velocityPattern(const RectangleGrid& grid);

  //! Pattern of B, edges times cells.
  Dune::MatrixIndexSet divergencePattern(const RectangleGrid& grid);

  //! A += nu (grad u, grad v)
  void assembleLaplace(const RectangleGrid& grid, double nu, SparseMatrix& A);

  //! M += (u, v)
  void assembleMass(const RectangleGrid& grid, SparseMatrix& M);

  //! \f$ B_k(i,T) = -\int_T \partial_k \varphi_i \f$
  void assembleDivergence(const RectangleGrid& grid, SparseMatrix& B1, SparseMatrix& B2);

  /**
   * \brief Assemble one convection term.
   *
   * \param grid the grid
   * \param nu the viscosity, enters the stabilization parameters
   * \param term kind, stabilization parameter and weight
   * \param velocity the convecting field, its first two blocks are used
   * \param target matrix to add to or defect to subtract from
   */
  void assembleConvection(const RectangleGrid& grid, double nu, const ConvectionTerm& term,
                          const SystemVector& velocity, ConvectionContribution& target);

  /** @} end documentation */

} // end namespace Q1Tilde
} // end namespace Feat

#endif
