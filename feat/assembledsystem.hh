// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#ifndef FEAT_ASSEMBLEDSYSTEM_HH
#define FEAT_ASSEMBLEDSYSTEM_HH

#include <memory>

#include <feat/coreequation.hh>
#include <feat/filters.hh>
#include <feat/interleveltransfer.hh>
#include <feat/sparsematrix.hh>
#include <feat/systemmatrix.hh>
#include <feat/systemvector.hh>

/** \file
 * \brief Interface of the discretization the nonlinear core works on.
 */

namespace Feat {

  /**
              @addtogroup FeatCore
              @{
   */

  //! Velocity element of a level, decides whether adaptive matrix restriction applies.
  enum class VelocityElement {
    q1tilde,
    other
  };

  /**
   * \brief One level of the discretization hierarchy.
   *
   * The system matrix is
   * \f[ \begin{pmatrix} A & 0 & B_1 \\ 0 & A & B_2 \\ B_1^T & B_2^T & 0 \end{pmatrix} \f]
   * where block (1,1) holds the current linearization and is rewritten
   * in every nonlinear iteration. In canonical form the blocks (1,3),
   * (2,3) share B1, B2 and the blocks (3,1), (3,2) are virtually
   * transposed views of them.
   */
  struct Level
  {
    int index = 0;
    BlockStructure structure;
    VelocityElement element = VelocityElement::q1tilde;

    SystemMatrix systemMatrix;

    //! nu times the Laplace matrix
    SparseMatrix stokes;
    SparseMatrix mass;
    SparseMatrix b1;
    SparseMatrix b2;

    //! receives the interpolated point of linearization
    SystemVector tempVector;

    //! Dirichlet conditions on the real boundary
    std::shared_ptr<const DirichletFilter> dirichlet;

    //! Dirichlet conditions on fictitious boundary objects, may be empty
    std::shared_ptr<const DirichletFilter> fictitious;

    //! nonlinear slip conditions, may be empty
    std::shared_ptr<const SlipFilter> slip;

    //! the canonical system matrix built from the scalar matrices
    void setupSystemMatrix(bool decoupledVelocity)
    {
      systemMatrix = SystemMatrix(structure);
      systemMatrix(0, 0) = stokes.duplicate(DuplicationMode::shareStructure);
      systemMatrix(1, 1) = decoupledVelocity ? stokes.duplicate(DuplicationMode::shareStructure)
                                             : systemMatrix(0, 0).duplicate(DuplicationMode::share);
      systemMatrix(0, 2) = b1.duplicate(DuplicationMode::share);
      systemMatrix(1, 2) = b2.duplicate(DuplicationMode::share);
      systemMatrix(2, 0) = b1.transposedView();
      systemMatrix(2, 1) = b2.transposedView();
      tempVector.resize(structure);
    }
  };

  //! Whether convection is assembled into a matrix or applied to a defect.
  enum class ConvectionMode {
    matrix,
    defect
  };

  /**
   * \brief Where the convection is assembled to.
   *
   * In matrix mode weight times the operator is added to matrix, in defect
   * mode weight times the operator applied to solution is subtracted from
   * defect.
   */
  struct ConvectionContribution
  {
    ConvectionMode mode = ConvectionMode::matrix;
    SparseMatrix* matrix = nullptr;
    const SystemVector* solution = nullptr;
    SystemVector* defect = nullptr;
  };

  /**
   * \brief The assembled discretization of a saddle point problem.
   *
   * Provides the level hierarchy with all matrices, the boundary
   * conditions and the assembly of the convective term.
   */
  class AssembledSystem
  {
  public:
    virtual ~AssembledSystem() {}

    virtual int minLevel() const = 0;
    virtual int maxLevel() const = 0;

    virtual Level& level(int l) = 0;
    virtual const Level& level(int l) const = 0;

    //! whether the pressure is determined by the boundary conditions
    virtual bool hasNeumannBoundary() const = 0;

    /**
     * \brief Assemble one convection term, linearized at velocity.
     *
     * \param l the level
     * \param term which term and its weight
     * \param velocity point of linearization, only the velocity blocks are used
     * \param target matrix or defect to update
     */
    virtual void assembleConvection(int l, const ConvectionTerm& term,
                                    const SystemVector& velocity,
                                    ConvectionContribution& target) const = 0;

    //! the interlevel transfer of this discretization
    virtual std::unique_ptr<InterlevelTransfer> createTransfer(const TransferParameters& params) const = 0;

    //! implement the linear boundary conditions into a vector
    void applyBoundaryFilter(int l, SystemVector& v, FilterKind kind) const
    {
      const Level& lev = level(l);
      if (lev.dirichlet)
        lev.dirichlet->apply(v, kind);
      if (lev.fictitious)
        lev.fictitious->apply(v, kind);
    }

    //! implement the linear boundary conditions into a matrix
    void applyBoundaryFilter(int l, SystemMatrix& A) const
    {
      const Level& lev = level(l);
      if (lev.dirichlet)
        lev.dirichlet->apply(A);
      if (lev.fictitious)
        lev.fictitious->apply(A);
    }

    void applyNonlinearBoundaryFilter(int l, SystemVector& v, FilterKind kind) const
    {
      if (level(l).slip)
        level(l).slip->apply(v, kind);
    }

    void applyNonlinearBoundaryFilter(int l, SystemMatrix& A) const
    {
      if (level(l).slip)
        level(l).slip->apply(A);
    }
  };

  /** @} end documentation */

} // end namespace

#endif
