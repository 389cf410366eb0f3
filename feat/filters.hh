// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#ifndef FEAT_FILTERS_HH
#define FEAT_FILTERS_HH

#include <array>
#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

#include <feat/systemmatrix.hh>
#include <feat/systemvector.hh>

/** \file
 * \brief Filters implementing boundary conditions and pressure normalization.
 */

namespace Feat {

  /**
              @addtogroup FeatCore
              @{
   */

  //! The role of a vector a filter is applied to.
  enum class FilterKind {
    solution,
    rhs,
    defect
  };

  //! Selects the vectors boundary conditions are implemented into.
  struct FilterTargets
  {
    bool applyToSolution = false;
    bool applyToRHS = false;
    bool applyToDefect = false;
  };

  /**
   * \brief Base class of all vector and matrix filters.
   *
   * A filter modifies a vector according to its role, and optionally
   * the rows of a system matrix, such that the filtered system encodes
   * a constraint like a Dirichlet boundary condition.
   */
  class Filter
  {
  public:
    typedef std::size_t size_type;

    virtual ~Filter() {}

    //! filter a vector of the given kind
    virtual void apply(SystemVector& v, FilterKind kind) const = 0;

    //! filter a system matrix, the default does nothing
    virtual void apply(SystemMatrix& A) const;
  };

  /**
   * \brief Prescribed velocity values on degrees of freedom.
   *
   * Solution and right hand side get the prescribed values, defects
   * are set to zero. In the matrix, the rows of the constrained DOFs are
   * replaced by unit rows in the diagonal blocks and cleared in all other
   * blocks of the block row.
   *
   * The same class serves for boundary conditions on the real boundary
   * and on fictitious boundary objects.
   */
  class DirichletFilter : public Filter
  {
  public:
    enum class Origin {
      boundary,
      fictitiousBoundary
    };

    explicit DirichletFilter(Origin origin = Origin::boundary)
      : origin_(origin)
    {}

    Origin origin() const { return origin_; }

    //! prescribe value for the DOF dof of velocity component 0 or 1
    void add(size_type component, size_type dof, double value);

    const std::vector<std::pair<size_type, double> >& constraints(size_type component) const
    {
      return constraints_[component];
    }

    void apply(SystemVector& v, FilterKind kind) const override;

    /**
     * Throws if blocks (1,1) and (2,2) share their data but the two
     * velocity components carry different constraints.
     */
    void apply(SystemMatrix& A) const override;

  private:
    Origin origin_;
    std::array<std::vector<std::pair<size_type, double> >, 2> constraints_;
  };

  /**
   * \brief Zero normal velocity on axis parallel slip boundaries.
   *
   * This is a nonlinear boundary condition in the sense that it is
   * implemented into the linearized matrices after each assembly. The
   * matrix part needs decoupled velocity blocks.
   */
  class SlipFilter : public Filter
  {
  public:
    //! the normal of the boundary at dof points in direction normalComponent
    void add(size_type normalComponent, size_type dof);

    bool empty() const { return dofs_[0].empty() && dofs_[1].empty(); }

    void apply(SystemVector& v, FilterKind kind) const override;
    void apply(SystemMatrix& A) const override;

  private:
    std::array<std::vector<size_type>, 2> dofs_;
  };

  /**
   * \brief Projects the pressure into \f$L^2_0\f$.
   *
   * Used when the boundary is of pure Dirichlet type, so the pressure is
   * only determined up to a constant. Acts on solutions and defects.
   */
  class PressureMeanFilter : public Filter
  {
  public:
    //! arithmetic mean, for pressure elements of equal measure
    PressureMeanFilter() = default;

    //! mean weighted by the measures of the pressure cells
    explicit PressureMeanFilter(ScalarVector weights)
      : weights_(std::move(weights))
    {}

    void apply(SystemVector& v, FilterKind kind) const override;

    void subtractMean(ScalarVector& p) const;

  private:
    ScalarVector weights_;
  };

  //! A sequence of filters applied one after another.
  class FilterChain : public Filter
  {
  public:
    void add(std::shared_ptr<const Filter> filter)
    {
      filters_.push_back(std::move(filter));
    }

    size_type size() const { return filters_.size(); }

    void clear() { filters_.clear(); }

    void apply(SystemVector& v, FilterKind kind) const override;
    void apply(SystemMatrix& A) const override;

  private:
    std::vector<std::shared_ptr<const Filter> > filters_;
  };

  //! apply a filter to all vectors requested by targets
  void implementBoundaryConditions(const Filter& filter, const FilterTargets& targets,
                                   SystemVector* solution, SystemVector* rhs, SystemVector* defect);

  /** @} end documentation */

} // end namespace

#endif
