// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#include <config.h>

#include <algorithm>

#include <feat/featexception.hh>
#include <feat/filters.hh>

namespace Feat {

  void Filter::apply(SystemMatrix&) const
  {}

  void DirichletFilter::add(size_type component, size_type dof, double value)
  {
    if (component > 1)
      DUNE_THROW(FeatError, "Dirichlet values can only be prescribed for velocity components");
    constraints_[component].emplace_back(dof, value);
  }

  void DirichletFilter::apply(SystemVector& v, FilterKind kind) const
  {
    for (size_type c = 0; c < 2; ++c)
      for (const auto& constraint : constraints_[c])
        v[c][constraint.first] = (kind == FilterKind::defect) ? 0.0 : constraint.second;
  }

  namespace {

    std::vector<Filter::size_type> dofsOf(const std::vector<std::pair<Filter::size_type, double> >& constraints)
    {
      std::vector<Filter::size_type> dofs;
      for (const auto& c : constraints)
        dofs.push_back(c.first);
      std::sort(dofs.begin(), dofs.end());
      return dofs;
    }

    void clearRowOfBlock(SystemMatrix& A, Filter::size_type i, Filter::size_type j, Filter::size_type row)
    {
      if (!A.active(i, j))
        return;
      if (A(i, j).isVirtuallyTransposed())
        DUNE_THROW(FeatError, "Cannot filter rows of the virtually transposed block (" << i << "," << j << ")");
      A(i, j).clearRow(row);
    }

  }

  void DirichletFilter::apply(SystemMatrix& A) const
  {
    if (A.active(0, 0) && A.active(1, 1) && A(0, 0).sharesDataWith(A(1, 1))
        && dofsOf(constraints_[0]) != dofsOf(constraints_[1]))
      DUNE_THROW(FeatError, "Different boundary conditions for the velocity components need decoupled velocity blocks");

    for (size_type c = 0; c < 2; ++c)
      for (const auto& constraint : constraints_[c]) {
        if (A.active(c, c))
          A(c, c).unitRow(constraint.first);
        clearRowOfBlock(A, c, 1-c, constraint.first);
        clearRowOfBlock(A, c, 2, constraint.first);
      }
  }

  void SlipFilter::add(size_type normalComponent, size_type dof)
  {
    if (normalComponent > 1)
      DUNE_THROW(FeatError, "The normal of a slip boundary has two components");
    dofs_[normalComponent].push_back(dof);
  }

  void SlipFilter::apply(SystemVector& v, FilterKind) const
  {
    for (size_type c = 0; c < 2; ++c)
      for (size_type dof : dofs_[c])
        v[c][dof] = 0.0;
  }

  void SlipFilter::apply(SystemMatrix& A) const
  {
    if (empty())
      return;
    if (A.active(0, 0) && A.active(1, 1) && A(0, 0).sharesDataWith(A(1, 1)))
      DUNE_THROW(FeatError, "Slip boundary conditions need decoupled velocity blocks");

    for (size_type c = 0; c < 2; ++c)
      for (size_type dof : dofs_[c]) {
        if (A.active(c, c))
          A(c, c).unitRow(dof);
        clearRowOfBlock(A, c, 1-c, dof);
        clearRowOfBlock(A, c, 2, dof);
      }
  }

  void PressureMeanFilter::subtractMean(ScalarVector& p) const
  {
    if (p.size() == 0)
      return;
    double mean = 0.0;
    if (weights_.size() == 0) {
      for (size_type i = 0; i < p.size(); ++i)
        mean += p[i];
      mean /= p.size();
    }
    else {
      if (weights_.size() != p.size())
        DUNE_THROW(FeatError, "Pressure weights do not match the pressure space");
      double measure = 0.0;
      for (size_type i = 0; i < p.size(); ++i) {
        mean += weights_[i]*p[i];
        measure += weights_[i];
      }
      mean /= measure;
    }
    for (size_type i = 0; i < p.size(); ++i)
      p[i] -= mean;
  }

  void PressureMeanFilter::apply(SystemVector& v, FilterKind kind) const
  {
    if (kind != FilterKind::rhs)
      subtractMean(v[2]);
  }

  void FilterChain::apply(SystemVector& v, FilterKind kind) const
  {
    for (const auto& f : filters_)
      f->apply(v, kind);
  }

  void FilterChain::apply(SystemMatrix& A) const
  {
    for (const auto& f : filters_)
      f->apply(A);
  }

  void implementBoundaryConditions(const Filter& filter, const FilterTargets& targets,
                                   SystemVector* solution, SystemVector* rhs, SystemVector* defect)
  {
    if (targets.applyToSolution && solution)
      filter.apply(*solution, FilterKind::solution);
    if (targets.applyToRHS && rhs)
      filter.apply(*rhs, FilterKind::rhs);
    if (targets.applyToDefect && defect)
      filter.apply(*defect, FilterKind::defect);
  }

} // end namespace Feat
