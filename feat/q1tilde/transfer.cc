// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#include <config.h>

#include <array>
#include <cmath>

#include <dune/common/exceptions.hh>
#include <dune/common/stdstreams.hh>
#include <dune/istl/matrixindexset.hh>

#include <feat/featexception.hh>
#include <feat/q1tilde/element.hh>
#include <feat/q1tilde/transfer.hh>

namespace Feat {
namespace Q1Tilde {

  namespace {

    typedef RectangleGrid::size_type size_type;

    //! the coarse cells whose closure contains the midpoint of fine edge e
    std::array<size_type, 2> parentCells(const RectangleGrid& coarse, const RectangleGrid& fine, size_type e)
    {
      std::array<size_type, 2> result = {{RectangleGrid::none, RectangleGrid::none}};
      size_type n = 0;
      if (fine.isHorizontal(e)) {
        const size_type i = e % fine.nx(), j = e / fine.nx();
        if (j % 2 == 1)
          result[n++] = coarse.cell(i/2, j/2);
        else {
          if (j/2 > 0)
            result[n++] = coarse.cell(i/2, j/2 - 1);
          if (j/2 < coarse.ny())
            result[n++] = coarse.cell(i/2, j/2);
        }
      }
      else {
        const size_type k = e - fine.horizontalEdges();
        const size_type i = k % (fine.nx()+1), j = k / (fine.nx()+1);
        if (i % 2 == 1)
          result[n++] = coarse.cell(i/2, j/2);
        else {
          if (i/2 > 0)
            result[n++] = coarse.cell(i/2 - 1, j/2);
          if (i/2 < coarse.nx())
            result[n++] = coarse.cell(i/2, j/2);
        }
      }
      return result;
    }

    //! local edge of the coarse cell on which xi lies, 4 for inner points
    size_type localEdgeAt(const Point& xi)
    {
      const double eps = 1e-8;
      if (std::abs(xi[1] + 1.0) < eps)
        return 0;
      if (std::abs(xi[0] - 1.0) < eps)
        return 1;
      if (std::abs(xi[1] - 1.0) < eps)
        return 2;
      if (std::abs(xi[0] + 1.0) < eps)
        return 3;
      return 4;
    }

    //! the four children of coarse cell c in the refined grid
    std::array<size_type, 4> childCells(const RectangleGrid& coarse, const RectangleGrid& fine, size_type c)
    {
      const size_type i = 2*(c % coarse.nx()), j = 2*(c / coarse.nx());
      return {{fine.cell(i, j), fine.cell(i+1, j), fine.cell(i, j+1), fine.cell(i+1, j+1)}};
    }

  }

  Transfer::Transfer(const std::vector<RectangleGrid>& grids, int minLevel, const TransferParameters& params)
    : grids_(grids), minLevel_(minLevel), params_(params)
  {
    if (params_.velocityOrder != -1 && params_.velocityOrder != 0 && params_.velocityOrder != 1)
      DUNE_THROW(ConfigurationError, "Unknown velocity interpolation order " << params_.velocityOrder);
    if (params_.velocityVariant < 0 || params_.velocityVariant > 2)
      DUNE_THROW(ConfigurationError, "Unknown velocity interpolation variant " << params_.velocityVariant);
  }

  Transfer::size_type Transfer::index(int coarseLevel) const
  {
    const int i = coarseLevel - minLevel_;
    if (i < 0 || i + 1 >= static_cast<int>(grids_.size()))
      DUNE_THROW(Dune::RangeError, "No transfer from level " << coarseLevel);
    if (static_cast<size_type>(i) >= prolongation_.size())
      DUNE_THROW(Dune::InvalidStateException, "Transfer used before init()");
    return i;
  }

  const SparseMatrix& Transfer::prolongation(int coarseLevel) const
  {
    return prolongation_[index(coarseLevel)];
  }

  SparseMatrix Transfer::buildProlongation(const RectangleGrid& coarse, bool constant) const
  {
    const RectangleGrid fine = coarse.refined();

    Dune::MatrixIndexSet pattern(fine.edges(), coarse.edges());
    for (size_type e = 0; e < fine.edges(); ++e)
      for (size_type c : parentCells(coarse, fine, e))
        if (c != RectangleGrid::none)
          for (size_type k : coarse.cellEdges(c))
            pattern.add(e, k);
    SparseMatrix P(pattern);

    for (size_type e = 0; e < fine.edges(); ++e) {
      const std::array<size_type, 2> parents = parentCells(coarse, fine, e);
      const double share = (parents[1] == RectangleGrid::none) ? 1.0 : 0.5;
      for (size_type c : parents) {
        if (c == RectangleGrid::none)
          continue;
        const std::array<size_type, 4> dofs = coarse.cellEdges(c);
        const Point xi = coarse.local(c, fine.edgeMidpoint(e));
        if (constant) {
          const size_type k = localEdgeAt(xi);
          if (k < 4)
            P.entry(e, dofs[k]) += share;
          else
            for (size_type a = 0; a < 4; ++a)
              P.entry(e, dofs[a]) += 0.25*share;
        }
        else {
          const std::array<double, 4> phi = Element::values(xi);
          for (size_type a = 0; a < 4; ++a)
            if (phi[a] != 0.0)
              P.entry(e, dofs[a]) += share*phi[a];
        }
      }
    }
    return P;
  }

  SparseMatrix Transfer::buildInterpolation(const RectangleGrid& coarse) const
  {
    const RectangleGrid fine = coarse.refined();

    Dune::MatrixIndexSet pattern(coarse.edges(), fine.edges());
    std::vector<std::array<size_type, 2> > halves(coarse.edges());
    for (size_type E = 0; E < coarse.edges(); ++E) {
      if (coarse.isHorizontal(E)) {
        const size_type I = E % coarse.nx(), J = E / coarse.nx();
        halves[E] = {{fine.horizontalEdge(2*I, 2*J), fine.horizontalEdge(2*I+1, 2*J)}};
      }
      else {
        const size_type k = E - coarse.horizontalEdges();
        const size_type I = k % (coarse.nx()+1), J = k / (coarse.nx()+1);
        halves[E] = {{fine.verticalEdge(2*I, 2*J), fine.verticalEdge(2*I, 2*J+1)}};
      }
      pattern.add(E, halves[E][0]);
      pattern.add(E, halves[E][1]);
    }

    SparseMatrix R(pattern);
    for (size_type E = 0; E < coarse.edges(); ++E) {
      R.entry(E, halves[E][0]) = 0.5;
      R.entry(E, halves[E][1]) = 0.5;
    }
    return R;
  }

  void Transfer::init()
  {
    prolongation_.clear();
    constantProlongation_.clear();
    interpolation_.clear();
    for (size_type l = 0; l + 1 < grids_.size(); ++l) {
      const RectangleGrid& coarse = grids_[l];
      const bool adaptive = params_.velocityVariant == 2 && coarse.aspectRatio() > params_.aspectRatioBound;
      constantProlongation_.push_back(buildProlongation(coarse, true));
      if (params_.velocityOrder == 0 || adaptive)
        prolongation_.push_back(constantProlongation_.back().duplicate(DuplicationMode::share));
      else
        prolongation_.push_back(buildProlongation(coarse, false));
      interpolation_.push_back(buildInterpolation(coarse));
    }
    Dune::dverb << "Q1~ transfer initialized for " << prolongation_.size() << " level pairs" << std::endl;
  }

  void Transfer::done()
  {
    prolongation_.clear();
    constantProlongation_.clear();
    interpolation_.clear();
  }

  void Transfer::prolongate(int coarseLevel, const SystemVector& coarse, SystemVector& fine,
                            ScalarVector&) const
  {
    const size_type l = index(coarseLevel);
    prolongation_[l].mv(coarse[0], fine[0]);
    prolongation_[l].mv(coarse[1], fine[1]);

    const RectangleGrid& cg = grids_[l];
    const RectangleGrid& fg = grids_[l+1];
    for (size_type c = 0; c < cg.cells(); ++c)
      for (size_type child : childCells(cg, fg, c))
        fine[2][child] = coarse[2][c];
  }

  void Transfer::restrictDefect(int coarseLevel, const SystemVector& fine, SystemVector& coarse,
                                ScalarVector&) const
  {
    const size_type l = index(coarseLevel);
    const SparseMatrix PT = prolongation_[l].transposedView();
    PT.mv(fine[0], coarse[0]);
    PT.mv(fine[1], coarse[1]);

    const RectangleGrid& cg = grids_[l];
    const RectangleGrid& fg = grids_[l+1];
    for (size_type c = 0; c < cg.cells(); ++c) {
      coarse[2][c] = 0.0;
      for (size_type child : childCells(cg, fg, c))
        coarse[2][c] += fine[2][child];
    }
  }

  void Transfer::interpolate(int coarseLevel, SystemVector& coarse, const SystemVector& fine,
                             ScalarVector&) const
  {
    const size_type l = index(coarseLevel);
    interpolation_[l].mv(fine[0], coarse[0]);
    interpolation_[l].mv(fine[1], coarse[1]);

    const RectangleGrid& cg = grids_[l];
    const RectangleGrid& fg = grids_[l+1];
    for (size_type c = 0; c < cg.cells(); ++c) {
      coarse[2][c] = 0.0;
      for (size_type child : childCells(cg, fg, c))
        coarse[2][c] += 0.25*fine[2][child];
    }
  }

  void Transfer::restrictMatrix(const Level& fine, Level& coarse,
                                AdaptiveMatrixMode mode, double threshold) const
  {
    if (mode == AdaptiveMatrixMode::off)
      return;
    if (fine.element != VelocityElement::q1tilde || coarse.element != VelocityElement::q1tilde)
      return;

    const size_type l = index(coarse.index);
    // all cells of a level share the aspect ratio, so either every row or none is restricted
    if (grids_[l].aspectRatio() <= threshold)
      return;

    const SparseMatrix& Af = fine.systemMatrix(0, 0);
    SparseMatrix& Ac = coarse.systemMatrix(0, 0);
    const SparseMatrix& P = constantProlongation_[l];
    const SparseMatrix PT = P.transposed();

    const ScalarMatrix& af = Af.stored();
    const ScalarMatrix& p = P.stored();
    const ScalarMatrix& pt = PT.stored();
    ScalarMatrix& ac = Ac.stored();

    for (size_type k = 0; k < ac.N(); ++k) {
      Ac.clearRow(k);
      auto& rowC = ac[k];
      for (auto r = pt[k].begin(); r != pt[k].end(); ++r) {
        const auto& rowF = af[r.index()];
        for (auto s = rowF.begin(); s != rowF.end(); ++s) {
          const auto& rowP = p[s.index()];
          for (auto t = rowP.begin(); t != rowP.end(); ++t) {
            auto target = rowC.find(t.index());
            if (target != rowC.end())
              *target += (*r)*(*s)*(*t);
          }
        }
      }
    }
    Dune::dverb << "Restricted velocity matrix of level " << coarse.index
                << " from level " << fine.index << std::endl;
  }

} // end namespace Q1Tilde
} // end namespace Feat
