// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#include <config.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <initializer_list>
#include <vector>

#include <dune/common/dynmatrix.hh>
#include <dune/common/exceptions.hh>

#include <feat/q1tilde/element.hh>
#include <feat/q1tilde/matrixassembly.hh>

namespace Feat {
namespace Q1Tilde {

  namespace {

    typedef RectangleGrid::size_type size_type;
    typedef Dune::DynamicMatrix<double> LocalMatrix;

    //! reference midpoints of the local edges
    const std::array<Point, 4> midpoints = {{Point({0.0, -1.0}), Point({1.0, 0.0}),
                                             Point({0.0, 1.0}), Point({-1.0, 0.0})}};

    //! reference vertex between local edges i and i+1
    const std::array<Point, 4> vertices = {{Point({1.0, -1.0}), Point({1.0, 1.0}),
                                            Point({-1.0, 1.0}), Point({-1.0, -1.0})}};

    //! the velocity field of x at reference point xi of a cell
    Point velocityAt(const std::array<size_type, 4>& dofs, const SystemVector& x, const Point& xi)
    {
      const std::array<double, 4> phi = Element::values(xi);
      Point w(0.0);
      for (size_type k = 0; k < 4; ++k) {
        w[0] += x[0][dofs[k]]*phi[k];
        w[1] += x[1][dofs[k]]*phi[k];
      }
      return w;
    }

    //! add weight times the local matrix to the target
    template<class Dofs>
    void scatter(const LocalMatrix& local, const Dofs& dofs, double weight,
                 ConvectionContribution& target)
    {
      const size_type n = dofs.size();
      if (target.mode == ConvectionMode::matrix) {
        for (size_type a = 0; a < n; ++a)
          for (size_type b = 0; b < n; ++b)
            if (local[a][b] != 0.0)
              target.matrix->entry(dofs[a], dofs[b]) += weight*local[a][b];
        return;
      }
      const SystemVector& u = *target.solution;
      SystemVector& d = *target.defect;
      for (size_type c = 0; c < 2; ++c)
        for (size_type a = 0; a < n; ++a) {
          double sum = 0.0;
          for (size_type b = 0; b < n; ++b)
            sum += local[a][b]*u[c][dofs[b]];
          d[c][dofs[a]] -= weight*sum;
        }
    }

    void streamlineDiffusion(const RectangleGrid& grid, double nu, const ConvectionTerm& term,
                             const SystemVector& velocity, ConvectionContribution& target)
    {
      const std::array<Point, 9> points = GaussRule::points();
      const std::array<double, 9> weights = GaussRule::weights();
      const double detJ = 0.25*grid.hx()*grid.hy();
      const double h = std::sqrt(grid.hx()*grid.hy());
      LocalMatrix local(4, 4);

      for (size_type c = 0; c < grid.cells(); ++c) {
        const std::array<size_type, 4> dofs = grid.cellEdges(c);

        double delta = 0.0;
        const double wnorm = velocityAt(dofs, velocity, Point(0.0)).two_norm();
        if (term.parameter != 0.0 && wnorm > 1e-12) {
          const double reLoc = wnorm*h/nu;
          delta = term.parameter*h*2.0*reLoc/(1.0 + reLoc)/wnorm;
        }

        local = 0.0;
        for (size_type q = 0; q < 9; ++q) {
          const std::array<double, 4> phi = Element::values(points[q]);
          const std::array<Point, 4> grad = Element::gradients(points[q], grid.hx(), grid.hy());
          const Point w = velocityAt(dofs, velocity, points[q]);
          std::array<double, 4> wgrad;
          for (size_type k = 0; k < 4; ++k)
            wgrad[k] = w*grad[k];
          for (size_type a = 0; a < 4; ++a)
            for (size_type b = 0; b < 4; ++b)
              local[a][b] += weights[q]*detJ*(wgrad[b]*phi[a] + delta*wgrad[b]*wgrad[a]);
        }
        scatter(local, dofs, term.weight, target);
      }
    }

    //! Samarskij weight of the upstream value for the local Peclet number r
    double samarskij(double r)
    {
      return (r >= 0.0) ? (1.0 + r)/(2.0 + r) : 1.0/(2.0 - r);
    }

    /*
     * Finite volume convection on the dual cells of the edges. The dual
     * cell of an edge is made of the triangles spanned by the edge and
     * the centers of its cells; two dual cells of a cell meet on the line
     * from the center to their common vertex.
     */
    void upwind(const RectangleGrid& grid, double nu, const ConvectionTerm& term,
                const SystemVector& velocity, ConvectionContribution& target)
    {
      const double hx = grid.hx(), hy = grid.hy();
      LocalMatrix local(4, 4);

      for (size_type c = 0; c < grid.cells(); ++c) {
        const std::array<size_type, 4> dofs = grid.cellEdges(c);
        local = 0.0;

        for (size_type i = 0; i < 4; ++i) {
          const size_type j = (i + 1) % 4;
          const Point s({0.5*hx*vertices[i][0], 0.5*hy*vertices[i][1]});
          Point n({-s[1], s[0]});
          const Point dm({0.5*hx*(midpoints[j][0] - midpoints[i][0]),
                          0.5*hy*(midpoints[j][1] - midpoints[i][1])});
          if (n*dm < 0.0)
            n *= -1.0;

          Point center(vertices[i]);
          center *= 0.5;
          // flux from the dual cell of i into the dual cell of j
          const double flux = velocityAt(dofs, velocity, center)*n;

          double lambdaIJ, lambdaJI;
          if (term.parameter < 0.0) {
            lambdaIJ = (flux >= 0.0) ? 1.0 : 0.0;
            lambdaJI = 1.0 - lambdaIJ;
          }
          else {
            const double r = term.parameter*flux/nu;
            lambdaIJ = samarskij(r);
            lambdaJI = samarskij(-r);
          }

          local[i][j] += flux*(1.0 - lambdaIJ);
          local[i][i] -= flux*(1.0 - lambdaIJ);
          local[j][i] -= flux*(1.0 - lambdaJI);
          local[j][j] += flux*(1.0 - lambdaJI);
        }
        scatter(local, dofs, term.weight, target);
      }
    }

    //! gamma h_E^2 ([grad u], [grad v])_E over all inner edges
    void edgeJump(const RectangleGrid& grid, const ConvectionTerm& term, ConvectionContribution& target)
    {
      const double g = 1.0/std::sqrt(3.0);
      std::vector<size_type> dofs;
      std::vector<Point> jumps;
      LocalMatrix local;

      for (size_type e = 0; e < grid.edges(); ++e) {
        const std::array<size_type, 2> cells = grid.edgeCells(e);
        if (cells[1] == RectangleGrid::none)
          continue;

        const std::array<size_type, 4> e0 = grid.cellEdges(cells[0]);
        const std::array<size_type, 4> e1 = grid.cellEdges(cells[1]);
        dofs.assign(e0.begin(), e0.end());
        for (size_type k : e1)
          if (std::find(dofs.begin(), dofs.end(), k) == dofs.end())
            dofs.push_back(k);
        const size_type n = dofs.size();
        local.resize(n, n, 0.0);
        local = 0.0;

        const double hE = grid.edgeLength(e);
        const double gammaE = term.parameter*hE*hE;
        const Point mid = grid.edgeMidpoint(e);

        for (double t : {-g, g}) {
          Point x(mid);
          if (grid.isHorizontal(e))
            x[0] += 0.5*hE*t;
          else
            x[1] += 0.5*hE*t;

          jumps.assign(n, Point(0.0));
          for (size_type side = 0; side < 2; ++side) {
            const std::array<size_type, 4>& cellDofs = side == 0 ? e0 : e1;
            const std::array<Point, 4> grad =
              Element::gradients(grid.local(cells[side], x), grid.hx(), grid.hy());
            for (size_type k = 0; k < 4; ++k) {
              const size_type a = std::find(dofs.begin(), dofs.end(), cellDofs[k]) - dofs.begin();
              Point jk(grad[k]);
              jk *= (side == 0) ? 1.0 : -1.0;
              jumps[a] += jk;
            }
          }

          for (size_type a = 0; a < n; ++a)
            for (size_type b = 0; b < n; ++b)
              local[a][b] += 0.5*hE*gammaE*(jumps[a]*jumps[b]);
        }
        scatter(local, dofs, term.weight, target);
      }
    }

  }

  Dune::MatrixIndexSet velocityPattern(const RectangleGrid& grid)
  {
    Dune::MatrixIndexSet pattern(grid.edges(), grid.edges());
    for (size_type c = 0; c < grid.cells(); ++c)
      for (size_type i : grid.cellEdges(c))
        for (size_type j : grid.cellEdges(c))
          pattern.add(i, j);
    for (size_type e = 0; e < grid.edges(); ++e) {
      const std::array<size_type, 2> cells = grid.edgeCells(e);
      if (cells[1] == RectangleGrid::none)
        continue;
      for (size_type i : grid.cellEdges(cells[0]))
        for (size_type j : grid.cellEdges(cells[1])) {
          pattern.add(i, j);
          pattern.add(j, i);
        }
    }
    return pattern;
  }

  Dune::MatrixIndexSet divergencePattern(const RectangleGrid& grid)
  {
    Dune::MatrixIndexSet pattern(grid.edges(), grid.cells());
    for (size_type c = 0; c < grid.cells(); ++c)
      for (size_type i : grid.cellEdges(c))
        pattern.add(i, c);
    return pattern;
  }

  void assembleLaplace(const RectangleGrid& grid, double nu, SparseMatrix& A)
  {
    const std::array<Point, 9> points = GaussRule::points();
    const std::array<double, 9> weights = GaussRule::weights();
    const double detJ = 0.25*grid.hx()*grid.hy();

    // all cells are congruent
    std::array<std::array<double, 4>, 4> local = {};
    for (size_type q = 0; q < 9; ++q) {
      const std::array<Point, 4> grad = Element::gradients(points[q], grid.hx(), grid.hy());
      for (size_type a = 0; a < 4; ++a)
        for (size_type b = 0; b < 4; ++b)
          local[a][b] += weights[q]*detJ*nu*(grad[a]*grad[b]);
    }

    for (size_type c = 0; c < grid.cells(); ++c) {
      const std::array<size_type, 4> dofs = grid.cellEdges(c);
      for (size_type a = 0; a < 4; ++a)
        for (size_type b = 0; b < 4; ++b)
          A.entry(dofs[a], dofs[b]) += local[a][b];
    }
  }

  void assembleMass(const RectangleGrid& grid, SparseMatrix& M)
  {
    const std::array<Point, 9> points = GaussRule::points();
    const std::array<double, 9> weights = GaussRule::weights();
    const double detJ = 0.25*grid.hx()*grid.hy();

    std::array<std::array<double, 4>, 4> local = {};
    for (size_type q = 0; q < 9; ++q) {
      const std::array<double, 4> phi = Element::values(points[q]);
      for (size_type a = 0; a < 4; ++a)
        for (size_type b = 0; b < 4; ++b)
          local[a][b] += weights[q]*detJ*phi[a]*phi[b];
    }

    for (size_type c = 0; c < grid.cells(); ++c) {
      const std::array<size_type, 4> dofs = grid.cellEdges(c);
      for (size_type a = 0; a < 4; ++a)
        for (size_type b = 0; b < 4; ++b)
          M.entry(dofs[a], dofs[b]) += local[a][b];
    }
  }

  void assembleDivergence(const RectangleGrid& grid, SparseMatrix& B1, SparseMatrix& B2)
  {
    const std::array<Point, 9> points = GaussRule::points();
    const std::array<double, 9> weights = GaussRule::weights();
    const double detJ = 0.25*grid.hx()*grid.hy();

    std::array<Point, 4> local;
    local.fill(Point(0.0));
    for (size_type q = 0; q < 9; ++q) {
      const std::array<Point, 4> grad = Element::gradients(points[q], grid.hx(), grid.hy());
      for (size_type a = 0; a < 4; ++a)
        local[a].axpy(-weights[q]*detJ, grad[a]);
    }

    for (size_type c = 0; c < grid.cells(); ++c) {
      const std::array<size_type, 4> dofs = grid.cellEdges(c);
      for (size_type a = 0; a < 4; ++a) {
        B1.entry(dofs[a], c) += local[a][0];
        B2.entry(dofs[a], c) += local[a][1];
      }
    }
  }

  void assembleConvection(const RectangleGrid& grid, double nu, const ConvectionTerm& term,
                          const SystemVector& velocity, ConvectionContribution& target)
  {
    if (target.mode == ConvectionMode::matrix && !target.matrix)
      DUNE_THROW(Dune::InvalidStateException, "Convection in matrix mode without matrix");
    if (target.mode == ConvectionMode::defect && (!target.solution || !target.defect))
      DUNE_THROW(Dune::InvalidStateException, "Convection in defect mode without vectors");

    switch (term.kind) {
    case ConvectionTerm::streamlineDiffusion :
      streamlineDiffusion(grid, nu, term, velocity, target);
      break;
    case ConvectionTerm::upwind :
      upwind(grid, nu, term, velocity, target);
      break;
    case ConvectionTerm::edgeJump :
      edgeJump(grid, term, target);
      break;
    }
  }

} // end namespace Q1Tilde
} // end namespace Feat
