// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#ifndef FEAT_Q1TILDE_RECTANGLEGRID_HH
#define FEAT_Q1TILDE_RECTANGLEGRID_HH

#include <algorithm>
#include <array>
#include <cstddef>

#include <dune/common/fvector.hh>

namespace Feat {
namespace Q1Tilde {

  /**
              @addtogroup FeatCore
              @{
   */

  typedef Dune::FieldVector<double, 2> Point;

  /**
   * \brief Uniform rectangular grid of \f$ [0,w] \times [0,h] \f$.
   *
   * Cells are numbered row by row starting in the lower left corner.
   * Edges are numbered in two groups, first all horizontal edges row by
   * row, then all vertical edges row by row. The local edges of a cell
   * are bottom, right, top, left.
   */
  class RectangleGrid
  {
  public:
    typedef std::size_t size_type;

    static constexpr size_type none = static_cast<size_type>(-1);

    RectangleGrid(size_type nx, size_type ny, double width, double height)
      : nx_(nx), ny_(ny), width_(width), height_(height)
    {}

    //! the grid with every cell split into four
    RectangleGrid refined() const
    {
      return RectangleGrid(2*nx_, 2*ny_, width_, height_);
    }

    size_type nx() const { return nx_; }
    size_type ny() const { return ny_; }
    double hx() const { return width_/nx_; }
    double hy() const { return height_/ny_; }

    size_type cells() const { return nx_*ny_; }
    size_type horizontalEdges() const { return nx_*(ny_+1); }
    size_type edges() const { return horizontalEdges() + (nx_+1)*ny_; }

    size_type cell(size_type i, size_type j) const { return j*nx_ + i; }

    size_type horizontalEdge(size_type i, size_type j) const { return j*nx_ + i; }
    size_type verticalEdge(size_type i, size_type j) const { return horizontalEdges() + j*(nx_+1) + i; }

    bool isHorizontal(size_type e) const { return e < horizontalEdges(); }

    //! the edges of cell c, bottom, right, top, left
    std::array<size_type, 4> cellEdges(size_type c) const
    {
      const size_type i = c % nx_, j = c / nx_;
      return {{horizontalEdge(i, j), verticalEdge(i+1, j), horizontalEdge(i, j+1), verticalEdge(i, j)}};
    }

    //! the cells adjacent to edge e, the second is none on the boundary
    std::array<size_type, 2> edgeCells(size_type e) const
    {
      std::array<size_type, 2> result = {{none, none}};
      size_type n = 0;
      if (isHorizontal(e)) {
        const size_type i = e % nx_, j = e / nx_;
        if (j > 0)
          result[n++] = cell(i, j-1);
        if (j < ny_)
          result[n++] = cell(i, j);
      }
      else {
        const size_type k = e - horizontalEdges();
        const size_type i = k % (nx_+1), j = k / (nx_+1);
        if (i > 0)
          result[n++] = cell(i-1, j);
        if (i < nx_)
          result[n++] = cell(i, j);
      }
      return result;
    }

    bool isBoundaryEdge(size_type e) const { return edgeCells(e)[1] == none; }

    Point cellCenter(size_type c) const
    {
      return Point({(c % nx_ + 0.5)*hx(), (c / nx_ + 0.5)*hy()});
    }

    Point edgeMidpoint(size_type e) const
    {
      if (isHorizontal(e))
        return Point({(e % nx_ + 0.5)*hx(), static_cast<double>(e / nx_)*hy()});
      const size_type k = e - horizontalEdges();
      return Point({static_cast<double>(k % (nx_+1))*hx(), (k / (nx_+1) + 0.5)*hy()});
    }

    double edgeLength(size_type e) const { return isHorizontal(e) ? hx() : hy(); }

    //! ratio of the longer to the shorter side of a cell
    double aspectRatio() const
    {
      return std::max(hx(), hy())/std::min(hx(), hy());
    }

    //! reference coordinates in \f$ [-1,1]^2 \f$ of a point in cell c
    Point local(size_type c, const Point& x) const
    {
      const Point center = cellCenter(c);
      return Point({2.0*(x[0] - center[0])/hx(), 2.0*(x[1] - center[1])/hy()});
    }

    //! the point of cell c at reference coordinates xi
    Point global(size_type c, const Point& xi) const
    {
      const Point center = cellCenter(c);
      return Point({center[0] + 0.5*hx()*xi[0], center[1] + 0.5*hy()*xi[1]});
    }

  private:
    size_type nx_, ny_;
    double width_, height_;
  };

  /** @} end documentation */

} // end namespace Q1Tilde
} // end namespace Feat

#endif
