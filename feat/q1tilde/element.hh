// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#ifndef FEAT_Q1TILDE_ELEMENT_HH
#define FEAT_Q1TILDE_ELEMENT_HH

#include <array>
#include <cmath>

#include <feat/q1tilde/rectanglegrid.hh>

namespace Feat {
namespace Q1Tilde {

  /**
              @addtogroup FeatCore
              @{
   */

  /**
   * \brief Rotated bilinear element with edge midpoint values.
   *
   * On the reference cell \f$ [-1,1]^2 \f$ the basis function of local
   * edge i is the function of \f$ span\{1, \xi, \eta, \xi^2-\eta^2\} \f$
   * that is one in the midpoint of edge i and zero in the other midpoints.
   */
  struct Element
  {
    enum { size = 4 };

    static std::array<double, 4> values(const Point& xi)
    {
      const double q = 0.25*(xi[0]*xi[0] - xi[1]*xi[1]);
      return {{0.25 - 0.5*xi[1] - q,
               0.25 + 0.5*xi[0] + q,
               0.25 + 0.5*xi[1] - q,
               0.25 - 0.5*xi[0] + q}};
    }

    //! gradients with respect to the reference coordinates
    static std::array<Point, 4> referenceGradients(const Point& xi)
    {
      const double gx = 0.5*xi[0], gy = 0.5*xi[1];
      return {{Point({-gx, -0.5 + gy}),
               Point({0.5 + gx, -gy}),
               Point({-gx, 0.5 + gy}),
               Point({-0.5 + gx, -gy})}};
    }

    //! gradients on a cell of size hx times hy
    static std::array<Point, 4> gradients(const Point& xi, double hx, double hy)
    {
      std::array<Point, 4> g = referenceGradients(xi);
      for (auto& gi : g) {
        gi[0] *= 2.0/hx;
        gi[1] *= 2.0/hy;
      }
      return g;
    }
  };

  //! Tensor Gauss rule with three points per direction on \f$ [-1,1]^2 \f$.
  struct GaussRule
  {
    enum { size = 9 };

    static std::array<Point, 9> points()
    {
      const double a = std::sqrt(0.6);
      const std::array<double, 3> p = {{-a, 0.0, a}};
      std::array<Point, 9> result;
      for (int j = 0; j < 3; ++j)
        for (int i = 0; i < 3; ++i)
          result[3*j + i] = Point({p[i], p[j]});
      return result;
    }

    static std::array<double, 9> weights()
    {
      const std::array<double, 3> w = {{5.0/9.0, 8.0/9.0, 5.0/9.0}};
      std::array<double, 9> result;
      for (int j = 0; j < 3; ++j)
        for (int i = 0; i < 3; ++i)
          result[3*j + i] = w[i]*w[j];
      return result;
    }
  };

  /** @} end documentation */

} // end namespace Q1Tilde
} // end namespace Feat

#endif
