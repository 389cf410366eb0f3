// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#ifndef FEAT_SYSTEMVECTOR_HH
#define FEAT_SYSTEMVECTOR_HH

#include <cmath>
#include <cstddef>

#include <dune/istl/bvector.hh>

#include <feat/sparsematrix.hh>

namespace Feat {

  /**
              @addtogroup FeatCore
              @{
   */

  //! Sizes of the three blocks (u1, u2, p) of a saddle point vector.
  struct BlockStructure
  {
    std::size_t velocity = 0;
    std::size_t pressure = 0;

    std::size_t size(std::size_t block) const { return block < 2 ? velocity : pressure; }
    std::size_t total() const { return 2*velocity + pressure; }

    bool operator==(const BlockStructure& o) const { return velocity == o.velocity && pressure == o.pressure; }
    bool operator!=(const BlockStructure& o) const { return !(*this == o); }
  };

  /**
   * \brief Block vector of a 2D saddle point problem.
   *
   * Block 0 and 1 hold the two velocity components, block 2 the pressure.
   * The blocks are stored in a Dune::BlockVector of scalar block
   * vectors, the vector space operations are those of ISTL.
   */
  class SystemVector
  {
  public:
    typedef Dune::BlockVector<ScalarVector> Storage;
    typedef Storage::size_type size_type;
    typedef double field_type;

    enum { blocks = 3 };

    SystemVector()
      : blocks_(blocks)
    {}

    explicit SystemVector(const BlockStructure& structure, double value = 0.0)
      : blocks_(blocks)
    {
      resize(structure, value);
    }

    void resize(const BlockStructure& structure, double value = 0.0)
    {
      structure_ = structure;
      for (size_type b = 0; b < blocks; ++b) {
        blocks_[b].resize(structure.size(b));
        blocks_[b] = value;
      }
    }

    const BlockStructure& structure() const { return structure_; }

    //! total number of equations
    size_type N() const { return structure_.total(); }

    ScalarVector& operator[](size_type b) { return blocks_[b]; }
    const ScalarVector& operator[](size_type b) const { return blocks_[b]; }

    SystemVector& operator=(double value)
    {
      blocks_ = value;
      return *this;
    }

    SystemVector& operator+=(const SystemVector& y)
    {
      blocks_ += y.blocks_;
      return *this;
    }

    SystemVector& operator-=(const SystemVector& y)
    {
      blocks_ -= y.blocks_;
      return *this;
    }

    SystemVector& operator*=(double alpha)
    {
      blocks_ *= alpha;
      return *this;
    }

    //! x += alpha y
    SystemVector& axpy(double alpha, const SystemVector& y)
    {
      blocks_.axpy(alpha, y.blocks_);
      return *this;
    }

    double dot(const SystemVector& y) const
    {
      return blocks_.dot(y.blocks_);
    }

    double two_norm() const
    {
      return blocks_.two_norm();
    }

    //! Euclidean norm of the velocity blocks together
    double velocity_two_norm() const
    {
      return std::sqrt(blocks_[0].two_norm2() + blocks_[1].two_norm2());
    }

  private:
    BlockStructure structure_;
    Storage blocks_;
  };

  /** @} end documentation */

} // end namespace

#endif
