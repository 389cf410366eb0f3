// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#include <config.h>

#include <feat/featexception.hh>
#include <feat/systemmatrix.hh>

namespace Feat {

  SystemMatrix::SystemMatrix(const BlockStructure& structure)
    : structure_(structure)
  {}

  void SystemMatrix::release(size_type i, size_type j)
  {
    blocks_[i][j] = SparseMatrix();
    scale_[i][j] = 1.0;
  }

  SystemMatrix SystemMatrix::duplicate(DuplicationMode mode) const
  {
    SystemMatrix result(structure_);
    for (size_type i = 0; i < blocks; ++i)
      for (size_type j = 0; j < blocks; ++j) {
        if (active(i, j))
          result.blocks_[i][j] = blocks_[i][j].duplicate(mode);
        result.scale_[i][j] = scale_[i][j];
      }
    return result;
  }

  void SystemMatrix::mv(const SystemVector& x, SystemVector& y) const
  {
    y = 0.0;
    usmv(1.0, x, y);
  }

  void SystemMatrix::usmv(double alpha, const SystemVector& x, SystemVector& y) const
  {
    if (x.structure() != structure_ || y.structure() != structure_)
      DUNE_THROW(FeatError, "Block structure of vector and matrix do not match");
    for (size_type i = 0; i < blocks; ++i)
      for (size_type j = 0; j < blocks; ++j)
        if (active(i, j) && scale_[i][j] != 0.0)
          blocks_[i][j].usmv(alpha*scale_[i][j], x[j], y[i]);
  }

} // end namespace Feat
