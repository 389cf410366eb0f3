// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#include <config.h>

#include <dune/common/stdstreams.hh>

#include <feat/finalassembly.hh>

namespace Feat {

  void FinalAssemblyAdapter::finalize(Level& level) const
  {
    if (!info_.transposeB)
      return;

    SystemMatrix& S = level.systemMatrix;
    S.release(2, 0);
    S.release(2, 1);
    S(2, 0) = level.b1.transposed(TransposeMode::all);
    S(2, 1) = level.b2.transposed(TransposeMode::all);
    // B1 and B2 have the same sparsity
    S(2, 1).shareStructureOf(S(2, 0));

    Dune::dverb << "Level " << level.index << ": B matrices physically transposed" << std::endl;
  }

  void FinalAssemblyAdapter::unfinalize(Level& level, bool restoreData) const
  {
    if (!info_.transposeB)
      return;

    SystemMatrix& S = level.systemMatrix;
    if (S.active(2, 0) && S(2, 0).isVirtuallyTransposed())
      return;

    const DuplicationMode mode = restoreData ? DuplicationMode::share : DuplicationMode::shareStructure;
    S.release(2, 0);
    S.release(2, 1);
    S(2, 0) = level.b1.transposedView(mode);
    S(2, 1) = level.b2.transposedView(mode);
  }

  void FinalAssemblyAdapter::finalize(AssembledSystem& system) const
  {
    for (int l = system.minLevel(); l <= system.maxLevel(); ++l)
      finalize(system.level(l));
  }

  void FinalAssemblyAdapter::unfinalize(AssembledSystem& system, bool restoreData) const
  {
    for (int l = system.minLevel(); l <= system.maxLevel(); ++l)
      unfinalize(system.level(l), restoreData);
  }

} // end namespace Feat
