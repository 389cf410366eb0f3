// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#ifndef FEAT_FINALASSEMBLY_HH
#define FEAT_FINALASSEMBLY_HH

#include <feat/assembledsystem.hh>
#include <feat/interleveltransfer.hh>

namespace Feat {

  /**
              @addtogroup FeatCore
              @{
   */

  //! Structural adjustments the linear solver asks for.
  struct FinalAssemblyInfo
  {
    //! B^T has to be stored physically transposed
    bool transposeB = false;
    AdaptiveMatrixMode adaptiveMatrixMode = AdaptiveMatrixMode::off;
    //! aspect ratio above which coarse rows are restricted
    double adaptiveThreshold = 20.0;
  };

  /**
   * \brief Switches the B^T blocks between virtual and physical transposition.
   *
   * finalize() replaces the views (3,1), (3,2) by physical transposes of
   * B1 and B2, where (3,2) shares the structure of (3,1). unfinalize()
   * restores the canonical views. Both are no-ops if no transposition
   * was requested.
   */
  class FinalAssemblyAdapter
  {
  public:
    explicit FinalAssemblyAdapter(const FinalAssemblyInfo& info)
      : info_(info)
    {}

    const FinalAssemblyInfo& info() const { return info_; }

    void finalize(Level& level) const;

    /**
     * \param level the level to restore
     * \param restoreData if false, the restored views get fresh data arrays
     *                    that the caller is going to overwrite
     */
    void unfinalize(Level& level, bool restoreData) const;

    //! finalize all levels
    void finalize(AssembledSystem& system) const;

    //! unfinalize all levels
    void unfinalize(AssembledSystem& system, bool restoreData) const;

  private:
    FinalAssemblyInfo info_;
  };

  /** @} end documentation */

} // end namespace

#endif
