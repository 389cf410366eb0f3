// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#ifndef FEAT_DAMPINGSEARCH_HH
#define FEAT_DAMPINGSEARCH_HH

#include <feat/assembledsystem.hh>
#include <feat/filters.hh>
#include <feat/linearization.hh>
#include <feat/systemvector.hh>

namespace Feat {

  /**
              @addtogroup FeatCore
              @{
   */

  /**
   * \brief Optimal damping parameter of the defect correction.
   *
   * Minimizes the defect along the preconditioned direction d in the
   * sense of
   * \f[ \omega = \frac{(T(\tilde x) d, f - T(\tilde x) x)}{(T(\tilde x) d, T(\tilde x) d)}, \f]
   * with \f$ \tilde x = x + \omega_{old} d \f$, and restricts the result
   * to \f$ [\omega_{min}, \omega_{max}] \f$. Both defects are filtered
   * with the defect filter of the finest level, which is the filter
   * chain of the preconditioner.
   */
  class DampingLineSearch
  {
  public:
    DampingLineSearch(AssembledSystem& system, MatrixAssembler& assembler, const Filter& filter,
                      double omegaMin, double omegaMax)
      : system_(system), assembler_(assembler), filter_(filter),
        omegaMin_(omegaMin), omegaMax_(omegaMax)
    {}

    //! whether the search is switched off by omegaMin >= omegaMax
    bool disabled() const { return omegaMin_ >= omegaMax_; }

    /**
     * \brief Compute the damping parameter.
     *
     * \param x current iterate
     * \param b right hand side
     * \param d preconditioned defect
     * \param omegaOld damping parameter of the last step
     * \param temp1 scratch vector on the finest level
     * \param temp2 scratch vector on the finest level
     *
     * \throws NumericalDegeneracy if \f$ T d \f$ vanishes
     */
    double compute(const SystemVector& x, const SystemVector& b, const SystemVector& d,
                   double omegaOld, SystemVector& temp1, SystemVector& temp2) const;

  private:
    AssembledSystem& system_;
    MatrixAssembler& assembler_;
    const Filter& filter_;
    double omegaMin_;
    double omegaMax_;
  };

  /** @} end documentation */

} // end namespace

#endif
