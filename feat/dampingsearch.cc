// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#include <config.h>

#include <dune/common/exceptions.hh>
#include <dune/common/stdstreams.hh>

#include <feat/dampingsearch.hh>
#include <feat/featexception.hh>

namespace Feat {

  double DampingLineSearch::compute(const SystemVector& x, const SystemVector& b, const SystemVector& d,
                                    double omegaOld, SystemVector& temp1, SystemVector& temp2) const
  {
    if (disabled())
      return omegaMin_;

    const int top = system_.maxLevel();

    // linearize at x + omegaOld d, a linear problem keeps its matrix
    temp1 = x;
    temp1.axpy(omegaOld, d);
    if (assembler_.coreEquation().gamma != 0.0)
      assembler_.assemble(temp1, false, true, false);

    const SystemMatrix& A = system_.level(top).systemMatrix;

    // temp2 = b - T x
    temp2 = b;
    A.mmv(x, temp2);
    filter_.apply(temp2, FilterKind::defect);

    // temp1 = T d
    A.mv(d, temp1);
    filter_.apply(temp1, FilterKind::defect);

    const double denominator = temp1.dot(temp1);
    if (denominator < 1e-40)
      DUNE_THROW(NumericalDegeneracy, "Damping parameter undefined, (Td,Td) = " << denominator);

    const double omega = temp1.dot(temp2)/denominator;
    Dune::dverb << "Optimal damping parameter " << omega << std::endl;

    // a NaN fails both comparisons and ends up at omegaMax
    if (omega < omegaMin_)
      return omegaMin_;
    if (!(omega <= omegaMax_))
      return omegaMax_;
    return omega;
  }

} // end namespace Feat
