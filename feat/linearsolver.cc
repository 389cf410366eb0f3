// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#include <config.h>

#include <feat/directsolver.hh>
#include <feat/featexception.hh>
#include <feat/linearsolver.hh>
#include <feat/multigrid.hh>

namespace Feat {

  std::unique_ptr<LinearSolverBackend> createLinearSolver(const Dune::ParameterTree& config)
  {
    const int type = config.get("isolverType", 0);
    switch (type) {
    case 0 :
      return std::make_unique<DirectSolver>(config.get("ioutputLevel", 0));
    case 1 :
      return std::make_unique<Multigrid>(Multigrid::Parameters(config));
    default :
      DUNE_THROW(ConfigurationError, "Unknown linear solver type " << type);
    }
  }

} // end namespace Feat
