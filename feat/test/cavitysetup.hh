// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#ifndef FEAT_TEST_CAVITYSETUP_HH
#define FEAT_TEST_CAVITYSETUP_HH

#include <string>

#include <dune/common/parametertree.hh>

/**
 * \brief Parameter tree of a small driven cavity.
 *
 * \param nlmin coarsest level
 * \param nlmax finest level
 * \param re Reynolds number
 * \param solverType 0 direct solver, 1 multigrid
 */
inline Dune::ParameterTree cavityConfig(int nlmin, int nlmax, double re, int solverType)
{
  Dune::ParameterTree config;

  config["CC-DISCRETISATION.NLMIN"] = std::to_string(nlmin);
  config["CC-DISCRETISATION.NLMAX"] = std::to_string(nlmax);
  config["CC-DISCRETISATION.RE"] = std::to_string(re);
  config["CC-DISCRETISATION.iUpwind"] = "0";
  config["CC-DISCRETISATION.dUpsam"] = "0.1";

  config["CAVITY.nx"] = "2";
  config["CAVITY.ny"] = "2";

  config["CC2D-NONLINEAR.itypePreconditioning"] = "1";
  config["CC2D-NONLINEAR.slinearSolver"] = "CC-LINEARSOLVER";
  config["CC2D-NONLINEAR.nminIterations"] = "1";
  config["CC2D-NONLINEAR.nmaxIterations"] = "20";
  config["CC2D-NONLINEAR.domegaMin"] = "1.0";
  config["CC2D-NONLINEAR.domegaMax"] = "1.0";

  config["CC-LINEARSOLVER.isolverType"] = std::to_string(solverType);
  config["CC-LINEARSOLVER.nmaxIterations"] = "50";
  config["CC-LINEARSOLVER.depsRel"] = "1e-10";
  config["CC-LINEARSOLVER.nsmoothingSteps"] = "4";

  return config;
}

#endif
