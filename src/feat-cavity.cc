// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:

#include <config.h>

#include <fenv.h>

#include <algorithm>
#include <iomanip>
#include <iostream>

#include <dune/common/exceptions.hh>
#include <dune/common/parametertree.hh>
#include <dune/common/parametertreeparser.hh>
#include <dune/common/timer.hh>

#include <feat/featexception.hh>
#include <feat/filters.hh>
#include <feat/nonlinearcore.hh>
#include <feat/q1tilde/cavityproblem.hh>

Dune::ParameterTree config;

void printHelp(){
  std::cout << "feat-cavity" << std::endl
            << "Solves the stationary driven cavity problem with the" << std::endl
            << "nonlinear defect correction and a multilevel preconditioner." << std::endl
            << "Parameters are read in a ParameterTree from cavity.ini" << std::endl
            << "but can also be passed in by command line arguments," << std::endl
            << "e.g. -CC-DISCRETISATION.RE 100." << std::endl
            << std::endl
            << std::setw(20) << std::left
            << "-ini"
            << "Filename of the ini-file (default: cavity.ini)" << std::endl
            << std::setw(20) << std::left
            << "-verbose"
            << "Verbosity (default: 1)" << std::endl
            << std::setw(20) << std::left
            << "-equation"
            << "0 Navier-Stokes, 1 Stokes (default: 0)" << std::endl
            << std::setw(20) << std::left
            << "-FP_EXCEPT"
            << "Enables floating point exceptions (default: 0)" << std::endl
            << std::endl
            << "The sections CC-DISCRETISATION, CC-PROLREST, CC2D-NONLINEAR, CAVITY" << std::endl
            << "and the linear solver section named by CC2D-NONLINEAR.slinearSolver" << std::endl
            << "configure the solver." << std::endl;
}

int main(int argc, char** argv) try {
  if(argc > 1 && argv[1][0]=='-' && argv[1][1] == 'h'){
    printHelp();
    return 0;
  }

  Dune::ParameterTreeParser::readOptions(argc, argv, config);
  Dune::ParameterTreeParser::readINITree(config.get("ini","cavity.ini"), config, false);

  if(config.get("FP_EXCEPT", false))
     feenableexcept(FE_DIVBYZERO | FE_INVALID | FE_OVERFLOW);

  int verbose = config.get("verbose", 1);

  if(verbose)
    std::cout << "Setting up levels... " << std::flush;
  Dune::Timer t;

  Feat::Q1Tilde::CavityProblem problem(config);
  Feat::SystemVector x = problem.initialSolution();
  const Feat::SystemVector b = problem.rightHandSide();

  Feat::NonlinearIterationController controller(problem, x, b, config);

  if(verbose){
    std::cout << t.elapsed() << " s" << std::endl;
    const Feat::Q1Tilde::RectangleGrid& grid = problem.grid(problem.maxLevel());
    std::cout << "Levels " << problem.minLevel() << " to " << problem.maxLevel()
              << ", finest grid " << grid.nx() << " x " << grid.ny()
              << ", " << x.N() << " unknowns" << std::endl;
  }

  // the convective term is switched off for the Stokes equation
  const int equation = config.get("equation", 0);
  if(equation != 0 && equation != 1)
    DUNE_THROW(Feat::ConfigurationError, "unknown equation " << equation);
  controller.setupCoreEquation(0.0, 1.0, equation == 0 ? 1.0 : 0.0);

  if(verbose)
    std::cout << "Solving system..." << std::endl;
  const Feat::NonlinearSolverResult result = controller.solve();

  if(verbose > 0){
    std::cout << "Nonlinear solver " << result.state << " after " << result.iterations
              << " iterations, " << result.elapsed << " s" << std::endl
              << "Rate of convergence: " << result.conv_rate << std::endl
              << "Final defect: " << result.finalDefect << std::endl;

    Feat::PressureMeanFilter().subtractMean(x[2]);
    std::cout << "max |u| = " << std::max(x[0].infinity_norm(), x[1].infinity_norm())
              << ", max |p - mean p| = " << x[2].infinity_norm() << std::endl;
  }

  return result.converged ? 0 : 1;
}
catch (Dune::Exception& e) {
  std::cerr << "Dune reported error: " << e << std::endl;
  return 1;
}
