// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#ifndef FEAT_COREEQUATION_HH
#define FEAT_COREEQUATION_HH

#include <vector>

#include <dune/common/parametertree.hh>

#include <feat/featexception.hh>

namespace Feat {

  /**
              @addtogroup FeatCore
              @{
   */

  /**
   * \brief Weights of the terms of the core equation.
   *
   * \f[ \alpha M u + \theta L u + \gamma N(u) u + B p = f, \quad B^T u = g \f]
   *
   * Stationary Stokes is (0,1,0), stationary Navier-Stokes (0,1,1).
   */
  struct CoreEquationParameters
  {
    double alpha = 0.0;
    double theta = 1.0;
    double gamma = 0.0;
  };

  //! Stabilization of the convective term, numbered as in the parameter files.
  enum class StabilizationMode {
    streamlineDiffusion = 0,
    upwind = 1,
    jumpStabilization = 2
  };

  //! One term of the convection operator that is assembled by the discretization.
  struct ConvectionTerm
  {
    enum Kind {
      streamlineDiffusion, //!< Galerkin convection plus streamline diffusion
      upwind,              //!< upwind convection
      edgeJump             //!< edge oriented gradient jump penalty
    };

    Kind kind;

    //! dupsam for streamline diffusion and upwind, penalty factor for jumps
    double parameter;

    //! weight of the term in the operator
    double weight;
  };

  /**
   * \brief Convection stabilization selected by the mode number.
   *
   * Only the three modes of StabilizationMode exist. Any other number is
   * rejected in the constructor.
   */
  class Stabilization
  {
  public:
    Stabilization(int mode, double upsam)
      : upsam_(upsam)
    {
      switch (mode) {
      case 0 : mode_ = StabilizationMode::streamlineDiffusion; break;
      case 1 : mode_ = StabilizationMode::upwind; break;
      case 2 : mode_ = StabilizationMode::jumpStabilization; break;
      default :
        DUNE_THROW(ConfigurationError, "Unsupported stabilization " << mode);
      }
    }

    //! read iUpwind and dUpsam from the discretization section
    explicit Stabilization(const Dune::ParameterTree& discretization)
      : Stabilization(discretization.get("iUpwind", 0), discretization.get("dUpsam", 0.0))
    {}

    StabilizationMode mode() const { return mode_; }
    double upsam() const { return upsam_; }

    /**
     * \brief The terms that form gamma times the stabilized convection.
     *
     * Jump stabilization is combined with central streamline diffusion
     * (dupsam = 0). It stays active if gamma vanishes and is then weighted
     * by one.
     */
    std::vector<ConvectionTerm> terms(double gamma) const
    {
      std::vector<ConvectionTerm> result;
      if (gamma != 0.0) {
        switch (mode_) {
        case StabilizationMode::streamlineDiffusion :
          result.push_back({ConvectionTerm::streamlineDiffusion, upsam_, gamma});
          break;
        case StabilizationMode::upwind :
          result.push_back({ConvectionTerm::upwind, upsam_, gamma});
          break;
        case StabilizationMode::jumpStabilization :
          result.push_back({ConvectionTerm::streamlineDiffusion, 0.0, gamma});
          result.push_back({ConvectionTerm::edgeJump, upsam_, gamma});
          break;
        }
      }
      else if (mode_ == StabilizationMode::jumpStabilization)
        result.push_back({ConvectionTerm::edgeJump, upsam_, 1.0});
      return result;
    }

  private:
    StabilizationMode mode_;
    double upsam_;
  };

  /** @} end documentation */

} // end namespace

#endif
