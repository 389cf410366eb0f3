// SPDX-FileCopyrightText: Copyright © DUNE Project contributors, see file LICENSE.md in module root
// SPDX-License-Identifier: LicenseRef-GPL-2.0-only-with-DUNE-exception
// -*- tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 2 -*-
// vi: set et ts=4 sw=2 sts=2:
#ifndef FEAT_UMFPACK_HH
#define FEAT_UMFPACK_HH

#if HAVE_SUITESPARSE_UMFPACK || defined DOXYGEN

#include <iostream>
#include <vector>

#include <umfpack.h>

#include <dune/common/exceptions.hh>
#include <dune/istl/umfpack.hh>

#include <feat/featexception.hh>
#include <feat/sparsematrix.hh>

namespace Feat {
  /**
   * @addtogroup FeatCore
   *
   * @{
   */
  /**
   * @file
   * @brief Direct solver wrapper for UMFPack with separate symbolic and numeric factorization.
   */

  /** @brief Use the %UMFPack package to directly solve linear systems
   *
   * The calls into UMFPack go through Dune::UMFPackMethodChooser.
   *
   * The factorization is split in a symbolic step, that only depends on
   * the sparsity pattern, and a numeric step. The symbolic factorization
   * is kept until the pattern changes, so a sequence of matrices with
   * equal structure costs one analysis only.
   *
   * The compressed row arrays of the matrix are the compressed column
   * arrays of its transpose, so all UMFPack calls work on \f$A^T\f$ and
   * the solve uses UMFPACK_At.
   */
  class UMFPack
  {
    using Caller = Dune::UMFPackMethodChooser<double>;

  public:
    /** @brief Construct a solver without matrix
     *
     *  @param verbose [0..2] set the verbosity level, defaults to 0
     */
    explicit UMFPack(int verbose = 0)
    {
      Caller::defaults(UMF_Control);
      setVerbosity(verbose);
    }

    UMFPack(const UMFPack&) = delete;
    UMFPack& operator=(const UMFPack&) = delete;

    virtual ~UMFPack()
    {
      free();
    }

    /** @brief sets the verbosity level for the UMFPack solver
     * @param v verbosity level
     * The following levels are implemented:
     * 0 - only error messages
     * 1 - a bit of statistics on decomposition and solution
     * 2 - lots of statistics on decomposition and solution
     */
    void setVerbosity(int v)
    {
      verbosity_ = v;
      // set the verbosity level in UMFPack
      if (verbosity_ == 0)
        UMF_Control[UMFPACK_PRL] = 1;
      if (verbosity_ == 1)
        UMF_Control[UMFPACK_PRL] = 2;
      if (verbosity_ == 2)
        UMF_Control[UMFPACK_PRL] = 4;
    }

    //! whether the pattern of A is the analysed one
    bool matchesPattern(const SparseMatrix& A) const
    {
      return UMF_Symbolic && !pattern_.empty() && pattern_.hasStructureOf(A);
    }

    /** @brief Analyse the sparsity pattern of A
     *
     * Any previous factorization is discarded.
     */
    void factorizeSymbolic(const SparseMatrix& A)
    {
      if (A.isVirtuallyTransposed() || A.N() != A.M())
        DUNE_THROW(SolverFactorizationFailure, "UMFPack needs a square matrix in row storage");
      free();

      pattern_ = A.duplicate(DuplicationMode::share);
      n_ = static_cast<long int>(A.N());
      rowStart_.assign(1, 0);
      columns_.clear();
      columns_.reserve(A.nonzeroes());
      for (auto row = A.stored().begin(); row != A.stored().end(); ++row) {
        for (auto col = row->begin(); col != row->end(); ++col)
          columns_.push_back(static_cast<long int>(col.index()));
        rowStart_.push_back(static_cast<long int>(columns_.size()));
      }
      copyValues(A);

      double UMF_Decomposition_Info[UMFPACK_INFO];
      Caller::symbolic(n_, n_, rowStart_.data(), columns_.data(), values_.data(),
                       &UMF_Symbolic, UMF_Control, UMF_Decomposition_Info);
      const int status = static_cast<int>(UMF_Decomposition_Info[UMFPACK_STATUS]);
      if (status != UMFPACK_OK) {
        Caller::report_status(UMF_Control, status);
        UMF_Symbolic = nullptr;
        DUNE_THROW(SolverFactorizationFailure, "UMFPack symbolic factorization failed with status " << status);
      }
      ++symbolicCount_;
    }

    /** @brief Numeric factorization of A
     *
     * A must have the pattern given to factorizeSymbolic(). A singular
     * matrix is reported as failure.
     */
    void factorizeNumeric(const SparseMatrix& A)
    {
      if (!matchesPattern(A))
        DUNE_THROW(SolverFactorizationFailure, "Numeric factorization without matching symbolic factorization");
      if (UMF_Numeric) {
        Caller::free_numeric(&UMF_Numeric);
        UMF_Numeric = nullptr;
      }
      copyValues(A);

      double UMF_Decomposition_Info[UMFPACK_INFO];
      Caller::numeric(rowStart_.data(), columns_.data(), values_.data(),
                      UMF_Symbolic, &UMF_Numeric, UMF_Control, UMF_Decomposition_Info);
      const int status = static_cast<int>(UMF_Decomposition_Info[UMFPACK_STATUS]);
      Caller::report_status(UMF_Control, status);
      if (verbosity_ == 1)
      {
        std::cout << "[UMFPack Decomposition]" << std::endl;
        std::cout << "Wallclock Time taken: " << UMF_Decomposition_Info[UMFPACK_NUMERIC_WALLTIME] << " (CPU Time: " << UMF_Decomposition_Info[UMFPACK_NUMERIC_TIME] << ")" << std::endl;
        std::cout << "Condition number estimate: " << 1./UMF_Decomposition_Info[UMFPACK_RCOND] << std::endl;
      }
      if (verbosity_ == 2)
        Caller::report_info(UMF_Control, UMF_Decomposition_Info);

      if (status != UMFPACK_OK) {
        if (UMF_Numeric)
          Caller::free_numeric(&UMF_Numeric);
        UMF_Numeric = nullptr;
        DUNE_THROW(SolverFactorizationFailure, "UMFPack numeric factorization failed with status " << status);
      }
      ++numericCount_;
    }

    //! solve A x = b with the current numeric factorization
    void apply(ScalarVector& x, const ScalarVector& b)
    {
      if (!UMF_Numeric)
        DUNE_THROW(Dune::InvalidStateException, "UMFPack applied without numeric factorization");
      if (x.size() != static_cast<std::size_t>(n_) || b.size() != static_cast<std::size_t>(n_))
        DUNE_THROW(FeatError, "Size mismatch in UMFPack::apply");

      double UMF_Apply_Info[UMFPACK_INFO];
      Caller::solve(UMFPACK_At, rowStart_.data(), columns_.data(), values_.data(),
                    &x[0], &b[0], UMF_Numeric, UMF_Control, UMF_Apply_Info);
      const int status = static_cast<int>(UMF_Apply_Info[UMFPACK_STATUS]);
      Caller::report_status(UMF_Control, status);
      if (status != UMFPACK_OK)
        DUNE_THROW(SolverFactorizationFailure, "UMFPack solve failed with status " << status);
      if (verbosity_ > 0)
      {
        std::cout << "[UMFPack Solve]" << std::endl;
        std::cout << "Wallclock Time: " << UMF_Apply_Info[UMFPACK_SOLVE_WALLTIME] << " (CPU Time: " << UMF_Apply_Info[UMFPACK_SOLVE_TIME] << ")" << std::endl;
      }
    }

    //! free both factorizations
    void free()
    {
      if (UMF_Numeric)
        Caller::free_numeric(&UMF_Numeric);
      if (UMF_Symbolic)
        Caller::free_symbolic(&UMF_Symbolic);
      UMF_Numeric = nullptr;
      UMF_Symbolic = nullptr;
      pattern_ = SparseMatrix();
    }

    unsigned int symbolicFactorizations() const { return symbolicCount_; }
    unsigned int numericFactorizations() const { return numericCount_; }

  private:
    void copyValues(const SparseMatrix& A)
    {
      values_.clear();
      values_.reserve(A.nonzeroes());
      for (auto row = A.stored().begin(); row != A.stored().end(); ++row)
        for (auto col = row->begin(); col != row->end(); ++col)
          values_.push_back(*col);
    }

    int verbosity_ = 0;
    long int n_ = 0;
    //! shares the analysed matrix to recognize its structure
    SparseMatrix pattern_;
    std::vector<long int> rowStart_;
    std::vector<long int> columns_;
    std::vector<double> values_;
    void *UMF_Symbolic = nullptr;
    void *UMF_Numeric = nullptr;
    double UMF_Control[UMFPACK_CONTROL];
    unsigned int symbolicCount_ = 0;
    unsigned int numericCount_ = 0;
  };

  /** @} end documentation */

} // end namespace Feat

#endif // HAVE_SUITESPARSE_UMFPACK

#endif //FEAT_UMFPACK_HH
