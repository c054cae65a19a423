#ifndef __ALS_HPP__
#define __ALS_HPP__

#include <omp.h>
#include <stdio.h>
#include <string>
#include <vector>

#include <Eigen/Dense>
#include <Eigen/Core>

#include "../elements.hpp"
#include "../errors.hpp"
#include "../interactions.hpp"
#include "../model.hpp"
#include "../problem.hpp"
#include "../evaluator.hpp"
#include "solver.hpp"

// Alternating least squares for implicit feedback (Hu, Koren, Volinsky).
// Each half-step solves, for every row r of the updated side,
//   (F^T F + sum_{j in obs(r)} c_rj f_j f_j^T + lambda I) w_r = sum_{j in obs(r)} (1 + c_rj) f_j
// where F is the fixed side and c_rj the stored confidence. F^T F covers the
// unit-confidence background and is computed once per half-step.
class SolverALS : public Solver {
  protected:
    // returns the first row whose system could not be factored, -1 if none
    int least_squares(const std::vector<interaction>&, const std::vector<int>&, bool,
                      int, double*, const double*, int, int, double);

  public:
    SolverALS() : Solver() {}
    SolverALS(int m_it, int n_th, unsigned int sd = 0) : Solver(m_it, n_th, sd) {}
    void solve(Problem&, Model&, Evaluator*);
};

inline int SolverALS::least_squares(const std::vector<interaction>& entries, const std::vector<int>& idx,
                                    bool rows_are_users, int n_rows, double *target,
                                    const double *fixed, int n_fixed, int rank, double lambda) {

  Eigen::Map<const FactorMatrix> F(fixed, n_fixed, rank);
  Eigen::MatrixXd G = F.transpose() * F;
  G.diagonal().array() += lambda;

  int failed_row = -1;

  #pragma omp parallel num_threads(n_threads)
  {
    Eigen::MatrixXd A(rank, rank);
    Eigen::VectorXd b(rank);
    Eigen::LLT<Eigen::MatrixXd, Eigen::Lower> llt(rank);

    #pragma omp for schedule(dynamic, 64)
    for(int r=0; r<n_rows; ++r) {
      A = G;
      b.setZero();

      for(int j=idx[r]; j<idx[r+1]; ++j) {
        int other = rows_are_users ? entries[j].item_id : entries[j].user_id;
        double c  = entries[j].signal;
        Eigen::Map<const Eigen::VectorXd> f(fixed + (size_t)other * rank, rank);

        A.selfadjointView<Eigen::Lower>().rankUpdate(f, c);
        b += (1. + c) * f;
      }

      Eigen::Map<Eigen::VectorXd> w(target + (size_t)r * rank, rank);

      llt.compute(A);
      bool ok = (llt.info() == Eigen::Success);
      if (ok) {
        w = llt.solve(b);
        ok = w.allFinite();
      }

      if (!ok) {
        w.setZero();
        #pragma omp critical
        {
          if ((failed_row < 0) || (r < failed_row)) failed_row = r;
        }
      }
    }
  }

  return failed_row;
}

inline void SolverALS::solve(Problem& prob, Model& model, Evaluator* eval) {

  check(prob, model);

  double lambda = prob.lambda;
  int rank = model.rank;

  n_users = prob.n_users;
  n_items = prob.n_items;
  n_interactions = prob.n_interactions;

  Eigen::setNbThreads(1);
  trace.clear();

  double time = omp_get_wtime();
  initialize(model);
  time = omp_get_wtime() - time;

  if (verbose) printf("0, %f", time);
  if (evaluate_every_iter) {
    double f = prob.evaluate(model);
    trace.push_back(f);
    if (verbose) printf(", %f, ", f);
    if (eval) {
      eval->evaluate(model);
      eval->evaluateAUC(model);
    }
  }
  if (verbose) printf("\n");

  const InteractionMatrix& C = prob.conf;

  for(int iter=1; iter<=max_iter; ++iter) {

    double time_single_iter = omp_get_wtime();

    ///////////////////////////
    // Learning U
    ///////////////////////////

    int bad = least_squares(C.by_user, C.uidx, true, n_users, model.U.data(),
                            model.V.data(), n_items, rank, lambda);
    if (bad >= 0) {
      throw SingularSystemError("iteration " + std::to_string(iter) + ": linear system for user " +
                                std::to_string(bad) + " is singular (lambda = " + std::to_string(lambda) + ")");
    }
    if (evaluate_every_iter) trace.push_back(prob.evaluate(model));

    ///////////////////////////
    // Learning V
    ///////////////////////////

    bad = least_squares(C.by_item, C.iidx, false, n_items, model.V.data(),
                        model.U.data(), n_users, rank, lambda);
    if (bad >= 0) {
      throw SingularSystemError("iteration " + std::to_string(iter) + ": linear system for item " +
                                std::to_string(bad) + " is singular (lambda = " + std::to_string(lambda) + ")");
    }

    time = time + (omp_get_wtime() - time_single_iter);

    if (verbose) printf("%d, %f", iter, time);
    if (evaluate_every_iter) {
      double f = prob.evaluate(model);
      trace.push_back(f);
      if (verbose) printf(", %f, ", f);
      if (eval) {
        eval->evaluate(model);
        eval->evaluateAUC(model);
      }
    }
    if (verbose) printf("\n");
  }
}

// Builds the interaction matrix, applies the confidence scaling and runs
// `iterations` rounds of ALS. Invalid input throws before any training.
inline Model train(const std::vector<interaction>& interactions, int n_users, int n_items,
                   int factors, double lambda, int iterations, double alpha,
                   unsigned int seed = 0, int n_threads = 1) {

  Problem prob(lambda, alpha);
  prob.set_data(interactions, n_users, n_items);

  Model model(factors);

  SolverALS solver(iterations, n_threads, seed);
  solver.verbose = false;
  solver.evaluate_every_iter = false;
  solver.solve(prob, model, NULL);

  return model;
}

#endif
