#ifndef __PROBLEM_HPP__
#define __PROBLEM_HPP__

#include <omp.h>
#include <stdio.h>
#include <string>
#include <stdexcept>
#include <vector>

#include <Eigen/Dense>

#include "elements.hpp"
#include "interactions.hpp"
#include "model.hpp"

typedef Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor> FactorMatrix;

class Problem {
  public:
    int n_users, n_items, n_interactions;
    double lambda;                  // regularization, also the guard against singular row systems
    double alpha;                   // confidence scaling

    InteractionMatrix   train;      // summed raw signals
    InteractionMatrix   conf;       // train scaled by alpha; C = 1 + conf

    Problem() : n_users(0), n_items(0), n_interactions(0), lambda(.1), alpha(40.) {}
    Problem(double l, double a) : n_users(0), n_items(0), n_interactions(0), lambda(l), alpha(a) {}

    void set_data(const std::vector<interaction>&, int, int);

    int get_nusers() const { return n_users; }
    int get_nitems() const { return n_items; }

    // sum_{u,i} C_ui (P_ui - x_u.y_i)^2 + lambda (|X|^2 + |Y|^2)
    double evaluate(const Model& model) const;
};

inline void Problem::set_data(const std::vector<interaction>& records, int nu, int ni) {
  if (!(lambda >= 0.)) {
    throw std::invalid_argument("lambda must be non-negative, got " + std::to_string(lambda));
  }

  train = InteractionMatrix::build(records, nu, ni);
  conf  = confidence(train, alpha);

  n_users = nu;
  n_items = ni;
  n_interactions = train.nnz();
}

inline double Problem::evaluate(const Model& model) const {

  int rank = model.rank;
  Eigen::Map<const FactorMatrix> X(model.U.data(), model.n_users, rank);
  Eigen::Map<const FactorMatrix> Y(model.V.data(), model.n_items, rank);

  // background: every cell with confidence 1 and preference 0
  Eigen::MatrixXd XtX = X.transpose() * X;
  Eigen::MatrixXd YtY = Y.transpose() * Y;
  double l = XtX.cwiseProduct(YtY).sum();

  // observed cells: replace s^2 by C (1 - s)^2
  double correction = 0.;
  #pragma omp parallel for reduction(+ : correction)
  for(int uid=0; uid<n_users; ++uid) {
    const double *user_vec = model.user_vec(uid);
    for(int j=conf.user_begin(uid); j<conf.user_end(uid); ++j) {
      const double *item_vec = model.item_vec(conf.by_user[j].item_id);
      double s = 0.;
      for(int k=0; k<rank; ++k) s += user_vec[k] * item_vec[k];
      double c = 1. + conf.by_user[j].signal;
      correction += c * (1. - s) * (1. - s) - s * s;
    }
  }

  return l + correction + lambda * (model.Unormsq() + model.Vnormsq());
}

#endif
