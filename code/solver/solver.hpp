#ifndef __SOLVER_HPP__
#define __SOLVER_HPP__

#include <stdlib.h>
#include <math.h>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include "../problem.hpp"
#include "../model.hpp"
#include "../evaluator.hpp"

class Solver {

protected:
  int             n_users, n_items, n_interactions;

  int             max_iter;
  int             n_threads;
  unsigned int    seed;

  std::vector<double> trace;      // objective after each half-step

  void check(const Problem&, const Model&) const;
  void initialize(Model&);

public:
  bool            verbose;                // per-iteration progress lines on stdout
  bool            evaluate_every_iter;    // compute the objective (and run the evaluator) every iteration

  Solver() : n_users(0), n_items(0), n_interactions(0), max_iter(20), n_threads(1), seed(0),
             verbose(true), evaluate_every_iter(true) {}
  Solver(int m_it, int n_th, unsigned int sd) : n_users(0), n_items(0), n_interactions(0),
                                                max_iter(m_it), n_threads(n_th), seed(sd),
                                                verbose(true), evaluate_every_iter(true) {}
  virtual ~Solver() {}

  virtual void solve(Problem&, Model&, Evaluator* eval) = 0;

  const std::vector<double>& objective_trace() const { return trace; }
};

inline void Solver::check(const Problem& prob, const Model& model) const {
  if (model.rank <= 0)
    throw std::invalid_argument("number of factors must be positive, got " + std::to_string(model.rank));
  if (max_iter < 0)
    throw std::invalid_argument("number of iterations must be non-negative, got " + std::to_string(max_iter));
  if (n_threads <= 0)
    throw std::invalid_argument("number of threads must be positive, got " + std::to_string(n_threads));
  if (!(prob.lambda >= 0.))
    throw std::invalid_argument("lambda must be non-negative, got " + std::to_string(prob.lambda));
}

// the seed is the only source of randomness, so a run is reproducible
inline void Solver::initialize(Model& model) {

  model.allocate(n_users, n_items);

  std::mt19937 gen(seed);
  std::uniform_real_distribution<double> unif(0., 1.);
  double scale = 1. / sqrt((double)model.rank);

  for(size_t i=0; i<model.U.size(); i++) model.U[i] = unif(gen) * scale;
  for(size_t i=0; i<model.V.size(); i++) model.V[i] = unif(gen) * scale;
}

#endif
