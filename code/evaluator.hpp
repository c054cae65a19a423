#ifndef __EVALUATOR_HPP__
#define __EVALUATOR_HPP__

#include <stdio.h>
#include <utility>
#include <vector>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <string>
#include <unordered_set>

#include "elements.hpp"
#include "interactions.hpp"
#include "model.hpp"
#include "query.hpp"

class Evaluator {
  public:
    virtual ~Evaluator() {}
    virtual void evaluate(const Model&) {}
    virtual void evaluateAUC(const Model&) {}
    virtual bool load_file(const InteractionMatrix&, const std::string&, const std::vector<int>&) = 0;

    std::vector<int> k;
    int k_max;
    bool verbose;       // print the metrics after computing them

    Evaluator() : k_max(0), verbose(true) {}
};

// Held-out (user, item) pairs; measures how many of them show up in each
// user's top-k recommendations.
class EvaluatorBinary : public Evaluator {
  public:
    InteractionMatrix                     train;
    std::vector<std::unordered_set<int> > test;

    std::vector<double> precision;      // one per entry of k
    double              auc;

    EvaluatorBinary() : auc(0.) {}

    void set_data(const InteractionMatrix&, const std::vector<interaction>&, const std::vector<int>&);
    bool load_file(const InteractionMatrix&, const std::string&, const std::vector<int>&);
    void evaluate(const Model&);
    void evaluateAUC(const Model&);
};

inline void EvaluatorBinary::set_data(const InteractionMatrix& tr, const std::vector<interaction>& held_out,
                                      const std::vector<int>& ik) {
  train = tr;
  test.assign(tr.n_users, std::unordered_set<int>());
  for(size_t j=0; j<held_out.size(); ++j) {
    int uid = held_out[j].user_id, iid = held_out[j].item_id;
    // ids the model never saw cannot be ranked
    if ((uid < 0) || (uid >= tr.n_users) || (iid < 0) || (iid >= tr.n_items)) continue;
    test[uid].insert(iid);
  }

  k = ik;
  std::sort(k.begin(), k.end());
  k_max = k.empty() ? 0 : k[k.size()-1];
  precision.assign(k.size(), 0.);
}

inline bool EvaluatorBinary::load_file(const InteractionMatrix& tr, const std::string& test_repo,
                                       const std::vector<int>& ik) {
  std::vector<interaction> held_out;
  int nu = 0, ni = 0;
  if (!read_interactions(test_repo, held_out, nu, ni)) {
    fprintf(stderr, "Error in opening the testing repository!\n");
    return false;
  }
  set_data(tr, held_out, ik);
  return true;
}

inline void EvaluatorBinary::evaluate(const Model& model) {
  std::vector<long long> hits(k.size(), 0);
  int n_users = std::min(model.n_users, (int)test.size());

  #pragma omp parallel for schedule(dynamic, 16)
  for(int uid=0; uid<n_users; ++uid) {
    if (k_max <= 0) continue;
    std::vector<scored_item> ranked = recommend(model, train, uid, k_max);
    for(int pos=0; pos<(int)ranked.size(); ++pos) {
      if (test[uid].find(ranked[pos].item_id) == test[uid].end()) continue;
      for(int l=(int)k.size()-1; (l>=0) && (k[l]>pos); --l) {
        #pragma omp atomic
        ++hits[l];
      }
    }
  }

  for(size_t l=0; l<k.size(); ++l) {
    precision[l] = (n_users > 0) ? (double)hits[l] / (double)k[l] / (double)n_users : 0.;
    if (verbose) printf("K%d: %f ", k[l], precision[l]);
  }
}

inline void EvaluatorBinary::evaluateAUC(const Model& model) {
  double AUC = 0.;
  int n_users = std::min(model.n_users, (int)test.size());
  int num_users = 0;

  #pragma omp parallel for reduction(+ : AUC, num_users) schedule(dynamic, 16)
  for(int uid=0; uid<n_users; ++uid) {
    if (test[uid].empty()) continue;

    std::vector<scored_item> v = recommend(model, train, uid, model.n_items);
    // ascending score: every held-out item earns the negatives ranked below it
    std::reverse(v.begin(), v.end());

    long long testNum = 0, nonTestNum = 0, accNumer = 0;
    for(size_t idx=0; idx<v.size(); ++idx) {
      if (test[uid].find(v[idx].item_id) != test[uid].end()) {
        accNumer += nonTestNum;
        ++testNum;
      } else {
        ++nonTestNum;
      }
    }

    if ((testNum == 0) || (nonTestNum == 0)) continue;

    AUC += (double)accNumer / (double)testNum / (double)nonTestNum;
    ++num_users;
  }

  auc = (num_users > 0) ? AUC / num_users : 0.;
  if (verbose) printf("AUC: %f ", auc);
}

#endif
