#ifndef __QUERY_HPP__
#define __QUERY_HPP__

#include <cmath>
#include <algorithm>
#include <queue>
#include <vector>

#include "elements.hpp"
#include "errors.hpp"
#include "interactions.hpp"
#include "model.hpp"

typedef std::priority_queue<scored_item, std::vector<scored_item>, scored_worst_on_top> topk_queue;

// keeps the k best seen so far, worst on top
inline void topk_push(topk_queue& pq, int k, const scored_item& cand) {
  if (k <= 0) return;
  if ((int)pq.size() < k) {
    pq.push(cand);
  } else if (scored_better(cand, pq.top())) {
    pq.pop();
    pq.push(cand);
  }
}

inline std::vector<scored_item> topk_drain(topk_queue& pq) {
  std::vector<scored_item> ranked(pq.size());
  for(int j=(int)ranked.size()-1; j>=0; --j) {
    ranked[j] = pq.top();
    pq.pop();
  }
  return ranked;
}

inline double dot(const double *a, const double *b, int rank) {
  double p = 0.;
  for(int l=0; l<rank; ++l) p += a[l] * b[l];
  return p;
}

// Cosine neighbours of item iid over the item factors. The item itself is
// ranked first with score 1; zero-norm vectors score 0 against everything.
inline std::vector<scored_item> similar_items(const Model& model, int iid, int k) {

  if ((iid < 0) || (iid >= model.n_items)) throw UnknownItemError(iid);

  std::vector<scored_item> ranked;
  if (k <= 0) return ranked;

  const double *query_vec = model.item_vec(iid);
  double query_norm = std::sqrt(dot(query_vec, query_vec, model.rank));

  topk_queue pq;
  for(int j=0; j<model.n_items; ++j) {
    if (j == iid) continue;

    const double *item_vec = model.item_vec(j);
    double norm = std::sqrt(dot(item_vec, item_vec, model.rank));

    double score = 0.;
    if ((query_norm > 0.) && (norm > 0.)) score = dot(query_vec, item_vec, model.rank) / (query_norm * norm);

    topk_push(pq, k-1, scored_item(j, score));
  }

  ranked.push_back(scored_item(iid, 1.));
  std::vector<scored_item> rest = topk_drain(pq);
  ranked.insert(ranked.end(), rest.begin(), rest.end());

  return ranked;
}

// Items the user has not consumed, ranked by x_u.y_i.
inline std::vector<scored_item> recommend(const Model& model, const InteractionMatrix& user_items, int uid, int k) {

  if ((uid < 0) || (uid >= model.n_users)) throw UnknownUserError(uid);

  std::vector<scored_item> ranked;
  if (k <= 0) return ranked;

  // the user's row is sorted by item id, walk it alongside the item loop
  int j = 0, j_end = 0;
  if (uid < user_items.n_users) {
    j     = user_items.user_begin(uid);
    j_end = user_items.user_end(uid);
  }

  const double *user_vec = model.user_vec(uid);

  topk_queue pq;
  for(int iid=0; iid<model.n_items; ++iid) {
    while((j < j_end) && (user_items.by_user[j].item_id < iid)) ++j;
    if ((j < j_end) && (user_items.by_user[j].item_id == iid)) continue;

    topk_push(pq, k, scored_item(iid, dot(user_vec, model.item_vec(iid), model.rank)));
  }

  return topk_drain(pq);
}

#endif
