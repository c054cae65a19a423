#ifndef __ELEMENTS_HPP__
#define __ELEMENTS_HPP__

// one observed (user, item) event with its raw signal
struct interaction {
  int     user_id, item_id;
  double  signal;

  interaction() : user_id(0), item_id(0), signal(0.) {}
  interaction(int uid, int iid, double s) : user_id(uid), item_id(iid), signal(s) {}
};

inline bool interaction_userwise(const interaction& a, const interaction& b) {
  if (a.user_id != b.user_id) return a.user_id < b.user_id;
  return a.item_id < b.item_id;
}

inline bool interaction_itemwise(const interaction& a, const interaction& b) {
  if (a.item_id != b.item_id) return a.item_id < b.item_id;
  return a.user_id < b.user_id;
}

// ranked query output
struct scored_item {
  int     item_id;
  double  score;

  scored_item() : item_id(-1), score(0.) {}
  scored_item(int iid, double s) : item_id(iid), score(s) {}
};

// higher score first, then lower id
inline bool scored_better(const scored_item& a, const scored_item& b) {
  if (a.score != b.score) return a.score > b.score;
  return a.item_id < b.item_id;
}

struct scored_worst_on_top {
  bool operator() (const scored_item& a, const scored_item& b) const {
    return scored_better(a, b);
  }
};

#endif
