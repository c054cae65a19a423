#ifndef __INTERACTIONS_HPP__
#define __INTERACTIONS_HPP__

#include <stdio.h>
#include <cmath>
#include <string>
#include <algorithm>
#include <stdexcept>
#include <vector>
#include <fstream>
#include <sstream>

#include "elements.hpp"
#include "errors.hpp"

// Sparse user x item matrix kept in two views over the same entries:
// by_user sorted (user, item) with offsets uidx, by_item sorted (item, user)
// with offsets iidx. Only non-zero values are stored.
class InteractionMatrix {
  public:
    int                       n_users, n_items;
    std::vector<interaction>  by_user, by_item;
    std::vector<int>          uidx, iidx;

    InteractionMatrix() : n_users(0), n_items(0), uidx(1, 0), iidx(1, 0) {}

    static InteractionMatrix build(const std::vector<interaction>&, int, int);

    int nnz() const { return (int)by_user.size(); }

    int user_begin(int uid) const { return uidx[uid]; }
    int user_end(int uid) const { return uidx[uid+1]; }
    int item_begin(int iid) const { return iidx[iid]; }
    int item_end(int iid) const { return iidx[iid+1]; }

    double value(int, int) const;
    bool contains(int uid, int iid) const { return value(uid, iid) != 0.; }

    // same pattern, every stored value multiplied by s
    InteractionMatrix scaled(double s) const;
};

inline InteractionMatrix InteractionMatrix::build(const std::vector<interaction>& records, int nu, int ni) {

  if ((nu < 0) || (ni < 0)) {
    throw InvalidRecordError("negative matrix dimensions " + std::to_string(nu) + " x " + std::to_string(ni));
  }

  // validate everything before building anything
  for(size_t j=0; j<records.size(); ++j) {
    const interaction& r = records[j];
    if ((r.user_id < 0) || (r.user_id >= nu)) {
      throw InvalidRecordError("record " + std::to_string(j) + ": user id " + std::to_string(r.user_id) +
                               " outside [0, " + std::to_string(nu) + ")");
    }
    if ((r.item_id < 0) || (r.item_id >= ni)) {
      throw InvalidRecordError("record " + std::to_string(j) + ": item id " + std::to_string(r.item_id) +
                               " outside [0, " + std::to_string(ni) + ")");
    }
    if (!(r.signal >= 0.) || std::isinf(r.signal)) {
      throw InvalidRecordError("record " + std::to_string(j) + ": invalid signal " + std::to_string(r.signal));
    }
  }

  InteractionMatrix m;
  m.n_users = nu;
  m.n_items = ni;

  std::vector<interaction> sorted(records);
  std::sort(sorted.begin(), sorted.end(), interaction_userwise);

  // sum duplicates, drop cells that end up zero
  m.by_user.reserve(sorted.size());
  for(size_t j=0; j<sorted.size(); ) {
    interaction cell = sorted[j];
    size_t k = j+1;
    while((k < sorted.size()) && (sorted[k].user_id == cell.user_id) && (sorted[k].item_id == cell.item_id)) {
      cell.signal += sorted[k].signal;
      ++k;
    }
    if (cell.signal != 0.) m.by_user.push_back(cell);
    j = k;
  }

  m.by_item = m.by_user;
  std::sort(m.by_item.begin(), m.by_item.end(), interaction_itemwise);

  m.uidx.assign(nu+1, 0);
  m.iidx.assign(ni+1, 0);
  for(size_t j=0; j<m.by_user.size(); ++j) {
    ++m.uidx[m.by_user[j].user_id+1];
    ++m.iidx[m.by_user[j].item_id+1];
  }
  for(int uid=0; uid<nu; ++uid) m.uidx[uid+1] += m.uidx[uid];
  for(int iid=0; iid<ni; ++iid) m.iidx[iid+1] += m.iidx[iid];

  return m;
}

inline double InteractionMatrix::value(int uid, int iid) const {
  if ((uid < 0) || (uid >= n_users) || (iid < 0) || (iid >= n_items)) return 0.;

  std::vector<interaction>::const_iterator first = by_user.begin() + uidx[uid];
  std::vector<interaction>::const_iterator last  = by_user.begin() + uidx[uid+1];
  std::vector<interaction>::const_iterator it =
    std::lower_bound(first, last, interaction(uid, iid, 0.), interaction_userwise);

  if ((it != last) && (it->item_id == iid)) return it->signal;
  return 0.;
}

inline InteractionMatrix InteractionMatrix::scaled(double s) const {
  InteractionMatrix m(*this);
  for(size_t j=0; j<m.by_user.size(); ++j) m.by_user[j].signal *= s;
  for(size_t j=0; j<m.by_item.size(); ++j) m.by_item[j].signal *= s;
  return m;
}

// confidence weights on top of the implicit background of 1
inline InteractionMatrix confidence(const InteractionMatrix& m, double alpha) {
  if (!(alpha > 0.)) {
    throw std::invalid_argument("alpha must be positive, got " + std::to_string(alpha));
  }
  return m.scaled(alpha);
}

// whole-token conversions; trailing characters make the token invalid
inline bool parse_id(const std::string& tok, int& v) {
  try {
    size_t pos = 0;
    v = std::stoi(tok, &pos);
    return pos == tok.size();
  } catch (const std::logic_error&) {
    return false;
  }
}

inline bool parse_signal(const std::string& tok, double& v) {
  try {
    size_t pos = 0;
    v = std::stod(tok, &pos);
    return pos == tok.size();
  } catch (const std::logic_error&) {
    return false;
  }
}

// Reads "user item [signal]" lines (zero-based ids, signal defaults to 1).
// Malformed lines are reported and skipped. n_users / n_items are grown to
// cover every id seen.
inline bool read_interactions(const std::string& filename, std::vector<interaction>& records,
                              int& n_users, int& n_items) {

  std::ifstream f(filename);
  if (!f.is_open()) {
    fprintf(stderr, "Error in opening the interaction file %s!\n", filename.c_str());
    return false;
  }

  std::string line;
  int line_no = 0;
  while(std::getline(f, line)) {
    ++line_no;

    std::istringstream iss(line);
    std::vector<std::string> tokens;
    std::string tok;
    while(iss >> tok) tokens.push_back(tok);
    if (tokens.empty() || (tokens[0][0] == '#')) continue;

    int uid, iid;
    double sc = 1.;
    bool ok = (tokens.size() == 2) || (tokens.size() == 3);
    ok = ok && parse_id(tokens[0], uid) && parse_id(tokens[1], iid);
    if (ok && (tokens.size() == 3)) ok = parse_signal(tokens[2], sc);

    if (!ok) {
      fprintf(stderr, "%s:%d: skipping malformed line\n", filename.c_str(), line_no);
      continue;
    }

    records.push_back(interaction(uid, iid, sc));
    n_users = std::max(n_users, uid+1);
    n_items = std::max(n_items, iid+1);
  }

  f.close();
  return true;
}

#endif
