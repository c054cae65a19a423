#ifndef __MODEL_HPP__
#define __MODEL_HPP__

#include <stdint.h>
#include <fstream>
#include <string>
#include <vector>

class Model {
  public:
    int n_users, n_items;           // number of users/items the factors were trained for
    int rank;                       // number of latent factors
    std::vector<double> U, V;       // row-major user factors (n_users x rank), item factors (n_items x rank)

    void allocate(int nu, int ni);

    Model(int r): n_users(0), n_items(0), rank(r) {}
    Model(int nu, int ni, int r): rank(r) { allocate(nu, ni); }

    double*       user_vec(int uid)       { return &U[(size_t)uid * rank]; }
    const double* user_vec(int uid) const { return &U[(size_t)uid * rank]; }
    double*       item_vec(int iid)       { return &V[(size_t)iid * rank]; }
    const double* item_vec(int iid) const { return &V[(size_t)iid * rank]; }

    double Unormsq() const;
    double Vnormsq() const;

    bool readFile(const std::string &file);
    bool writeFile(const std::string &file) const;
};

inline double Model::Unormsq() const {
  double p = 0.;
  for(size_t i=0; i<U.size(); ++i) p += U[i]*U[i];
  return p;
}

inline double Model::Vnormsq() const {
  double p = 0.;
  for(size_t i=0; i<V.size(); ++i) p += V[i]*V[i];
  return p;
}

inline void Model::allocate(int nu, int ni) {
  U.assign((size_t)nu * rank, 0.);
  V.assign((size_t)ni * rank, 0.);

  n_users = nu;
  n_items = ni;
}

// layout: int32 n_users, int32 n_items, int32 rank, then U and V row-major
inline bool Model::readFile(const std::string &file) {
  std::ifstream f;
  f.open(file, std::ios::in | std::ios::binary);
  if (!f.is_open()) return false;

  int32_t dims[3];
  f.read(reinterpret_cast<char *>(dims), sizeof(dims));
  if (!f || (dims[0] < 0) || (dims[1] < 0) || (dims[2] <= 0)) return false;

  // the current factors stay untouched unless the whole file reads
  std::vector<double> u((size_t)dims[0] * dims[2]), v((size_t)dims[1] * dims[2]);
  f.read(reinterpret_cast<char *>(u.data()), u.size()*sizeof(double));
  f.read(reinterpret_cast<char *>(v.data()), v.size()*sizeof(double));
  if (!f) return false;
  f.close();

  n_users = dims[0];
  n_items = dims[1];
  rank = dims[2];
  U.swap(u);
  V.swap(v);

  return true;
}

inline bool Model::writeFile(const std::string &file) const {
  std::ofstream f;
  f.open(file, std::ios::out | std::ios::binary);
  if (!f.is_open()) return false;

  int32_t dims[3] = { n_users, n_items, rank };
  f.write(reinterpret_cast<const char *>(dims), sizeof(dims));
  f.write(reinterpret_cast<const char *>(U.data()), U.size()*sizeof(double));
  f.write(reinterpret_cast<const char *>(V.data()), V.size()*sizeof(double));
  f.close();

  return !f.fail();
}

#endif
