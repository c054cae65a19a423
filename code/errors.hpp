#ifndef __ERRORS_HPP__
#define __ERRORS_HPP__

#include <stdexcept>
#include <string>

class InvalidRecordError : public std::runtime_error {
  public:
    explicit InvalidRecordError(const std::string& what) : std::runtime_error(what) {}
};

// raised only when lambda = 0 leaves a row system without a Cholesky factor
class SingularSystemError : public std::runtime_error {
  public:
    explicit SingularSystemError(const std::string& what) : std::runtime_error(what) {}
};

class UnknownUserError : public std::out_of_range {
  public:
    int user_id;
    explicit UnknownUserError(int uid)
      : std::out_of_range("unknown user id " + std::to_string(uid)), user_id(uid) {}
};

class UnknownItemError : public std::out_of_range {
  public:
    int item_id;
    explicit UnknownItemError(int iid)
      : std::out_of_range("unknown item id " + std::to_string(iid)), item_id(iid) {}
};

#endif
