#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace fillcast {

// Base error for the engine.
class Error : public std::runtime_error {
public:
  explicit Error(std::string msg) : std::runtime_error(std::move(msg)) {}
};

// Caller programming error: a numeric input outside its domain
// (shrinkage with n = m = 0, negative iterations, rate outside [0,1], ...).
class InvalidParameter : public Error {
public:
  explicit InvalidParameter(std::string msg) : Error(std::move(msg)) {}
};

} // namespace fillcast
