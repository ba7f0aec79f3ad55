// SPDX-License-Identifier: MIT

#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace pcgr {

// Bad bound passed to next_below / next_in_range.
class InvalidArgument : public std::out_of_range {
  std::string param_;
  int64_t value_;
public:
  InvalidArgument(std::string param, int64_t value, const std::string& what)
    : std::out_of_range(param + ": " + what), param_(std::move(param)), value_(value) {}
  const std::string& param() const { return param_; }
  int64_t value() const { return value_; }
};

// fill_bytes called without a buffer.
class NullBuffer : public std::invalid_argument {
  std::string param_;
public:
  explicit NullBuffer(std::string param)
    : std::invalid_argument(param + ": buffer is null"), param_(std::move(param)) {}
  const std::string& param() const { return param_; }
};

} // namespace pcgr
