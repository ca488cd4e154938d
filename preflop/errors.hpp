#pragma once

#include <stdexcept>
#include <string>

namespace preflop {

class InvalidCardError : public std::runtime_error {
public:
  explicit InvalidCardError(const std::string& msg) : std::runtime_error{msg} {}
};

class InvalidHandError : public InvalidCardError {
public:
  explicit InvalidHandError(const std::string& msg) : InvalidCardError{msg} {}
};

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& msg) : std::runtime_error{msg} {}
};

}
