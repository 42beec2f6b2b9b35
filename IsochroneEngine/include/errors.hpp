#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// Malformed or missing dataset. The component that failed to load keeps its
// previous state.
class DataError : public std::runtime_error {
public:
  explicit DataError(const std::string &what) : std::runtime_error(what) {}
};

// Invalid parameter rejected at a call boundary (pixel size, radius, speed...).
class ConfigurationError : public std::invalid_argument {
public:
  explicit ConfigurationError(const std::string &what)
      : std::invalid_argument(what) {}
};

#endif // ERRORS_HPP
