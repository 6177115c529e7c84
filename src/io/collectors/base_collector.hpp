#ifndef BASE_COLLECTOR_HPP
#define BASE_COLLECTOR_HPP

#include <stdexcept>
#include <string>

// A reading could not be obtained this cycle. The identity is skipped; it is
// neither a problem nor a recovery.
class TransientReadError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class IMetricCollector {
public:
  virtual ~IMetricCollector() = default;
  // Throws TransientReadError
  virtual double sample() = 0;
  virtual std::string resource() const = 0;
  virtual const char *unit() const = 0;
};

#endif // BASE_COLLECTOR_HPP
