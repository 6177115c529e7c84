#ifndef BASE_TRANSPORT_HPP
#define BASE_TRANSPORT_HPP

#include <string>

// Delivers an already rendered message. Implementations own their retry
// policy; send() reports whether the message was accepted.
class INotificationTransport {
public:
  virtual ~INotificationTransport() = default;
  virtual bool send(const std::string &text) = 0;
  virtual const char *get_name() const = 0;
  virtual std::string get_transport_type() const = 0;
};

#endif // BASE_TRANSPORT_HPP
