#pragma once

#include <stdexcept>
#include <string>

namespace fixlog {

class error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

// Malformed declarations, rules or injected facts.
class definition_error : public error {
  public:
    using error::error;
};

// Type faults detected while rules are being evaluated.
class evaluation_error : public error {
  public:
    using error::error;
};

} // namespace fixlog
