#pragma once

#include <cstdlib>
#include <string>

namespace portico::test {

// Sets (or unsets, with a nullptr value) an environment variable for the lifetime of the object,
// restoring the previous state afterwards.
class ScopedEnvVar {
 public:
  ScopedEnvVar(const char* name, const char* value) : _name(name) {
    if (const char* prev = std::getenv(name)) {
      _hadOld = true;
      _old = prev;
    }
    if (value != nullptr) {
      ::setenv(name, value, 1);
    } else {
      ::unsetenv(name);
    }
  }

  ScopedEnvVar(const ScopedEnvVar&) = delete;
  ScopedEnvVar& operator=(const ScopedEnvVar&) = delete;

  ~ScopedEnvVar() {
    if (_hadOld) {
      ::setenv(_name.c_str(), _old.c_str(), 1);
    } else {
      ::unsetenv(_name.c_str());
    }
  }

 private:
  std::string _name;
  std::string _old;
  bool _hadOld = false;
};

}  // namespace portico::test
