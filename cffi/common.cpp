#include "cffi/common.hpp"

#include <string>

namespace cffi {
  static thread_local std::string last_error;

  void setErrorMessage(const std::string& e) {
    last_error = e;
  }
}

extern "C" {

  NACORR_EXTERN const char* nacorr_strerror() {
    return cffi::last_error.c_str();
  }
}
