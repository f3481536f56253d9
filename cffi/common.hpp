#pragma once

#if defined _WIN32
  #define NACORR_EXTERN __declspec(dllexport)
#else
  #define NACORR_EXTERN __attribute__ ((visibility ("default")))
#endif

extern "C" {
  NACORR_EXTERN const char* nacorr_strerror();
}

#include <string>
#include <exception>
#include <functional>

namespace cffi {
  void setErrorMessage(const std::string& e);

  template <typename R>
  R wrap_catch(R on_error, std::function<R()>&& setter) {
    try {
      return setter();
    } catch (std::exception& e) {
      setErrorMessage(e.what());
      return on_error;
    }
  }
}
