#pragma once

#ifdef NACORR_PROFILE_MATRIX
#include <fstream>
#include <chrono>
#include <string>
#include <sstream>
#include <mutex>

namespace utils {

// one timer per thread, all of them appending to the same log file
class ProfilingTimer {
  typedef std::chrono::high_resolution_clock Clock;
  Clock clock_;
  std::stringstream message_;
  std::chrono::time_point<Clock> start_;
  bool started_;

  ProfilingTimer() : started_(false) {}

  static std::ofstream& output(std::mutex*& mutex) {
    static std::mutex m;
    static std::ofstream out("nacorr_profile.log", std::ofstream::out | std::ofstream::app);
    mutex = &m;
    return out;
  }

 public:
  inline static ProfilingTimer& instance() {
    static thread_local ProfilingTimer timer;
    return timer;
  }

  void start() {
    start_ = clock_.now();
    started_ = true;
  }

  void reset() {
    std::stringstream().swap(message_);
    started_ = false;
  }

  template <typename T>
  ProfilingTimer& operator<<(const T& obj) {
    message_ << obj;
    return *this;
  }

  void stop() {
    if (!started_) return;

    started_ = false;
    auto end_ = clock_.now();
    auto diff = end_ - start_;
    auto milli = std::chrono::duration<double, std::milli>(diff).count();

    std::mutex* mutex = nullptr;
    auto& out = output(mutex);
    std::lock_guard<std::mutex> lock(*mutex);
    out << "[ " << message_.str() << " ] ~ " << milli << std::endl;
  }
};
}
#else  // no-op logger
namespace utils {
struct ProfilingTimer {
  inline static ProfilingTimer& instance() {
    static ProfilingTimer timer;
    return timer;
  }

  void start() {}
  void stop() {}
  void reset() {}

  template <typename T>
  ProfilingTimer& operator<<(const T&) {
    return *this;
  }
};
}
#endif
