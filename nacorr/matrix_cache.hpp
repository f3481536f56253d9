#pragma once

#include "nacorr/correction_matrix.hpp"

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace nacorr {

/**
   Correction matrices keyed by (formula, tracer, options).

   A missing matrix is computed without holding the lock, so two threads may
   build the same one concurrently; whichever publishes first wins and every
   caller gets that instance.
 **/
class CorrectionMatrixCache {
  mutable std::mutex mutex_;
  std::map<std::string, CorrectionMatrixPtr> matrices_;

 public:
  CorrectionMatrixCache() {}
  CorrectionMatrixCache(const CorrectionMatrixCache&) = delete;
  CorrectionMatrixCache& operator=(const CorrectionMatrixCache&) = delete;

  static std::string makeKey(const ms::ElementCounter& formula, const TracerSpec& tracer,
                             const CorrectionOptions& options);

  CorrectionMatrixPtr get(const ms::ElementCounter& formula, const TracerSpec& tracer,
                          const CorrectionOptions& options=CorrectionOptions());

  // returns the instance that ends up in the cache
  CorrectionMatrixPtr insert(const std::string& key, CorrectionMatrixPtr matrix);

  // nullptr when absent
  CorrectionMatrixPtr find(const std::string& key) const;

  bool contains(const std::string& key) const;
  size_t size() const;
  void clear();
  std::vector<std::string> keys() const;
};
}
