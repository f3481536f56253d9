#include "nacorr/matrix_cache.hpp"

#include <sstream>

namespace nacorr {

std::string CorrectionMatrixCache::makeKey(const ms::ElementCounter& formula,
                                           const TracerSpec& tracer,
                                           const CorrectionOptions& options) {
  std::ostringstream ss;
  ss << ms::toString(formula) << "|" << tracer.name() << "/" << tracer.max_labels
     << "|" << options.key();
  return ss.str();
}

CorrectionMatrixPtr CorrectionMatrixCache::get(const ms::ElementCounter& formula,
                                               const TracerSpec& tracer,
                                               const CorrectionOptions& options) {
  auto key = makeKey(formula, tracer, options);
  auto cached = find(key);
  if (cached)
    return cached;

  auto matrix = std::make_shared<const CorrectionMatrix>(
      buildCorrectionMatrix(formula, tracer, options));
  return insert(key, matrix);
}

CorrectionMatrixPtr CorrectionMatrixCache::insert(const std::string& key,
                                                  CorrectionMatrixPtr matrix) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto result = matrices_.insert(std::make_pair(key, matrix));
  return result.first->second;
}

CorrectionMatrixPtr CorrectionMatrixCache::find(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = matrices_.find(key);
  return it == matrices_.end() ? nullptr : it->second;
}

bool CorrectionMatrixCache::contains(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return matrices_.count(key) > 0;
}

size_t CorrectionMatrixCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return matrices_.size();
}

void CorrectionMatrixCache::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  matrices_.clear();
}

std::vector<std::string> CorrectionMatrixCache::keys() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> result;
  for (auto& item : matrices_)
    result.push_back(item.first);
  return result;
}
}
