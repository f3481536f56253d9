#include "utils/correction_matrix_db.hpp"
#include "nacorr/tracer.hpp"
#include "ms/isocalc.hpp"

#include "msgpack.hpp"

extern "C" {
#include "progressbar.h"
}

#include <cstdio>
#include <chrono>
#include <fstream>
#include <mutex>
#include <stdexcept>

namespace utils {

void CorrectionMatrixDB::computeCorrectionMatrices(const nacorr::CorrectionOptions& options)
{
  std::mutex map_mutex;
  options_ = options.key();
  matrices_.clear();
  failures_.clear();

  progressbar* bar = nullptr;
  const size_t BAR_STEP = 100;
  if (use_progressbar_)
    bar = progressbar_new("", pairs_.size() / BAR_STEP);

  std::chrono::high_resolution_clock clock;

#pragma omp parallel for private(clock)
  for (size_t i = 0; i < pairs_.size(); i++) {
    const auto& key = pairs_[i];
    try {
      auto formula = sf_parser::parseSumFormula(key.first);
      auto tracer = nacorr::resolveTracer(formula, key.second);

      auto t1 = clock.now();
      auto matrix = nacorr::buildCorrectionMatrix(formula, tracer, options);
      auto t2 = clock.now();

      const auto& m = matrix.matrix();
      std::vector<double> values;
      values.reserve(m.size());
      for (Eigen::Index r = 0; r < m.rows(); r++)
        for (Eigen::Index c = 0; c < m.cols(); c++)
          values.push_back(m(r, c));

      std::lock_guard<std::mutex> lock(map_mutex);
      matrices_[key]["matrix"] = values;
      matrices_[key]["labels"] = std::vector<double>{double(tracer.max_labels)};
      matrices_[key]["time"] = std::vector<double>{
        std::chrono::duration<double, std::milli>(t2 - t1).count()
      };
    } catch (std::runtime_error& e) {
      std::lock_guard<std::mutex> lock(map_mutex);
      failures_[key] = e.what();
    }

    std::lock_guard<std::mutex> lock(map_mutex);
    if (bar != nullptr && (i + 1) % BAR_STEP == 0)
      progressbar_inc(bar);
  }

  if (bar != nullptr) {
    progressbar_finish(bar);
    std::fflush(stdout);
  }
}

nacorr::CorrectionMatrix CorrectionMatrixDB::operator()(const std::string& formula,
                                                        const std::string& tracer) const {
  auto& entry = matrices_.at(std::make_pair(formula, tracer));
  auto& values = entry.at("matrix");
  size_t n = static_cast<size_t>(entry.at("labels").at(0)) + 1;
  if (values.size() != n * n)
    throw std::runtime_error("corrupted correction matrix for " + formula + "/" + tracer);

  Eigen::MatrixXd m(n, n);
  for (size_t r = 0; r < n; r++)
    for (size_t c = 0; c < n; c++)
      m(r, c) = values[r * n + c];
  return nacorr::CorrectionMatrix(m);
}

void CorrectionMatrixDB::fillCache(nacorr::CorrectionMatrixCache& cache) const {
  auto selection = options();
  for (auto& item : matrices_) {
    const auto& key = item.first;
    auto formula = sf_parser::parseSumFormula(key.first);
    auto labels = static_cast<int>(item.second.at("labels").at(0));
    auto tracer = nacorr::resolveTracer(formula, key.second, labels);
    auto matrix = std::make_shared<const nacorr::CorrectionMatrix>((*this)(key.first, key.second));
    cache.insert(nacorr::CorrectionMatrixCache::makeKey(formula, tracer, selection), matrix);
  }
}

void CorrectionMatrixDB::save(const std::string& output_filename) const {
  msgpack::sbuffer sbuf;
  msgpack::pack(sbuf, std::make_pair(options_, matrices_));
  std::ofstream db(output_filename, std::ios::binary);
  if (db)
    db.write(sbuf.data(), sbuf.size());
  else
    throw std::runtime_error("can't open " + output_filename + " for writing");
}

void CorrectionMatrixDB::load(const std::string& input_filename)
{
  // load precomputed matrices from msgpack file
  std::ifstream in(input_filename, std::ios::binary | std::ios::ate);
  if (!in)
    throw std::runtime_error("can't open " + input_filename + " for reading");
  size_t bufsize = in.tellg();
  std::vector<char> buffer(bufsize);
  in.seekg(0, std::ios::beg);
  in.read(buffer.data(), bufsize);
  in.close();

  msgpack::object_handle handle = msgpack::unpack(buffer.data(), bufsize);
  std::pair<std::string, decltype(matrices_)> contents;
  handle.get().convert(contents);

  options_ = contents.first;
  matrices_ = contents.second;
  failures_.clear();
  pairs_.clear();
  for (auto& item : matrices_) pairs_.push_back(item.first);
}

}
