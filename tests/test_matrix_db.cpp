#include "utils/correction_matrix_db.hpp"
#include "ms/isocalc.hpp"

#include <cstdio>
#include <iostream>
#include <string>
#include <vector>

int main() {
  const std::string filename = "test_correction_matrices.db";
  std::vector<std::string> formulas{"C3H7O2", "C6H12O6", "NH3", "C5H9NO4"};
  auto selection = nacorr::parseIsotopeSelection("H,O17:2");

  utils::CorrectionMatrixDB db{formulas, "C13"};
  db.computeCorrectionMatrices(selection);

  // ammonia has no carbon
  if (db.size() != 3 || db.failures().size() != 1 || db.contains("NH3", "C13")) {
    std::cerr << "unexpected database contents\n";
    return 1;
  }
  db.save(filename);

  utils::CorrectionMatrixDB loaded{filename};
  std::remove(filename.c_str());

  if (loaded.size() != 3 || loaded.keys().size() != 3 || loaded.options().key() != "H,O17:2") {
    std::cerr << "database didn't survive a save/load cycle\n";
    return 1;
  }

  for (auto& key : loaded.keys()) {
    auto original = db(key.first, key.second);
    auto restored = loaded(key.first, key.second);
    if (original.size() != restored.size() || original.matrix() != restored.matrix()) {
      std::cerr << key.first << ": matrix changed after loading\n";
      return 1;
    }
  }

  // stored matrices are what the cache would compute
  nacorr::CorrectionMatrixCache cache;
  loaded.fillCache(cache);
  if (cache.size() != 3) {
    std::cerr << "cache has " << cache.size() << " entries\n";
    return 1;
  }
  auto glucose = sf_parser::parseSumFormula("C6H12O6");
  auto tracer = nacorr::resolveTracer(glucose, "C13");
  auto key = nacorr::CorrectionMatrixCache::makeKey(glucose, tracer, selection);
  auto cached = cache.find(key);
  auto fresh = nacorr::buildCorrectionMatrix(glucose, tracer, selection);
  if (!cached || cached->matrix() != fresh.matrix()) {
    std::cerr << "cached matrix differs from a freshly built one\n";
    return 1;
  }

  try {
    loaded("C2H6O", "C13");
    std::cerr << "Expected failure for a missing matrix\n";
    return 1;
  } catch (std::out_of_range&) {
  }

  try {
    utils::CorrectionMatrixDB missing{std::string("no_such_file.db")};
    std::cerr << "Expected failure for a missing file\n";
    return 1;
  } catch (std::runtime_error&) {
  }

  std::cout << "OK\n";
  return 0;
}
