#include "utils/correction_matrix_db.hpp"
#include "utils/string.hpp"
#include "nacorr/correction_matrix.hpp"
#include "ms/isocalc.hpp"

#include "cxxopts.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

static void printMatrices(const utils::CorrectionMatrixDB& db) {
  for (auto& key : db.keys()) {
    if (!db.contains(key.first, key.second))
      continue;
    auto m = db(key.first, key.second);
    std::cout << key.first << " " << key.second << ", " << m.maxLabels() << " labels\n";
    for (size_t i = 0; i < m.size(); i++) {
      for (size_t j = 0; j < m.size(); j++)
        std::cout << std::setw(12) << std::setprecision(6) << m(i, j);
      std::cout << "\n";
    }
  }
  std::cout << std::flush;
}

int matrix_main(int argc, char** argv) {
  std::string input_file, output_file;
  std::string tracer, isotopes;
  bool print;

  cxxopts::Options options("nacorr matrix",
  " <input.txt> <output.db>\n\t\t\twhere input contains one sum formula per line.");
  options.add_options()
    ("tracer",            "Tracer isotope or element (C13, N15, S34, C...)",
     cxxopts::value<std::string>(tracer)->default_value("C13"))
    ("indistinguishable", "Natural isotopes merged into label peaks, e.g. H,O17:2 (* for all)",
     cxxopts::value<std::string>(isotopes)->default_value("*"))
    ("print",             "Print the matrices to stdout",
     cxxopts::value<bool>(print)->default_value("false"))
    ("help", "Print help");

  options.add_options("hidden")
    ("input-file",        "List of sum formulas, one per line",
     cxxopts::value<std::string>(input_file))
    ("output-file",       "Output file",
     cxxopts::value<std::string>(output_file));

  options.parse_positional(std::vector<std::string>{"input-file", "output-file"});

  try {
    auto args = options.parse(argc, argv);

    if (args.count("help") || input_file.empty() || output_file.empty()) {
      std::cout << options.help({""}) << std::endl;
      return 0;
    }

    auto selection = nacorr::parseIsotopeSelection(isotopes);

    std::ifstream in(input_file);
    if (!in) {
      std::cerr << "can't open " << input_file << std::endl;
      return 1;
    }

    std::vector<std::string> formulas;
    std::string f;
    while (std::getline(in, f)) {
      f = utils::trim(f);
      if (!f.empty())
        formulas.push_back(f);
    }

    std::cout << "Computing " << tracer << " correction matrices for "
              << formulas.size() << " formulas..." << std::endl;

    utils::CorrectionMatrixDB db{formulas, tracer};
    std::ios_base::sync_with_stdio(true);
    db.useProgressBar(true);
    db.computeCorrectionMatrices(selection);

    for (auto& failure : db.failures())
      std::cerr << failure.first.first << ": " << failure.second << std::endl;

    db.save(output_file);
    std::cout << db.size() << " correction matrices have been saved to "
              << output_file << std::endl;

    if (print)
      printMatrices(db);
  } catch (std::exception& e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }

  return 0;
}
