#include "nacorr/nacorr.hpp"
#include "utils/intensity_table.hpp"
#include "utils/correction_matrix_db.hpp"
#include "ms/instrument.hpp"

#include "cxxopts.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

static void reportFailures(const std::vector<nacorr::GroupOutcome>& outcomes, size_t& n_failed) {
  n_failed = 0;
  for (auto& outcome : outcomes) {
    if (outcome.ok()) continue;
    ++n_failed;
    std::cerr << outcome.metabolite << " (" << outcome.sample << "): "
              << nacorr::toString(outcome.error) << ": " << outcome.message << std::endl;
  }
}

int correct_main(int argc, char** argv) {
  std::string input_file, output_file;
  std::string tracer, isotopes, instrument_type, db_filename;
  double resolution, resolution_mz;
  bool show_progress;

  cxxopts::Options options("nacorr correct",
  " <input.csv>\n\t\t\twhere input has Name,Formula,Label,Sample,Intensity columns.");
  options.add_options()
    ("tracer",            "Tracer isotope or element (C13, N15, S34, C...), or several: C13,N15",
     cxxopts::value<std::string>(tracer)->default_value("C13"))
    ("out",               "Output file",
     cxxopts::value<std::string>(output_file)->default_value("/dev/stdout"))
    ("indistinguishable", "Natural isotopes merged into label peaks, e.g. H,O17:2 (* for all); "
                          "per tracer: C13=H,O17:2;N15=",
     cxxopts::value<std::string>(isotopes)->default_value("*"))
    ("resolution",        "Resolving power; when set, indistinguishable isotopes are detected per formula",
     cxxopts::value<double>(resolution)->default_value("0"))
    ("resolution-mz",     "m/z at which the resolving power is given",
     cxxopts::value<double>(resolution_mz)->default_value("200.0"))
    ("instrument",        "Instrument type (orbitrap|fticr|tof)",
     cxxopts::value<std::string>(instrument_type)->default_value("orbitrap"))
    ("matrix-db",         "Precomputed correction matrices (see 'nacorr matrix')",
     cxxopts::value<std::string>(db_filename)->default_value(""))
    ("progress",          "Show progress bar",
     cxxopts::value<bool>(show_progress)->default_value("false"))
    ("help", "Print help");

  options.add_options("hidden")
    ("input-file",        "Intensity table", cxxopts::value<std::string>(input_file));

  options.parse_positional(std::vector<std::string>{"input-file"});

  try {
    auto args = options.parse(argc, argv);

    if (args.count("help") || input_file.empty()) {
      std::cout << options.help({""}) << std::endl;
      return 0;
    }

    nacorr::WorkflowSettings settings;
    settings.pad_to_label_range = true;
    if (resolution > 0) {
      settings.instrument = ms::makeInstrumentProfile(instrument_type, resolution, resolution_mz);
      if (args.count("indistinguishable"))
        std::cerr << "--indistinguishable is ignored when --resolution is given" << std::endl;
    } else {
      auto tracers = nacorr::parseTracers(tracer);
      auto selections = nacorr::parseTracerSelections(isotopes);
      if (selections.count("") && selections.count(tracers[0].name()))
        throw std::invalid_argument("--indistinguishable gives two selections for " +
                                    tracers[0].name());
      for (auto& item : selections) {
        if (item.first.empty() || item.first == tracers[0].name())
          settings.options = item.second;
        else
          settings.tracer_options[item.first] = item.second;
      }
      if (tracers.size() == 1 && !settings.tracer_options.empty())
        throw std::invalid_argument("--indistinguishable names a tracer other than " +
                                    tracers[0].name());
    }

    auto records = utils::readIntensityTable(input_file);
    auto groups = utils::groupRecords(records, tracer);

    nacorr::CorrectionMatrixCache cache;
    if (!db_filename.empty()) {
      utils::CorrectionMatrixDB db(db_filename);
      if (settings.instrument || db.options().key() != settings.options.key())
        std::cerr << "matrices in " << db_filename
                  << " were computed for other isotopes and won't be used" << std::endl;
      else
        db.fillCache(cache);
    }

    std::ios_base::sync_with_stdio(true);
    auto outcomes = nacorr::correctAll(groups, cache, settings, show_progress);

    std::ofstream out(output_file);
    if (!out) {
      std::cerr << "can't open " << output_file << " for writing" << std::endl;
      return 1;
    }
    utils::writeCorrectedTable(out, groups, outcomes);

    size_t n_failed;
    reportFailures(outcomes, n_failed);
    if (n_failed > 0) {
      std::cerr << n_failed << " of " << groups.size() << " groups failed" << std::endl;
      return 1;
    }
  } catch (std::exception& e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }

  return 0;
}
