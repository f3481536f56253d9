#include "utils/intensity_table.hpp"
#include "utils/string.hpp"
#include "ms/periodic_table.hpp"
#include "ms/isocalc.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>

namespace utils {

static std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

static const char* labelExample = "expected e.g. C13-label-1 or C13N15-label-1-0";

static unsigned parseLabelCount(const std::string& text, const std::string& label) {
  if (text.empty() ||
      !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); }))
    throw InvalidTable("invalid label '" + label + "', " + labelExample);

  unsigned long value = 0;
  for (char c : text) {
    value = value * 10 + static_cast<unsigned long>(c - '0');
    if (value > static_cast<unsigned long>(ms::maxAtomCount))
      throw InvalidTable("label count in '" + label + "' exceeds " +
                         std::to_string(ms::maxAtomCount));
  }
  return static_cast<unsigned>(value);
}

// "C13N15" -> {"C13", "N15"}
static std::vector<std::string> splitIsotopes(const std::string& text, const std::string& label) {
  std::vector<std::string> result;
  size_t i = 0;
  while (i < text.size()) {
    size_t start = i;
    if (!std::isupper(static_cast<unsigned char>(text[i])))
      throw InvalidTable("invalid label '" + label + "', " + labelExample);
    ++i;
    while (i < text.size() && std::islower(static_cast<unsigned char>(text[i])))
      ++i;
    size_t digits = i;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i])))
      ++i;
    if (i == digits)
      throw InvalidTable("invalid label '" + label + "', " + labelExample);
    auto isotope = text.substr(start, i - start);
    if (std::find(result.begin(), result.end(), isotope) != result.end())
      throw InvalidTable("label '" + label + "' names " + isotope + " twice");
    result.push_back(isotope);
  }
  return result;
}

LabelState parseLabel(const std::string& label) {
  auto trimmed = trim(label);
  auto lower = toLower(trimmed);
  if (lower.find("parent") != std::string::npos)
    return LabelState();

  const std::string separator = "-label-";
  auto pos = lower.find(separator);
  if (pos == std::string::npos || pos == 0)
    throw InvalidTable("invalid label '" + label + "', " + labelExample);

  LabelState state;
  state.isotopes = splitIsotopes(trim(trimmed.substr(0, pos)), label);
  auto counts = split(trimmed.substr(pos + separator.size()), '-');
  if (counts.size() != state.isotopes.size())
    throw InvalidTable("label '" + label + "' has " + std::to_string(state.isotopes.size()) +
                       " isotopes but " + std::to_string(counts.size()) + " counts");
  for (auto& count : counts)
    state.counts.push_back(parseLabelCount(trim(count), label));
  return state;
}

std::string formatLabel(const std::vector<nacorr::TracerSpec>& tracers,
                        const std::vector<unsigned>& counts) {
  if (std::all_of(counts.begin(), counts.end(), [](unsigned n) { return n == 0; })) {
    const auto& element = ms::Element::getByName(tracers.at(0).element);
    return element.isotopeName(element.monoisotopicIndex()) + " PARENT";
  }

  std::string names, numbers;
  for (size_t k = 0; k < tracers.size(); k++) {
    names += tracers[k].name();
    numbers += "-" + std::to_string(counts.at(k));
  }
  return names + "-label" + numbers;
}

std::string formatLabel(const nacorr::TracerSpec& tracer, unsigned count) {
  return formatLabel(std::vector<nacorr::TracerSpec>(1, tracer), std::vector<unsigned>(1, count));
}

std::vector<std::string> splitCsvLine(const std::string& line) {
  std::vector<std::string> fields;
  std::string field;
  bool quoted = false;
  for (size_t i = 0; i < line.size(); i++) {
    char c = line[i];
    if (quoted) {
      if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
        field += '"';
        ++i;
      } else if (c == '"') {
        quoted = false;
      } else {
        field += c;
      }
    } else if (c == '"') {
      quoted = true;
    } else if (c == ',') {
      fields.push_back(trim(field));
      field.clear();
    } else if (c != '\r') {
      field += c;
    }
  }
  if (quoted)
    throw InvalidTable("unterminated quoted field");
  fields.push_back(trim(field));
  return fields;
}

static std::string quoted(const std::string& field) {
  if (field.find_first_of(",\"") == std::string::npos)
    return field;
  std::string result = "\"";
  for (char c : field) {
    if (c == '"') result += '"';
    result += c;
  }
  return result + "\"";
}

static double parseIntensity(const std::string& value, size_t line) {
  if (value.empty())
    return 0.0;
  size_t pos = 0;
  double result = 0.0;
  try {
    result = std::stod(value, &pos);
  } catch (std::logic_error&) {
    throw InvalidTable("invalid intensity '" + value + "'", line);
  }
  if (pos != value.size())
    throw InvalidTable("invalid intensity '" + value + "'", line);
  return result;
}

std::vector<IntensityRecord> readIntensityTable(std::istream& in) {
  static const char* required[] = {"Name", "Formula", "Label", "Sample", "Intensity"};

  std::string line;
  size_t line_no = 0;
  std::map<std::string, size_t> columns;
  while (columns.empty() && std::getline(in, line)) {
    ++line_no;
    if (trim(line).empty())
      continue;
    auto header = splitCsvLine(line);
    for (size_t i = 0; i < header.size(); i++)
      columns[header[i]] = i;
  }
  if (columns.empty())
    throw InvalidTable("empty table");

  std::vector<size_t> index;
  for (auto name : required) {
    auto it = columns.find(name);
    if (it == columns.end())
      throw InvalidTable(std::string("missing column '") + name + "'", line_no);
    index.push_back(it->second);
  }
  size_t min_fields = *std::max_element(index.begin(), index.end()) + 1;

  std::vector<IntensityRecord> records;
  while (std::getline(in, line)) {
    ++line_no;
    if (trim(line).empty())
      continue;
    auto fields = splitCsvLine(line);
    if (fields.size() < min_fields)
      throw InvalidTable("too few fields", line_no);

    IntensityRecord r;
    r.name = fields[index[0]];
    r.formula = fields[index[1]];
    r.label = fields[index[2]];
    r.sample = fields[index[3]];
    r.intensity = parseIntensity(fields[index[4]], line_no);
    records.push_back(r);
  }
  return records;
}

std::vector<IntensityRecord> readIntensityTable(const std::string& filename) {
  std::ifstream in(filename);
  if (!in)
    throw std::runtime_error("can't open " + filename + " for reading");
  return readIntensityTable(in);
}

std::vector<nacorr::MetaboliteSample> groupRecords(const std::vector<IntensityRecord>& records,
                                                   const std::string& tracer) {
  std::vector<std::string> tracer_names;
  for (auto& spec : nacorr::parseTracers(tracer))
    tracer_names.push_back(spec.name());
  const bool several = tracer_names.size() > 1;

  std::vector<nacorr::MetaboliteSample> groups;
  std::vector<std::vector<bool>> seen;
  std::map<std::pair<std::string, std::string>, size_t> group_index;
  std::map<std::string, std::string> formulas;

  for (auto& r : records) {
    auto f = formulas.insert(std::make_pair(r.name, r.formula));
    if (f.first->second != r.formula)
      throw InvalidTable("metabolite " + r.name + " has formulas " + f.first->second +
                         " and " + r.formula);

    auto state = parseLabel(r.label);
    std::vector<unsigned> counts(tracer_names.size(), 0);
    for (size_t k = 0; k < state.isotopes.size(); k++) {
      auto it = std::find(tracer_names.begin(), tracer_names.end(), state.isotopes[k]);
      if (it == tracer_names.end())
        throw InvalidTable("label '" + r.label + "' doesn't match tracer " + tracer);
      counts[it - tracer_names.begin()] = state.counts[k];
    }

    auto key = std::make_pair(r.name, r.sample);
    auto it = group_index.find(key);
    if (it == group_index.end()) {
      nacorr::MetaboliteSample group;
      group.metabolite = r.name;
      group.sample = r.sample;
      group.formula = r.formula;
      group.tracer = tracer;
      groups.push_back(group);
      seen.push_back(std::vector<bool>());
      it = group_index.insert(std::make_pair(key, groups.size() - 1)).first;
    }

    auto& group = groups[it->second];
    bool repeated;
    if (several) {
      repeated = !group.labeled.insert(std::make_pair(counts, r.intensity)).second;
    } else {
      unsigned count = counts[0];
      auto& labels = seen[it->second];
      if (group.observed.size() <= count) {
        group.observed.resize(count + 1, 0.0);
        labels.resize(count + 1, false);
      }
      repeated = labels[count];
      labels[count] = true;
      group.observed[count] = r.intensity;
    }
    if (repeated)
      throw InvalidTable("label '" + r.label + "' appears twice for " + r.name +
                         " in sample " + r.sample);
  }
  return groups;
}

static double observedAt(const nacorr::MetaboliteSample& group, size_t index,
                         const std::vector<unsigned>& counts) {
  if (!group.labeled.empty()) {
    auto it = group.labeled.find(counts);
    return it == group.labeled.end() ? 0.0 : it->second;
  }
  return index < group.observed.size() ? group.observed[index] : 0.0;
}

void writeCorrectedTable(std::ostream& out,
                         const std::vector<nacorr::MetaboliteSample>& groups,
                         const std::vector<nacorr::GroupOutcome>& outcomes) {
  if (groups.size() != outcomes.size())
    throw std::invalid_argument("number of outcomes differs from number of groups");

  const auto sep = ",";
  auto precision = out.precision(12);
  out << "Name,Formula,Sample,Label,Intensity,NA Corrected,Pool Total,Fractional Enrichment\n";
  for (size_t g = 0; g < groups.size(); g++) {
    if (!outcomes[g].ok())
      continue;
    const auto& group = groups[g];
    const auto& result = outcomes[g].result;
    auto tracers = nacorr::parseTracers(group.tracer);
    const auto& dims = outcomes[g].label_dimensions;
    nacorr::LabelGrid grid(dims.empty() ? std::vector<size_t>(1, result.corrected.size()) : dims);
    for (size_t i = 0; i < result.corrected.size(); i++) {
      auto counts = grid.counts(i);
      out << quoted(group.metabolite) << sep << group.formula << sep << quoted(group.sample) << sep
          << formatLabel(tracers, counts) << sep << observedAt(group, i, counts) << sep
          << result.corrected[i] << sep << result.pool_total << sep
          << result.fractional_enrichment[i] << "\n";
    }
  }
  out.precision(precision);
}
}
