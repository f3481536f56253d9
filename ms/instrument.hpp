#pragma once

#include <cmath>
#include <memory>
#include <string>
#include <stdexcept>

namespace ms {

class InstrumentProfile {
 public:
  virtual double resolvingPowerAt(double mz) const = 0;

  // full width at half maximum of a peak at a given m/z
  double fwhmAt(double mz) const { return mz / resolvingPowerAt(mz); }

  virtual ~InstrumentProfile() {}
};

class OrbitrapProfile : public InstrumentProfile {
  double res_power_;
  double at_;

 public:
  OrbitrapProfile(double resolving_power, double at = 200)
      : res_power_(resolving_power), at_(at) {}

  double resolvingPowerAt(double mz) const { return res_power_ * std::sqrt(at_ / mz); }
};

class FTICRProfile : public InstrumentProfile {
  double res_power_;
  double at_;

 public:
  FTICRProfile(double resolving_power, double at = 200)
      : res_power_(resolving_power), at_(at) {}

  double resolvingPowerAt(double mz) const { return res_power_ * at_ / mz; }
};

class TOFProfile : public InstrumentProfile {
  double res_power_;

 public:
  TOFProfile(double resolving_power) : res_power_(resolving_power) {}

  double resolvingPowerAt(double) const { return res_power_; }
};

typedef std::shared_ptr<const InstrumentProfile> InstrumentProfilePtr;

// type is one of orbitrap, fticr (also ft-icr) and tof
inline InstrumentProfilePtr makeInstrumentProfile(
    const std::string& type, double resolving_power, double at = 200) {
  if (!(resolving_power > 0))
    throw std::invalid_argument("resolving power must be positive");
  if (type == "orbitrap")
    return std::make_shared<OrbitrapProfile>(resolving_power, at);
  else if (type == "fticr" || type == "ft-icr")
    return std::make_shared<FTICRProfile>(resolving_power, at);
  else if (type == "tof")
    return std::make_shared<TOFProfile>(resolving_power);
  throw std::invalid_argument("unknown instrument type: '" + type + "'");
}
}
