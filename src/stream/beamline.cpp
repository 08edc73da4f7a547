/**************************************************
 * Copyright (c) 2025 Wenbo Li
 * University of Science and Technology of China
 *
 * This file is part of the RT-BSA project.
 * Distributed under the MIT License.
 **************************************************/

#include "rt_bsa/stream/beamline.hpp"

#include "rt_bsa/stream/stream_errors.hpp"

namespace rt_bsa {

namespace {

const BeamlineInfo kBeamlines[] = {
    {Beamline::NC_SXR, "NC_SXR", "EVNT:SYS0:1:NC_SOFTRATE", "HSTCUS",
     Facility::NC, 120.0, "BLEN:LI21:265:AIMAX",
     "EM1K0:GMD:HPS:milliJoulesPerPulse"},
    {Beamline::NC_HXR, "NC_HXR", "EVNT:SYS0:1:NC_HARDRATE", "HSTCUH",
     Facility::NC, 120.0, "BLEN:LI21:265:AIMAX", "GDET:FEE1:241:ENRC"},
    {Beamline::SC_BSYD, "SC_BSYD", "TPG:SYS0:1:DST02:RATE_RBV", "HSTSCD",
     Facility::SC, 102.0, "BPMS:BC1B:125:X", "BPMS:BC1B:440:X"},
    {Beamline::SC_SXR, "SC_SXR", "TPG:SYS0:1:DST04:RATE_RBV", "HSTSCS",
     Facility::SC, 102.0, "BLEN:BC1B:850:1:BLEN",
     "EM1K0:GMD:HPS:milliJoulesPerPulse"},
    {Beamline::SC_HXR, "SC_HXR", "TPG:SYS0:1:DST03:RATE_RBV", "HSTSCH",
     Facility::SC, 102.0, "BLEN:BC1B:850:1:BLEN", "BLEN:BC2B:950:1:BLEN"},
    {Beamline::F2, "F2", "EVNT:SYS1:1:BEAMRATE", "HST", Facility::F2, 30.0,
     "BPMS:IN10:221:X", "BPMS:IN10:221:TMIT"},
};

constexpr double kSlowEdefRate = 10.0;

}  // namespace

const BeamlineInfo& beamline_info(Beamline beamline) {
  for (const auto& info : kBeamlines) {
    if (info.beamline == beamline) return info;
  }
  throw ConfigurationError("unknown beamline enumerator");
}

const std::vector<Beamline>& all_beamlines() {
  static const std::vector<Beamline> beamlines = {
      Beamline::NC_SXR, Beamline::NC_HXR, Beamline::SC_BSYD,
      Beamline::SC_SXR, Beamline::SC_HXR, Beamline::F2};
  return beamlines;
}

Beamline parse_beamline(const std::string& name) {
  for (const auto& info : kBeamlines) {
    if (name == info.name) return info.beamline;
  }
  throw ConfigurationError(name + " is not a valid beamline");
}

std::string beamline_name(Beamline beamline) {
  return beamline_info(beamline).name;
}

std::string facility_name(Facility facility) {
  switch (facility) {
    case Facility::NC:
      return "NC";
    case Facility::SC:
      return "SC";
    case Facility::F2:
      return "F2";
    default:
      return "UNKNOWN";
  }
}

std::string history_suffix(Beamline beamline, double sample_rate) {
  const BeamlineInfo& info = beamline_info(beamline);
  if (sample_rate >= info.max_rate) {
    return info.facility == Facility::SC ? "HH" : "BR";
  }
  if (sample_rate >= kSlowEdefRate) return "TH";
  return "1H";
}

std::string history_address(const std::string& channel, Beamline beamline,
                            double sample_rate) {
  return channel + beamline_info(beamline).history_edef +
         history_suffix(beamline, sample_rate);
}

}  // namespace rt_bsa
