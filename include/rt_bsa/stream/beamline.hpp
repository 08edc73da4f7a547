/**************************************************
 * Copyright (c) 2025 Wenbo Li
 * University of Science and Technology of China
 *
 * This file is part of the RT-BSA project.
 * Distributed under the MIT License.
 **************************************************/

#pragma once

#include <string>
#include <vector>

namespace rt_bsa {

enum class Beamline {
    NC_SXR,
    NC_HXR,
    SC_BSYD,
    SC_SXR,
    SC_HXR,
    F2
};

enum class Facility {
    NC,
    SC,
    F2
};

/**
 * @brief Static deployment description of one beamline
 */
struct BeamlineInfo {
  Beamline beamline;
  const char* name;
  const char* rate_address;   // beam rate PV
  const char* history_edef;   // history buffer naming convention
  Facility facility;
  double max_rate;            // facility maximum BSA buffer rate (Hz)
  const char* default_ch1;
  const char* default_ch2;
};

/// Table lookup, never fails for a valid enumerator
const BeamlineInfo& beamline_info(Beamline beamline);

/// All known beamlines in table order
const std::vector<Beamline>& all_beamlines();

/// Parse "NC_HXR" etc. Throws ConfigurationError for unknown names.
Beamline parse_beamline(const std::string& name);

std::string beamline_name(Beamline beamline);
std::string facility_name(Facility facility);

/**
 * @brief History buffer suffix for the fastest populating edef at this rate
 *
 * below 10 Hz: "1H", 10 Hz up to the facility max: "TH",
 * at or above the facility max: "HH" on SC beamlines, "BR" elsewhere
 */
std::string history_suffix(Beamline beamline, double sample_rate);

/// channel + history edef + suffix, e.g. "GDET:FEE1:241:ENRCHSTCUHTH"
std::string history_address(const std::string& channel, Beamline beamline,
                             double sample_rate);

}  // namespace rt_bsa
