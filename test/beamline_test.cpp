#include <gtest/gtest.h>

#include <limits>
#include <string>

#include <rt_bsa/stream/beamline.hpp>
#include <rt_bsa/stream/stream_errors.hpp>

using namespace rt_bsa;

TEST(BeamlineTest, NamesRoundTrip) {
  ASSERT_EQ(all_beamlines().size(), 6u);
  for (Beamline beamline : all_beamlines()) {
    EXPECT_EQ(parse_beamline(beamline_name(beamline)), beamline);
  }
}

TEST(BeamlineTest, UnknownNameIsConfigurationError) {
  EXPECT_THROW(parse_beamline("NC_XXX"), ConfigurationError);
  EXPECT_THROW(parse_beamline(""), ConfigurationError);
  EXPECT_THROW(parse_beamline("nc_hxr"), ConfigurationError);
}

TEST(BeamlineTest, TableEntries) {
  const BeamlineInfo& hxr = beamline_info(Beamline::NC_HXR);
  EXPECT_STREQ(hxr.rate_address, "EVNT:SYS0:1:NC_HARDRATE");
  EXPECT_STREQ(hxr.history_edef, "HSTCUH");
  EXPECT_EQ(hxr.facility, Facility::NC);
  EXPECT_DOUBLE_EQ(hxr.max_rate, 120.0);

  const BeamlineInfo& sxr = beamline_info(Beamline::SC_SXR);
  EXPECT_STREQ(sxr.rate_address, "TPG:SYS0:1:DST04:RATE_RBV");
  EXPECT_EQ(sxr.facility, Facility::SC);
  EXPECT_DOUBLE_EQ(sxr.max_rate, 102.0);

  const BeamlineInfo& f2 = beamline_info(Beamline::F2);
  EXPECT_STREQ(f2.history_edef, "HST");
  EXPECT_DOUBLE_EQ(f2.max_rate, 30.0);
  EXPECT_STREQ(f2.default_ch1, "BPMS:IN10:221:X");
}

TEST(BeamlineTest, HistorySuffixBuckets) {
  EXPECT_EQ(history_suffix(Beamline::NC_HXR, 1.0), "1H");
  EXPECT_EQ(history_suffix(Beamline::NC_HXR, 9.99), "1H");
  EXPECT_EQ(history_suffix(Beamline::NC_HXR, 10.0), "TH");
  EXPECT_EQ(history_suffix(Beamline::NC_HXR, 60.0), "TH");
  EXPECT_EQ(history_suffix(Beamline::NC_HXR, 120.0), "BR");

  EXPECT_EQ(history_suffix(Beamline::SC_HXR, 50.0), "TH");
  EXPECT_EQ(history_suffix(Beamline::SC_HXR, 102.0), "HH");
  EXPECT_EQ(history_suffix(Beamline::SC_BSYD, 102.0), "HH");

  EXPECT_EQ(history_suffix(Beamline::F2, 30.0), "BR");
  EXPECT_EQ(history_suffix(Beamline::F2, 20.0), "TH");
}

TEST(BeamlineTest, NoBeamUsesSlowestEdef) {
  EXPECT_EQ(history_suffix(Beamline::NC_SXR, 0.0), "1H");
  EXPECT_EQ(history_suffix(Beamline::NC_SXR,
                           std::numeric_limits<double>::quiet_NaN()),
            "1H");
}

TEST(BeamlineTest, HistoryAddressConcatenates) {
  EXPECT_EQ(history_address("GDET:FEE1:241:ENRC", Beamline::NC_HXR, 60.0),
            "GDET:FEE1:241:ENRCHSTCUHTH");
  EXPECT_EQ(history_address("BPMS:BC1B:125:X", Beamline::SC_BSYD, 102.0),
            "BPMS:BC1B:125:XHSTSCDHH");
}

TEST(BeamlineTest, FacilityNames) {
  EXPECT_EQ(facility_name(Facility::NC), "NC");
  EXPECT_EQ(facility_name(Facility::SC), "SC");
  EXPECT_EQ(facility_name(Facility::F2), "F2");
}
