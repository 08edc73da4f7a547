#include <gtest/gtest.h>

#include <cmath>
#include <memory>
#include <string>

#include <rt_bsa/source/simulated_source.hpp>
#include <rt_bsa/stream/dual_bsa_stream_buffer.hpp>

#include "stream_test_support.hpp"

using namespace rt_bsa;
using rt_bsa::testing::ns_for;
using rt_bsa::testing::pulse_id_history;
using rt_bsa::testing::ramp_history;
using rt_bsa::testing::register_channel;

namespace {
const char* kCh1 = "BLEN:LI21:265:AIMAX";
const char* kCh2 = "GDET:FEE1:241:ENRC";
const char* kRateAddress = "EVNT:SYS0:1:NC_HARDRATE";
}  // namespace

// NC_HXR at 60 Hz: 6 ticks per sample, buffer modulus 2730.
// ch1 history holds 0..2799, ch2 holds 10000..12799.
class DualBSAStreamBufferTest : public ::testing::Test {
 protected:
  void SetUp() override { monitor_ = std::make_shared<GapMonitor>(false); }

  std::unique_ptr<DualBSAStreamBuffer> make_dual(PulseId p1, PulseId p2) {
    register_channel(source_, kCh1, Beamline::NC_HXR, 60.0,
                     ramp_history(0.0, p1));
    register_channel(source_, kCh2, Beamline::NC_HXR, 60.0,
                     ramp_history(10000.0, p2));
    return std::make_unique<DualBSAStreamBuffer>(
        source_, DualStreamConfig{kCh1, kCh2, Beamline::NC_HXR}, monitor_);
  }

  SimulatedSource source_;
  std::shared_ptr<GapMonitor> monitor_;
};

TEST_F(DualBSAStreamBufferTest, EqualPulseIdsReturnFullBuffers) {
  auto dual = make_dual(1000, 1000);

  SyncedSnapshot synced = dual->align();
  ASSERT_EQ(synced.rows[0].size(), kBufferLength);
  ASSERT_EQ(synced.rows[1].size(), kBufferLength);
  EXPECT_DOUBLE_EQ(synced.rows[0].front(), 0.0);
  EXPECT_DOUBLE_EQ(synced.rows[1].front(), 10000.0);
  EXPECT_EQ(synced.pulse_id, 1000u);

  // no misalignment seen yet
  EXPECT_EQ(dual->synced_point_count(), -1);
  EXPECT_EQ(dual->latest_synced_pulse_id(), 1000u);
}

TEST_F(DualBSAStreamBufferTest, SecondStreamAheadTrimsOldestOfSecond) {
  auto dual = make_dual(1000, 1030);

  SyncedSnapshot synced = dual->align();
  ASSERT_EQ(synced.size(), kBufferLength - 5);
  ASSERT_EQ(synced.rows[1].size(), kBufferLength - 5);
  EXPECT_DOUBLE_EQ(synced.rows[0].front(), 5.0);
  EXPECT_DOUBLE_EQ(synced.rows[0].back(), 2799.0);
  EXPECT_DOUBLE_EQ(synced.rows[1].front(), 10000.0);
  EXPECT_DOUBLE_EQ(synced.rows[1].back(), 12794.0);
  EXPECT_EQ(synced.pulse_id, 1000u);
  EXPECT_EQ(dual->synced_point_count(), 2795);
}

TEST_F(DualBSAStreamBufferTest, FirstStreamAheadTrimsOldestOfFirst) {
  auto dual = make_dual(1030, 1000);

  SyncedSnapshot synced = dual->align();
  ASSERT_EQ(synced.size(), kBufferLength - 5);
  ASSERT_EQ(synced.rows[1].size(), kBufferLength - 5);
  EXPECT_DOUBLE_EQ(synced.rows[0].front(), 0.0);
  EXPECT_DOUBLE_EQ(synced.rows[0].back(), 2794.0);
  EXPECT_DOUBLE_EQ(synced.rows[1].front(), 10005.0);
  EXPECT_DOUBLE_EQ(synced.rows[1].back(), 12799.0);
  EXPECT_EQ(synced.pulse_id, 1000u);
  EXPECT_EQ(dual->synced_point_count(), 2795);
}

TEST_F(DualBSAStreamBufferTest, OffsetAcrossPulseIdRollover) {
  // ch2 is 22 ticks behind ch1 once the 14-bit counter wraps
  auto dual = make_dual(10, 16372);

  SyncedSnapshot synced = dual->align();
  ASSERT_EQ(synced.size(), kBufferLength - 3);
  ASSERT_EQ(synced.rows[1].size(), kBufferLength - 3);
  EXPECT_DOUBLE_EQ(synced.rows[0].front(), 0.0);
  EXPECT_DOUBLE_EQ(synced.rows[1].back(), 12799.0);
  EXPECT_EQ(dual->synced_point_count(), 2797);
}

TEST_F(DualBSAStreamBufferTest, SubSampleDifferenceKeepsFullBuffers) {
  auto dual = make_dual(1000, 1003);

  SyncedSnapshot synced = dual->align();
  EXPECT_EQ(synced.rows[0].size(), kBufferLength);
  EXPECT_EQ(synced.rows[1].size(), kBufferLength);
  EXPECT_EQ(dual->synced_point_count(), 2800);
}

TEST_F(DualBSAStreamBufferTest, NoBeamGivesEmptyAlignment) {
  auto dual = make_dual(1000, 1030);

  source_.publish_rate(kRateAddress, 0.0);
  ASSERT_TRUE(source_.flush(2000));
  EXPECT_TRUE(std::isnan(dual->ticks_per_sample()));

  SyncedSnapshot synced = dual->align();
  EXPECT_TRUE(synced.empty());
  EXPECT_TRUE(synced.rows[1].empty());
  EXPECT_EQ(dual->synced_point_count(), 0);
}

TEST_F(DualBSAStreamBufferTest, LiveUpdatesStayAligned) {
  register_channel(source_, kCh1, Beamline::NC_HXR, 60.0,
                   pulse_id_history(1000, 6));
  register_channel(source_, kCh2, Beamline::NC_HXR, 60.0,
                   pulse_id_history(1000, 6));
  DualBSAStreamBuffer dual(source_,
                           DualStreamConfig{kCh1, kCh2, Beamline::NC_HXR},
                           monitor_);

  // values are the pulse IDs they were taken on
  source_.publish_value(kCh2, 1006.0, ns_for(1006));
  source_.publish_value(kCh2, 1012.0, ns_for(1012));
  ASSERT_TRUE(source_.flush(2000));

  SyncedSnapshot synced = dual.align();
  ASSERT_EQ(synced.size(), kBufferLength - 2);
  ASSERT_EQ(synced.rows[1].size(), kBufferLength - 2);
  for (size_t i = 0; i < synced.size(); ++i) {
    EXPECT_DOUBLE_EQ(synced.rows[0][i], synced.rows[1][i]) << "at " << i;
  }
  EXPECT_DOUBLE_EQ(synced.rows[0].back(), 1000.0);
}

TEST_F(DualBSAStreamBufferTest, InvalidConfigurationIsRejected) {
  EXPECT_THROW(DualBSAStreamBuffer(source_,
                                   DualStreamConfig{kCh1, "", Beamline::NC_HXR}),
               ConfigurationError);

  auto dual = make_dual(1000, 1000);
  EXPECT_THROW(dual->set_beamline("NC_XXX"), ConfigurationError);
  EXPECT_EQ(dual->beamline(), Beamline::NC_HXR);
}

TEST_F(DualBSAStreamBufferTest, ConstructionFailureRaisesAndDetaches) {
  register_channel(source_, kCh1, Beamline::NC_HXR, 60.0,
                   ramp_history(0.0, 1000));

  EXPECT_THROW(DualBSAStreamBuffer(source_, DualStreamConfig{kCh1, "NO:SUCH:PV",
                                                             Beamline::NC_HXR}),
               StreamInitError);
  EXPECT_EQ(source_.subscription_count(kCh1), 0u);
  EXPECT_EQ(source_.subscription_count(kRateAddress), 0u);
}

TEST_F(DualBSAStreamBufferTest, ChannelChangeRebuildsStreams) {
  auto dual = make_dual(1000, 1000);
  register_channel(source_, "GDET:FEE1:242:ENRC", Beamline::NC_HXR, 60.0,
                   ramp_history(20000.0, 1006));

  dual->set_ch2("GDET:FEE1:242:ENRC");

  EXPECT_EQ(dual->ch2(), "GDET:FEE1:242:ENRC");
  EXPECT_TRUE(dual->stream_b().is_enabled());
  EXPECT_EQ(dual->stream_b().latest_pulse_id(), 1006u);
  EXPECT_EQ(source_.subscription_count(kCh2), 0u);
  EXPECT_EQ(source_.subscription_count("GDET:FEE1:242:ENRC"), 1u);
  EXPECT_EQ(source_.subscription_count(kRateAddress), 2u);
  EXPECT_EQ(dual->synced_point_count(), -1);

  SyncedSnapshot synced = dual->align();
  EXPECT_EQ(synced.size(), kBufferLength - 1);
}

TEST_F(DualBSAStreamBufferTest, BadChannelChangeOnlyWarns) {
  auto dual = make_dual(1000, 1000);

  EXPECT_NO_THROW(dual->set_ch2("NO:SUCH:PV"));
  EXPECT_TRUE(dual->stream_a().is_enabled());
  EXPECT_FALSE(dual->stream_b().is_enabled());
  EXPECT_EQ(source_.subscription_count(kRateAddress), 1u);
}

TEST_F(DualBSAStreamBufferTest, TimingComesFromFirstStream) {
  auto dual = make_dual(1000, 1000);

  EXPECT_DOUBLE_EQ(dual->sample_rate(), 60.0);
  EXPECT_DOUBLE_EQ(dual->sample_spacing(), 1.0 / 60.0);
  EXPECT_DOUBLE_EQ(dual->ticks_per_sample(), 6.0);
  EXPECT_DOUBLE_EQ(dual->buffer_modulus(), 2730.0);
  EXPECT_EQ(dual->stream_a().gap_monitor(), monitor_);
  EXPECT_EQ(dual->stream_b().gap_monitor(), monitor_);
}

TEST_F(DualBSAStreamBufferTest, StopDetachesBothStreams) {
  auto dual = make_dual(1000, 1000);
  EXPECT_EQ(source_.subscription_count(kRateAddress), 2u);

  dual->stop();

  EXPECT_EQ(source_.subscription_count(kCh1), 0u);
  EXPECT_EQ(source_.subscription_count(kCh2), 0u);
  EXPECT_EQ(source_.subscription_count(kRateAddress), 0u);
}
