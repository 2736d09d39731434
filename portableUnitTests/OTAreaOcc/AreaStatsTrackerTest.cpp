/*
The OpenTRV project licenses this file to you
under the Apache Licence, Version 2.0 (the "Licence");
you may not use this file except in compliance
with the Licence. You may obtain a copy of the Licence at

http://www.apache.org/licenses/LICENSE-2.0

Unless required by applicable law or agreed to in writing,
software distributed under the Licence is distributed on an
"AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
KIND, either express or implied. See the Licence for the
specific language governing permissions and limitations
under the Licence.

Author(s) / Copyright (s): Damon Hart-Davis 2017--2018
*/

/*
 * Driver for area stats tests.
 */

#include <math.h>
#include <stdint.h>
#include <gtest/gtest.h>
#include <OTAreaOcc.h>

#include "OTAREAOCC_AreaStatsTracker.h"


namespace ASTT
{
static OTAREAOCC::AreaState state(const OTAREAOCC::timestamp_ms_t t, const double p, const bool occ)
    {
    OTAREAOCC::AreaState s;
    s.areaId = "hall";
    s.lastUpdatedMs = t;
    s.probability = p;
    s.occupied = occ;
    s.thresholdPC = 50;
    return(s);
    }
}

// Nothing recorded.
TEST(AreaStatsTracker,empty)
{
    const OTAREAOCC::AreaStatsTracker st;
    EXPECT_EQ(0U, st.getProbabilitySampleCount());
    EXPECT_EQ(0U, st.getOccupancySampleCount());
    EXPECT_TRUE(isnan(st.getMovingAverage()));
    EXPECT_TRUE(isnan(st.getMinProbability()));
    EXPECT_TRUE(isnan(st.getMaxProbability()));
    EXPECT_EQ(0, st.getRateOfChangePerMinute());
    EXPECT_EQ(0, st.getOccupancyRate());
    EXPECT_EQ(OTAREAOCC::NO_TIME, st.getLastOccupiedMs());
    EXPECT_FALSE(st.isOccupied());
    EXPECT_EQ(0, st.getStateDurationMs(1000));
}

// Averages, extremes, rate and occupancy.
TEST(AreaStatsTracker,basics)
{
    OTAREAOCC::AreaStatsTracker st;
    st.update(ASTT::state(0, 0.2, false));
    st.update(ASTT::state(60000, 0.8, true));
    st.update(ASTT::state(120000, 0.5, true));
    st.update(ASTT::state(180000, 0.1, false));
    EXPECT_EQ(4U, st.getProbabilitySampleCount());
    EXPECT_DOUBLE_EQ((0.2 + 0.8 + 0.5 + 0.1) / 4, st.getMovingAverage());
    EXPECT_DOUBLE_EQ(0.1, st.getMinProbability());
    EXPECT_DOUBLE_EQ(0.8, st.getMaxProbability());
    // From 0.2 to 0.1 over three minutes.
    EXPECT_NEAR(-0.1 / 3, st.getRateOfChangePerMinute(), 1e-12);
    EXPECT_DOUBLE_EQ(0.5, st.getOccupancyRate());
    EXPECT_EQ(120000, st.getLastOccupiedMs());
    EXPECT_FALSE(st.isOccupied());
    EXPECT_EQ(20000, st.getStateDurationMs(200000));
    // Clock behind the last state.
    EXPECT_EQ(0, st.getStateDurationMs(100000));
    // Repeating the same state does not restart its duration.
    st.update(ASTT::state(240000, 0.1, false));
    EXPECT_EQ(120000, st.getStateDurationMs(300000));
    st.reset();
    EXPECT_EQ(0U, st.getProbabilitySampleCount());
    EXPECT_TRUE(isnan(st.getMovingAverage()));
}

// Histories are bounded; extremes are not.
TEST(AreaStatsTracker,bounded)
{
    OTAREAOCC::AreaStatsTracker st;
    st.update(ASTT::state(0, 0.99, true));
    for(int i = 1; i <= 400; ++i) { st.update(ASTT::state(i * 1000, 0.3, false)); }
    EXPECT_EQ(OTAREAOCC::PROBABILITY_HISTORY_LENGTH, st.getProbabilitySampleCount());
    EXPECT_EQ(OTAREAOCC::OCCUPANCY_HISTORY_LENGTH, st.getOccupancySampleCount());
    EXPECT_NEAR(0.3, st.getMovingAverage(), 1e-12);
    EXPECT_EQ(0, st.getRateOfChangePerMinute());
    EXPECT_EQ(0, st.getOccupancyRate());
    EXPECT_DOUBLE_EQ(0.99, st.getMaxProbability());
    EXPECT_EQ(0, st.getLastOccupiedMs());
}
