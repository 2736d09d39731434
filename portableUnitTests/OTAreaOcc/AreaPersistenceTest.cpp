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
 * Driver for save/restore of area priors and stats.
 */

#include <math.h>
#include <stdint.h>
#include <string>
#include <gtest/gtest.h>
#include <OTAreaOcc.h>

#include "OTAREAOCC_AreaPersistence.h"


namespace APT
{
static OTAREAOCC::AreaState state(const OTAREAOCC::timestamp_ms_t t, const double p, const bool occ)
    {
    OTAREAOCC::AreaState s;
    s.areaId = "den";
    s.lastUpdatedMs = t;
    s.probability = p;
    s.occupied = occ;
    s.thresholdPC = 50;
    return(s);
    }

// A table with something learned in every part.
static OTAREAOCC::PriorTable learnedTable()
    {
    OTAREAOCC::PriorTable t;
    t.setForType(OTAREAOCC::SENSOR_DOOR, OTAREAOCC::PriorModel(0.61, 0.17, 0.43));
    t.setForType(OTAREAOCC::SENSOR_MEDIA, OTAREAOCC::PriorModel(1.0 / 3, 0.09, 0.38));
    t.setForSensor("binary_sensor.den_motion", OTAREAOCC::PriorModel(0.93, 0.031, 0.27));
    t.setBaseline("sensor.den_lux", 123.456789);
    t.setBaseline("sensor.den_temp", -4.5);
    t.getByHour().set(0, 5);
    t.getByHour().set(7, 95);
    t.getByHour().set(23, 50);
    t.setLearnedAtMs(1234567890123LL);
    return(t);
    }

static OTAREAOCC::AreaStatsTracker someStats()
    {
    OTAREAOCC::AreaStatsTracker st;
    st.update(state(1000, 0.2, false));
    st.update(state(61000, 0.81, true));
    st.update(state(121000, 0.7, true));
    st.update(state(181000, 0.1, false));
    return(st);
    }

static void expectSameStats(const OTAREAOCC::AreaStatsTracker &a, const OTAREAOCC::AreaStatsTracker &b)
    {
    EXPECT_TRUE(a.getProbabilityHistory() == b.getProbabilityHistory());
    EXPECT_TRUE(a.getOccupancyHistory() == b.getOccupancyHistory());
    if(isnan(a.getMinProbability())) { EXPECT_TRUE(isnan(b.getMinProbability())); }
    else { EXPECT_EQ(a.getMinProbability(), b.getMinProbability()); }
    if(isnan(a.getMaxProbability())) { EXPECT_TRUE(isnan(b.getMaxProbability())); }
    else { EXPECT_EQ(a.getMaxProbability(), b.getMaxProbability()); }
    EXPECT_EQ(a.getLastOccupiedMs(), b.getLastOccupiedMs());
    EXPECT_EQ(a.getStateSinceMs(), b.getStateSinceMs());
    EXPECT_EQ(a.isOccupied(), b.isOccupied());
    }
}

// Everything saved comes back exactly.
TEST(AreaPersistence,roundTrip)
{
    const OTAREAOCC::PriorTable t(APT::learnedTable());
    const OTAREAOCC::AreaStatsTracker st(APT::someStats());
    std::string text;
    ASSERT_TRUE(OTAREAOCC::saveAreaState(t, st, text));
    EXPECT_EQ(0U, text.find(OTAREAOCC::AREA_STATE_HEADER));

    OTAREAOCC::PriorTable t2;
    OTAREAOCC::AreaStatsTracker st2;
    ASSERT_EQ(OTAREAOCC::ErrorReport::ERR_NONE, OTAREAOCC::loadAreaState(text, t2, st2));
    EXPECT_TRUE(t == t2);
    EXPECT_EQ(1.0 / 3, t2.forType(OTAREAOCC::SENSOR_MEDIA).getTruePositive());
    ASSERT_TRUE(NULL != t2.getBaseline("sensor.den_lux"));
    EXPECT_EQ(123.456789, *t2.getBaseline("sensor.den_lux"));
    EXPECT_EQ(OTAREAOCC::ByHourPriors::UNSET_BYTE, t2.getByHour().get(1));
    EXPECT_EQ(3U, t2.getByHour().countSet());
    APT::expectSameStats(st, st2);
    EXPECT_DOUBLE_EQ(0.5, st2.getOccupancyRate());
    EXPECT_EQ(60000, st2.getStateDurationMs(241000));

    // Saving the restored copy gives the same text.
    std::string again;
    ASSERT_TRUE(OTAREAOCC::saveAreaState(t2, st2, again));
    EXPECT_EQ(text, again);
}

// Defaults and no stats at all.
TEST(AreaPersistence,emptyState)
{
    const OTAREAOCC::PriorTable t;
    const OTAREAOCC::AreaStatsTracker st;
    std::string text;
    ASSERT_TRUE(OTAREAOCC::saveAreaState(t, st, text));
    OTAREAOCC::PriorTable t2(APT::learnedTable());
    OTAREAOCC::AreaStatsTracker st2(APT::someStats());
    ASSERT_EQ(OTAREAOCC::ErrorReport::ERR_NONE, OTAREAOCC::loadAreaState(text, t2, st2));
    EXPECT_TRUE(t == t2);
    EXPECT_EQ(OTAREAOCC::NO_TIME, t2.getLearnedAtMs());
    EXPECT_EQ(0U, st2.getProbabilitySampleCount());
    APT::expectSameStats(st, st2);
}

// IDs that would not read back as one field are refused.
TEST(AreaPersistence,unwritable)
{
    const OTAREAOCC::AreaStatsTracker st;
    std::string text;
    OTAREAOCC::PriorTable spaced;
    spaced.setForSensor("binary_sensor.den motion", OTAREAOCC::PriorModel(0.9, 0.1, 0.3));
    EXPECT_FALSE(OTAREAOCC::saveAreaState(spaced, st, text));
    OTAREAOCC::PriorTable blank;
    blank.setBaseline("", 1);
    EXPECT_FALSE(OTAREAOCC::saveAreaState(blank, st, text));
    OTAREAOCC::PriorTable inf;
    inf.setBaseline("sensor.den_lux", INFINITY);
    EXPECT_FALSE(OTAREAOCC::saveAreaState(inf, st, text));
}

// Malformed text is rejected and nothing is changed.
TEST(AreaPersistence,rejectsMalformed)
{
    const std::string h = std::string(OTAREAOCC::AREA_STATE_HEADER) + "\n";
    std::string tooMany(h);
    for(int i = 0; i <= OTAREAOCC::PROBABILITY_HISTORY_LENGTH; ++i)
        { tooMany += "Q " + std::to_string(i * 1000) + " 0.5\n"; }
    const std::string bad[] =
        {
        "",
        "\n\n",
        "OTAO 2\n",
        "L 1\n",
        h + "Z 1\n",
        h + "LL 1\n",
        h + "L soon\n",
        h + "T garage 0.5 0.5 0.5\n",
        h + "T motion 1.5 0.2 0.3\n",
        h + "T motion 0.5 0.2\n",
        h + "S binary_sensor.x 0.5 nan 0.5\n",
        h + "B sensor.lux inf\n",
        h + "H 1 2 3\n",
        h + "H 0 0 0 0 0 0 0 0 0 0 0 0 0 0 0 0 0 0 0 0 0 0 0 101\n",
        h + "Q 10 abc\n",
        h + "Q 10 -0.1\n",
        h + "O 012\n",
        h + "M 0.8 0.2\n",
        h + "X 1 2 yes\n",
        tooMany,
        };
    const OTAREAOCC::PriorTable original(APT::learnedTable());
    const OTAREAOCC::AreaStatsTracker originalStats(APT::someStats());
    for(size_t i = 0; i < sizeof(bad)/sizeof(bad[0]); ++i)
        {
        SCOPED_TRACE(i);
        OTAREAOCC::PriorTable t(original);
        OTAREAOCC::AreaStatsTracker st(originalStats);
        EXPECT_EQ(OTAREAOCC::ErrorReport::ERR_RESTORE_FORMAT, OTAREAOCC::loadAreaState(bad[i], t, st));
        EXPECT_TRUE(original == t);
        APT::expectSameStats(originalStats, st);
        }
    EXPECT_STREQ("ERR_RESTORE_FORMAT", OTAREAOCC::errorCatalogueName(OTAREAOCC::ErrorReport::ERR_RESTORE_FORMAT));
}

// Records may come in any order; only the header must be first.
TEST(AreaPersistence,recordOrder)
{
    const std::string text =
        "\n"
        "OTAO 1\n"
        "X 61000 61000 1\n"
        "  B   sensor.den_lux 80  \n"
        "T motion 0.9 0.2 0.4\n"
        "Q 1000 0.25\n"
        "Q 61000 0.75\n"
        "O 01\n"
        "M 0.25 0.75\n";
    OTAREAOCC::PriorTable t;
    OTAREAOCC::AreaStatsTracker st;
    ASSERT_EQ(OTAREAOCC::ErrorReport::ERR_NONE, OTAREAOCC::loadAreaState(text, t, st));
    EXPECT_EQ(OTAREAOCC::PriorModel(0.9, 0.2, 0.4), t.forType(OTAREAOCC::SENSOR_MOTION));
    EXPECT_EQ(OTAREAOCC::PriorModel::forType(OTAREAOCC::SENSOR_MEDIA), t.forType(OTAREAOCC::SENSOR_MEDIA));
    ASSERT_TRUE(NULL != t.getBaseline("sensor.den_lux"));
    EXPECT_EQ(80, *t.getBaseline("sensor.den_lux"));
    EXPECT_EQ(0U, t.getByHour().countSet());
    EXPECT_EQ(OTAREAOCC::NO_TIME, t.getLearnedAtMs());
    EXPECT_EQ(2U, st.getProbabilitySampleCount());
    EXPECT_DOUBLE_EQ(0.5, st.getMovingAverage());
    EXPECT_DOUBLE_EQ(0.5, st.getOccupancyRate());
    EXPECT_TRUE(st.isOccupied());
    EXPECT_EQ(61000, st.getLastOccupiedMs());
}
