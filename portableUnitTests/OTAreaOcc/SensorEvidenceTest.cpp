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
 * Driver for sensor type and evidence extraction tests.
 */

#include <stdint.h>
#include <gtest/gtest.h>
#include <OTAreaOcc.h>

#include "OTAREAOCC_SensorEvidence.h"
#include "OTAREAOCC_SensorType.h"


// Category names round-trip and unknown names are rejected.
TEST(SensorType,parse)
{
    for(uint8_t i = 0; i < OTAREAOCC::SENSOR_TYPE_COUNT; ++i)
        {
        const OTAREAOCC::SensorType t = OTAREAOCC::SensorType(i);
        OTAREAOCC::SensorType out = OTAREAOCC::SENSOR_TYPE_COUNT;
        EXPECT_TRUE(OTAREAOCC::parseSensorType(OTAREAOCC::sensorTypeName(t), out)) << int(i);
        EXPECT_EQ(t, out);
        }
    OTAREAOCC::SensorType out = OTAREAOCC::SENSOR_DOOR;
    EXPECT_FALSE(OTAREAOCC::parseSensorType("sofa", out));
    EXPECT_FALSE(OTAREAOCC::parseSensorType(NULL, out));
    EXPECT_EQ(OTAREAOCC::SENSOR_DOOR, out);
    EXPECT_STREQ("?", OTAREAOCC::sensorTypeName(OTAREAOCC::SENSOR_TYPE_COUNT));
}

// Defaults are sane for every category.
TEST(SensorType,defaults)
{
    for(uint8_t i = 0; i < OTAREAOCC::SENSOR_TYPE_COUNT; ++i)
        {
        const OTAREAOCC::SensorTypeDefaults &d = OTAREAOCC::getSensorTypeDefaults(OTAREAOCC::SensorType(i));
        EXPECT_GE(d.weight, 0.0);
        EXPECT_LE(d.weight, 1.0);
        EXPECT_GT(d.pTruePositive, d.pFalsePositive) << d.name;
        EXPECT_GT(d.priorOccupied, 0.0);
        EXPECT_LT(d.priorOccupied, 1.0);
        if(d.numeric) { EXPECT_GT(d.continuousScale, 0.0) << d.name; }
        }
    // Motion outweighs everything else.
    const double motionWeight = OTAREAOCC::getSensorTypeDefaults(OTAREAOCC::SENSOR_MOTION).weight;
    for(uint8_t i = 1; i < OTAREAOCC::SENSOR_TYPE_COUNT; ++i)
        { EXPECT_GT(motionWeight, OTAREAOCC::getSensorTypeDefaults(OTAREAOCC::SensorType(i)).weight); }
    EXPECT_TRUE(OTAREAOCC::isNumericSensorType(OTAREAOCC::SENSOR_TEMPERATURE));
    EXPECT_FALSE(OTAREAOCC::isNumericSensorType(OTAREAOCC::SENSOR_DOOR));
}

// State-set sensors: default active states, unavailable text.
TEST(SensorEvidence,stateSet)
{
    const OTAREAOCC::SensorConfig motion = OTAREAOCC::SensorConfig::make("binary_sensor.m", OTAREAOCC::SENSOR_MOTION);
    EXPECT_EQ(OTAREAOCC::PREDICATE_STATE_SET, motion.predicate.kind);
    EXPECT_DOUBLE_EQ(0.85, motion.weight);
    OTAREAOCC::Evidence e = OTAREAOCC::extractEvidence(motion, "on", true, NULL);
    EXPECT_TRUE(e.available);
    EXPECT_TRUE(e.active);
    EXPECT_EQ(1.0, e.strength);
    e = OTAREAOCC::extractEvidence(motion, "off", true, NULL);
    EXPECT_TRUE(e.available);
    EXPECT_FALSE(e.active);
    EXPECT_EQ(0.0, e.strength);
    e = OTAREAOCC::extractEvidence(motion, "unavailable", true, NULL);
    EXPECT_FALSE(e.available);
    EXPECT_FALSE(e.active);
    e = OTAREAOCC::extractEvidence(motion, "", true, NULL);
    EXPECT_FALSE(e.available);
    // Host flag overrides any text.
    e = OTAREAOCC::extractEvidence(motion, "on", false, NULL);
    EXPECT_FALSE(e.available);
    EXPECT_FALSE(e.active);

    const OTAREAOCC::SensorConfig door = OTAREAOCC::SensorConfig::make("binary_sensor.d", OTAREAOCC::SENSOR_DOOR);
    EXPECT_TRUE(OTAREAOCC::extractEvidence(door, "open", true, NULL).active);
    EXPECT_FALSE(OTAREAOCC::extractEvidence(door, "closed", true, NULL).active);

    // Explicit active states replace the defaults.
    OTAREAOCC::SensorConfig app = OTAREAOCC::SensorConfig::make("switch.kettle", OTAREAOCC::SENSOR_APPLIANCE);
    app.activeStates.push_back("standby");
    EXPECT_TRUE(OTAREAOCC::extractEvidence(app, "standby", true, NULL).active);
    EXPECT_FALSE(OTAREAOCC::extractEvidence(app, "on", true, NULL).active);
}

// Paused media is weaker evidence than playing.
TEST(SensorEvidence,mediaStrength)
{
    const OTAREAOCC::SensorConfig tv = OTAREAOCC::SensorConfig::make("media_player.tv", OTAREAOCC::SENSOR_MEDIA);
    const OTAREAOCC::Evidence playing = OTAREAOCC::extractEvidence(tv, "playing", true, NULL);
    EXPECT_TRUE(playing.active);
    EXPECT_EQ(1.0, playing.strength);
    const OTAREAOCC::Evidence paused = OTAREAOCC::extractEvidence(tv, "paused", true, NULL);
    EXPECT_TRUE(paused.active);
    EXPECT_DOUBLE_EQ(0.7, paused.strength);
    const OTAREAOCC::Evidence idle = OTAREAOCC::extractEvidence(tv, "idle", true, NULL);
    EXPECT_TRUE(idle.available);
    EXPECT_FALSE(idle.active);
}

// Hard numeric predicates.
TEST(SensorEvidence,numericCutoffs)
{
    OTAREAOCC::SensorConfig lux = OTAREAOCC::SensorConfig::make("sensor.lux", OTAREAOCC::SENSOR_ILLUMINANCE);
    lux.predicate = OTAREAOCC::ActivationPredicate::above(100);
    EXPECT_TRUE(OTAREAOCC::extractEvidence(lux, "100.5", true, NULL).active);
    EXPECT_FALSE(OTAREAOCC::extractEvidence(lux, "100", true, NULL).active);
    EXPECT_FALSE(OTAREAOCC::extractEvidence(lux, "bright", true, NULL).available);
    lux.predicate = OTAREAOCC::ActivationPredicate::below(5);
    EXPECT_TRUE(OTAREAOCC::extractEvidence(lux, "4", true, NULL).active);
    EXPECT_FALSE(OTAREAOCC::extractEvidence(lux, "5", true, NULL).active);
    lux.predicate = OTAREAOCC::ActivationPredicate::band(10, 20);
    EXPECT_TRUE(OTAREAOCC::extractEvidence(lux, "10", true, NULL).active);
    EXPECT_TRUE(OTAREAOCC::extractEvidence(lux, "20", true, NULL).active);
    EXPECT_FALSE(OTAREAOCC::extractEvidence(lux, "20.1", true, NULL).active);
    EXPECT_EQ(1.0, OTAREAOCC::extractEvidence(lux, "15", true, NULL).strength);
}

// Continuous predicates grow smoothly with deviation from the baseline.
TEST(SensorEvidence,continuous)
{
    const OTAREAOCC::SensorConfig hum = OTAREAOCC::SensorConfig::make("sensor.hum", OTAREAOCC::SENSOR_HUMIDITY);
    EXPECT_EQ(OTAREAOCC::PREDICATE_CONTINUOUS, hum.predicate.kind);
    // No baseline yet: available but neutral.
    OTAREAOCC::Evidence e = OTAREAOCC::extractEvidence(hum, "70", true, NULL);
    EXPECT_TRUE(e.available);
    EXPECT_FALSE(e.active);
    // With a learned baseline.
    const double baseline = 50;
    e = OTAREAOCC::extractEvidence(hum, "45", true, &baseline);
    EXPECT_FALSE(e.active);
    EXPECT_FALSE(OTAREAOCC::extractEvidence(hum, "50", true, &baseline).active);
    const OTAREAOCC::Evidence small = OTAREAOCC::extractEvidence(hum, "52", true, &baseline);
    const OTAREAOCC::Evidence large = OTAREAOCC::extractEvidence(hum, "70", true, &baseline);
    EXPECT_TRUE(small.active);
    EXPECT_TRUE(large.active);
    EXPECT_LT(small.strength, large.strength);
    EXPECT_LE(large.strength, 1.0);
    // One scale above the baseline gives about 63%.
    EXPECT_NEAR(0.632, OTAREAOCC::extractEvidence(hum, "55", true, &baseline).strength, 0.001);

    // Configured baseline, below-baseline direction; a learned one takes precedence.
    OTAREAOCC::SensorConfig temp = OTAREAOCC::SensorConfig::make("sensor.t", OTAREAOCC::SENSOR_TEMPERATURE);
    temp.predicate = OTAREAOCC::ActivationPredicate::continuousFrom(20, 1, -1);
    EXPECT_TRUE(OTAREAOCC::extractEvidence(temp, "19", true, NULL).active);
    EXPECT_FALSE(OTAREAOCC::extractEvidence(temp, "21", true, NULL).active);
    const double learned = 18;
    EXPECT_FALSE(OTAREAOCC::extractEvidence(temp, "19", true, &learned).active);
}

// Folding evidence into sensor state and decay.
TEST(SensorEvidence,applyEvidence)
{
    OTAREAOCC::SensorState s;
    OTAREAOCC::DecayState d;
    EXPECT_FALSE(s.available);
    const OTAREAOCC::Evidence on = { true, true, 0.7 };
    const OTAREAOCC::Evidence off = { true, false, 0 };
    const OTAREAOCC::Evidence gone = { false, false, 0 };

    EXPECT_TRUE(OTAREAOCC::applyEvidence(on, 1000, s, d));
    EXPECT_TRUE(s.available);
    EXPECT_TRUE(s.isActive);
    EXPECT_DOUBLE_EQ(0.7, s.strength);
    EXPECT_EQ(1000, s.lastActivatedMs);
    EXPECT_EQ(1000, s.lastObservedMs);
    // Repeat activation keeps the first activation time.
    EXPECT_FALSE(OTAREAOCC::applyEvidence(on, 2000, s, d));
    EXPECT_EQ(1000, s.lastActivatedMs);
    EXPECT_EQ(2000, s.lastObservedMs);
    // Deactivation starts decay holding the live strength.
    EXPECT_TRUE(OTAREAOCC::applyEvidence(off, 3000, s, d));
    EXPECT_FALSE(s.isActive);
    EXPECT_EQ(0.0, s.strength);
    EXPECT_TRUE(d.isDecaying());
    EXPECT_EQ(3000, d.getDecayStartMs());
    EXPECT_DOUBLE_EQ(0.7, d.getPeakStrength());
    // A repeated inactive reading does not restart decay.
    EXPECT_FALSE(OTAREAOCC::applyEvidence(off, 4000, s, d));
    EXPECT_EQ(3000, d.getDecayStartMs());
    // Unavailable drops decaying evidence.
    EXPECT_FALSE(OTAREAOCC::applyEvidence(gone, 5000, s, d));
    EXPECT_FALSE(s.available);
    EXPECT_FALSE(d.isDecaying());
    EXPECT_EQ(5000, s.lastObservedMs);
    // Unavailable while active reports a change.
    EXPECT_TRUE(OTAREAOCC::applyEvidence(on, 6000, s, d));
    EXPECT_TRUE(OTAREAOCC::applyEvidence(gone, 7000, s, d));
    EXPECT_FALSE(s.isActive);
}
