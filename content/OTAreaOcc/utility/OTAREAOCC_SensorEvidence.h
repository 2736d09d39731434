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

Author(s) / Copyright (s): Damon Hart-Davis 2016--2018
*/

/*
 Sensor evidence model.

 Normalises raw host readings (contact/power/media states as text,
 numeric environmental readings) into a per-sensor
 active/inactive signal with a strength in [0,1],
 and tracks the resulting per-sensor state.
 */

#ifndef OTAREAOCC_SENSOREVIDENCE_H
#define OTAREAOCC_SENSOREVIDENCE_H

#include <stdint.h>
#include <map>
#include <string>
#include <vector>

#include "OTAREAOCC_Decay.h"
#include "OTAREAOCC_SensorType.h"
#include "OTAREAOCC_Util.h"


namespace OTAREAOCC
{


// How a raw reading is turned into evidence.
enum PredicateKind : uint8_t
    {
    // Active iff the raw text is one of a set of active states.
    PREDICATE_STATE_SET = 0,
    // Numeric: active iff value > threshold.
    PREDICATE_ABOVE,
    // Numeric: active iff value < threshold.
    PREDICATE_BELOW,
    // Numeric: active iff lo <= value <= hi.
    PREDICATE_BAND,
    // Numeric: no hard cutoff; strength grows smoothly
    // with the deviation from a (learned or configured) baseline.
    PREDICATE_CONTINUOUS
    };

// Activation predicate for one sensor.
// Only the fields relevant to the kind are used.
struct ActivationPredicate
    {
    PredicateKind kind;
    // PREDICATE_ABOVE/PREDICATE_BELOW cutoff.
    double threshold;
    // PREDICATE_BAND inclusive bounds.
    double lo, hi;
    // PREDICATE_CONTINUOUS configured baseline, used until one has been learned.
    bool hasBaseline;
    double baseline;
    // PREDICATE_CONTINUOUS deviation scale; strictly positive.
    double scale;
    // PREDICATE_CONTINUOUS: +1 if readings above baseline are evidence, -1 if below.
    int8_t direction;

    ActivationPredicate()
      : kind(PREDICATE_STATE_SET), threshold(0), lo(0), hi(0),
        hasBaseline(false), baseline(0), scale(1), direction(1) { }

    static ActivationPredicate stateSet() { return(ActivationPredicate()); }
    static ActivationPredicate above(double threshold);
    static ActivationPredicate below(double threshold);
    static ActivationPredicate band(double lo, double hi);
    static ActivationPredicate continuous(double scale, int8_t direction = 1);
    static ActivationPredicate continuousFrom(double baseline, double scale, int8_t direction = 1);
    };

// Identifies one physical sensor within an area.
// Immutable after configuration.
struct SensorConfig
    {
    // Stable host identifier, eg "binary_sensor.kitchen_motion"; unique within an area.
    std::string id;
    SensorType type;
    // Type-level reliability weight in [0,1].
    double weight;
    ActivationPredicate predicate;
    // For PREDICATE_STATE_SET: the active states; if empty the category defaults are used.
    std::vector<std::string> activeStates;
    // Optional evidence strength per active state, eg "paused" -> 0.7; others are 1.0.
    std::map<std::string, double> stateStrengths;

    SensorConfig() : type(SENSOR_MOTION), weight(0) { }

    // Sensor with all the category defaults:
    // the category weight, a state-set predicate for contact/power/media categories,
    // and a continuous predicate (no baseline yet) for numeric categories.
    static SensorConfig make(const std::string &id, SensorType type);
    };

// One reading from the host.
struct SensorReading
    {
    std::string sensorId;
    // Raw state text, eg "on", "playing" or "312.5".
    std::string raw;
    timestamp_ms_t timestampMs;
    // False if the host marked the sensor unavailable.
    bool available;

    SensorReading() : timestampMs(NO_TIME), available(false) { }
    SensorReading(const std::string &id, const std::string &value, const timestamp_ms_t t, const bool avail = true)
      : sensorId(id), raw(value), timestampMs(t), available(avail) { }
    };

// Evidence extracted from one reading.
struct Evidence
    {
    // False if the reading carries no usable value.
    bool available;
    bool active;
    // In [0,1]; 0 when not active.
    double strength;
    };

// Current observed evidence for one sensor.
// Mutated only by applyEvidence().
struct SensorState
    {
    bool isActive;
    // Current strength in [0,1]; 0 when not active.
    double strength;
    // Time of last transition to active, or NO_TIME.
    timestamp_ms_t lastActivatedMs;
    // Time of last reading of any kind, or NO_TIME.
    timestamp_ms_t lastObservedMs;
    // False until a usable reading arrives, and whenever the host reports no value.
    bool available;

    SensorState() : isActive(false), strength(0), lastActivatedMs(NO_TIME), lastObservedMs(NO_TIME), available(false) { }
    };

// Default active states for a state-set category; empty for numeric categories.
const std::vector<std::string> &defaultActiveStates(SensorType t);

// Extract evidence from a raw reading.
//   * available  false if the host marked the reading unavailable
//   * learnedBaselineOpt  learned baseline for continuous predicates; may be NULL
// Unavailable/unknown/empty text and unparseable numbers give unavailable evidence.
Evidence extractEvidence(const SensorConfig &config, const std::string &raw, bool available, const double *learnedBaselineOpt);

// Fold new evidence at nowMs into the sensor state and its decay state.
// Unavailable evidence marks the sensor unavailable and drops any decaying evidence.
// Returns true iff the active flag changed.
bool applyEvidence(const Evidence &e, timestamp_ms_t nowMs, SensorState &state, DecayState &decay);


}

#endif
