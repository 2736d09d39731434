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
 Bayesian aggregator.

 Combines the current (decayed) evidence of all sensors in an area
 into one posterior occupancy probability,
 by a weighted sequential Bayesian update in log-odds space.

 Each sensor i contributes w_i * log(LR_i) to the log-odds, where
 w_i is the type weight scaled by evidence strength and decay,
 and LR_i = tp_i / fp_i for positive evidence.
 Low-weight types thus sway the posterior less.

 This is a pure function of its inputs, for deterministic replay.
 */

#ifndef OTAREAOCC_BAYESIANAGGREGATOR_H
#define OTAREAOCC_BAYESIANAGGREGATOR_H

#include <stdint.h>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "OTAREAOCC_PriorStore.h"
#include "OTAREAOCC_SensorType.h"
#include "OTAREAOCC_Util.h"


namespace OTAREAOCC
{


// Everything the aggregator needs to know about one sensor at one instant.
struct SensorSnapshot
    {
    std::string id;
    SensorType type;
    // Type-level weight in [0,1].
    double weight;
    // False if the sensor has no usable reading; then it is ignored entirely.
    bool available;
    bool active;
    // Current strength in [0,1] while active.
    double strength;
    // Decay factor in [0,1]; 1 while active, 0 when nothing is decaying.
    double decayFactor;
    // Strength held at deactivation; weighted by decayFactor while decaying.
    double decayStrength;

    SensorSnapshot()
      : type(SENSOR_MOTION), weight(0), available(false), active(false),
        strength(0), decayFactor(0), decayStrength(0) { }
    };

// Aggregation options.
struct AggregatorParameters
    {
    // If false, only currently-active sensors give positive evidence.
    bool decayEnabled;
    // If true and the current hour has a learned prior, use it as the baseline.
    bool timeOfDayPriors;
    // If true, an available sensor with no current or decaying evidence
    // contributes its negative likelihood ratio (1-tp)/(1-fp).
    bool negativeEvidence;
    // Local time offset from UTC for by-hour priors.
    int16_t utcOffsetMinutes;

    AggregatorParameters() : decayEnabled(true), timeOfDayPriors(false), negativeEvidence(false), utcOffsetMinutes(0) { }
    };

// Aggregate result for one area at one instant.
// Never persisted: derivable from sensor, decay and prior state.
struct AreaState
    {
    std::string areaId;
    // Posterior occupancy probability in [0,1].
    double probability;
    // probability >= thresholdPC/100.
    bool occupied;
    // Threshold (percent) used for occupied.
    uint8_t thresholdPC;
    // Baseline prior the posterior was built from.
    double priorOccupied;
    // Sensors currently giving non-negligible positive evidence.
    std::set<std::string> activeTriggers;
    // For each available sensor, the posterior from the baseline and that sensor alone.
    std::map<std::string, double> perSensorProbabilities;
    timestamp_ms_t lastUpdatedMs;
    // True if some intermediate value was not finite; an internal error.
    bool numericFault;

    AreaState() : probability(0), occupied(false), thresholdPC(0), priorOccupied(0), lastUpdatedMs(NO_TIME), numericFault(false) { }
    };

// Baseline prior for aggregation.
// The learned by-hour prior for the current hour if enabled and set,
// else the mean category prior over the distinct categories of available sensors,
// else (none available) over all configured sensors' categories,
// else (no sensors) the motion category prior.
double baselinePrior(const std::vector<SensorSnapshot> &sensors, const PriorTable &priors,
                     const AggregatorParameters &params, timestamp_ms_t nowMs);

// Compute the area state from the given sensor snapshots and priors.
// The result is bit-for-bit independent of the order of the sensors.
// With no non-zero contribution the probability is exactly the baseline prior.
AreaState aggregate(const std::vector<SensorSnapshot> &sensors, const PriorTable &priors,
                    const AggregatorParameters &params, uint8_t thresholdPC, timestamp_ms_t nowMs);


}

#endif
