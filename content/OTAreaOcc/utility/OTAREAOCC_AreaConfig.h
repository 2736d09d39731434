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
 Runtime configuration for one monitored area.
 Loaded by the host at area creation and on explicit reconfiguration.
 */

#ifndef OTAREAOCC_AREACONFIG_H
#define OTAREAOCC_AREACONFIG_H

#include <stdint.h>
#include <string>
#include <vector>

#include "OTAREAOCC_BayesianAggregator.h"
#include "OTAREAOCC_Decay.h"
#include "OTAREAOCC_ErrorReport.h"
#include "OTAREAOCC_Parameters.h"
#include "OTAREAOCC_SensorEvidence.h"


namespace OTAREAOCC
{


struct AreaConfig
    {
    // Unique non-empty area identifier; also the JSON "@" ID so no '"' or '\'.
    std::string areaId;
    // All sensors; at least one must be a motion sensor.
    std::vector<SensorConfig> sensors;

    // Occupied iff probability >= thresholdPC/100; [1,99].
    uint8_t thresholdPC;

    // Decay of evidence after sensors go inactive.
    bool decayEnabled;
    int32_t decayWindow_s;
    int32_t decayMinDelay_s;
    DecayShape decayShape;

    // Periodic re-learning of priors from history.
    bool historicalAnalysisEnabled;
    // Learner lookback; [1,90] days.
    uint8_t historyPeriodDays;

    // Use learned by-hour priors as the aggregation baseline.
    bool timeOfDayPriorsEnabled;
    // Let idle sensors count against occupancy.
    bool negativeEvidence;

    // If true the union of motion sensor activity is the learner's ground truth;
    // else groundTruthSensorId names the sensor used instead.
    bool motionAsGroundTruth;
    std::string groundTruthSensorId;

    // Local time offset from UTC, for by-hour priors.
    int16_t utcOffsetMinutes;

    // Configuration with DEFAULT_AreaParameters and no sensors.
    AreaConfig();

    // Sensor with the given ID, or NULL if none.
    const SensorConfig *findSensor(const std::string &sensorId) const;

    DecaySettings getDecaySettings() const;
    AggregatorParameters getAggregatorParameters() const;
    };

// Check a configuration before it is used.
// Returns ERR_NONE if acceptable, else the first problem found.
ErrorReport::errorCatalogue validateAreaConfig(const AreaConfig &config);


}

#endif
