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
 */

#include <set>

#include "OTAREAOCC_AreaConfig.h"
#include "OTAREAOCC_ThresholdDecision.h"


namespace OTAREAOCC
{


AreaConfig::AreaConfig()
  : thresholdPC(DEFAULT_AreaParameters::THRESHOLD_PC),
    decayEnabled(DEFAULT_AreaParameters::DECAY_ENABLED),
    decayWindow_s(DEFAULT_AreaParameters::DECAY_WINDOW_S),
    decayMinDelay_s(DEFAULT_AreaParameters::DECAY_MIN_DELAY_S),
    decayShape(DECAY_COSINE),
    historicalAnalysisEnabled(true),
    historyPeriodDays(DEFAULT_AreaParameters::HISTORY_PERIOD_DAYS),
    timeOfDayPriorsEnabled(false),
    negativeEvidence(false),
    motionAsGroundTruth(true),
    utcOffsetMinutes(0)
    { }

const SensorConfig *AreaConfig::findSensor(const std::string &sensorId) const
    {
    for(std::vector<SensorConfig>::const_iterator i = sensors.begin(); i != sensors.end(); ++i)
        { if(sensorId == i->id) { return(&*i); } }
    return(NULL);
    }

DecaySettings AreaConfig::getDecaySettings() const
    {
    DecaySettings s;
    s.enabled = decayEnabled;
    s.windowMs = int64_t(decayWindow_s) * MS_PER_S;
    s.minDelayMs = int64_t(decayMinDelay_s) * MS_PER_S;
    s.shape = decayShape;
    return(s);
    }

AggregatorParameters AreaConfig::getAggregatorParameters() const
    {
    AggregatorParameters p;
    p.decayEnabled = decayEnabled;
    p.timeOfDayPriors = timeOfDayPriorsEnabled;
    p.negativeEvidence = negativeEvidence;
    p.utcOffsetMinutes = utcOffsetMinutes;
    return(p);
    }

ErrorReport::errorCatalogue validateAreaConfig(const AreaConfig &config)
    {
    if(config.areaId.empty()) { return(ErrorReport::ERR_CONFIG_AREA_ID); }
    if(std::string::npos != config.areaId.find_first_of("\"\\")) { return(ErrorReport::ERR_CONFIG_AREA_ID); }
    if(!isValidThresholdPC(config.thresholdPC)) { return(ErrorReport::ERR_CONFIG_THRESHOLD_RANGE); }
    if((config.decayWindow_s < 0) || (config.decayMinDelay_s < 0)) { return(ErrorReport::ERR_CONFIG_DECAY_RANGE); }
    if((config.historyPeriodDays < MIN_HISTORY_PERIOD_DAYS) || (config.historyPeriodDays > MAX_HISTORY_PERIOD_DAYS))
        { return(ErrorReport::ERR_CONFIG_HISTORY_PERIOD); }

    bool haveMotion = false;
    std::set<std::string> ids;
    for(std::vector<SensorConfig>::const_iterator i = config.sensors.begin(); i != config.sensors.end(); ++i)
        {
        if(i->id.empty() || !ids.insert(i->id).second) { return(ErrorReport::ERR_CONFIG_DUPLICATE_SENSOR); }
        // Written to reject NaN too.
        if(!((i->weight >= 0) && (i->weight <= 1))) { return(ErrorReport::ERR_CONFIG_WEIGHT_RANGE); }
        if(SENSOR_MOTION == i->type) { haveMotion = true; }
        }
    if(!haveMotion) { return(ErrorReport::ERR_CONFIG_NO_MOTION); }

    if(!config.motionAsGroundTruth && (NULL == config.findSensor(config.groundTruthSensorId)))
        { return(ErrorReport::ERR_CONFIG_NO_GROUND_TRUTH); }

    return(ErrorReport::ERR_NONE);
    }


}
