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
 One monitored area.
 */

#include <memory>

#include "OTAREAOCC_Area.h"
#include "OTAREAOCC_Serial_IO.h"


namespace OTAREAOCC
{


Area::Area(const AreaConfig &c, PriorStore &s)
  : store(s)
    { reconfigure(c); }

Area::SensorRuntime *Area::find(const std::string &sensorId)
    {
    for(std::vector<SensorRuntime>::iterator i = sensors.begin(); i != sensors.end(); ++i)
        { if(sensorId == i->config.id) { return(&*i); } }
    return(NULL);
    }
const Area::SensorRuntime *Area::find(const std::string &sensorId) const
    {
    for(std::vector<SensorRuntime>::const_iterator i = sensors.begin(); i != sensors.end(); ++i)
        { if(sensorId == i->config.id) { return(&*i); } }
    return(NULL);
    }

bool Area::applyReading(const SensorReading &r)
    {
    SensorRuntime *const s = find(r.sensorId);
    if(NULL == s) { return(false); }
    // Out of order.
    if((NO_TIME != s->state.lastObservedMs) && (r.timestampMs < s->state.lastObservedMs)) { return(false); }

    const std::shared_ptr<const PriorTable> priors = store.get(config.areaId);
    const double *const baseline = priors ? priors->getBaseline(r.sensorId) : NULL;
    const Evidence e = extractEvidence(s->config, r.raw, r.available, baseline);
    if(!e.available)
        {
        // WARN_EVIDENCE_UNAVAILABLE: the sensor simply drops out of aggregation.
        OTAREAOCC_DEBUG_SERIAL_PRINT("unavailable: ");
        OTAREAOCC_DEBUG_SERIAL_PRINT(r.sensorId.c_str());
        OTAREAOCC_DEBUG_SERIAL_PRINTLN();
        }
    applyEvidence(e, r.timestampMs, s->state, s->decay);
    return(true);
    }

AreaState Area::recompute(const timestamp_ms_t nowMs, const uint8_t thresholdPC)
    {
    const DecaySettings ds = config.getDecaySettings();
    std::vector<SensorSnapshot> snapshots;
    snapshots.reserve(sensors.size());
    for(std::vector<SensorRuntime>::iterator i = sensors.begin(); i != sensors.end(); ++i)
        {
        SensorSnapshot ss;
        ss.id = i->config.id;
        ss.type = i->config.type;
        ss.weight = i->config.weight;
        ss.available = i->state.available;
        ss.active = i->state.isActive;
        ss.strength = i->state.strength;
        ss.decayFactor = i->decay.update(i->state.isActive, nowMs, ds);
        ss.decayStrength = i->decay.getPeakStrength();
        snapshots.push_back(ss);
        }

    const std::shared_ptr<const PriorTable> priors = store.get(config.areaId);
    // Area dropped from the store (being removed): fall back to defaults.
    static const PriorTable defaults;
    AreaState result = aggregate(snapshots, priors ? *priors : defaults,
                                 config.getAggregatorParameters(), thresholdPC, nowMs);
    result.areaId = config.areaId;
    return(result);
    }

void Area::reconfigure(const AreaConfig &newConfig)
    {
    std::vector<SensorRuntime> rebuilt;
    rebuilt.reserve(newConfig.sensors.size());
    for(std::vector<SensorConfig>::const_iterator i = newConfig.sensors.begin(); i != newConfig.sensors.end(); ++i)
        {
        SensorRuntime r;
        const SensorRuntime *const old = find(i->id);
        if((NULL != old) && (old->config.type == i->type))
            {
            r.state = old->state;
            r.decay = old->decay;
            }
        r.config = *i;
        rebuilt.push_back(r);
        }
    sensors.swap(rebuilt);
    config = newConfig;
    }

const SensorState *Area::getSensorState(const std::string &sensorId) const
    {
    const SensorRuntime *const s = find(sensorId);
    return((NULL == s) ? NULL : &s->state);
    }

const DecayState *Area::getDecayState(const std::string &sensorId) const
    {
    const SensorRuntime *const s = find(sensorId);
    return((NULL == s) ? NULL : &s->decay);
    }


}
