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
 */

#include <math.h>
#include <algorithm>

#include "OTAREAOCC_SensorEvidence.h"


namespace OTAREAOCC
{


ActivationPredicate ActivationPredicate::above(const double t)
    { ActivationPredicate p; p.kind = PREDICATE_ABOVE; p.threshold = t; return(p); }

ActivationPredicate ActivationPredicate::below(const double t)
    { ActivationPredicate p; p.kind = PREDICATE_BELOW; p.threshold = t; return(p); }

ActivationPredicate ActivationPredicate::band(const double l, const double h)
    { ActivationPredicate p; p.kind = PREDICATE_BAND; p.lo = l; p.hi = h; return(p); }

ActivationPredicate ActivationPredicate::continuous(const double s, const int8_t dir)
    {
    ActivationPredicate p;
    p.kind = PREDICATE_CONTINUOUS;
    p.scale = s;
    p.direction = (dir < 0) ? -1 : 1;
    return(p);
    }

ActivationPredicate ActivationPredicate::continuousFrom(const double b, const double s, const int8_t dir)
    {
    ActivationPredicate p(continuous(s, dir));
    p.hasBaseline = true;
    p.baseline = b;
    return(p);
    }

SensorConfig SensorConfig::make(const std::string &id, const SensorType type)
    {
    const SensorTypeDefaults &d = getSensorTypeDefaults(type);
    SensorConfig c;
    c.id = id;
    c.type = type;
    c.weight = d.weight;
    if(d.numeric) { c.predicate = ActivationPredicate::continuous(d.continuousScale); }
    // Paused media still suggests someone is about, but less strongly.
    if(SENSOR_MEDIA == type) { c.stateStrengths["paused"] = 0.7; }
    return(c);
    }

const std::vector<std::string> &defaultActiveStates(const SensorType t)
    {
    static const std::vector<std::string> none;
    static const std::vector<std::string> on { "on" };
    static const std::vector<std::string> media { "playing", "paused" };
    static const std::vector<std::string> appliance { "on", "active" };
    static const std::vector<std::string> contact { "open", "on" };
    switch(t)
        {
        case SENSOR_MOTION: return(on);
        case SENSOR_MEDIA: return(media);
        case SENSOR_APPLIANCE: return(appliance);
        case SENSOR_DOOR: return(contact);
        case SENSOR_WINDOW: return(contact);
        case SENSOR_LIGHT: return(on);
        default: break;
        }
    return(none);
    }

// Evidence from a state-set predicate; raw is known to be a real value.
static Evidence stateSetEvidence(const SensorConfig &config, const std::string &raw)
    {
    Evidence e = { true, false, 0 };
    const std::vector<std::string> &states = config.activeStates.empty() ? defaultActiveStates(config.type) : config.activeStates;
    if(states.end() == std::find(states.begin(), states.end(), raw)) { return(e); }
    const std::map<std::string, double>::const_iterator s = config.stateStrengths.find(raw);
    const double strength = (config.stateStrengths.end() == s) ? 1.0 : fnconstrain(s->second, 0.0, 1.0);
    e.active = (strength > 0);
    e.strength = e.active ? strength : 0;
    return(e);
    }

// Evidence from a numeric predicate.
static Evidence numericEvidence(const ActivationPredicate &p, const double v, const double *const learnedBaselineOpt)
    {
    Evidence e = { true, false, 0 };
    switch(p.kind)
        {
        case PREDICATE_ABOVE: e.active = (v > p.threshold); break;
        case PREDICATE_BELOW: e.active = (v < p.threshold); break;
        case PREDICATE_BAND: e.active = ((v >= p.lo) && (v <= p.hi)); break;
        case PREDICATE_CONTINUOUS:
            {
            // No baseline yet: available but no evidence either way.
            if((NULL == learnedBaselineOpt) && !p.hasBaseline) { return(e); }
            const double baseline = (NULL != learnedBaselineOpt) ? *learnedBaselineOpt : p.baseline;
            const double scale = (p.scale > 0) ? p.scale : 1.0;
            const double d = p.direction * (v - baseline) / scale;
            if(d > 0)
                {
                e.strength = fnconstrain(1.0 - exp(-d), 0.0, 1.0);
                e.active = (e.strength > 0);
                }
            return(e);
            }
        default: break;
        }
    e.strength = e.active ? 1.0 : 0.0;
    return(e);
    }

Evidence extractEvidence(const SensorConfig &config, const std::string &raw, const bool available, const double *const learnedBaselineOpt)
    {
    const Evidence unavailable = { false, false, 0 };
    if(!available || isUnavailableStateText(raw)) { return(unavailable); }
    if(PREDICATE_STATE_SET == config.predicate.kind) { return(stateSetEvidence(config, raw)); }
    double v;
    if(!parseFiniteDouble(raw, v)) { return(unavailable); }
    return(numericEvidence(config.predicate, v, learnedBaselineOpt));
    }

bool applyEvidence(const Evidence &e, const timestamp_ms_t nowMs, SensorState &state, DecayState &decay)
    {
    const bool wasActive = state.isActive;
    state.lastObservedMs = nowMs;
    if(!e.available)
        {
        state.available = false;
        state.isActive = false;
        state.strength = 0;
        decay.clear();
        return(wasActive);
        }
    state.available = true;
    if(e.active)
        {
        if(!wasActive) { state.lastActivatedMs = nowMs; }
        decay.onActivated();
        state.isActive = true;
        state.strength = e.strength;
        }
    else
        {
        if(wasActive) { decay.onDeactivated(nowMs, state.strength); }
        state.isActive = false;
        state.strength = 0;
        }
    return(wasActive != e.active);
    }


}
