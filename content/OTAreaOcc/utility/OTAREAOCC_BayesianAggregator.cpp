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
 */

#include <math.h>
#include <algorithm>
#include <cmath>
#include <utility>

#include "OTAREAOCC_BayesianAggregator.h"
#include "OTAREAOCC_Parameters.h"
#include "OTAREAOCC_ThresholdDecision.h"


namespace OTAREAOCC
{


// Keep log-odds finite and away from the extremes before conversion.
static double clampLogOdds(const double x)
    { return(fnconstrain(x, -LOG_ODDS_LIMIT, LOG_ODDS_LIMIT)); }

double baselinePrior(const std::vector<SensorSnapshot> &sensors, const PriorTable &priors,
                     const AggregatorParameters &params, const timestamp_ms_t nowMs)
    {
    if(params.timeOfDayPriors)
        {
        const uint8_t pc = priors.getByHour().get(hourOfDay(nowMs, params.utcOffsetMinutes));
        if(ByHourPriors::UNSET_BYTE != pc)
            { return(fnconstrain(pc / 100.0, LEARNED_PROBABILITY_MIN, LEARNED_PROBABILITY_MAX)); }
        }

    // Distinct categories present, in category order so that sensor order cannot matter.
    bool configured[SENSOR_TYPE_COUNT] = { };
    bool available[SENSOR_TYPE_COUNT] = { };
    bool anyAvailable = false;
    for(std::vector<SensorSnapshot>::const_iterator i = sensors.begin(); i != sensors.end(); ++i)
        {
        if(i->type >= SENSOR_TYPE_COUNT) { continue; }
        configured[i->type] = true;
        if(i->available) { available[i->type] = true; anyAvailable = true; }
        }
    const bool *const use = anyAvailable ? available : configured;
    double sum = 0;
    uint8_t n = 0;
    for(uint8_t t = 0; t < SENSOR_TYPE_COUNT; ++t)
        {
        if(!use[t]) { continue; }
        sum += priors.forType(SensorType(t)).getPriorOccupied();
        ++n;
        }
    if(0 == n) { return(priors.forType(SENSOR_MOTION).getPriorOccupied()); }
    return(sum / n);
    }

AreaState aggregate(const std::vector<SensorSnapshot> &sensors, const PriorTable &priors,
                    const AggregatorParameters &params, const uint8_t thresholdPC, const timestamp_ms_t nowMs)
    {
    AreaState result;
    result.thresholdPC = thresholdPC;
    result.lastUpdatedMs = nowMs;

    const double prior = baselinePrior(sensors, priors, params, nowMs);
    result.priorOccupied = prior;
    // The prior is always strictly inside (0,1) so this is finite.
    const double priorLogOdds = logit(prior);

    // (sensor ID, log-odds contribution), summed in ID order.
    std::vector<std::pair<std::string, double> > contributions;
    contributions.reserve(sensors.size());

    for(std::vector<SensorSnapshot>::const_iterator i = sensors.begin(); i != sensors.end(); ++i)
        {
        const SensorSnapshot &s = *i;
        // Unavailable sensors give no evidence either way.
        if(!s.available) { continue; }

        const PriorModel &m = priors.forSensor(s.id, s.type);
        const double tp = m.getTruePositive();
        const double fp = m.getFalsePositive();

        // Effective weight of positive evidence: live, else decaying.
        double w = 0;
        if(s.active) { w = s.weight * s.strength; }
        else if(params.decayEnabled && (s.decayFactor > 0)) { w = s.weight * s.decayStrength * s.decayFactor; }

        double c = 0;
        const bool positive = (w > 0);
        if(positive) { c = w * log(tp / fp); }
        else if(params.negativeEvidence && (s.weight > 0)) { c = s.weight * log((1 - tp) / (1 - fp)); }

        if(!std::isfinite(c))
            {
            // Cannot happen with clamped priors and validated weights.
            result.numericFault = true;
            c = 0;
            }

        contributions.push_back(std::make_pair(s.id, c));
        result.perSensorProbabilities[s.id] = (0 == c) ? prior : logistic(clampLogOdds(priorLogOdds + c));
        if(positive && (w > NEGLIGIBLE_EVIDENCE)) { result.activeTriggers.insert(s.id); }
        }

    // Fixed summation order makes the floating-point result independent of input order.
    std::sort(contributions.begin(), contributions.end());
    double sum = 0;
    bool anyContribution = false;
    for(std::vector<std::pair<std::string, double> >::const_iterator i = contributions.begin(); i != contributions.end(); ++i)
        {
        if(0 == i->second) { continue; }
        sum += i->second;
        anyContribution = true;
        }

    if(!anyContribution) { result.probability = prior; }
    else { result.probability = fnconstrain(logistic(clampLogOdds(priorLogOdds + sum)), 0.0, 1.0); }
    if(!std::isfinite(result.probability))
        {
        result.numericFault = true;
        result.probability = prior;
        }

    result.occupied = isOccupied(result.probability, thresholdPC);
    return(result);
    }


}
