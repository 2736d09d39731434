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

Author(s) / Copyright (s): Damon Hart-Davis 2014--2018
*/

/*
 Recent statistics of an area's published states.
 */

#include <math.h>

#include "OTAREAOCC_AreaStatsTracker.h"


namespace OTAREAOCC
{


void AreaStatsTracker::reset()
    {
    probabilities.clear();
    occupancy.clear();
    minProbability = NAN;
    maxProbability = NAN;
    lastOccupiedMs = NO_TIME;
    stateSinceMs = NO_TIME;
    currentlyOccupied = false;
    }

void AreaStatsTracker::update(const AreaState &s)
    {
    probabilities.push_back(std::make_pair(s.lastUpdatedMs, s.probability));
    while(probabilities.size() > PROBABILITY_HISTORY_LENGTH) { probabilities.pop_front(); }
    occupancy.push_back(s.occupied);
    while(occupancy.size() > OCCUPANCY_HISTORY_LENGTH) { occupancy.pop_front(); }

    // NaN compares false so the first sample always sets both.
    if(!(s.probability >= minProbability)) { minProbability = s.probability; }
    if(!(s.probability <= maxProbability)) { maxProbability = s.probability; }

    if(s.occupied) { lastOccupiedMs = s.lastUpdatedMs; }
    if((NO_TIME == stateSinceMs) || (s.occupied != currentlyOccupied))
        {
        stateSinceMs = s.lastUpdatedMs;
        currentlyOccupied = s.occupied;
        }
    }

bool AreaStatsTracker::restore(const ProbabilityHistory &p, const OccupancyHistory &o,
                               const double minP, const double maxP,
                               const timestamp_ms_t lastOccupied, const timestamp_ms_t stateSince, const bool occupied)
    {
    if((p.size() > PROBABILITY_HISTORY_LENGTH) || (o.size() > OCCUPANCY_HISTORY_LENGTH)) { return(false); }
    for(ProbabilityHistory::const_iterator i = p.begin(); i != p.end(); ++i)
        { if(!((i->second >= 0) && (i->second <= 1))) { return(false); } }
    const bool noExtremes = isnan(minP) && isnan(maxP);
    if(!noExtremes && !((minP >= 0) && (minP <= maxP) && (maxP <= 1))) { return(false); }
    probabilities = p;
    occupancy = o;
    minProbability = minP;
    maxProbability = maxP;
    lastOccupiedMs = lastOccupied;
    stateSinceMs = stateSince;
    currentlyOccupied = occupied;
    return(true);
    }

double AreaStatsTracker::getMovingAverage() const
    {
    if(probabilities.empty()) { return(NAN); }
    double sum = 0;
    for(std::deque<std::pair<timestamp_ms_t, double> >::const_iterator i = probabilities.begin(); i != probabilities.end(); ++i)
        { sum += i->second; }
    return(sum / probabilities.size());
    }

double AreaStatsTracker::getRateOfChangePerMinute() const
    {
    if(probabilities.size() < 2) { return(0); }
    const int64_t dt = probabilities.back().first - probabilities.front().first;
    if(dt <= 0) { return(0); }
    return((probabilities.back().second - probabilities.front().second) * MS_PER_MINUTE / double(dt));
    }

double AreaStatsTracker::getOccupancyRate() const
    {
    if(occupancy.empty()) { return(0); }
    size_t n = 0;
    for(std::deque<bool>::const_iterator i = occupancy.begin(); i != occupancy.end(); ++i) { if(*i) { ++n; } }
    return(double(n) / occupancy.size());
    }

int64_t AreaStatsTracker::getStateDurationMs(const timestamp_ms_t nowMs) const
    {
    if((NO_TIME == stateSinceMs) || (nowMs < stateSinceMs)) { return(0); }
    return(nowMs - stateSinceMs);
    }


}
