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
 Recent statistics of an area's published states,
 eg for diagnostics and the compact JSON state line.
 */

#ifndef OTAREAOCC_AREASTATSTRACKER_H
#define OTAREAOCC_AREASTATSTRACKER_H

#include <stdint.h>
#include <deque>
#include <utility>

#include "OTAREAOCC_BayesianAggregator.h"
#include "OTAREAOCC_Parameters.h"
#include "OTAREAOCC_Util.h"


namespace OTAREAOCC
{


// Rolling statistics over recent area states.
// Not thread-safe.
class AreaStatsTracker final
    {
    private:
        // (time, probability), newest at the back; at most PROBABILITY_HISTORY_LENGTH.
        std::deque<std::pair<timestamp_ms_t, double> > probabilities;
        // Occupied flags, newest at the back; at most OCCUPANCY_HISTORY_LENGTH.
        std::deque<bool> occupancy;

        // Extremes of probability seen since the last reset().
        double minProbability;
        double maxProbability;

        // Time of the last update() that was occupied, or NO_TIME.
        timestamp_ms_t lastOccupiedMs;
        // Time at which the current occupied/vacant state began, or NO_TIME.
        timestamp_ms_t stateSinceMs;
        bool currentlyOccupied;

    public:
        typedef std::deque<std::pair<timestamp_ms_t, double> > ProbabilityHistory;
        typedef std::deque<bool> OccupancyHistory;

        AreaStatsTracker() { reset(); }

        // Forget everything.
        void reset();

        // Record one published state.
        void update(const AreaState &s);

        // Replace everything with previously-saved history.
        // Returns false (and changes nothing) if either history is too long,
        // a probability or extreme is outside [0,1],
        // or min/max are not both NAN or both set with min <= max.
        bool restore(const ProbabilityHistory &p, const OccupancyHistory &o,
                     double minP, double maxP,
                     timestamp_ms_t lastOccupied, timestamp_ms_t stateSince, bool occupied);

        // Held samples, oldest first.
        const ProbabilityHistory &getProbabilityHistory() const { return(probabilities); }
        const OccupancyHistory &getOccupancyHistory() const { return(occupancy); }

        // Number of probability samples held, [0,PROBABILITY_HISTORY_LENGTH].
        size_t getProbabilitySampleCount() const { return(probabilities.size()); }
        // Number of occupancy samples held, [0,OCCUPANCY_HISTORY_LENGTH].
        size_t getOccupancySampleCount() const { return(occupancy.size()); }

        // Mean of held probability samples; NAN if none.
        double getMovingAverage() const;

        // Change in probability per minute between the oldest and newest held samples;
        // 0 if fewer than two samples or no time between them.
        double getRateOfChangePerMinute() const;

        // NAN if no samples yet.
        double getMinProbability() const { return(minProbability); }
        double getMaxProbability() const { return(maxProbability); }

        // Fraction [0,1] of held occupancy samples that were occupied; 0 if none.
        double getOccupancyRate() const;

        timestamp_ms_t getLastOccupiedMs() const { return(lastOccupiedMs); }
        bool isOccupied() const { return(currentlyOccupied); }
        // Start of the current occupied/vacant state, or NO_TIME.
        timestamp_ms_t getStateSinceMs() const { return(stateSinceMs); }

        // Time in the current occupied/vacant state as of nowMs; 0 if unknown.
        int64_t getStateDurationMs(timestamp_ms_t nowMs) const;
    };


}

#endif
