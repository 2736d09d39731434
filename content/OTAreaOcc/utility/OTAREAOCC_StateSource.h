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
 Host state interfaces consumed by the occupancy engine:
 current state (for start-up and reconciliation)
 and recorded history (for the learner).

 Implemented by the host; may block.
 */

#ifndef OTAREAOCC_STATESOURCE_H
#define OTAREAOCC_STATESOURCE_H

#include <string>
#include <vector>

#include "OTAREAOCC_Concurrency.h"
#include "OTAREAOCC_SensorEvidence.h"
#include "OTAREAOCC_Util.h"


namespace OTAREAOCC
{


// One recorded state of a sensor.
struct HistorySample
    {
    timestamp_ms_t timestampMs;
    // Raw state text as for SensorReading.
    std::string raw;
    // False if the host recorded the sensor as unavailable.
    bool available;

    HistorySample() : timestampMs(NO_TIME), available(false) { }
    HistorySample(const timestamp_ms_t t, const std::string &value, const bool avail = true)
      : timestampMs(t), raw(value), available(avail) { }
    };

// Current state of each sensor.
class CurrentStateSource
    {
    public:
        // Fetch the sensor's current state into out.
        // Returns false if the host has no state for that sensor.
        virtual bool fetchCurrent(const std::string &sensorId, SensorReading &out) = 0;

    protected:
        // Prevent deletion through this base.
        ~CurrentStateSource() { }
    };

// Recorded state history of each sensor.
class StateHistorySource
    {
    public:
        // Append to out the samples for the sensor in [startMs,endMs],
        // including the state in force at startMs if known.
        // Samples need not be in time order.
        // A slow fetch should poll token.shouldStop() and give up (returning false)
        // once it says stop, so that the learner can honour its deadline and cancellation.
        // Returns false if the history could not be retrieved.
        virtual bool fetchHistory(const std::string &sensorId, timestamp_ms_t startMs, timestamp_ms_t endMs,
                                  const CancellationToken &token, std::vector<HistorySample> &out) = 0;

    protected:
        // Prevent deletion through this base.
        ~StateHistorySource() { }
    };


}

#endif
