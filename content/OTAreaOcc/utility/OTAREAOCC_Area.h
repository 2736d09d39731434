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
 One monitored area: its sensors' evidence and decay state,
 and the recomputation of its occupancy from them.

 Not thread-safe: driven by a single owner (see AreaWorker).
 */

#ifndef OTAREAOCC_AREA_H
#define OTAREAOCC_AREA_H

#include <stdint.h>
#include <string>
#include <vector>

#include "OTAREAOCC_AreaConfig.h"
#include "OTAREAOCC_BayesianAggregator.h"
#include "OTAREAOCC_Decay.h"
#include "OTAREAOCC_PriorStore.h"
#include "OTAREAOCC_SensorEvidence.h"


namespace OTAREAOCC
{


class Area final
    {
    private:
        // Everything held for one configured sensor.
        struct SensorRuntime
            {
            SensorConfig config;
            SensorState state;
            DecayState decay;
            };

        // Source of this area's priors; never another area's.
        PriorStore &store;
        AreaConfig config;
        // In configuration order.
        std::vector<SensorRuntime> sensors;

        SensorRuntime *find(const std::string &sensorId);
        const SensorRuntime *find(const std::string &sensorId) const;

    public:
        // Config is assumed to have passed validateAreaConfig().
        Area(const AreaConfig &config, PriorStore &store);
        Area(const Area &) = delete;
        Area &operator=(const Area &) = delete;

        const std::string &getId() const { return(config.areaId); }
        const AreaConfig &getConfig() const { return(config); }

        // Fold one reading into the matching sensor's state.
        // Readings for sensors not in this area,
        // or older than the last reading for that sensor,
        // are ignored and false returned.
        bool applyReading(const SensorReading &r);

        // Advance decay to nowMs and aggregate.
        AreaState recompute(timestamp_ms_t nowMs, uint8_t thresholdPC);

        // Replace the configuration.
        // Sensors whose ID and type are unchanged keep their state.
        void reconfigure(const AreaConfig &newConfig);

        // State of one sensor, or NULL if not configured.
        const SensorState *getSensorState(const std::string &sensorId) const;
        const DecayState *getDecayState(const std::string &sensorId) const;
    };


}

#endif
