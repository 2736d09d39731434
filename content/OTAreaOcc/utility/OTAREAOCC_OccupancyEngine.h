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
 Registry of monitored areas and the host-facing entry points.

 Owns the prior store and one AreaWorker per area.
 Areas are fully isolated from one another:
 a reading is applied only to areas that configure its sensor.
 */

#ifndef OTAREAOCC_OCCUPANCYENGINE_H
#define OTAREAOCC_OCCUPANCYENGINE_H

#include <stdint.h>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "OTAREAOCC_AreaConfig.h"
#include "OTAREAOCC_AreaWorker.h"
#include "OTAREAOCC_ErrorReport.h"
#include "OTAREAOCC_HistoricalLearner.h"
#include "OTAREAOCC_PriorStore.h"
#include "OTAREAOCC_StateSource.h"


namespace OTAREAOCC
{


// Thread-safe.
class OccupancyEngine final
    {
    private:
        PriorStore store;
        const LearnerParameters learnerParams;

        // Guards the map structure only.
        mutable std::mutex areasLock;
        std::map<std::string, std::shared_ptr<AreaWorker> > areas;

        std::shared_ptr<AreaWorker> find(const std::string &areaId) const;

    public:
        OccupancyEngine() { }
        explicit OccupancyEngine(const LearnerParameters &lp) : learnerParams(lp) { }
        OccupancyEngine(const OccupancyEngine &) = delete;
        OccupancyEngine &operator=(const OccupancyEngine &) = delete;

        // Validate and create an area, with default priors.
        // Returns ERR_NONE on success, ERR_CONFIG_AREA_ID if the ID is in use,
        // else the validation failure; on failure nothing is created.
        ErrorReport::errorCatalogue addArea(const AreaConfig &config,
                                            const AreaWorker::Listener &listener = AreaWorker::Listener());

        // Stop and drop an area and its priors.
        // Returns false if no such area.
        bool removeArea(const std::string &areaId);

        bool hasArea(const std::string &areaId) const { return(static_cast<bool>(find(areaId))); }
        // IDs of all areas, in ID order.
        std::vector<std::string> getAreaIds() const;

        // Replace an area's configuration; learned priors are kept.
        // Returns ERR_UNKNOWN_AREA, a validation failure, or ERR_NONE.
        ErrorReport::errorCatalogue reconfigure(const AreaConfig &config);

        // Queue a reading for one area.
        // Returns false if no such area or the sensor is not in it.
        bool postReading(const std::string &areaId, const SensorReading &r);

        // Queue a reading for every area that configures its sensor.
        // Returns the number of areas it was queued to.
        size_t routeReading(const SensorReading &r);

        // Advance decay and recompute every area at nowMs.
        void tick(timestamp_ms_t nowMs);

        // Latest state of an area.
        // Returns false if no such area.
        bool getState(const std::string &areaId, AreaState &out) const;

        // Learn an area's priors now on the calling thread.
        // historyDays of USE_CONFIGURED_HISTORY_PERIOD means the area's configured period.
        // An unknown area gives LEARN_FAILED with ERR_UNKNOWN_AREA.
        LearnResult updatePriors(const std::string &areaId, StateHistorySource &source,
                                 uint8_t historyDays, timestamp_ms_t nowMs,
                                 uint32_t timeout_ms = DEFAULT_LEARNER_TIMEOUT_MS);
        // As updatePriors() but on a separate thread.
        std::future<LearnResult> updatePriorsAsync(const std::string &areaId, StateHistorySource &source,
                                                   uint8_t historyDays, timestamp_ms_t nowMs,
                                                   uint32_t timeout_ms = DEFAULT_LEARNER_TIMEOUT_MS);

        // Save an area's priors and stats; false if no such area or it cannot be written.
        bool saveAreaState(const std::string &areaId, std::string &out) const;
        // Restore state saved by saveAreaState() into an existing area.
        // Returns ERR_UNKNOWN_AREA, ERR_RESTORE_FORMAT or ERR_NONE.
        ErrorReport::errorCatalogue restoreAreaState(const std::string &areaId, const std::string &text);

        // Threshold in percent, or 0 if no such area.
        uint8_t getThreshold(const std::string &areaId) const;
        // Returns false if no such area or the threshold is out of range.
        bool setThreshold(const std::string &areaId, uint8_t pc);

        // Block until all work queued so far for every area is done.
        void flush();

        // Direct access, eg for diagnostics; NULL if no such area.
        std::shared_ptr<AreaWorker> getArea(const std::string &areaId) const { return(find(areaId)); }
        PriorStore &getPriorStore() { return(store); }
        const PriorStore &getPriorStore() const { return(store); }
    };


}

#endif
