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
 Likelihood/prior store.

 Holds, per area, the per-category and per-sensor likelihoods and priors,
 learned baselines for environmental sensors,
 and by-hour occupancy priors.

 Each area's table is immutable once published
 and is replaced wholesale by the learner.
 */

#ifndef OTAREAOCC_PRIORSTORE_H
#define OTAREAOCC_PRIORSTORE_H

#include <stdint.h>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "OTAREAOCC_Concurrency.h"
#include "OTAREAOCC_Parameters.h"
#include "OTAREAOCC_SensorType.h"
#include "OTAREAOCC_Util.h"


namespace OTAREAOCC
{


// Likelihoods and prior for one sensor category or one sensor.
// All three values always lie strictly inside (0,1):
// the constructor clamps them to [PROBABILITY_FLOOR,PROBABILITY_CEIL].
class PriorModel final
    {
    private:
        double pTruePositive;
        double pFalsePositive;
        double priorOccupied;

    public:
        PriorModel() : pTruePositive(0.5), pFalsePositive(0.5), priorOccupied(0.5) { }
        PriorModel(double tp, double fp, double prior)
          : pTruePositive(clampProbability(tp)),
            pFalsePositive(clampProbability(fp)),
            priorOccupied(clampProbability(prior)) { }

        // Category defaults.
        static PriorModel forType(SensorType t);

        // P(active | occupied).
        double getTruePositive() const { return(pTruePositive); }
        // P(active | unoccupied).
        double getFalsePositive() const { return(pFalsePositive); }
        // Baseline P(occupied).
        double getPriorOccupied() const { return(priorOccupied); }

        // Clamp into [PROBABILITY_FLOOR,PROBABILITY_CEIL]; NaN becomes 0.5.
        static double clampProbability(double p);

        bool operator==(const PriorModel &o) const
            { return((pTruePositive == o.pTruePositive) && (pFalsePositive == o.pFalsePositive) && (priorOccupied == o.priorOccupied)); }
        bool operator!=(const PriorModel &o) const { return(!(*this == o)); }
    };


// By-hour occupancy priors as whole percentages.
// A slot holds [0,100] or UNSET_BYTE if nothing has been learned for that hour.
class ByHourPriors final
    {
    public:
        static constexpr uint8_t HOURS = 24;
        // Unset slot.
        static constexpr uint8_t UNSET_BYTE = 0xff;

    private:
        uint8_t slots[HOURS];

    public:
        ByHourPriors() { zap(); }

        // Mark all slots unset.
        void zap();

        // Bounds-checked read; UNSET_BYTE for an unset slot or an invalid hour.
        uint8_t get(uint8_t hh) const { return((hh < HOURS) ? slots[hh] : UNSET_BYTE); }

        // Bounds-checked write; values above 100 (other than UNSET_BYTE) are clamped to 100.
        void set(uint8_t hh, uint8_t pc);

        // Count of set slots.
        uint8_t countSet() const;

        // Minimum/maximum set value; UNSET_BYTE if all unset.
        uint8_t getMin() const;
        uint8_t getMax() const;

        bool operator==(const ByHourPriors &o) const;
    };


// All learned parameters for one area.
// Published as an immutable snapshot; copy, modify and commit to change.
class PriorTable final
    {
    private:
        PriorModel byType[SENSOR_TYPE_COUNT];
        std::map<std::string, PriorModel> bySensor;
        std::map<std::string, double> baselines;
        ByHourPriors byHour;
        // Time of the last successful learning commit, or NO_TIME.
        timestamp_ms_t learnedAtMs;

    public:
        // Table with category defaults, no per-sensor entries, baselines or by-hour priors.
        PriorTable();

        // Category entry.
        const PriorModel &forType(SensorType t) const;
        void setForType(SensorType t, const PriorModel &m);

        // Entry for an individual sensor: its own if learned, else its category's.
        const PriorModel &forSensor(const std::string &sensorId, SensorType t) const;
        // True if the sensor has its own learned entry.
        bool hasSensorEntry(const std::string &sensorId) const { return(bySensor.end() != bySensor.find(sensorId)); }
        void setForSensor(const std::string &sensorId, const PriorModel &m) { bySensor[sensorId] = m; }
        // All per-sensor entries, by sensor ID.
        const std::map<std::string, PriorModel> &getSensorEntries() const { return(bySensor); }

        // Learned baseline for a sensor, or NULL if none.
        // Pointer valid for the lifetime of this table.
        const double *getBaseline(const std::string &sensorId) const;
        void setBaseline(const std::string &sensorId, double b) { baselines[sensorId] = b; }
        const std::map<std::string, double> &getBaselines() const { return(baselines); }

        const ByHourPriors &getByHour() const { return(byHour); }
        ByHourPriors &getByHour() { return(byHour); }

        timestamp_ms_t getLearnedAtMs() const { return(learnedAtMs); }
        void setLearnedAtMs(const timestamp_ms_t t) { learnedAtMs = t; }

        bool operator==(const PriorTable &o) const;
    };


// Store of prior tables keyed by area ID.
// No area ever reads or writes another's table.
// Reads and commits are atomic per area:
// a reader holds either the whole old or the whole new table.
// Thread-safe.
class PriorStore final
    {
    private:
        typedef AtomicSnapshot<PriorTable> Slot;
        // Guards the map structure only; table access is lock-free once a slot is found.
        mutable std::mutex mapLock;
        std::map<std::string, std::shared_ptr<Slot> > slots;

        std::shared_ptr<Slot> findSlot(const std::string &areaId) const;

    public:
        PriorStore() { }
        PriorStore(const PriorStore &) = delete;
        PriorStore &operator=(const PriorStore &) = delete;

        // Create an area's slot holding default priors.
        // Returns false if the area already exists.
        bool createArea(const std::string &areaId);

        // Drop an area's slot; readers holding its table may keep using it.
        // Returns false if no such area.
        bool removeArea(const std::string &areaId);

        // True if the area has a slot.
        bool hasArea(const std::string &areaId) const { return(static_cast<bool>(findSlot(areaId))); }

        // Current table for the area, or NULL if no such area.
        std::shared_ptr<const PriorTable> get(const std::string &areaId) const;

        // Atomically replace the area's table.
        // Returns false (and does nothing) if no such area or table is NULL.
        bool commit(const std::string &areaId, std::shared_ptr<const PriorTable> table);
    };


}

#endif
