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
 */

#include <string.h>

#include "OTAREAOCC_PriorStore.h"


namespace OTAREAOCC
{


constexpr uint8_t ByHourPriors::HOURS;
constexpr uint8_t ByHourPriors::UNSET_BYTE;

PriorModel PriorModel::forType(const SensorType t)
    {
    const SensorTypeDefaults &d = getSensorTypeDefaults(t);
    return(PriorModel(d.pTruePositive, d.pFalsePositive, d.priorOccupied));
    }

double PriorModel::clampProbability(const double p)
    {
    if(p != p) { return(0.5); } // NaN.
    return(fnconstrain(p, PROBABILITY_FLOOR, PROBABILITY_CEIL));
    }


void ByHourPriors::zap()
    { memset(slots, UNSET_BYTE, sizeof(slots)); }

void ByHourPriors::set(const uint8_t hh, const uint8_t pc)
    {
    if(hh >= HOURS) { return; }
    slots[hh] = ((UNSET_BYTE == pc) || (pc <= 100)) ? pc : 100;
    }

uint8_t ByHourPriors::countSet() const
    {
    uint8_t result = 0;
    for(int8_t hh = HOURS; --hh >= 0; )
        { if(UNSET_BYTE != slots[hh]) { ++result; } }
    return(result);
    }

// Get minimum set value; UNSET_BYTE if all samples are unset.
uint8_t ByHourPriors::getMin() const
    {
    uint8_t result = UNSET_BYTE;
    for(int8_t hh = HOURS; --hh >= 0; )
        {
        const uint8_t v = slots[hh];
        // All valid samples are less than UNSET_BYTE.
        if(v < result) { result = v; }
        }
    return(result);
    }

// Get maximum set value; UNSET_BYTE if all samples are unset.
uint8_t ByHourPriors::getMax() const
    {
    uint8_t result = UNSET_BYTE;
    for(int8_t hh = HOURS; --hh >= 0; )
        {
        const uint8_t v = slots[hh];
        if((UNSET_BYTE != v) &&
           ((UNSET_BYTE == result) || (v > result)))
            { result = v; }
        }
    return(result);
    }

bool ByHourPriors::operator==(const ByHourPriors &o) const
    { return(0 == memcmp(slots, o.slots, sizeof(slots))); }


PriorTable::PriorTable() : learnedAtMs(NO_TIME)
    {
    for(uint8_t i = 0; i < SENSOR_TYPE_COUNT; ++i)
        { byType[i] = PriorModel::forType(SensorType(i)); }
    }

const PriorModel &PriorTable::forType(const SensorType t) const
    { return(byType[(t < SENSOR_TYPE_COUNT) ? t : SENSOR_MOTION]); }

void PriorTable::setForType(const SensorType t, const PriorModel &m)
    { if(t < SENSOR_TYPE_COUNT) { byType[t] = m; } }

const PriorModel &PriorTable::forSensor(const std::string &sensorId, const SensorType t) const
    {
    const std::map<std::string, PriorModel>::const_iterator i = bySensor.find(sensorId);
    if(bySensor.end() != i) { return(i->second); }
    return(forType(t));
    }

const double *PriorTable::getBaseline(const std::string &sensorId) const
    {
    const std::map<std::string, double>::const_iterator i = baselines.find(sensorId);
    return((baselines.end() == i) ? NULL : &(i->second));
    }

bool PriorTable::operator==(const PriorTable &o) const
    {
    for(uint8_t i = 0; i < SENSOR_TYPE_COUNT; ++i)
        { if(byType[i] != o.byType[i]) { return(false); } }
    return((bySensor == o.bySensor) && (baselines == o.baselines) &&
           (byHour == o.byHour) && (learnedAtMs == o.learnedAtMs));
    }


std::shared_ptr<PriorStore::Slot> PriorStore::findSlot(const std::string &areaId) const
    {
    std::lock_guard<std::mutex> lock(mapLock);
    const std::map<std::string, std::shared_ptr<Slot> >::const_iterator i = slots.find(areaId);
    if(slots.end() == i) { return(std::shared_ptr<Slot>()); }
    return(i->second);
    }

bool PriorStore::createArea(const std::string &areaId)
    {
    std::lock_guard<std::mutex> lock(mapLock);
    if(slots.end() != slots.find(areaId)) { return(false); }
    std::shared_ptr<const PriorTable> initial(std::make_shared<PriorTable>());
    slots[areaId] = std::make_shared<Slot>(initial);
    return(true);
    }

bool PriorStore::removeArea(const std::string &areaId)
    {
    std::lock_guard<std::mutex> lock(mapLock);
    return(0 != slots.erase(areaId));
    }

std::shared_ptr<const PriorTable> PriorStore::get(const std::string &areaId) const
    {
    const std::shared_ptr<Slot> slot(findSlot(areaId));
    if(!slot) { return(std::shared_ptr<const PriorTable>()); }
    return(slot->load());
    }

bool PriorStore::commit(const std::string &areaId, std::shared_ptr<const PriorTable> table)
    {
    if(!table) { return(false); }
    const std::shared_ptr<Slot> slot(findSlot(areaId));
    if(!slot) { return(false); }
    slot->store(std::move(table));
    return(true);
    }


}
