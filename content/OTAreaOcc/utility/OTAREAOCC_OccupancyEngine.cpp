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
 Registry of monitored areas.
 */

#include "OTAREAOCC_OccupancyEngine.h"
#include "OTAREAOCC_Serial_IO.h"


namespace OTAREAOCC
{


std::shared_ptr<AreaWorker> OccupancyEngine::find(const std::string &areaId) const
    {
    std::lock_guard<std::mutex> lock(areasLock);
    const std::map<std::string, std::shared_ptr<AreaWorker> >::const_iterator i = areas.find(areaId);
    if(areas.end() == i) { return(std::shared_ptr<AreaWorker>()); }
    return(i->second);
    }

// Snapshot of all workers, so that none is called with the map locked.
static std::vector<std::shared_ptr<AreaWorker> > allWorkers(std::mutex &lock,
                                                           const std::map<std::string, std::shared_ptr<AreaWorker> > &areas)
    {
    std::lock_guard<std::mutex> guard(lock);
    std::vector<std::shared_ptr<AreaWorker> > v;
    v.reserve(areas.size());
    for(std::map<std::string, std::shared_ptr<AreaWorker> >::const_iterator i = areas.begin(); i != areas.end(); ++i)
        { v.push_back(i->second); }
    return(v);
    }

ErrorReport::errorCatalogue OccupancyEngine::addArea(const AreaConfig &config, const AreaWorker::Listener &listener)
    {
    const ErrorReport::errorCatalogue v = validateAreaConfig(config);
    if(ErrorReport::ERR_NONE != v)
        {
        ErrorReporter.report(v, config.areaId.c_str(), "area not created");
        return(v);
        }
    std::lock_guard<std::mutex> lock(areasLock);
    if(areas.end() != areas.find(config.areaId)) { return(ErrorReport::ERR_CONFIG_AREA_ID); }
    // Fresh default priors even if a stale slot was somehow left behind.
    store.removeArea(config.areaId);
    store.createArea(config.areaId);
    areas[config.areaId] = std::make_shared<AreaWorker>(config, store, listener, learnerParams);
    serialPrintlnLine(SERLINE_START_CHAR_INFO, config.areaId.c_str(), "area added");
    return(ErrorReport::ERR_NONE);
    }

bool OccupancyEngine::removeArea(const std::string &areaId)
    {
    std::shared_ptr<AreaWorker> w;
        {
        std::lock_guard<std::mutex> lock(areasLock);
        const std::map<std::string, std::shared_ptr<AreaWorker> >::iterator i = areas.find(areaId);
        if(areas.end() == i) { return(false); }
        w = i->second;
        areas.erase(i);
        }
    // Stop the worker (outside the map lock) before dropping its priors.
    w.reset();
    store.removeArea(areaId);
    serialPrintlnLine(SERLINE_START_CHAR_INFO, areaId.c_str(), "area removed");
    return(true);
    }

std::vector<std::string> OccupancyEngine::getAreaIds() const
    {
    std::lock_guard<std::mutex> lock(areasLock);
    std::vector<std::string> ids;
    for(std::map<std::string, std::shared_ptr<AreaWorker> >::const_iterator i = areas.begin(); i != areas.end(); ++i)
        { ids.push_back(i->first); }
    return(ids);
    }

ErrorReport::errorCatalogue OccupancyEngine::reconfigure(const AreaConfig &config)
    {
    const std::shared_ptr<AreaWorker> w = find(config.areaId);
    if(!w) { return(ErrorReport::ERR_UNKNOWN_AREA); }
    return(w->reconfigure(config));
    }

bool OccupancyEngine::postReading(const std::string &areaId, const SensorReading &r)
    {
    const std::shared_ptr<AreaWorker> w = find(areaId);
    if(!w) { return(false); }
    return(w->post(r));
    }

size_t OccupancyEngine::routeReading(const SensorReading &r)
    {
    const std::vector<std::shared_ptr<AreaWorker> > v(allWorkers(areasLock, areas));
    size_t n = 0;
    for(std::vector<std::shared_ptr<AreaWorker> >::const_iterator i = v.begin(); i != v.end(); ++i)
        { if((*i)->post(r)) { ++n; } }
    return(n);
    }

void OccupancyEngine::tick(const timestamp_ms_t nowMs)
    {
    const std::vector<std::shared_ptr<AreaWorker> > v(allWorkers(areasLock, areas));
    for(std::vector<std::shared_ptr<AreaWorker> >::const_iterator i = v.begin(); i != v.end(); ++i)
        { (*i)->tick(nowMs); }
    }

bool OccupancyEngine::getState(const std::string &areaId, AreaState &out) const
    {
    const std::shared_ptr<AreaWorker> w = find(areaId);
    if(!w) { return(false); }
    out = w->getState();
    return(true);
    }

LearnResult OccupancyEngine::updatePriors(const std::string &areaId, StateHistorySource &source,
                                          const uint8_t historyDays, const timestamp_ms_t nowMs, const uint32_t timeout_ms)
    {
    const std::shared_ptr<AreaWorker> w = find(areaId);
    if(!w)
        {
        LearnResult r;
        r.error = ErrorReport::ERR_UNKNOWN_AREA;
        return(r);
        }
    return(w->updatePriors(source, historyDays, nowMs, timeout_ms));
    }

std::future<LearnResult> OccupancyEngine::updatePriorsAsync(const std::string &areaId, StateHistorySource &source,
                                                            const uint8_t historyDays, const timestamp_ms_t nowMs,
                                                            const uint32_t timeout_ms)
    {
    const std::shared_ptr<AreaWorker> w = find(areaId);
    if(!w)
        {
        std::promise<LearnResult> p;
        LearnResult r;
        r.error = ErrorReport::ERR_UNKNOWN_AREA;
        p.set_value(r);
        return(p.get_future());
        }
    return(w->updatePriorsAsync(source, historyDays, nowMs, timeout_ms));
    }

bool OccupancyEngine::saveAreaState(const std::string &areaId, std::string &out) const
    {
    const std::shared_ptr<AreaWorker> w = find(areaId);
    return(w && w->saveState(out));
    }

ErrorReport::errorCatalogue OccupancyEngine::restoreAreaState(const std::string &areaId, const std::string &text)
    {
    const std::shared_ptr<AreaWorker> w = find(areaId);
    if(!w) { return(ErrorReport::ERR_UNKNOWN_AREA); }
    return(w->restoreState(text));
    }

uint8_t OccupancyEngine::getThreshold(const std::string &areaId) const
    {
    const std::shared_ptr<AreaWorker> w = find(areaId);
    return(w ? w->getThreshold() : 0);
    }

bool OccupancyEngine::setThreshold(const std::string &areaId, const uint8_t pc)
    {
    const std::shared_ptr<AreaWorker> w = find(areaId);
    if(!w) { return(false); }
    return(w->setThreshold(pc));
    }

void OccupancyEngine::flush()
    {
    const std::vector<std::shared_ptr<AreaWorker> > v(allWorkers(areasLock, areas));
    for(std::vector<std::shared_ptr<AreaWorker> >::const_iterator i = v.begin(); i != v.end(); ++i)
        { (*i)->flush(); }
    }


}
