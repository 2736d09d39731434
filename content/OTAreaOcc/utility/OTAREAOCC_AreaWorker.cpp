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
 Serialised owner of one area.
 */

#include <utility>

#include "OTAREAOCC_AreaPersistence.h"
#include "OTAREAOCC_AreaStateJSON.h"
#include "OTAREAOCC_AreaWorker.h"
#include "OTAREAOCC_Serial_IO.h"
#include "OTAREAOCC_ThresholdDecision.h"


namespace OTAREAOCC
{


AreaWorker::AreaWorker(const AreaConfig &config, PriorStore &s,
                       const Listener &l, const LearnerParameters &learnerParams)
  : id(config.areaId), store(s), learner(learnerParams), listener(l),
    area(config, s), lastRecomputeMs(NO_TIME),
    configSnapshot(std::make_shared<AreaConfig>(config)),
    thresholdPC(config.thresholdPC),
    stopping(false), closing(false), inFlight(0), lastLearnMs(NO_TIME)
    {
    store.createArea(id);
    // Initial state before anything is observed; the thread is not yet running.
    publish(NO_TIME);
    worker = std::thread(&AreaWorker::run, this);
    }

AreaWorker::~AreaWorker()
    {
    closing.store(true);
    cancelLearning();
        {
        std::unique_lock<std::mutex> lock(inFlightLock);
        inFlightCV.wait(lock, [this]() { return(0 == inFlight); });
        }
        {
        std::lock_guard<std::mutex> lock(queueLock);
        stopping = true;
        }
    queueCV.notify_all();
    if(worker.joinable()) { worker.join(); }
    }

void AreaWorker::run()
    {
    for( ; ; )
        {
        std::function<void()> task;
            {
            std::unique_lock<std::mutex> lock(queueLock);
            queueCV.wait(lock, [this]() { return(stopping || !queue.empty()); });
            // Stopping and fully drained.
            if(queue.empty()) { return; }
            task = std::move(queue.front());
            queue.pop_front();
            }
        task();
        }
    }

void AreaWorker::enqueue(std::function<void()> task)
    {
        {
        std::lock_guard<std::mutex> lock(queueLock);
        queue.push_back(std::move(task));
        }
    queueCV.notify_one();
    }

void AreaWorker::publish(const timestamp_ms_t nowMs)
    {
    const bool timeKnown = (NO_TIME != nowMs);
    if(timeKnown) { lastRecomputeMs = nowMs; }
    std::shared_ptr<AreaState> s = std::make_shared<AreaState>(area.recompute(timeKnown ? nowMs : 0, thresholdPC.load()));
    if(!timeKnown) { s->lastUpdatedMs = NO_TIME; }
    if(s->numericFault) { errors.report(ErrorReport::ERR_INTERNAL, id.c_str(), "non-finite probability"); }
    stateSnapshot.store(s);
    if(!timeKnown) { return; }
        {
        std::lock_guard<std::mutex> lock(statsLock);
        stats.update(*s);
        }
    if(listener) { listener(*s); }
    }

bool AreaWorker::hasSensor(const std::string &sensorId) const
    { return(NULL != configSnapshot.load()->findSensor(sensorId)); }

bool AreaWorker::post(const SensorReading &r)
    {
    if(!hasSensor(r.sensorId)) { return(false); }
    enqueue([this, r]()
        {
        if(!area.applyReading(r)) { return; }
        publish((NO_TIME == lastRecomputeMs) ? r.timestampMs : fnmax(lastRecomputeMs, r.timestampMs));
        });
    return(true);
    }

void AreaWorker::tick(const timestamp_ms_t nowMs)
    {
    enqueue([this, nowMs]()
        {
        errors.read();
        publish((NO_TIME == lastRecomputeMs) ? nowMs : fnmax(lastRecomputeMs, nowMs));
        });
    }

ErrorReport::errorCatalogue AreaWorker::reconfigure(const AreaConfig &config)
    {
    if(config.areaId != id) { return(ErrorReport::ERR_CONFIG_AREA_ID); }
    const ErrorReport::errorCatalogue v = validateAreaConfig(config);
    if(ErrorReport::ERR_NONE != v) { return(v); }
    configSnapshot.store(std::make_shared<AreaConfig>(config));
    thresholdPC.store(config.thresholdPC);
    enqueue([this, config]()
        {
        area.reconfigure(config);
        publish(lastRecomputeMs);
        });
    return(ErrorReport::ERR_NONE);
    }

void AreaWorker::flush()
    {
    std::promise<void> done;
    std::future<void> f = done.get_future();
    enqueue([&done]() { done.set_value(); });
    f.wait();
    }

AreaState AreaWorker::getState() const
    {
    AreaState s(*stateSnapshot.load());
    // Threshold may have changed since publication.
    s.thresholdPC = thresholdPC.load();
    s.occupied = isOccupied(s.probability, s.thresholdPC);
    return(s);
    }

bool AreaWorker::setThreshold(const uint8_t pc)
    {
    if(!isValidThresholdPC(pc)) { return(false); }
    thresholdPC.store(pc);
    enqueue([this]() { publish(lastRecomputeMs); });
    return(true);
    }

LearnResult AreaWorker::updatePriors(StateHistorySource &source, const uint8_t historyDays, const timestamp_ms_t nowMs,
                                     const uint32_t timeout_ms)
    {
    std::lock_guard<std::mutex> serial(learnerLock);
    // Deadline runs from the start of this run, not from when it was requested.
    const std::shared_ptr<CancellationToken> token = std::make_shared<CancellationToken>(timeout_ms);
        {
        std::lock_guard<std::mutex> lock(tokenLock);
        activeToken = token;
        }
    if(closing.load()) { token->cancel(); }
    const std::shared_ptr<const AreaConfig> config = configSnapshot.load();
    const uint8_t days = (USE_CONFIGURED_HISTORY_PERIOD == historyDays) ? config->historyPeriodDays : historyDays;
    const LearnResult r = learner.learn(id, *config, days, nowMs, source, store, *token);
        {
        std::lock_guard<std::mutex> lock(tokenLock);
        activeToken.reset();
        }

    if(r.succeeded()) { lastLearnMs.store(nowMs); }
    // Pick up the new priors.
    if(r.committed()) { enqueue([this]() { publish(lastRecomputeMs); }); }
    if(ErrorReport::ERR_NONE != r.error) { errors.report(r.error, id.c_str(), "learner"); }
    return(r);
    }

std::future<LearnResult> AreaWorker::updatePriorsAsync(StateHistorySource &source, const uint8_t historyDays,
                                                       const timestamp_ms_t nowMs, const uint32_t timeout_ms)
    {
        {
        std::lock_guard<std::mutex> lock(inFlightLock);
        ++inFlight;
        }
    return(std::async(std::launch::async, [this, &source, historyDays, nowMs, timeout_ms]()
        {
        const LearnResult r = updatePriors(source, historyDays, nowMs, timeout_ms);
        // Notify under the lock: the destructor may proceed as soon as it is released.
        std::lock_guard<std::mutex> lock(inFlightLock);
        --inFlight;
        inFlightCV.notify_all();
        return(r);
        }));
    }

void AreaWorker::cancelLearning()
    {
    std::lock_guard<std::mutex> lock(tokenLock);
    if(activeToken) { activeToken->cancel(); }
    }

bool AreaWorker::learningDue(const timestamp_ms_t nowMs) const
    {
    if(!configSnapshot.load()->historicalAnalysisEnabled) { return(false); }
    const timestamp_ms_t last = lastLearnMs.load();
    return((NO_TIME == last) || ((nowMs - last) >= LEARNING_INTERVAL_MS));
    }

size_t AreaWorker::reconcile(CurrentStateSource &source, const timestamp_ms_t nowMs)
    {
    const std::shared_ptr<const AreaConfig> config = configSnapshot.load();
    size_t n = 0;
    for(std::vector<SensorConfig>::const_iterator i = config->sensors.begin(); i != config->sensors.end(); ++i)
        {
        SensorReading r;
        if(!source.fetchCurrent(i->id, r)) { continue; }
        r.sensorId = i->id;
        if(NO_TIME == r.timestampMs) { r.timestampMs = nowMs; }
        if(post(r)) { ++n; }
        }
    tick(nowMs);
    return(n);
    }

AreaStatsTracker AreaWorker::getStats() const
    {
    std::lock_guard<std::mutex> lock(statsLock);
    return(stats);
    }

size_t AreaWorker::writeJSON(char *const buf, const size_t bufSize) const
    {
    const AreaStatsTracker s(getStats());
    return(writeAreaStateJSON(buf, bufSize, getState(), errors.get(), &s));
    }

bool AreaWorker::saveState(std::string &out) const
    {
    const std::shared_ptr<const PriorTable> table = store.get(id);
    if(!table) { return(false); }
    return(saveAreaState(*table, getStats(), out));
    }

ErrorReport::errorCatalogue AreaWorker::restoreState(const std::string &text)
    {
    PriorTable table;
    AreaStatsTracker restored;
    const ErrorReport::errorCatalogue v = loadAreaState(text, table, restored);
    if(ErrorReport::ERR_NONE != v)
        {
        errors.report(v, id.c_str(), "restore");
        return(v);
        }
        {
        std::lock_guard<std::mutex> serial(learnerLock);
        if(!store.commit(id, std::make_shared<const PriorTable>(table)))
            {
            errors.report(ErrorReport::ERR_INTERNAL, id.c_str(), "restore");
            return(ErrorReport::ERR_INTERNAL);
            }
        if(NO_TIME != table.getLearnedAtMs()) { lastLearnMs.store(table.getLearnedAtMs()); }
        }
        {
        std::lock_guard<std::mutex> lock(statsLock);
        stats = restored;
        }
    enqueue([this]() { publish(lastRecomputeMs); });
    return(ErrorReport::ERR_NONE);
    }


}
