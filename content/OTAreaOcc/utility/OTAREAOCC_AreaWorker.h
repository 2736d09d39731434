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

 All evidence updates, decay and aggregation for the area
 run in arrival order on one worker thread,
 so each recomputation sees the fully-applied previous state.
 Different areas have different workers and run concurrently.

 Results are published as whole AreaState snapshots
 readable from any thread without blocking the worker.

 Learning runs on its own thread,
 serialised per area, cancellable and with a deadline;
 its only contact with the real-time path is the prior store commit,
 after which the worker is asked to recompute.
 */

#ifndef OTAREAOCC_AREAWORKER_H
#define OTAREAOCC_AREAWORKER_H

#include <stdint.h>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "OTAREAOCC_Area.h"
#include "OTAREAOCC_AreaConfig.h"
#include "OTAREAOCC_AreaStatsTracker.h"
#include "OTAREAOCC_BayesianAggregator.h"
#include "OTAREAOCC_Concurrency.h"
#include "OTAREAOCC_ErrorReport.h"
#include "OTAREAOCC_HistoricalLearner.h"
#include "OTAREAOCC_PriorStore.h"
#include "OTAREAOCC_Sensor.h"
#include "OTAREAOCC_StateSource.h"


namespace OTAREAOCC
{


class AreaWorker final
    {
    public:
        // Called on the worker thread with each newly-published state.
        // Must not block for long nor call flush() on the same worker.
        typedef std::function<void(const AreaState &)> Listener;

    private:
        // Immutable area ID.
        const std::string id;
        PriorStore &store;
        const HistoricalLearner learner;
        const Listener listener;

        // Touched only from the worker thread once started.
        Area area;
        // Time of the last recomputation, or NO_TIME.
        timestamp_ms_t lastRecomputeMs;

        // Latest configuration, for readers off the worker thread.
        AtomicSnapshot<AreaConfig> configSnapshot;
        // Latest published state.
        AtomicSnapshot<AreaState> stateSnapshot;
        // Live threshold; may be changed from any thread.
        OTAtomic_t<uint8_t> thresholdPC;

        // This area's errors and warnings.
        ErrorReport errors;

        mutable std::mutex statsLock;
        AreaStatsTracker stats;

        // FIFO of work for the worker thread.
        std::mutex queueLock;
        std::condition_variable queueCV;
        std::deque<std::function<void()> > queue;
        bool stopping;

        // Serialises learner runs for this area.
        std::mutex learnerLock;
        // Set once destruction starts; learner runs that start after this are cancelled at once.
        OTAtomic_t<bool> closing;
        // Token of the run in progress, if any.
        std::mutex tokenLock;
        std::shared_ptr<CancellationToken> activeToken;
        // Count of async learner runs not yet finished.
        std::mutex inFlightLock;
        std::condition_variable inFlightCV;
        unsigned inFlight;
        // nowMs of the last learner run that did not fail, or NO_TIME.
        OTAtomic_t<timestamp_ms_t> lastLearnMs;

        // Started last, after everything it uses.
        std::thread worker;

        void run();
        void enqueue(std::function<void()> task);
        // Recompute and publish; worker thread only (or before it starts).
        void publish(timestamp_ms_t nowMs);

    public:
        // Config must already have passed validateAreaConfig().
        // Creates the area's slot in store if not already present.
        AreaWorker(const AreaConfig &config, PriorStore &store,
                   const Listener &listener = Listener(),
                   const LearnerParameters &learnerParams = LearnerParameters());
        // Cancels any learning, waits for async learner runs,
        // then drains the queue and stops the worker thread.
        ~AreaWorker();
        AreaWorker(const AreaWorker &) = delete;
        AreaWorker &operator=(const AreaWorker &) = delete;

        const std::string &getId() const { return(id); }

        // True if the sensor is configured in this area.
        bool hasSensor(const std::string &sensorId) const;

        // Queue a reading; it is applied and the area recomputed in arrival order.
        // Returns false (and does nothing) if the sensor is not in this area.
        bool post(const SensorReading &r);

        // Queue decay advance and recomputation at nowMs, and age errors.
        // The host calls this periodically, eg every few seconds.
        void tick(timestamp_ms_t nowMs);

        // Replace the configuration (same area ID) and recompute.
        // Returns ERR_NONE if accepted, else the validation failure and nothing changes.
        ErrorReport::errorCatalogue reconfigure(const AreaConfig &config);

        // Block until everything queued before this call has been processed.
        void flush();

        // Latest state; occupied reflects the current threshold.
        // Thread-safe and non-blocking.
        AreaState getState() const;

        // Current configuration snapshot.
        std::shared_ptr<const AreaConfig> getConfig() const { return(configSnapshot.load()); }

        uint8_t getThreshold() const { return(thresholdPC.load()); }
        // Set the threshold in [1,99] percent; returns false if out of range.
        bool setThreshold(uint8_t pc);

        // Run the learner now on the calling thread and return its result.
        // historyDays of USE_CONFIGURED_HISTORY_PERIOD means the configured historyPeriodDays.
        // Runs for this area are serialised.
        // Runs regardless of historicalAnalysisEnabled.
        LearnResult updatePriors(StateHistorySource &source, uint8_t historyDays, timestamp_ms_t nowMs,
                                 uint32_t timeout_ms = DEFAULT_LEARNER_TIMEOUT_MS);
        // As updatePriors() but on a separate thread.
        // The source must outlive the run.
        std::future<LearnResult> updatePriorsAsync(StateHistorySource &source, uint8_t historyDays, timestamp_ms_t nowMs,
                                                   uint32_t timeout_ms = DEFAULT_LEARNER_TIMEOUT_MS);
        // Cancel the learner run in progress, if any.
        void cancelLearning();

        // True if historical analysis is enabled and no learner run
        // has completed in the LEARNING_INTERVAL_MS before nowMs.
        bool learningDue(timestamp_ms_t nowMs) const;

        // Queue the current state of every configured sensor from the host,
        // then a recomputation at nowMs.
        // Readings without a timestamp are taken to be at nowMs.
        // Returns the number of sensors for which a state was available.
        size_t reconcile(CurrentStateSource &source, timestamp_ms_t nowMs);

        // This area's error reporter.
        ErrorReport &getErrorReport() { return(errors); }
        const ErrorReport &getErrorReport() const { return(errors); }

        // Copy of the current stats.
        AreaStatsTracker getStats() const;

        // Write the compact JSON state line; see writeAreaStateJSON().
        size_t writeJSON(char *buf, size_t bufSize) const;

        // Save this area's priors and stats; see saveAreaState().
        bool saveState(std::string &out) const;
        // Restore priors and stats saved by saveState(), then recompute.
        // Waits for any learner run in progress.
        // A restored learning time counts towards learningDue().
        // Returns ERR_NONE, or ERR_RESTORE_FORMAT and nothing changes
        // (ERR_INTERNAL if the area's priors slot has gone).
        ErrorReport::errorCatalogue restoreState(const std::string &text);
    };


// Pseudo-sensor exposing an area's occupancy probability as a percentage [0,100].
// Thread-safe.
class AreaOccupancyPctSensor final : public SensorCore<uint8_t>
    {
    private:
        const AreaWorker &worker;
    public:
        explicit AreaOccupancyPctSensor(const AreaWorker &w) : worker(w) { }
        virtual uint8_t get() const override { return(probabilityToPercent(worker.getState().probability)); }
        // Available once some reading or tick has been processed.
        virtual bool isAvailable() const override { return(NO_TIME != worker.getState().lastUpdatedMs); }
        virtual Sensor_tag_t tag() const override { return("occ|%"); }
    };


}

#endif
