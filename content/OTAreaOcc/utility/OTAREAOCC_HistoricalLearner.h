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
 Historical analysis learner.

 Re-estimates an area's priors and likelihoods
 from the recorded history of its sensors
 against a ground truth of occupancy,
 and publishes them to the prior store in one atomic commit.

 Runs out of band, possibly for a long time, so is cancellable
 and carries a deadline; if stopped nothing is committed.
 */

#ifndef OTAREAOCC_HISTORICALLEARNER_H
#define OTAREAOCC_HISTORICALLEARNER_H

#include <math.h>
#include <stdint.h>
#include <string>
#include <vector>

#include "OTAREAOCC_AreaConfig.h"
#include "OTAREAOCC_Concurrency.h"
#include "OTAREAOCC_ErrorReport.h"
#include "OTAREAOCC_Parameters.h"
#include "OTAREAOCC_PriorStore.h"
#include "OTAREAOCC_StateSource.h"


namespace OTAREAOCC
{


// Half-open time interval [startMs,endMs).
struct Interval
    {
    timestamp_ms_t startMs;
    timestamp_ms_t endMs;

    Interval() : startMs(0), endMs(0) { }
    Interval(const timestamp_ms_t s, const timestamp_ms_t e) : startMs(s), endMs(e) { }
    int64_t lengthMs() const { return((endMs > startMs) ? (endMs - startMs) : 0); }
    bool operator<(const Interval &o) const { return((startMs < o.startMs) || ((startMs == o.startMs) && (endMs < o.endMs))); }
    };

// Sort and coalesce overlapping or touching intervals, dropping empty ones.
void mergeIntervals(std::vector<Interval> &intervals);

// Total length of merged intervals.
int64_t totalMs(const std::vector<Interval> &merged);

// Length of the intersection of two merged interval lists.
int64_t overlapMs(const std::vector<Interval> &a, const std::vector<Interval> &b);

// Convert a sensor's samples to the merged intervals within [startMs,endMs) when it was active.
// Each sample's state holds until the next sample (or endMs);
// a sample before startMs sets the state in force at startMs.
// Unavailable samples count as inactive.
// Returns the number of samples that carried a usable value.
//   * learnedBaselineOpt  baseline for continuous predicates; may be NULL
size_t samplesToActiveIntervals(const SensorConfig &config, const std::vector<HistorySample> &samples,
                                timestamp_ms_t startMs, timestamp_ms_t endMs, const double *learnedBaselineOpt,
                                std::vector<Interval> &out);

// Baseline for an environmental sensor from its numeric samples:
// mean + ENVIRONMENTAL_BASELINE_FRACTION * (max - min).
// Returns the number of usable numeric samples;
// baseline is left untouched if that is zero.
size_t computeEnvironmentalBaseline(const std::vector<HistorySample> &samples, double &baseline);

// Outcome of a learning run.
enum LearnStatus : uint8_t
    {
    // Every configured sensor type was re-learned and committed.
    LEARN_OK = 0,
    // Some types were re-learned and committed; others retained their previous values.
    LEARN_PARTIAL,
    // Nothing could be learnt; nothing was committed.
    LEARN_NO_CHANGE,
    // The run failed; nothing was committed.
    LEARN_FAILED
    };

struct LearnResult
    {
    LearnStatus status;
    // ERR_NONE, WARN_INSUFFICIENT_HISTORY (partial or no change), or the failure.
    ErrorReport::errorCatalogue error;
    // Count of sensor types whose entries were replaced.
    uint8_t updatedTypes;
    // Count of configured sensor types kept for lack of history.
    uint8_t retainedTypes;
    // Count of individual sensors given their own entries.
    uint16_t updatedSensors;
    // Fraction of the window that the ground truth was occupied; NaN if not computed.
    double groundTruthDutyCycle;

    LearnResult()
      : status(LEARN_FAILED), error(ErrorReport::ERR_UNSPECIFIED),
        updatedTypes(0), retainedTypes(0), updatedSensors(0), groundTruthDutyCycle(NAN) { }

    // True unless the run failed.
    bool succeeded() const { return(LEARN_FAILED != status); }
    // True if a new table was committed.
    bool committed() const { return((LEARN_OK == status) || (LEARN_PARTIAL == status)); }
    };

// Tunables for the learner.
struct LearnerParameters
    {
    // Fewer valid samples than this in the window and a type or sensor keeps its entry.
    size_t minSamples;
    // Learned probabilities are clamped to [clampLo,clampHi].
    double clampLo;
    double clampHi;

    LearnerParameters()
      : minSamples(DEFAULT_MIN_HISTORY_SAMPLES),
        clampLo(LEARNED_PROBABILITY_MIN), clampHi(LEARNED_PROBABILITY_MAX) { }
    };

// Learns priors for one area at a time.
// Stateless apart from its parameters so one instance may serve many areas,
// though runs for any one area must be serialised by the caller.
class HistoricalLearner final
    {
    private:
        const LearnerParameters params;

    public:
        HistoricalLearner() { }
        explicit HistoricalLearner(const LearnerParameters &p) : params(p) { }

        const LearnerParameters &getParameters() const { return(params); }

        // Learn from the historyDays before nowMs and commit to store.
        // Passes token to each history fetch and checks it after each fetch,
        // within each estimation pass and just before committing;
        // if it says stop, fails with ERR_LEARNER_CANCELLED or ERR_LEARNER_TIMEOUT
        // and leaves the store untouched.
        // By-hour priors are set only for hours of day observed for at least
        // MIN_BY_HOUR_COVERAGE_MS since the first usable ground-truth sample,
        // and are clamped to the learned bounds as percentages.
        // The area must already exist in the store.
        LearnResult learn(const std::string &areaId, const AreaConfig &config, uint8_t historyDays,
                          timestamp_ms_t nowMs, StateHistorySource &source, PriorStore &store,
                          const CancellationToken &token) const;
    };


}

#endif
