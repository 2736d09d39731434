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
 */

#include <stdio.h>
#include <algorithm>
#include <memory>

#include "OTAREAOCC_HistoricalLearner.h"
#include "OTAREAOCC_Serial_IO.h"


namespace OTAREAOCC
{


void mergeIntervals(std::vector<Interval> &intervals)
    {
    std::vector<Interval> in;
    in.swap(intervals);
    std::sort(in.begin(), in.end());
    for(std::vector<Interval>::const_iterator i = in.begin(); i != in.end(); ++i)
        {
        if(i->lengthMs() <= 0) { continue; }
        if(!intervals.empty() && (i->startMs <= intervals.back().endMs))
            { intervals.back().endMs = fnmax(intervals.back().endMs, i->endMs); }
        else { intervals.push_back(*i); }
        }
    }

int64_t totalMs(const std::vector<Interval> &merged)
    {
    int64_t sum = 0;
    for(std::vector<Interval>::const_iterator i = merged.begin(); i != merged.end(); ++i) { sum += i->lengthMs(); }
    return(sum);
    }

int64_t overlapMs(const std::vector<Interval> &a, const std::vector<Interval> &b)
    {
    int64_t sum = 0;
    size_t i = 0, j = 0;
    while((i < a.size()) && (j < b.size()))
        {
        const timestamp_ms_t lo = fnmax(a[i].startMs, b[j].startMs);
        const timestamp_ms_t hi = fnmin(a[i].endMs, b[j].endMs);
        if(hi > lo) { sum += hi - lo; }
        // Advance whichever ends first.
        if(a[i].endMs < b[j].endMs) { ++i; } else { ++j; }
        }
    return(sum);
    }

static bool sampleEarlier(const HistorySample &a, const HistorySample &b)
    { return(a.timestampMs < b.timestampMs); }

size_t samplesToActiveIntervals(const SensorConfig &config, const std::vector<HistorySample> &samples,
                                const timestamp_ms_t startMs, const timestamp_ms_t endMs, const double *const learnedBaselineOpt,
                                std::vector<Interval> &out)
    {
    out.clear();
    if(endMs <= startMs) { return(0); }
    std::vector<HistorySample> sorted(samples);
    std::stable_sort(sorted.begin(), sorted.end(), sampleEarlier);

    size_t valid = 0;
    for(size_t n = 0; n < sorted.size(); ++n)
        {
        const HistorySample &s = sorted[n];
        if(s.timestampMs >= endMs) { break; }
        const Evidence e = extractEvidence(config, s.raw, s.available, learnedBaselineOpt);
        if(!e.available) { continue; }
        ++valid;
        if(!e.active) { continue; }
        const timestamp_ms_t from = fnmax(s.timestampMs, startMs);
        const timestamp_ms_t to = ((n + 1) < sorted.size()) ? fnmin(sorted[n+1].timestampMs, endMs) : endMs;
        if(to > from) { out.push_back(Interval(from, to)); }
        }
    mergeIntervals(out);
    return(valid);
    }

size_t computeEnvironmentalBaseline(const std::vector<HistorySample> &samples, double &baseline)
    {
    size_t n = 0;
    double sum = 0, lo = 0, hi = 0;
    for(std::vector<HistorySample>::const_iterator i = samples.begin(); i != samples.end(); ++i)
        {
        if(!i->available || isUnavailableStateText(i->raw)) { continue; }
        double v;
        if(!parseFiniteDouble(i->raw, v)) { continue; }
        if(0 == n) { lo = hi = v; }
        else { lo = fnmin(lo, v); hi = fnmax(hi, v); }
        sum += v;
        ++n;
        }
    if(0 == n) { return(0); }
    baseline = (sum / n) + (ENVIRONMENTAL_BASELINE_FRACTION * (hi - lo));
    return(n);
    }

// Add the length of the interval falling in each local hour of the day to byHour[].
static void accumulateByHour(const Interval &iv, const int16_t utcOffsetMinutes, int64_t (&byHour)[ByHourPriors::HOURS])
    {
    const int64_t offsetMs = int64_t(utcOffsetMinutes) * MS_PER_MINUTE;
    timestamp_ms_t t = iv.startMs;
    while(t < iv.endMs)
        {
        const int64_t local = t + offsetMs;
        int64_t hourIndex = local / MS_PER_HOUR;
        if((local % MS_PER_HOUR) < 0) { --hourIndex; }
        const timestamp_ms_t next = fnmin(((hourIndex + 1) * MS_PER_HOUR) - offsetMs, iv.endMs);
        byHour[hourOfDay(t, utcOffsetMinutes)] += next - t;
        t = next;
        }
    }

// Likelihoods of the given activity against the ground truth.
static PriorModel estimate(const std::vector<Interval> &active, const std::vector<Interval> &truth,
                           const int64_t occupiedMs, const int64_t vacantMs, const double dutyCycle,
                           const LearnerParameters &p)
    {
    const int64_t both = overlapMs(active, truth);
    const int64_t falseActive = totalMs(active) - both;
    const double tp = fnconstrain(double(both) / occupiedMs, p.clampLo, p.clampHi);
    const double fp = fnconstrain(double(falseActive) / vacantMs, p.clampLo, p.clampHi);
    const double prior = fnconstrain(dutyCycle, p.clampLo, p.clampHi);
    return(PriorModel(tp, fp, prior));
    }

// Failed result for a stopped run.
static LearnResult stopped(const CancellationToken &token)
    {
    LearnResult r;
    r.error = token.isCancelled() ? ErrorReport::ERR_LEARNER_CANCELLED : ErrorReport::ERR_LEARNER_TIMEOUT;
    return(r);
    }

// Earliest sample carrying a usable value; NO_TIME if none.
static timestamp_ms_t firstUsableSampleMs(const std::vector<HistorySample> &samples)
    {
    timestamp_ms_t first = NO_TIME;
    for(std::vector<HistorySample>::const_iterator i = samples.begin(); i != samples.end(); ++i)
        {
        if(!i->available || isUnavailableStateText(i->raw)) { continue; }
        if((NO_TIME == first) || (i->timestampMs < first)) { first = i->timestampMs; }
        }
    return(first);
    }

// Count of distinct sensor types in the configuration.
static uint8_t countConfiguredTypes(const AreaConfig &config)
    {
    bool seen[SENSOR_TYPE_COUNT] = { };
    uint8_t n = 0;
    for(std::vector<SensorConfig>::const_iterator i = config.sensors.begin(); i != config.sensors.end(); ++i)
        {
        if((i->type >= SENSOR_TYPE_COUNT) || seen[i->type]) { continue; }
        seen[i->type] = true;
        ++n;
        }
    return(n);
    }

namespace {
// What was gathered for one sensor.
struct SensorHistory
    {
    const SensorConfig *config;
    bool fetched;
    size_t valid;
    // Time of the earliest sample with a usable value, or NO_TIME.
    timestamp_ms_t firstValidMs;
    std::vector<Interval> active;
    SensorHistory() : config(NULL), fetched(false), valid(0), firstValidMs(NO_TIME) { }
    };
}

LearnResult HistoricalLearner::learn(const std::string &areaId, const AreaConfig &config, const uint8_t historyDays,
                                     const timestamp_ms_t nowMs, StateHistorySource &source, PriorStore &store,
                                     const CancellationToken &token) const
    {
    LearnResult result;
    // Held for the whole run so baseline pointers stay valid.
    const std::shared_ptr<const PriorTable> current = store.get(areaId);
    if(!current) { result.error = ErrorReport::ERR_UNKNOWN_AREA; return(result); }
    if((historyDays < MIN_HISTORY_PERIOD_DAYS) || (historyDays > MAX_HISTORY_PERIOD_DAYS))
        { result.error = ErrorReport::ERR_CONFIG_HISTORY_PERIOD; return(result); }

    const timestamp_ms_t endMs = nowMs;
    const timestamp_ms_t startMs = nowMs - (int64_t(historyDays) * MS_PER_DAY);

    // Work on a private copy; unchanged entries stay byte-identical.
    PriorTable updated(*current);

    std::vector<SensorHistory> histories(config.sensors.size());
    size_t fetchedCount = 0;
    for(size_t n = 0; n < config.sensors.size(); ++n)
        {
        if(token.shouldStop()) { return(stopped(token)); }
        const SensorConfig &sc = config.sensors[n];
        SensorHistory &h = histories[n];
        h.config = &sc;
        std::vector<HistorySample> samples;
        h.fetched = source.fetchHistory(sc.id, startMs, endMs, token, samples);
        // A fetch may have been abandoned part way.
        if(token.shouldStop()) { return(stopped(token)); }
        if(!h.fetched)
            {
            OTAREAOCC_DEBUG_SERIAL_PRINT("no history: ");
            OTAREAOCC_DEBUG_SERIAL_PRINT(sc.id.c_str());
            OTAREAOCC_DEBUG_SERIAL_PRINTLN();
            continue;
            }
        ++fetchedCount;

        const double *baseline = current->getBaseline(sc.id);
        double learnedBaseline = 0;
        if((PREDICATE_CONTINUOUS == sc.predicate.kind) &&
           (computeEnvironmentalBaseline(samples, learnedBaseline) >= params.minSamples))
            {
            updated.setBaseline(sc.id, learnedBaseline);
            baseline = &learnedBaseline;
            }
        h.valid = samplesToActiveIntervals(sc, samples, startMs, endMs, baseline, h.active);
        h.firstValidMs = firstUsableSampleMs(samples);
        }
    if(0 == fetchedCount) { result.error = ErrorReport::ERR_LEARNER_HISTORY; return(result); }

    // Ground truth.
    std::vector<Interval> truth;
    size_t truthValid = 0;
    // Start of the part of the window in which the ground truth was observed.
    timestamp_ms_t observedFromMs = endMs;
    for(std::vector<SensorHistory>::const_iterator h = histories.begin(); h != histories.end(); ++h)
        {
        if(!h->fetched) { continue; }
        const bool isTruth = config.motionAsGroundTruth ? (SENSOR_MOTION == h->config->type) :
                                                          (config.groundTruthSensorId == h->config->id);
        if(!isTruth) { continue; }
        truth.insert(truth.end(), h->active.begin(), h->active.end());
        truthValid += h->valid;
        if(NO_TIME != h->firstValidMs) { observedFromMs = fnmin(observedFromMs, fnmax(h->firstValidMs, startMs)); }
        }
    mergeIntervals(truth);
    const int64_t windowMs = endMs - startMs;
    const int64_t occupiedMs = totalMs(truth);
    const int64_t vacantMs = windowMs - occupiedMs;
    if((truthValid < params.minSamples) || (occupiedMs <= 0) || (vacantMs <= 0))
        {
        result.status = LEARN_NO_CHANGE;
        result.error = ErrorReport::WARN_INSUFFICIENT_HISTORY;
        result.retainedTypes = countConfiguredTypes(config);
        return(result);
        }
    const double dutyCycle = double(occupiedMs) / windowMs;
    result.groundTruthDutyCycle = dutyCycle;

    // Per type, from the union of activity of all that type's sensors.
    for(uint8_t t = 0; t < SENSOR_TYPE_COUNT; ++t)
        {
        if(token.shouldStop()) { return(stopped(token)); }
        bool configured = false;
        size_t valid = 0;
        std::vector<Interval> active;
        for(std::vector<SensorHistory>::const_iterator h = histories.begin(); h != histories.end(); ++h)
            {
            if(t != h->config->type) { continue; }
            configured = true;
            if(!h->fetched) { continue; }
            valid += h->valid;
            active.insert(active.end(), h->active.begin(), h->active.end());
            }
        if(!configured) { continue; }
        if(valid < params.minSamples) { ++result.retainedTypes; continue; }
        mergeIntervals(active);
        updated.setForType(SensorType(t), estimate(active, truth, occupiedMs, vacantMs, dutyCycle, params));
        ++result.updatedTypes;
        }

    if(0 == result.updatedTypes)
        {
        result.status = LEARN_NO_CHANGE;
        result.error = ErrorReport::WARN_INSUFFICIENT_HISTORY;
        return(result);
        }

    // Per sensor, where the sensor's own history suffices.
    for(std::vector<SensorHistory>::const_iterator h = histories.begin(); h != histories.end(); ++h)
        {
        if(token.shouldStop()) { return(stopped(token)); }
        if(!h->fetched || (h->valid < params.minSamples)) { continue; }
        updated.setForSensor(h->config->id, estimate(h->active, truth, occupiedMs, vacantMs, dutyCycle, params));
        ++result.updatedSensors;
        }

    // By-hour duty cycle of the ground truth, over the hours it was observed.
    int64_t occupiedByHour[ByHourPriors::HOURS] = { };
    int64_t windowByHour[ByHourPriors::HOURS] = { };
    for(std::vector<Interval>::const_iterator i = truth.begin(); i != truth.end(); ++i)
        { accumulateByHour(*i, config.utcOffsetMinutes, occupiedByHour); }
    accumulateByHour(Interval(observedFromMs, endMs), config.utcOffsetMinutes, windowByHour);
    const uint8_t pcLo = probabilityToPercent(params.clampLo);
    const uint8_t pcHi = probabilityToPercent(params.clampHi);
    for(uint8_t hh = 0; hh < ByHourPriors::HOURS; ++hh)
        {
        // Too little of this hour seen to say anything; keep what was there.
        if(windowByHour[hh] < MIN_BY_HOUR_COVERAGE_MS) { continue; }
        const uint8_t pc = probabilityToPercent(double(occupiedByHour[hh]) / windowByHour[hh]);
        updated.getByHour().set(hh, fnconstrain(pc, pcLo, pcHi));
        }

    if(token.shouldStop()) { return(stopped(token)); }
    updated.setLearnedAtMs(nowMs);
    if(!store.commit(areaId, std::make_shared<PriorTable>(updated)))
        {
        // Area removed while learning.
        result.error = ErrorReport::ERR_UNKNOWN_AREA;
        return(result);
        }

    if(0 != result.retainedTypes)
        {
        result.status = LEARN_PARTIAL;
        result.error = ErrorReport::WARN_INSUFFICIENT_HISTORY;
        }
    else
        {
        result.status = LEARN_OK;
        result.error = ErrorReport::ERR_NONE;
        }

    char line[96];
    snprintf(line, sizeof(line), "priors learned: types %u kept %u sensors %u occ%% %u",
             unsigned(result.updatedTypes), unsigned(result.retainedTypes),
             unsigned(result.updatedSensors), unsigned(probabilityToPercent(dutyCycle)));
    serialPrintlnLine(SERLINE_START_CHAR_INFO, areaId.c_str(), line);
    return(result);
    }


}
