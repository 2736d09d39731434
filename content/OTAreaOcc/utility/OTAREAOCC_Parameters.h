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

Author(s) / Copyright (s): Damon Hart-Davis 2013--2018
*/

/*
 * Area occupancy engine basic parameters.
 */

#ifndef OTAREAOCC_PARAMETERS_H
#define OTAREAOCC_PARAMETERS_H


#include <stddef.h>
#include <stdint.h>

#include "OTAREAOCC_Util.h"


// Use namespaces to help avoid collisions.
namespace OTAREAOCC
    {


    // Bounds on the occupancy threshold, in percent.
    // 0% and 100% are excluded as they would make the decision independent of all evidence.
    static const uint8_t MIN_THRESHOLD_PC = 1;
    static const uint8_t MAX_THRESHOLD_PC = 99;

    // Bounds on the history period for learning, in days.
    static const uint8_t MIN_HISTORY_PERIOD_DAYS = 1;
    static const uint8_t MAX_HISTORY_PERIOD_DAYS = 90;
    // Passed as a learner lookback to mean the area's configured history period.
    static const uint8_t USE_CONFIGURED_HISTORY_PERIOD = 0;

    // Every stored probability (tp, fp, prior) is held strictly inside (0,1),
    // so that no odds ratio is ever 0 or infinite.
    static constexpr double PROBABILITY_FLOOR = 0.001;
    static constexpr double PROBABILITY_CEIL = 0.999;

    // Learned estimates are clamped harder than stored values
    // so that no learned likelihood can make later evidence irrelevant.
    static constexpr double LEARNED_PROBABILITY_MIN = 0.05;
    static constexpr double LEARNED_PROBABILITY_MAX = 0.95;

    // A by-hour prior is learned only for an hour of day
    // that the history window covers for at least this long.
    static constexpr int64_t MIN_BY_HOUR_COVERAGE_MS = MS_PER_HOUR;

    // Posterior log-odds are held within +/- this value before conversion,
    // ie the probability stays within about [1e-4, 1-1e-4].
    static constexpr double LOG_ODDS_LIMIT = 9.2;

    // A sensor whose effective (weighted, decayed) evidence is at or below this
    // is not reported as an active trigger.
    static constexpr double NEGLIGIBLE_EVIDENCE = 0.01;

    // Environmental baseline is the mean plus this fraction of the observed range.
    static constexpr double ENVIRONMENTAL_BASELINE_FRACTION = 0.05;

    // Minimum number of valid history samples for a sensor type (or single sensor)
    // before its parameters may be re-learned.
    static const uint16_t DEFAULT_MIN_HISTORY_SAMPLES = 10;

    // Default bound on the wall-clock duration of one learner run.
    static const uint32_t DEFAULT_LEARNER_TIMEOUT_MS = 5 * 60 * 1000UL;

    // Interval between periodic learner runs when historical analysis is enabled.
    static constexpr int64_t LEARNING_INTERVAL_MS = 6 * MS_PER_HOUR;

    // Recent-history lengths for area stats.
    // 12 probability samples for the moving average and rate of change.
    static const uint8_t PROBABILITY_HISTORY_LENGTH = 12;
    // 288 occupancy samples, ie one day at 5-minute updates.
    static const uint16_t OCCUPANCY_HISTORY_LENGTH = 288;


    // Templated set of constant area parameters derived together from common arguments.
    // Can be tweaked to parameterise different kinds of area,
    // eg a bedroom with long still periods wants a longer decay.
    //   * thresholdPC  occupied iff probability >= thresholdPC/100; [1,99]
    //   * decayWindowS  seconds over which decaying evidence fades to nothing
    //   * decayMinDelayS  grace seconds after deactivation before decay starts
    //   * historyDays  default learner lookback in days; [1,90]
    template<uint8_t thresholdPC, uint16_t decayWindowS, uint16_t decayMinDelayS, uint8_t historyDays>
    class AreaParameters
        {
        public:
            // Occupancy threshold in percent.
            // Must be in range [MIN_THRESHOLD_PC,MAX_THRESHOLD_PC].
            static constexpr uint8_t THRESHOLD_PC = fnmin(fnmax(thresholdPC, MIN_THRESHOLD_PC), MAX_THRESHOLD_PC);

            // Decay is on unless explicitly turned off.
            static constexpr bool DECAY_ENABLED = true;
            // Decay window (s).
            static constexpr uint16_t DECAY_WINDOW_S = decayWindowS;
            // Grace period (s) after deactivation before decay starts.
            static constexpr uint16_t DECAY_MIN_DELAY_S = decayMinDelayS;

            // Learner lookback (days).
            // Must be in range [MIN_HISTORY_PERIOD_DAYS,MAX_HISTORY_PERIOD_DAYS].
            static constexpr uint8_t HISTORY_PERIOD_DAYS = fnmin(fnmax(historyDays, MIN_HISTORY_PERIOD_DAYS), MAX_HISTORY_PERIOD_DAYS);
        };
    template<uint8_t t, uint16_t w, uint16_t d, uint8_t h> constexpr uint8_t AreaParameters<t, w, d, h>::THRESHOLD_PC;
    template<uint8_t t, uint16_t w, uint16_t d, uint8_t h> constexpr bool AreaParameters<t, w, d, h>::DECAY_ENABLED;
    template<uint8_t t, uint16_t w, uint16_t d, uint8_t h> constexpr uint16_t AreaParameters<t, w, d, h>::DECAY_WINDOW_S;
    template<uint8_t t, uint16_t w, uint16_t d, uint8_t h> constexpr uint16_t AreaParameters<t, w, d, h>::DECAY_MIN_DELAY_S;
    template<uint8_t t, uint16_t w, uint16_t d, uint8_t h> constexpr uint8_t AreaParameters<t, w, d, h>::HISTORY_PERIOD_DAYS;

    // Typical living area parameters.
    typedef AreaParameters<
        50,  // Threshold: more likely than not.
        600, // Decay window: 10 minutes of fading confidence.
        60,  // Minimum delay: ignore up to a minute of sensor flicker.
        7    // History: a week captures the weekday/weekend cycle.
        > DEFAULT_AreaParameters;


    }

#endif
