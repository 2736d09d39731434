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
 Time decay of evidence after a sensor stops indicating activity.

 Once a sensor goes inactive its evidence is held at full strength
 for a short grace period (to ride out sensor flicker)
 then fades smoothly to nothing over the decay window.
 */

#ifndef OTAREAOCC_DECAY_H
#define OTAREAOCC_DECAY_H

#include <stdint.h>

#include "OTAREAOCC_Util.h"


namespace OTAREAOCC
{


// Shape of the fade from 1 to 0 over the decay window.
enum DecayShape : uint8_t
    {
    // Half-cosine easing: flat at both ends, steepest mid-window.
    DECAY_COSINE = 0,
    // Exponential fall, rescaled to reach exactly 0 at the end of the window.
    DECAY_EXPONENTIAL
    };

// Rate for DECAY_EXPONENTIAL: the unscaled curve falls to exp(-rate) at the end of the window.
static constexpr double DECAY_EXPONENTIAL_RATE = 4.0;

// Decay factor in [0,1] for a sensor that went inactive elapsedMs ago.
// Exactly 1.0 for elapsedMs <= minDelayMs.
// Exactly 0.0 for elapsedMs >= minDelayMs + windowMs.
// Non-increasing in elapsedMs in between.
// A non-positive window gives a step from 1 to 0 just after the minimum delay.
double decayFactor(int64_t elapsedMs, int64_t windowMs, int64_t minDelayMs, DecayShape shape = DECAY_COSINE);

// Area-level decay settings.
struct DecaySettings
    {
    // If false, evidence from an inactive sensor is dropped at once.
    bool enabled;
    int64_t windowMs;
    int64_t minDelayMs;
    DecayShape shape;
    };

// Per-sensor decay state.
// Not thread-safe; owned and driven by the single owner of the area.
class DecayState final
    {
    private:
        // Time of the last active to inactive transition, or NO_TIME if not decaying.
        timestamp_ms_t decayStartMs;
        // Factor computed by the last update(); in [0,1].
        double currentDecayFactor;
        // Evidence strength held when the sensor went inactive; in [0,1].
        double peakStrength;

    public:
        // Initially not decaying and with nothing to decay.
        DecayState() : decayStartMs(NO_TIME), currentDecayFactor(0), peakStrength(0) { }

        // Sensor (re)activated: no decay, factor 1, timer cleared.
        void onActivated()
            { decayStartMs = NO_TIME; currentDecayFactor = 1; }

        // Sensor went inactive at nowMs while holding the given evidence strength: start the timer.
        void onDeactivated(const timestamp_ms_t nowMs, const double strength)
            { decayStartMs = nowMs; currentDecayFactor = 1; peakStrength = strength; }

        // Forget any decaying evidence, eg when the sensor becomes unavailable.
        void clear()
            { decayStartMs = NO_TIME; currentDecayFactor = 0; peakStrength = 0; }

        // Recompute and return the factor for time nowMs.
        // Active sensors always have factor 1.
        // Inactive sensors with no timer running have factor 0,
        // as do all inactive sensors when decay is disabled.
        double update(bool active, timestamp_ms_t nowMs, const DecaySettings &settings);

        // True while the decay timer is running.
        bool isDecaying() const { return(NO_TIME != decayStartMs); }
        timestamp_ms_t getDecayStartMs() const { return(decayStartMs); }
        double getCurrentDecayFactor() const { return(currentDecayFactor); }
        double getPeakStrength() const { return(peakStrength); }
    };


}

#endif
