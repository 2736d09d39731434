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
 */

#include <math.h>

#include "OTAREAOCC_Decay.h"


namespace OTAREAOCC
{


static constexpr double PI = 3.14159265358979323846;

double decayFactor(const int64_t elapsedMs, const int64_t windowMs, const int64_t minDelayMs, const DecayShape shape)
    {
    // Grace period, including any clock step backwards.
    if(elapsedMs <= minDelayMs) { return(1.0); }
    if(windowMs <= 0) { return(0.0); }
    const int64_t into = elapsedMs - minDelayMs;
    if(into >= windowMs) { return(0.0); }
    // Strictly inside (0,1) here.
    const double x = double(into) / double(windowMs);
    double f;
    switch(shape)
        {
        case DECAY_EXPONENTIAL:
            {
            const double tail = exp(-DECAY_EXPONENTIAL_RATE);
            f = (exp(-DECAY_EXPONENTIAL_RATE * x) - tail) / (1.0 - tail);
            break;
            }
        case DECAY_COSINE:
        default:
            f = 0.5 * (1.0 + cos(PI * x));
            break;
        }
    return(fnconstrain(f, 0.0, 1.0));
    }

double DecayState::update(const bool active, const timestamp_ms_t nowMs, const DecaySettings &settings)
    {
    if(active) { onActivated(); }
    else if(!isDecaying() || !settings.enabled) { currentDecayFactor = 0; }
    else { currentDecayFactor = decayFactor(nowMs - decayStartMs, settings.windowMs, settings.minDelayMs, settings.shape); }
    return(currentDecayFactor);
    }


}
