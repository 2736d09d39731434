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
 Threshold decision: occupancy probability to binary occupied state.

 Stateless: no hysteresis beyond that given by evidence decay.
 */

#ifndef OTAREAOCC_THRESHOLDDECISION_H
#define OTAREAOCC_THRESHOLDDECISION_H

#include <stdint.h>

#include "OTAREAOCC_Parameters.h"


namespace OTAREAOCC
{


// True iff thresholdPC is an acceptable threshold, ie in [MIN_THRESHOLD_PC,MAX_THRESHOLD_PC].
inline bool isValidThresholdPC(const uint8_t thresholdPC)
    { return((thresholdPC >= MIN_THRESHOLD_PC) && (thresholdPC <= MAX_THRESHOLD_PC)); }

// Occupied iff probability >= thresholdPC/100.
// The bound is inclusive: probability exactly at the threshold is occupied.
inline bool isOccupied(const double probability, const uint8_t thresholdPC)
    { return(probability >= (thresholdPC / 100.0)); }


}

#endif
