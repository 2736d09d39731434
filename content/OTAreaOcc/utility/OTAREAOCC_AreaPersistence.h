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

Author(s) / Copyright (s): Damon Hart-Davis 2017--2018
*/

/*
 Save and restore of an area's learned priors and recent stats,
 so that a restarted host need not wait for the next learner run.

 The saved form is line-oriented text, one record per line:
     OTAO 1                            header and format version
     L <ms>                            time the priors were learned
     T <category> <tp> <fp> <prior>    category entry
     S <sensorId> <tp> <fp> <prior>    per-sensor entry
     B <sensorId> <baseline>           learned baseline
     H <24 by-hour values>             255 for an unset hour
     Q <ms> <probability>              one held probability sample, oldest first
     O <string of 0 and 1>             held occupancy flags, oldest first
     M <min> <max>                     probability extremes, if any
     X <lastOccupiedMs> <stateSinceMs> <0|1>
 Times are signed milliseconds; NO_TIME is written as its value.
 Real values use enough digits to be read back exactly.
 */

#ifndef OTAREAOCC_AREAPERSISTENCE_H
#define OTAREAOCC_AREAPERSISTENCE_H

#include <string>

#include "OTAREAOCC_AreaStatsTracker.h"
#include "OTAREAOCC_ErrorReport.h"
#include "OTAREAOCC_PriorStore.h"


namespace OTAREAOCC
{


// First line of saved area state.
static const char AREA_STATE_HEADER[] = "OTAO 1";

// Write the table and stats to out (replacing its contents).
// Returns false (out undefined) if a sensor ID in the table is empty
// or contains whitespace, or a baseline is not finite.
bool saveAreaState(const PriorTable &table, const AreaStatsTracker &stats, std::string &out);

// Parse text written by saveAreaState().
// Returns ERR_NONE on success,
// else ERR_RESTORE_FORMAT and leaves table and stats untouched.
// Unknown sensor categories, out-of-range values, a missing header
// and unknown record types are all rejected.
ErrorReport::errorCatalogue loadAreaState(const std::string &text, PriorTable &table, AreaStatsTracker &stats);


}

#endif
