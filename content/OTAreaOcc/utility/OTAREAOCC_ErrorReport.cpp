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
 Simple low-frequency error reporting.
 */

#include <stdio.h>

#include "OTAREAOCC_ErrorReport.h"
#include "OTAREAOCC_Serial_IO.h"


namespace OTAREAOCC
{


constexpr uint8_t ErrorReport::DEFAULT_TIMEOUT;

// Global instance.
ErrorReport ErrorReporter;

// Short symbolic name for a catalogue value.
const char *errorCatalogueName(const int8_t err)
    {
    switch(err)
        {
        case ErrorReport::WARN_EVIDENCE_UNAVAILABLE: return("WARN_EVIDENCE_UNAVAILABLE");
        case ErrorReport::WARN_INSUFFICIENT_HISTORY: return("WARN_INSUFFICIENT_HISTORY");
        case ErrorReport::WARN_INTERNAL: return("WARN_INTERNAL");
        case ErrorReport::WARN_UNSPECIFIED: return("WARN_UNSPECIFIED");
        case ErrorReport::ERR_NONE: return("ERR_NONE");
        case ErrorReport::ERR_UNSPECIFIED: return("ERR_UNSPECIFIED");
        case ErrorReport::ERR_INTERNAL: return("ERR_INTERNAL");
        case ErrorReport::ERR_CONFIG_NO_MOTION: return("ERR_CONFIG_NO_MOTION");
        case ErrorReport::ERR_CONFIG_WEIGHT_RANGE: return("ERR_CONFIG_WEIGHT_RANGE");
        case ErrorReport::ERR_CONFIG_THRESHOLD_RANGE: return("ERR_CONFIG_THRESHOLD_RANGE");
        case ErrorReport::ERR_CONFIG_DUPLICATE_SENSOR: return("ERR_CONFIG_DUPLICATE_SENSOR");
        case ErrorReport::ERR_CONFIG_DECAY_RANGE: return("ERR_CONFIG_DECAY_RANGE");
        case ErrorReport::ERR_CONFIG_HISTORY_PERIOD: return("ERR_CONFIG_HISTORY_PERIOD");
        case ErrorReport::ERR_CONFIG_NO_GROUND_TRUTH: return("ERR_CONFIG_NO_GROUND_TRUTH");
        case ErrorReport::ERR_CONFIG_AREA_ID: return("ERR_CONFIG_AREA_ID");
        case ErrorReport::ERR_UNKNOWN_AREA: return("ERR_UNKNOWN_AREA");
        case ErrorReport::ERR_LEARNER_HISTORY: return("ERR_LEARNER_HISTORY");
        case ErrorReport::ERR_LEARNER_TIMEOUT: return("ERR_LEARNER_TIMEOUT");
        case ErrorReport::ERR_LEARNER_CANCELLED: return("ERR_LEARNER_CANCELLED");
        case ErrorReport::ERR_RESTORE_FORMAT: return("ERR_RESTORE_FORMAT");
        default: break;
        }
    return((err > 0) ? "ERR_?" : "WARN_?");
    }

// As set() but also logs a one-line report.
bool ErrorReport::report(const errorCatalogue err, const char * const context, const char * const detail)
    {
    const bool accepted = set(err);
    char line[128];
    if(NULL == detail) { snprintf(line, sizeof(line), "%s (%d)", errorCatalogueName(err), int(err)); }
    else { snprintf(line, sizeof(line), "%s (%d) %s", errorCatalogueName(err), int(err), detail); }
    serialPrintlnLine((err > 0) ? SERLINE_START_CHAR_ERROR : SERLINE_START_CHAR_WARNING, context, line);
    return(accepted);
    }


}
