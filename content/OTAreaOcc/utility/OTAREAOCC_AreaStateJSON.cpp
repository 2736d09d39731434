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

Author(s) / Copyright (s): Damon Hart-Davis 2014--2018
*/

/*
 Compact JSON state line for an area.
 */

#include <math.h>
#include <string.h>

#include "OTAREAOCC_AreaStateJSON.h"
#include "OTAREAOCC_Util.h"


namespace OTAREAOCC
{


bool isValidSimpleStatsKey(const MSG_JSON_SimpleStatsKey_t key)
    {
    if(NULL == key) { return(false); }
    for(const char *s = key; ; ++s)
        {
        const char c = *s;
        if('\0' == c) { break; }
        if((c < 32) || (c > 126) || ('"' == c) || ('\\' == c)) { return(false); }
        }
    return(true);
    }

size_t Printer::print(const char *const s)
    {
    if(NULL == s) { return(0); }
    return(write(s, strlen(s)));
    }

size_t Printer::print(const long l)
    {
    // Enough for any 64-bit value and sign.
    char digits[24];
    size_t n = 0;
    // Work in unsigned to handle the most negative value.
    unsigned long u = (l < 0) ? (0UL - (unsigned long)l) : (unsigned long)l;
    do { digits[n++] = char('0' + (u % 10)); u /= 10; } while(0 != u);
    size_t w = 0;
    if(l < 0) { w += print('-'); }
    while(n > 0) { w += print(digits[--n]); }
    return(w);
    }

// Print ,"key":value with the comma only if needed.
static void printField(BufPrint &bp, const MSG_JSON_SimpleStatsKey_t key, const long value, bool &commaPending)
    {
    if(commaPending) { bp.print(','); }
    bp.print('"');
    bp.print(key); // Assumed not to need escaping in any way.
    bp.print('"');
    bp.print(':');
    bp.print(value);
    commaPending = true;
    }

size_t writeAreaStateJSON(char *const buf, const size_t bufSize, const AreaState &state, const int8_t err,
                          const AreaStatsTracker *const statsOpt)
    {
    if(NULL == buf) { return(0); }
    if(bufSize < MSG_JSON_AREA_MIN_BUF) { if(bufSize > 0) { buf[0] = '\0'; } return(0); }
    if(state.areaId.empty() || !isValidSimpleStatsKey(state.areaId.c_str())) { buf[0] = '\0'; return(0); }

    BufPrint bp(buf, bufSize);
    // Maximum size that can be taken up before final "}\0".
    const size_t maxLengthBeforeClose = bufSize - 3;
    bool commaPending = false;

    bp.print(MSG_JSON_LEADING_CHAR);
    bp.print("\"@\":\"");
    bp.print(state.areaId.c_str());
    bp.print('"');
    commaPending = true;

    printField(bp, "occ|%", probabilityToPercent(state.probability), commaPending);
    printField(bp, "O", state.occupied ? 1 : 0, commaPending);
    printField(bp, "thr|%", state.thresholdPC, commaPending);
    printField(bp, "tr", long(state.activeTriggers.size()), commaPending);
    printField(bp, "err", err, commaPending);
    // Mandatory part must fit entirely.
    if(bp.getSize() > maxLengthBeforeClose) { buf[0] = '\0'; return(0); }
    bp.setMark();

    if(NULL != statsOpt)
        {
        const double avg = statsOpt->getMovingAverage();
        if(!isnan(avg))
            {
            printField(bp, "avg|%", probabilityToPercent(avg), commaPending);
            if(bp.getSize() > maxLengthBeforeClose) { bp.rewind(); }
            else { bp.setMark(); }
            }
        if(0 != statsOpt->getOccupancySampleCount())
            {
            printField(bp, "or|%", probabilityToPercent(statsOpt->getOccupancyRate()), commaPending);
            if(bp.getSize() > maxLengthBeforeClose) { bp.rewind(); }
            else { bp.setMark(); }
            }
        }

    // Terminate object.
    bp.print('}');
    return(bp.getSize());
    }


}
