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
 Simple utilities.
 */

#include <ctype.h>
#include <stdlib.h>
#include <string.h>
#include <cmath>

#include "OTAREAOCC_Util.h"


namespace OTAREAOCC
{


// True if the host's raw state text means "no usable value".
bool isUnavailableStateText(const std::string &raw)
    {
    if(raw.empty()) { return(true); }
    return(("unavailable" == raw) || ("unknown" == raw) || ("none" == raw));
    }

// Parse a complete decimal floating-point number.
bool parseFiniteDouble(const std::string &text, double &out)
    {
    const char *const s = text.c_str();
    char *end = NULL;
    const double v = strtod(s, &end);
    if(end == s) { return(false); } // No digits at all.
    // Allow only trailing whitespace.
    while(('\0' != *end) && isspace((unsigned char)*end)) { ++end; }
    if('\0' != *end) { return(false); }
    if(!std::isfinite(v)) { return(false); }
    out = v;
    return(true);
    }


}
