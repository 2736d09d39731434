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
 Simple utilities: min/max/constrain helpers,
 millisecond timestamps, and probability/log-odds conversions.
 */

#ifndef OTAREAOCC_UTIL_H
#define OTAREAOCC_UTIL_H

#include <stdint.h>
#include <stddef.h>
#include <math.h>
#include <string>


namespace OTAREAOCC
{


// Templated function versions of min()/max() that do not evaluate the arguments twice.
template <class T> constexpr const T& fnmin(const T& a, const T& b) { return((a>b)?b:a); }
template <class T> constexpr const T& fnmax(const T& a, const T& b) { return((a<b)?b:a); }

// Constrains x to inclusive range [l,h].
template <class T> constexpr const T& fnconstrain(const T& x, const T& l, const T& h) { return((x<l)?l:((x>h)?h:x)); }


// All timestamps are signed milliseconds since the Unix epoch (UTC).
typedef int64_t timestamp_ms_t;
// Marker for "no time set", eg a decay timer that is not running.
static constexpr timestamp_ms_t NO_TIME = INT64_MIN;

static constexpr int64_t MS_PER_S = 1000;
static constexpr int64_t MS_PER_MINUTE = 60 * MS_PER_S;
static constexpr int64_t MS_PER_HOUR = 60 * MS_PER_MINUTE;
static constexpr int64_t MS_PER_DAY = 24 * MS_PER_HOUR;

// Hour of day [0,23] of the given timestamp after applying a fixed offset from UTC in minutes.
// Correct for timestamps before the epoch too.
inline uint8_t hourOfDay(const timestamp_ms_t t, const int16_t utcOffsetMinutes = 0)
    {
    const int64_t local = t + (int64_t(utcOffsetMinutes) * MS_PER_MINUTE);
    int64_t h = (local / MS_PER_HOUR) % 24;
    if((local < 0) && (0 != (local % MS_PER_HOUR))) { --h; }
    if(h < 0) { h += 24; }
    return(uint8_t(h));
    }


// Log-odds of probability p; p must be strictly inside (0,1).
inline double logit(const double p) { return(log(p / (1.0 - p))); }
// Inverse of logit(): maps any finite log-odds to a probability in [0,1].
inline double logistic(const double x) { return(1.0 / (1.0 + exp(-x))); }

// Probability as a whole percentage [0,100], rounded to nearest.
// Non-finite input is reported as 0.
inline uint8_t probabilityToPercent(const double p)
    {
    if(!(p > 0)) { return(0); }
    if(p >= 1) { return(100); }
    return(uint8_t(lround(p * 100)));
    }

// True if the host's raw state text means "no usable value",
// ie "unavailable", "unknown", "none" or empty.
bool isUnavailableStateText(const std::string &raw);

// Parse a complete decimal floating-point number (surrounding whitespace allowed).
// Returns false and leaves out untouched if the text is not a finite number.
bool parseFiniteDouble(const std::string &text, double &out);


}

#endif
