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
 Compact JSON state line for an area, eg
     {"@":"kitchen","occ|%":87,"O":1,"thr|%":50,"tr":2,"err":0}
 written into a bounded buffer with no dynamic allocation.
 */

#ifndef OTAREAOCC_AREASTATEJSON_H
#define OTAREAOCC_AREASTATEJSON_H

#include <stddef.h>
#include <stdint.h>

#include "OTAREAOCC_AreaStatsTracker.h"
#include "OTAREAOCC_BayesianAggregator.h"
#include "OTAREAOCC_Sensor.h"


namespace OTAREAOCC
{


// First character of a JSON object line.
static const char MSG_JSON_LEADING_CHAR = '{';

// Key used for JSON stats items; same as that used for Sensor tags.
typedef Sensor_tag_t MSG_JSON_SimpleStatsKey_t;

// Returns true iff a valid key for our subset of JSON.
// Rejects NULL, and keys containing " or \ or any chars outside the range [32,126]
// to avoid having to escape anything.
bool isValidSimpleStatsKey(MSG_JSON_SimpleStatsKey_t key);

// Minimal character sink.
class Printer
    {
    public:
        // Write one byte; returns 1 if written, else 0.
        virtual size_t write(uint8_t c) = 0;
        // Write until done or the first failure; returns bytes written.
        size_t write(const char *buf, size_t size)
            { size_t n = 0; while((size-- > 0) && (0 != write(uint8_t(*buf++)))) { ++n; } return(n); }
        size_t print(char c) { return(write(uint8_t(c))); }
        size_t print(const char *s);
        size_t print(long l);
        size_t print(int i) { return(print(long(i))); }
        size_t print(unsigned u) { return(print(long(u))); }

    protected:
        ~Printer() { }
    };

// Print to a bounded buffer, always '\0'-terminated.
class BufPrint final : public Printer
    {
    private:
        char * const b;
        const size_t capacity;
        size_t size;
        size_t mark;
    public:
        // Wrap around a buffer of size bufSize-1 chars and a trailing '\0'.
        // The buffer must be of at least size 1.
        BufPrint(char *buf, size_t bufSize) : b(buf), capacity(bufSize-1), size(0), mark(0) { buf[0] = '\0'; }
        // Print a single char to the bounded buffer; returns 1 if successful, else 0 if full.
        virtual size_t write(uint8_t c) override
            { if(size < capacity) { b[size++] = char(c); b[size] = '\0'; return(1); } else { return(0); } }
        using Printer::write;
        // True if buffer is completely full.
        bool isFull() const { return(size == capacity); }
        // Chars already in the buffer, not including trailing '\0'.
        size_t getSize() const { return(size); }
        // Record a good place to rewind to.
        void setMark() { mark = size; }
        // Rewind to the previous good position, clearing newer text.
        void rewind() { size = mark; b[size] = '\0'; }
    };

// Smallest buffer that writeAreaStateJSON() will attempt to use.
static const size_t MSG_JSON_AREA_MIN_BUF = 64;

// Write the compact JSON state line for an area into buf, '\0'-terminated.
// Mandatory fields are:
//   "@" area ID (must need no escaping), "occ|%" probability percent,
//   "O" 1 if occupied else 0, "thr|%" threshold, "tr" active trigger count,
//   "err" current error/warning code.
// If statsOpt is not NULL and there is room,
// "avg|%" moving average and "or|%" recent occupancy rate are appended.
// Returns the length written, or 0 if the buffer is too small or the ID unsafe.
size_t writeAreaStateJSON(char *buf, size_t bufSize, const AreaState &state, int8_t err,
                          const AreaStatsTracker *statsOpt = NULL);


}

#endif
