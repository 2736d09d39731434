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
                           Deniz Erbilgin 2015
*/

/*
 Serial (console) I/O.

 Writes to stdout, flushing after each call,
 with whole tagged log lines written atomically
 so that lines from different area worker threads never interleave.

 The debug support is only enabled if OTAREAOCC_DEBUG is defined,
 else does nothing, or at least as little as possible.
 */

#ifndef OTAREAOCC_SERIAL_IO_H
#define OTAREAOCC_SERIAL_IO_H

#include <stdint.h>


namespace OTAREAOCC
{


#ifndef OTAREAOCC_DEBUG
#define OTAREAOCC_DEBUG_SERIAL_PRINT(s) // Do nothing.
#define OTAREAOCC_DEBUG_SERIAL_PRINTLN() // Do nothing.
#else

// Send simple string to the console and flush.
#define OTAREAOCC_DEBUG_SERIAL_PRINT(s) { OTAREAOCC::serialPrintAndFlush(s); }
#define OTAREAOCC_DEBUG_SERIAL_PRINTLN() { OTAREAOCC::serialPrintlnAndFlush(); }

#endif // OTAREAOCC_DEBUG


// Conventions for data sent on the console to indicate 'significant' lines.
// If the initial character on the line is one of the following distinguished values
// then that implies that the entire line is for the described purpose.
// For example, lines starting with '!' can treated as an error log.
enum Serial_LineType_InitChar : uint8_t {
    SERLINE_START_CHAR_ERROR = '!', // Error log line.
    SERLINE_START_CHAR_WARNING = '?', // Warning log line.
    SERLINE_START_CHAR_INFO = '+', // Informational log line.
    SERLINE_START_CHAR_RJSTATS = '{', // JSON stats log line.
    SERLINE_START_CHAR_STATS = '=' // Local stats log line.
};


// Write a single string to the console and flush.
void serialPrintAndFlush(char const *text);

// Write line-end to the console and flush.
void serialPrintlnAndFlush();

// Write one complete log line, prefixed with its line-type character,
// as a single atomic write with respect to all other serialPrintlnLine() calls.
// Thread-safe.
//   * lineType  initial character (eg SERLINE_START_CHAR_WARNING)
//   * context  optional short context such as an area ID; may be NULL
//   * text  message text; never NULL
void serialPrintlnLine(Serial_LineType_InitChar lineType, const char *context, const char *text);


}

#endif
