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
 Simple console output, flushed after each call.
 */

#include <stdio.h>
#include <mutex>

#include "OTAREAOCC_Serial_IO.h"

namespace OTAREAOCC
{

// Flush to use for all serialPrintXXX() and OTAREAOCC_DEBUG_PRINTXXX routines.
#define _flush() fflush(stdout)

// Serialises whole-line writes from multiple threads.
static std::mutex serialLineLock;


// Write a single string to the console and flush.
void serialPrintAndFlush(char const * const text)
  {
  fputs(text, stdout);
  _flush();
  }

// Write line-end to the console and flush.
void serialPrintlnAndFlush()
  {
  putchar('\n');
  _flush();
  }

// Write one complete log line, prefixed with its line-type character.
void serialPrintlnLine(const Serial_LineType_InitChar lineType, const char * const context, const char * const text)
  {
  std::lock_guard<std::mutex> lock(serialLineLock);
  if(NULL == context) { printf("%c %s\n", char(lineType), text); }
  else { printf("%c%s: %s\n", char(lineType), context, text); }
  _flush();
  }


}
