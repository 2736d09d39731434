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
 * Driver for console output tests.
 */

#include <stdint.h>
#include <string>
#include <gtest/gtest.h>
#include <OTAreaOcc.h>

#include "OTAREAOCC_Serial_IO.h"


// Plain output and line end.
TEST(SerialIO,printAndFlush)
{
    testing::internal::CaptureStdout();
    OTAREAOCC::serialPrintAndFlush("abc");
    OTAREAOCC::serialPrintlnAndFlush();
    EXPECT_EQ("abc\n", testing::internal::GetCapturedStdout());
}

// Tagged lines, with and without context.
TEST(SerialIO,printlnLine)
{
    testing::internal::CaptureStdout();
    OTAREAOCC::serialPrintlnLine(OTAREAOCC::SERLINE_START_CHAR_WARNING, "kitchen", "no history");
    OTAREAOCC::serialPrintlnLine(OTAREAOCC::SERLINE_START_CHAR_INFO, NULL, "started");
    EXPECT_EQ("?kitchen: no history\n+ started\n", testing::internal::GetCapturedStdout());
}
