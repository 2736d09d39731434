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
 * Driver for OTAREAOCC_Util tests.
 */

#include <math.h>
#include <stdint.h>
#include <gtest/gtest.h>
#include <OTAreaOcc.h>

#include "OTAREAOCC_Util.h"


// Test basic min/max/constrain helpers.
TEST(Util,fnminmax)
{
    EXPECT_EQ(1, OTAREAOCC::fnmin(1, 2));
    EXPECT_EQ(2, OTAREAOCC::fnmax(1, 2));
    EXPECT_EQ(5, OTAREAOCC::fnconstrain(7, 0, 5));
    EXPECT_EQ(0, OTAREAOCC::fnconstrain(-3, 0, 5));
    EXPECT_EQ(3, OTAREAOCC::fnconstrain(3, 0, 5));
}

// Hour of day, including offsets and times before the epoch.
TEST(Util,hourOfDay)
{
    const int64_t hour = OTAREAOCC::MS_PER_HOUR;
    EXPECT_EQ(0, OTAREAOCC::hourOfDay(0));
    EXPECT_EQ(1, OTAREAOCC::hourOfDay(hour));
    EXPECT_EQ(23, OTAREAOCC::hourOfDay(OTAREAOCC::MS_PER_DAY - 1));
    EXPECT_EQ(0, OTAREAOCC::hourOfDay(OTAREAOCC::MS_PER_DAY));
    // An hour before the epoch is 23:00 the previous day.
    EXPECT_EQ(23, OTAREAOCC::hourOfDay(-hour));
    EXPECT_EQ(23, OTAREAOCC::hourOfDay(-1));
    // Offsets either side of UTC.
    EXPECT_EQ(2, OTAREAOCC::hourOfDay(hour, 60));
    EXPECT_EQ(23, OTAREAOCC::hourOfDay(0, -60));
    EXPECT_EQ(5, OTAREAOCC::hourOfDay(0, 330));
}

// logit() and logistic() are inverses.
TEST(Util,logOdds)
{
    EXPECT_DOUBLE_EQ(0.0, OTAREAOCC::logit(0.5));
    EXPECT_DOUBLE_EQ(0.5, OTAREAOCC::logistic(0.0));
    for(double p = 0.01; p < 1; p += 0.07)
        { EXPECT_NEAR(p, OTAREAOCC::logistic(OTAREAOCC::logit(p)), 1e-12) << p; }
    EXPECT_GT(OTAREAOCC::logit(0.9), 0);
    EXPECT_LT(OTAREAOCC::logit(0.1), 0);
}

// Probability to whole percent.
TEST(Util,probabilityToPercent)
{
    EXPECT_EQ(0, OTAREAOCC::probabilityToPercent(0));
    EXPECT_EQ(100, OTAREAOCC::probabilityToPercent(1));
    EXPECT_EQ(50, OTAREAOCC::probabilityToPercent(0.5));
    EXPECT_EQ(87, OTAREAOCC::probabilityToPercent(0.8701));
    EXPECT_EQ(0, OTAREAOCC::probabilityToPercent(-1));
    EXPECT_EQ(100, OTAREAOCC::probabilityToPercent(2));
    EXPECT_EQ(0, OTAREAOCC::probabilityToPercent(NAN));
}

// Host text meaning "no value".
TEST(Util,isUnavailableStateText)
{
    EXPECT_TRUE(OTAREAOCC::isUnavailableStateText(""));
    EXPECT_TRUE(OTAREAOCC::isUnavailableStateText("unavailable"));
    EXPECT_TRUE(OTAREAOCC::isUnavailableStateText("unknown"));
    EXPECT_TRUE(OTAREAOCC::isUnavailableStateText("none"));
    EXPECT_FALSE(OTAREAOCC::isUnavailableStateText("on"));
    EXPECT_FALSE(OTAREAOCC::isUnavailableStateText("off"));
    EXPECT_FALSE(OTAREAOCC::isUnavailableStateText("0"));
}

// Strict numeric parsing.
TEST(Util,parseFiniteDouble)
{
    double v = -1;
    EXPECT_TRUE(OTAREAOCC::parseFiniteDouble("312.5", v));
    EXPECT_DOUBLE_EQ(312.5, v);
    EXPECT_TRUE(OTAREAOCC::parseFiniteDouble(" -4 ", v));
    EXPECT_DOUBLE_EQ(-4, v);
    EXPECT_TRUE(OTAREAOCC::parseFiniteDouble("1e2", v));
    EXPECT_DOUBLE_EQ(100, v);
    // Failures leave the output untouched.
    v = 7;
    EXPECT_FALSE(OTAREAOCC::parseFiniteDouble("", v));
    EXPECT_FALSE(OTAREAOCC::parseFiniteDouble("on", v));
    EXPECT_FALSE(OTAREAOCC::parseFiniteDouble("12abc", v));
    EXPECT_FALSE(OTAREAOCC::parseFiniteDouble("nan", v));
    EXPECT_FALSE(OTAREAOCC::parseFiniteDouble("inf", v));
    EXPECT_FALSE(OTAREAOCC::parseFiniteDouble("1e999", v));
    EXPECT_EQ(7, v);
}
