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
 * Driver for compact JSON area state tests.
 */

#include <stdint.h>
#include <string.h>
#include <gtest/gtest.h>
#include <OTAreaOcc.h>

#include "OTAREAOCC_AreaStateJSON.h"


namespace ASJT
{
static OTAREAOCC::AreaState state(const char *id)
    {
    OTAREAOCC::AreaState s;
    s.areaId = id;
    s.probability = 0.8701;
    s.occupied = true;
    s.thresholdPC = 50;
    s.activeTriggers.insert("binary_sensor.a");
    s.activeTriggers.insert("binary_sensor.b");
    s.lastUpdatedMs = 1;
    return(s);
    }
}

// Key checks.
TEST(AreaStateJSON,isValidSimpleStatsKey)
{
    EXPECT_TRUE(OTAREAOCC::isValidSimpleStatsKey("occ|%"));
    EXPECT_TRUE(OTAREAOCC::isValidSimpleStatsKey(""));
    EXPECT_FALSE(OTAREAOCC::isValidSimpleStatsKey(NULL));
    EXPECT_FALSE(OTAREAOCC::isValidSimpleStatsKey("a\"b"));
    EXPECT_FALSE(OTAREAOCC::isValidSimpleStatsKey("a\\b"));
    EXPECT_FALSE(OTAREAOCC::isValidSimpleStatsKey("a\nb"));
}

// Bounded printing.
TEST(AreaStateJSON,BufPrint)
{
    char buf[8];
    OTAREAOCC::BufPrint bp(buf, sizeof(buf));
    EXPECT_EQ(0U, bp.getSize());
    EXPECT_STREQ("", buf);
    EXPECT_EQ(3U, bp.print(-42));
    EXPECT_EQ(1U, bp.print(','));
    bp.setMark();
    EXPECT_EQ(3U, bp.print("abcdef"));
    EXPECT_TRUE(bp.isFull());
    EXPECT_STREQ("-42,abc", buf);
    EXPECT_EQ(0U, bp.print('x'));
    bp.rewind();
    EXPECT_STREQ("-42,", buf);
    EXPECT_FALSE(bp.isFull());
    EXPECT_EQ(1U, bp.print(0));
    EXPECT_STREQ("-42,0", buf);
}

// Mandatory fields only.
TEST(AreaStateJSON,mandatory)
{
    char buf[OTAREAOCC::MSG_JSON_AREA_MIN_BUF];
    const size_t n = OTAREAOCC::writeAreaStateJSON(buf, sizeof(buf), ASJT::state("kitchen"), 0);
    EXPECT_STREQ("{\"@\":\"kitchen\",\"occ|%\":87,\"O\":1,\"thr|%\":50,\"tr\":2,\"err\":0}", buf);
    EXPECT_EQ(strlen(buf), n);
    OTAREAOCC::AreaState s(ASJT::state("kitchen"));
    s.occupied = false;
    s.probability = 0.1;
    s.activeTriggers.clear();
    OTAREAOCC::writeAreaStateJSON(buf, sizeof(buf), s, OTAREAOCC::ErrorReport::WARN_INSUFFICIENT_HISTORY);
    EXPECT_STREQ("{\"@\":\"kitchen\",\"occ|%\":10,\"O\":0,\"thr|%\":50,\"tr\":0,\"err\":-20}", buf);
}

// Optional stats are added only where they fit.
TEST(AreaStateJSON,optionalStats)
{
    OTAREAOCC::AreaStatsTracker st;
    st.update(ASJT::state("kitchen"));
    char big[128];
    OTAREAOCC::writeAreaStateJSON(big, sizeof(big), ASJT::state("kitchen"), 0, &st);
    EXPECT_STREQ("{\"@\":\"kitchen\",\"occ|%\":87,\"O\":1,\"thr|%\":50,\"tr\":2,\"err\":0,\"avg|%\":87,\"or|%\":100}", big);
    // Room for one only.
    char mid[80];
    OTAREAOCC::writeAreaStateJSON(mid, sizeof(mid), ASJT::state("kitchen"), 0, &st);
    EXPECT_STREQ("{\"@\":\"kitchen\",\"occ|%\":87,\"O\":1,\"thr|%\":50,\"tr\":2,\"err\":0,\"avg|%\":87}", mid);
    // Room for neither.
    char small[OTAREAOCC::MSG_JSON_AREA_MIN_BUF];
    OTAREAOCC::writeAreaStateJSON(small, sizeof(small), ASJT::state("kitchen"), 0, &st);
    EXPECT_STREQ("{\"@\":\"kitchen\",\"occ|%\":87,\"O\":1,\"thr|%\":50,\"tr\":2,\"err\":0}", small);
    // Empty stats add nothing.
    const OTAREAOCC::AreaStatsTracker none;
    OTAREAOCC::writeAreaStateJSON(big, sizeof(big), ASJT::state("kitchen"), 0, &none);
    EXPECT_STREQ(small, big);
}

// Failures leave an empty string.
TEST(AreaStateJSON,failures)
{
    char buf[OTAREAOCC::MSG_JSON_AREA_MIN_BUF];
    // Too small a buffer.
    EXPECT_EQ(0U, OTAREAOCC::writeAreaStateJSON(buf, sizeof(buf) - 1, ASJT::state("kitchen"), 0));
    EXPECT_STREQ("", buf);
    // ID needing escapes.
    EXPECT_EQ(0U, OTAREAOCC::writeAreaStateJSON(buf, sizeof(buf), ASJT::state("kit\"chen"), 0));
    EXPECT_STREQ("", buf);
    EXPECT_EQ(0U, OTAREAOCC::writeAreaStateJSON(buf, sizeof(buf), ASJT::state(""), 0));
    // Mandatory part does not fit.
    EXPECT_EQ(0U, OTAREAOCC::writeAreaStateJSON(buf, sizeof(buf), ASJT::state("a_very_long_area_name"), 0));
    EXPECT_STREQ("", buf);
    EXPECT_EQ(0U, OTAREAOCC::writeAreaStateJSON(NULL, 100, ASJT::state("kitchen"), 0));
}
