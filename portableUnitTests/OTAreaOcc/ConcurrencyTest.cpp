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
 * Driver for OTAREAOCC concurrency tests.
 */

#include <stdint.h>
#include <chrono>
#include <memory>
#include <thread>
#include <gtest/gtest.h>
#include <OTAreaOcc.h>

#include "OTAREAOCC_Concurrency.h"


// Tests some basic features of Atomic_UInt8T.
TEST(Concurrency,AtomicUInt8T)
{
    OTAREAOCC::Atomic_UInt8T v0(0);
    EXPECT_EQ(0, v0.load());
    OTAREAOCC::safeDecIfNZWeak(v0);
    EXPECT_EQ(0, v0.load());
    OTAREAOCC::Atomic_UInt8T v1(1);
    EXPECT_EQ(1, v1.load());
    OTAREAOCC::safeDecIfNZWeak(v1); // In practice not expected to fail.
    EXPECT_EQ(0, v1.load());
    // Test initialisation, load/store, decrement.
    for(uint8_t i = 255; i > 0; --i)
        {
        OTAREAOCC::Atomic_UInt8T v(i);
        EXPECT_EQ(i, v.load());
        OTAREAOCC::safeDecIfNZWeak(v); // In practice not expected to fail.
        EXPECT_EQ(i-1, v.load());
        OTAREAOCC::Atomic_UInt8T w;
        w.store(i); // Test explicit store.
        EXPECT_EQ(i, w.load());
        OTAREAOCC::safeDecIfNZWeak(w);
        EXPECT_EQ(i-1, w.load());
        }
    // Increment stops at the top.
    OTAREAOCC::Atomic_UInt8T vff(0xff);
    OTAREAOCC::safeIncIfNotFFWeak(vff);
    EXPECT_EQ(0xff, vff.load());
    OTAREAOCC::Atomic_UInt8T vfe(0xfe);
    OTAREAOCC::safeIncIfNotFFWeak(vfe);
    EXPECT_EQ(0xff, vfe.load());
}

// Readers keep what they loaded across a replacement.
TEST(Concurrency,AtomicSnapshot)
{
    OTAREAOCC::AtomicSnapshot<int> s;
    EXPECT_FALSE(s.load());
    s.store(std::make_shared<int>(1));
    const std::shared_ptr<const int> old = s.load();
    ASSERT_TRUE(static_cast<bool>(old));
    s.store(std::make_shared<int>(2));
    EXPECT_EQ(1, *old);
    EXPECT_EQ(2, *s.load());
}

// Concurrent replacement never yields a torn or NULL value.
TEST(Concurrency,AtomicSnapshotThreads)
{
    struct Pair { int a, b; };
    OTAREAOCC::AtomicSnapshot<Pair> s(std::make_shared<Pair>(Pair{0, 0}));
    std::thread writer([&s]()
        {
        for(int i = 1; i <= 2000; ++i) { s.store(std::make_shared<Pair>(Pair{i, -i})); }
        });
    for(int i = 0; i < 2000; ++i)
        {
        const std::shared_ptr<const Pair> p = s.load();
        ASSERT_TRUE(static_cast<bool>(p));
        ASSERT_EQ(-p->a, p->b);
        }
    writer.join();
    EXPECT_EQ(2000, s.load()->a);
}

// Cancellation and deadline.
TEST(Concurrency,CancellationToken)
{
    // No deadline.
    OTAREAOCC::CancellationToken t0;
    EXPECT_FALSE(t0.isCancelled());
    EXPECT_FALSE(t0.isExpired());
    EXPECT_FALSE(t0.shouldStop());
    t0.cancel();
    EXPECT_TRUE(t0.isCancelled());
    EXPECT_FALSE(t0.isExpired());
    EXPECT_TRUE(t0.shouldStop());

    // Short deadline.
    OTAREAOCC::CancellationToken t1(5);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_FALSE(t1.isCancelled());
    EXPECT_TRUE(t1.isExpired());
    EXPECT_TRUE(t1.shouldStop());

    // Long deadline not reached.
    OTAREAOCC::CancellationToken t2(60000);
    EXPECT_FALSE(t2.shouldStop());
}
