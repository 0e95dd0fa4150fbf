/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE ListPoolTests
#include <boost/test/unit_test.hpp>

#include "utils/ListPool.hpp"
#include <utility>

using namespace Traverse;

using IntPool = ListPool<int, 4>;

BOOST_AUTO_TEST_SUITE(ListPoolTestSuite)

BOOST_AUTO_TEST_CASE(TestObtainFromEmptyPool)
{
    IntPool pool;
    BOOST_CHECK_EQUAL(pool.cachedCount(), 0u);

    {
        auto lease = pool.obtain();
        BOOST_CHECK(lease->empty());
        lease->push_back(1);
        lease->push_back(2);
        BOOST_CHECK_EQUAL(lease.get().size(), 2u);
    }

    // The buffer came back when the lease died
    BOOST_CHECK_EQUAL(pool.cachedCount(), 1u);
}

BOOST_AUTO_TEST_CASE(TestReturnedListsAreCleared)
{
    IntPool pool;
    {
        auto lease = pool.obtain();
        for (int i = 0; i < 10; ++i) {
            lease->push_back(i);
        }
    }

    auto again = pool.obtain();
    BOOST_CHECK(again->empty());
    // Capacity survives the round trip, so reuse does not reallocate
    BOOST_CHECK_GE(again->capacity(), 10u);
    BOOST_CHECK_EQUAL(pool.cachedCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestWarmTrimAndClear)
{
    IntPool pool;
    pool.warmCache(3);
    BOOST_CHECK_EQUAL(pool.cachedCount(), 3u);

    // Warming never shrinks
    pool.warmCache(1);
    BOOST_CHECK_EQUAL(pool.cachedCount(), 3u);

    {
        auto a = pool.obtain();
        auto b = pool.obtain();
        BOOST_CHECK_EQUAL(pool.cachedCount(), 1u);
    }
    BOOST_CHECK_EQUAL(pool.cachedCount(), 3u);

    pool.trimCache(1);
    BOOST_CHECK_EQUAL(pool.cachedCount(), 1u);
    pool.trimCache(5);
    BOOST_CHECK_EQUAL(pool.cachedCount(), 1u);

    pool.clearCache();
    BOOST_CHECK_EQUAL(pool.cachedCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestNestedLeasesAreDistinct)
{
    IntPool pool;
    pool.warmCache(2);

    auto outer = pool.obtain();
    outer->push_back(7);
    {
        auto inner = pool.obtain();
        inner->push_back(8);
        BOOST_CHECK(&outer.get() != &inner.get());
        BOOST_CHECK_EQUAL(outer->size(), 1u);
    }
    BOOST_CHECK_EQUAL((*outer)[0], 7);
}

BOOST_AUTO_TEST_CASE(TestMovedLeaseReturnsOnce)
{
    IntPool pool;
    {
        auto first = pool.obtain();
        first->push_back(1);
        auto second = std::move(first);
        BOOST_CHECK_EQUAL(second->size(), 1u);
    }
    BOOST_CHECK_EQUAL(pool.cachedCount(), 1u);
}

BOOST_AUTO_TEST_SUITE_END()
