//@HEADER
// ************************************************************************
//
//                        Kokkos v. 4.0
//       Copyright (2022) National Technology & Engineering
//               Solutions of Sandia, LLC (NTESS).
//
// Under the terms of Contract DE-NA0003525 with NTESS,
// the U.S. Government retains certain rights in this software.
//
// Part of Kokkos, under the Apache License v2.0 with LLVM Exceptions.
// See https://kokkos.org/LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//@HEADER

#include <gtest/gtest.h>
#include <Kokkos_Core.hpp>

#include <algorithm>
#include <cstdint>
#include <random>
#include <vector>

#include "KokkosScan_TaggedWord.hpp"
#include "KokkosScan_Lookback_impl.hpp"

/* These tests drive the publication protocol one partition at a time from the
 * host, so that the order in which partitions publish and resolve can be
 * chosen freely.
 */
using lookback_slot_view = Kokkos::View<uint32_t *, Kokkos::HostSpace>;
using lookback_tagged    = KokkosScan::TaggedWord<uint32_t>;

struct LookbackState {
  lookback_slot_view aggregates;
  lookback_slot_view prefixes;

  explicit LookbackState(const int numPartitions)
      : aggregates("aggregates", numPartitions),
        prefixes("prefixes", numPartitions) {}
};

inline std::vector<uint32_t> exclusive_reference(
    const std::vector<uint32_t> &totals) {
  std::vector<uint32_t> ex(totals.size());
  uint32_t acc = 0;
  for (size_t p = 0; p < totals.size(); ++p) {
    ex[p] = acc;
    acc += totals[p];
  }
  return ex;
}

// partition 0 resolves without a walk; its inclusive prefix is its aggregate
inline uint32_t resolve_and_publish(LookbackState &state, const int p,
                             const uint32_t total, const bool publishPrefix) {
  KokkosScan::Impl::LookbackResult<uint32_t> r;
  if (p != 0) {
    r = KokkosScan::Impl::resolve_exclusive_prefix(state.aggregates,
                                                   state.prefixes, p, 0);
    EXPECT_FALSE(r.stalled);
    EXPECT_GE(r.steps, 1);
    EXPECT_LE(r.steps, p);
  }
  if (publishPrefix) {
    KokkosScan::Impl::publish_inclusive_prefix(state.prefixes, p,
                                               r.exclusive_prefix + total);
  }
  return r.exclusive_prefix;
}

inline void test_lookback_partition_zero() {
  LookbackState state(4);
  KokkosScan::Impl::publish_aggregate(state.aggregates, 0, uint32_t(17));
  const uint32_t ex = resolve_and_publish(state, 0, 17, true);
  EXPECT_EQ(ex, 0u);

  const uint32_t agg = state.aggregates(0);
  const uint32_t pre = state.prefixes(0);
  EXPECT_TRUE(lookback_tagged::is_ready(agg));
  EXPECT_TRUE(lookback_tagged::is_ready(pre));
  EXPECT_EQ(agg, pre);
  EXPECT_EQ(lookback_tagged::payload(pre), 17u);
}

inline void test_lookback_short_circuit() {
  // the immediate predecessor has an inclusive prefix: one step
  LookbackState state(3);
  KokkosScan::Impl::publish_aggregate(state.aggregates, 0, uint32_t(5));
  KokkosScan::Impl::publish_aggregate(state.aggregates, 1, uint32_t(7));
  KokkosScan::Impl::publish_inclusive_prefix(state.prefixes, 1, uint32_t(12));

  auto r = KokkosScan::Impl::resolve_exclusive_prefix(state.aggregates,
                                                      state.prefixes, 2, 0);
  EXPECT_FALSE(r.stalled);
  EXPECT_EQ(r.exclusive_prefix, 12u);
  EXPECT_EQ(r.steps, 1);
}

inline void test_lookback_aggregates_only() {
  // no inclusive prefix anywhere: the walk goes all the way to partition 0
  const std::vector<uint32_t> totals = {3, 0, 9, 1, 4, 4, 2};
  const int P                        = totals.size();
  LookbackState state(P);
  for (int p = 0; p < P; ++p) {
    KokkosScan::Impl::publish_aggregate(state.aggregates, p, totals[p]);
  }
  const auto ex = exclusive_reference(totals);
  for (int p = 1; p < P; ++p) {
    auto r = KokkosScan::Impl::resolve_exclusive_prefix(state.aggregates,
                                                        state.prefixes, p, 0);
    EXPECT_FALSE(r.stalled);
    EXPECT_EQ(r.exclusive_prefix, ex[p]) << "partition " << p;
    EXPECT_EQ(r.steps, p) << "partition " << p;
  }
}

inline void test_lookback_prefix_preferred_over_aggregate() {
  // partition 1 has both; the inclusive prefix ends the walk there
  LookbackState state(3);
  KokkosScan::Impl::publish_aggregate(state.aggregates, 0, uint32_t(5));
  KokkosScan::Impl::publish_aggregate(state.aggregates, 1, uint32_t(6));
  KokkosScan::Impl::publish_inclusive_prefix(state.prefixes, 1, uint32_t(11));

  auto r = KokkosScan::Impl::resolve_exclusive_prefix(state.aggregates,
                                                      state.prefixes, 2, 0);
  EXPECT_EQ(r.exclusive_prefix, 11u);
  EXPECT_EQ(r.steps, 1);
}

inline void test_lookback_stall() {
  LookbackState state(3);
  // partition 1 published, partition 0 never did
  KokkosScan::Impl::publish_aggregate(state.aggregates, 1, uint32_t(6));

  auto r = KokkosScan::Impl::resolve_exclusive_prefix(state.aggregates,
                                                      state.prefixes, 2, 100);
  EXPECT_TRUE(r.stalled);
  EXPECT_EQ(r.steps, 1);

  // nothing published by the immediate predecessor either
  LookbackState empty(2);
  r = KokkosScan::Impl::resolve_exclusive_prefix(empty.aggregates,
                                                 empty.prefixes, 1, 1);
  EXPECT_TRUE(r.stalled);
  EXPECT_EQ(r.steps, 0);
}

/* Aggregates are published in a random order, then partitions resolve in a
 * random order and a random subset of them withholds its inclusive prefix.
 * The exclusive prefixes depend only on the partition index.
 */
inline void test_lookback_interleavings(const int P, const unsigned seed) {
  std::mt19937 gen(seed);
  std::uniform_int_distribution<uint32_t> value(0, 1000);
  std::bernoulli_distribution withhold(0.5);

  std::vector<uint32_t> totals(P);
  for (auto &t : totals) t = value(gen);
  const auto ex = exclusive_reference(totals);

  std::vector<int> order(P);
  for (int p = 0; p < P; ++p) order[p] = p;

  LookbackState state(P);
  std::shuffle(order.begin(), order.end(), gen);
  for (int p : order) {
    KokkosScan::Impl::publish_aggregate(state.aggregates, p, totals[p]);
  }

  std::shuffle(order.begin(), order.end(), gen);
  for (int p : order) {
    const uint32_t got =
        resolve_and_publish(state, p, totals[p], !withhold(gen));
    EXPECT_EQ(got, ex[p]) << "partition " << p << " seed " << seed;
  }

  // every published inclusive prefix is the true one
  for (int p = 0; p < P; ++p) {
    const uint32_t w = state.prefixes(p);
    if (lookback_tagged::is_ready(w)) {
      EXPECT_EQ(lookback_tagged::payload(w), ex[p] + totals[p]);
    }
  }
}

TEST_F(TestCategory, scan_lookback_protocol) {
  test_lookback_partition_zero();
  test_lookback_short_circuit();
  test_lookback_aggregates_only();
  test_lookback_prefix_preferred_over_aggregate();
  test_lookback_stall();
}

TEST_F(TestCategory, scan_lookback_interleavings) {
  for (unsigned seed = 0; seed < 20; ++seed) {
    test_lookback_interleavings(1, seed);
    test_lookback_interleavings(2, seed);
    test_lookback_interleavings(37, seed);
    test_lookback_interleavings(500, seed);
  }
}
