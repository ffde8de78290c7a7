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

#ifndef KOKKOSSCAN_LOOKBACK_IMPL_HPP
#define KOKKOSSCAN_LOOKBACK_IMPL_HPP

/// \file KokkosScan_Lookback_impl.hpp
/// \brief Decoupled look-back: per-partition publication and the backward
/// walk that resolves a partition's exclusive prefix.
///
/// Every partition owns two tagged slots. Its aggregate slot is published as
/// soon as the local total is known, before the partition has resolved its own
/// prefix. Its inclusive-prefix slot is published once the exclusive prefix is
/// resolved. A later partition walks backward over these slots, taking an
/// inclusive prefix as soon as it finds one and otherwise accumulating
/// aggregates.
///
/// All functions here are meant to run on a single thread of the team.

#include <Kokkos_Core.hpp>

#include "KokkosScan_TaggedWord.hpp"

namespace KokkosScan {
namespace Impl {

template <typename Word>
struct LookbackResult {
  Word exclusive_prefix;
  /// predecessor slots consumed by the walk
  int steps;
  /// true if the walk gave up waiting on a predecessor
  bool stalled;

  KOKKOS_INLINE_FUNCTION
  LookbackResult() : exclusive_prefix(0), steps(0), stalled(false) {}
};

template <typename SlotView, typename Word>
KOKKOS_INLINE_FUNCTION void publish_aggregate(const SlotView &aggregates,
                                              const int partition,
                                              const Word total) {
  TaggedWord<Word>::publish(&aggregates(partition), total);
}

template <typename SlotView, typename Word>
KOKKOS_INLINE_FUNCTION void publish_inclusive_prefix(const SlotView &prefixes,
                                                     const int partition,
                                                     const Word inclusive) {
  TaggedWord<Word>::publish(&prefixes(partition), inclusive);
}

/*! \brief Resolve the exclusive prefix of \c partition by walking backward
    over its predecessors' published state.

    \param aggregates per-partition aggregate slots
    \param prefixes per-partition inclusive-prefix slots
    \param partition the partition being resolved, must be > 0
    \param max_spin unsuccessful polls of a single predecessor tolerated before
   the walk gives up; 0 waits forever

    The cursor only moves backward and partition 0 publishes its aggregate
   unconditionally, so with every partition dispatched the walk finishes.
*/
template <typename SlotView>
KOKKOS_INLINE_FUNCTION LookbackResult<typename SlotView::non_const_value_type>
resolve_exclusive_prefix(const SlotView &aggregates, const SlotView &prefixes,
                         const int partition, const size_t max_spin) {
  using word_type = typename SlotView::non_const_value_type;
  using tagged    = TaggedWord<word_type>;

  LookbackResult<word_type> result;
  int cursor  = partition - 1;
  size_t spin = 0;

  while (true) {
    const word_type prefix = tagged::poll(&prefixes(cursor));
    if (tagged::is_ready(prefix)) {
      result.exclusive_prefix += tagged::payload(prefix);
      ++result.steps;
      return result;
    }

    const word_type aggregate = tagged::poll(&aggregates(cursor));
    if (tagged::is_ready(aggregate)) {
      result.exclusive_prefix += tagged::payload(aggregate);
      ++result.steps;
      // partition 0's aggregate is its inclusive prefix
      if (cursor == 0) {
        return result;
      }
      --cursor;
      spin = 0;
      continue;
    }

    ++spin;
    if (max_spin != 0 && spin >= max_spin) {
      result.stalled = true;
      return result;
    }
  }
}

}  // namespace Impl
}  // namespace KokkosScan

#endif  // KOKKOSSCAN_LOOKBACK_IMPL_HPP
