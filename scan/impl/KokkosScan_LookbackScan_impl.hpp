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

#ifndef KOKKOSSCAN_LOOKBACKSCAN_IMPL_HPP
#define KOKKOSSCAN_LOOKBACKSCAN_IMPL_HPP

/// \file KokkosScan_LookbackScan_impl.hpp
/// \brief Single-pass inclusive scan: one team per partition, no global
/// barrier between teams.

#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

#include <Kokkos_Core.hpp>

#include "KokkosScan_ExecSpaceUtils.hpp"
#include "KokkosScan_TaggedWord.hpp"
#include "KokkosScan_TeamTree_impl.hpp"
#include "KokkosScan_PartitionAllocator_impl.hpp"
#include "KokkosScan_Lookback_impl.hpp"

namespace KokkosScan {

namespace Impl {
enum LookbackStat {
  StatTotalSteps   = 0,
  StatMaxSteps     = 1,
  StatStalled      = 2,
  NumLookbackStats = 3
};
}  // namespace Impl

/*! \brief The buffer contract of the scan, apart from input and output

    One aggregate slot and one inclusive-prefix slot per partition, the
   partition counter of the allocated variant, and run statistics. Every entry
   must be zero before a dispatch; reset() does that.
*/
template <typename Word, typename Device>
struct LookbackScanBuffers {
  using slot_view_type    = Kokkos::View<Word *, Device>;
  using counter_view_type = Kokkos::View<int, Device>;
  using stats_view_type   = Kokkos::View<size_t *, Device>;

  slot_view_type aggregates;
  slot_view_type prefixes;
  counter_view_type counter;
  stats_view_type stats;

  /*! \brief size the slot views for \c numPartitions partitions and set every
      slot to unset
   */
  template <typename ExecSpace>
  void reset(const ExecSpace &space, const int numPartitions) {
    if (aggregates.extent(0) != size_t(numPartitions)) {
      Kokkos::realloc(Kokkos::WithoutInitializing, aggregates, numPartitions);
      Kokkos::realloc(Kokkos::WithoutInitializing, prefixes, numPartitions);
    }
    if (!counter.is_allocated()) {
      counter = counter_view_type("KokkosScan::partition_counter");
    }
    if (!stats.is_allocated()) {
      stats = stats_view_type("KokkosScan::lookback_stats",
                              Impl::NumLookbackStats);
    }
    Kokkos::deep_copy(space, aggregates, Word(0));
    Kokkos::deep_copy(space, prefixes, Word(0));
    Kokkos::deep_copy(space, counter, 0);
    Kokkos::deep_copy(space, stats, size_t(0));
  }
};

namespace Impl {

template <typename Word, typename ExecSpace, typename InputView,
          typename OutputView, typename SlotView, typename CounterView,
          typename StatsView, bool AllocatePartition, int ElementsPerThread>
struct LookbackScanFunctor {
  using execution_space = ExecSpace;
  using policy_type     = Kokkos::TeamPolicy<execution_space>;
  using member_type     = typename policy_type::member_type;
  using scratch_view_type =
      Kokkos::View<Word *, typename execution_space::scratch_memory_space,
                   Kokkos::MemoryTraits<Kokkos::Unmanaged>>;
  using lookback_type = LookbackResult<Word>;

  LookbackScanFunctor(const InputView &input, const OutputView &output,
                      const SlotView &aggregates, const SlotView &prefixes,
                      const CounterView &counter, const StatsView &stats,
                      const size_t maxSpin)
      : input_(input),
        output_(output),
        aggregates_(aggregates),
        prefixes_(prefixes),
        counter_(counter),
        stats_(stats),
        maxSpin_(maxSpin),
        n_(input.extent(0)) {}

  size_t team_shmem_size(const int teamSize) const {
    return scratch_view_type::shmem_size(teamSize);
  }

  KOKKOS_INLINE_FUNCTION
  int partition_of(const member_type &team) const {
    if (AllocatePartition) {
      return allocate_partition(team, counter_);
    }
    return team.league_rank();
  }

  KOKKOS_INLINE_FUNCTION
  void operator()(const member_type &team) const {
    const int partition = partition_of(team);
    scratch_view_type scratch(team.team_scratch(0), team.team_size());

    const size_t partitionSize = size_t(team.team_size()) * ElementsPerThread;
    const size_t begin         = size_t(partition) * partitionSize +
                         size_t(team.team_rank()) * ElementsPerThread;

    Word partials[ElementsPerThread];
    const Word threadTotal =
        thread_fold<ElementsPerThread>(input_, begin, n_, partials);
    const Word total = team_tree_reduce(team, scratch, threadTotal);

    lookback_type lookback;
    Kokkos::single(
        Kokkos::PerTeam(team),
        [&](lookback_type &r) {
          publish_aggregate(aggregates_, partition, total);
          r = lookback_type();
          if (partition != 0) {
            r = resolve_exclusive_prefix(aggregates_, prefixes_, partition,
                                         maxSpin_);
          }
          if (r.stalled) {
            Kokkos::atomic_add(&stats_(StatStalled), size_t(1));
            return;
          }
          publish_inclusive_prefix(prefixes_, partition,
                                   Word(r.exclusive_prefix + total));
          Kokkos::atomic_add(&stats_(StatTotalSteps), size_t(r.steps));
          Kokkos::atomic_max(&stats_(StatMaxSteps), size_t(r.steps));
        },
        lookback);

    // uniform across the team
    if (lookback.stalled) {
      return;
    }

    const Word inclusive = team_tree_inclusive_scan(team, scratch, threadTotal);
    const Word offset    = lookback.exclusive_prefix + (inclusive - threadTotal);
    for (int s = 0; s < ElementsPerThread; ++s) {
      const size_t i = begin + s;
      if (i < n_) {
        output_(i) = offset + partials[s];
      }
    }
  }

  InputView input_;
  OutputView output_;
  SlotView aggregates_;
  SlotView prefixes_;
  CounterView counter_;
  StatsView stats_;
  size_t maxSpin_;
  size_t n_;
};

/*! \brief Saturating sum of the input, clamped at the readiness bit
 */
template <typename InputView>
struct PayloadRangeFunctor {
  using value_type = typename InputView::non_const_value_type;
  using tagged     = TaggedWord<value_type>;

  PayloadRangeFunctor(const InputView &input) : input_(input) {}

  KOKKOS_INLINE_FUNCTION
  static value_type saturating_add(const value_type a, const value_type b) {
    if (!tagged::fits(a) || !tagged::fits(b)) {
      return tagged::ready_flag;
    }
    const value_type sum = a + b;
    return tagged::fits(sum) ? sum : tagged::ready_flag;
  }

  KOKKOS_INLINE_FUNCTION
  void operator()(const size_t i, value_type &update) const {
    update = saturating_add(update, input_(i));
  }

  KOKKOS_INLINE_FUNCTION
  void join(value_type &dst, const value_type &src) const {
    dst = saturating_add(dst, src);
  }

  KOKKOS_INLINE_FUNCTION
  void init(value_type &update) const { update = value_type(0); }

  InputView input_;
};

template <typename ExecSpace, typename InputView>
bool input_fits_payload(const ExecSpace &space, const InputView &input) {
  using value_type = typename InputView::non_const_value_type;
  value_type total = 0;
  Kokkos::parallel_reduce(
      "KokkosScan::check_payload_range",
      Kokkos::RangePolicy<ExecSpace>(space, 0, input.extent(0)),
      PayloadRangeFunctor<InputView>(input), total);
  return TaggedWord<value_type>::fits(total);
}

template <bool AllocatePartition, int ElementsPerThread, typename ExecSpace,
          typename Handle, typename InputView, typename OutputView,
          typename Buffers>
void launch_lookback_scan_kernel(const ExecSpace &space, Handle *handle,
                                 const InputView &input,
                                 const OutputView &output,
                                 const Buffers &buffers,
                                 const int numPartitions, const int teamSize) {
  using word_type = typename Handle::word_t;
  using functor_type =
      LookbackScanFunctor<word_type, ExecSpace, InputView, OutputView,
                          typename Buffers::slot_view_type,
                          typename Buffers::counter_view_type,
                          typename Buffers::stats_view_type, AllocatePartition,
                          ElementsPerThread>;
  using policy_type = typename functor_type::policy_type;

  functor_type functor(input, output, buffers.aggregates, buffers.prefixes,
                       buffers.counter, buffers.stats, handle->get_max_spin());

  // check before asking for the team: some backends abort on oversized teams
  const int teamSizeMax = policy_type(space, numPartitions, 1)
                              .team_size_max(functor, Kokkos::ParallelForTag());
  if (teamSize > teamSizeMax) {
    std::ostringstream os;
    os << "KokkosScan::lookback_scan: team size " << teamSize
       << " exceeds the maximum of " << teamSizeMax << " for "
       << ExecSpace::name();
    throw std::invalid_argument(os.str());
  }
  policy_type policy(space, numPartitions, teamSize);
  policy.set_scratch_size(0,
                          Kokkos::PerTeam(functor.team_shmem_size(teamSize)));

  Kokkos::parallel_for(AllocatePartition
                           ? "KokkosScan::lookback_scan_allocated_index"
                           : "KokkosScan::lookback_scan_direct_index",
                       policy, functor);
}

template <bool AllocatePartition, typename ExecSpace, typename Handle,
          typename InputView, typename OutputView, typename Buffers>
void launch_lookback_scan(const ExecSpace &space, Handle *handle,
                          const InputView &input, const OutputView &output,
                          const Buffers &buffers, const int numPartitions,
                          const int teamSize) {
  switch (handle->get_elements_per_thread()) {
    case 1:
      launch_lookback_scan_kernel<AllocatePartition, 1>(
          space, handle, input, output, buffers, numPartitions, teamSize);
      break;
    case 2:
      launch_lookback_scan_kernel<AllocatePartition, 2>(
          space, handle, input, output, buffers, numPartitions, teamSize);
      break;
    case 4:
      launch_lookback_scan_kernel<AllocatePartition, 4>(
          space, handle, input, output, buffers, numPartitions, teamSize);
      break;
    case 8:
      launch_lookback_scan_kernel<AllocatePartition, 8>(
          space, handle, input, output, buffers, numPartitions, teamSize);
      break;
    default:
      throw std::invalid_argument(
          "KokkosScan::lookback_scan: elements per thread must be 1, 2, 4 or "
          "8");
  }
}

/*! \brief Largest team the look-back kernel can be launched with on
    \c ExecSpace
 */
template <typename ExecSpace, typename Word>
int lookback_scan_team_size_max() {
  using view_type = Kokkos::View<Word *, ExecSpace>;
  using functor_type =
      LookbackScanFunctor<Word, ExecSpace, view_type, view_type, view_type,
                          Kokkos::View<int, ExecSpace>,
                          Kokkos::View<size_t *, ExecSpace>, true, 8>;
  functor_type functor(view_type(), view_type(), view_type(), view_type(),
                       Kokkos::View<int, ExecSpace>(),
                       Kokkos::View<size_t *, ExecSpace>(), 0);
  return Kokkos::TeamPolicy<ExecSpace>(1, 1).team_size_max(
      functor, Kokkos::ParallelForTag());
}

template <typename ExecSpace, typename Handle>
int resolve_team_size(const Handle &handle) {
  if (handle.get_team_size() > 0) {
    return handle.get_team_size();
  }
  return get_suggested_team_size<ExecSpace>();
}

template <typename ExecSpace, typename Handle, typename InputView,
          typename OutputView, typename Buffers>
void lookback_scan_dispatch(const ExecSpace &space, Handle *handle,
                            const InputView &input, const OutputView &output,
                            const Buffers &buffers) {
  using handle_type = Handle;

  const bool verbose       = handle->get_verbose();
  const size_t n           = input.extent(0);
  const int teamSize       = resolve_team_size<ExecSpace>(*handle);
  const size_t partitionSz = size_t(teamSize) * handle->get_elements_per_thread();
  const size_t numPartitionsL = (n + partitionSz - 1) / partitionSz;

  handle->reset_stats();
  if (numPartitionsL > size_t(std::numeric_limits<int>::max())) {
    std::ostringstream os;
    os << "KokkosScan::lookback_scan: " << numPartitionsL
       << " partitions exceed the league size limit";
    throw std::invalid_argument(os.str());
  }
  const int numPartitions = static_cast<int>(numPartitionsL);

  if (buffers.aggregates.extent(0) < numPartitionsL ||
      buffers.prefixes.extent(0) < numPartitionsL ||
      !buffers.counter.is_allocated() ||
      buffers.stats.extent(0) < size_t(NumLookbackStats)) {
    std::ostringstream os;
    os << "KokkosScan::lookback_scan: buffers hold "
       << buffers.aggregates.extent(0) << " aggregate and "
       << buffers.prefixes.extent(0) << " prefix slots, " << numPartitions
       << " partitions are needed";
    throw std::invalid_argument(os.str());
  }

  handle->set_launch(numPartitions, partitionSz);
  if (0 == numPartitions) {
    handle->set_stats(0, 0, 0);
    return;
  }

  if (verbose) {
    std::cout << "KokkosScan::lookback_scan on " << ExecSpace::name() << ": "
              << n << " elements, " << numPartitions << " partitions of "
              << partitionSz << " (team size " << teamSize << " x "
              << handle->get_elements_per_thread() << "), "
              << (handle->get_variant() == handle_type::AllocatedIndex
                      ? "allocated"
                      : "direct")
              << " partition index, max spin " << handle->get_max_spin()
              << std::endl;
  }

  Kokkos::Profiling::pushRegion("KokkosScan::lookback_scan");
  if (handle->get_variant() == handle_type::AllocatedIndex) {
    launch_lookback_scan<true>(space, handle, input, output, buffers,
                               numPartitions, teamSize);
  } else {
    launch_lookback_scan<false>(space, handle, input, output, buffers,
                                numPartitions, teamSize);
  }
  Kokkos::Profiling::popRegion();

  auto stats = Kokkos::create_mirror_view(buffers.stats);
  Kokkos::deep_copy(space, stats, buffers.stats);
  space.fence();

  handle->set_stats(stats(StatTotalSteps),
                    static_cast<int>(stats(StatMaxSteps)),
                    static_cast<int>(stats(StatStalled)));

  if (verbose) {
    std::cout << "KokkosScan::lookback_scan: " << stats(StatTotalSteps)
              << " look-back steps in total, at most "
              << stats(StatMaxSteps) << " for one partition" << std::endl;
  }

  if (handle->get_status() == handle_type::Stalled) {
    std::ostringstream os;
    os << "KokkosScan::lookback_scan: " << stats(StatStalled) << " of "
       << numPartitions << " partitions stalled after "
       << handle->get_max_spin()
       << " polls of a predecessor; their output was not written";
    Kokkos::Impl::throw_runtime_exception(os.str());
  }
}

}  // namespace Impl
}  // namespace KokkosScan

#endif  // KOKKOSSCAN_LOOKBACKSCAN_IMPL_HPP
