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

/// \file KokkosScan_LookbackScan.hpp
/// \brief Single-pass inclusive prefix sum by decoupled look-back
///
/// The input is cut into partitions of team_size x elements_per_thread
/// elements, one team per partition. A team reduces its partition, publishes
/// the total, resolves the sum of everything before it by polling the state
/// its predecessors published, publishes its own inclusive prefix and writes
/// its part of the output. There is no barrier between teams.
///
/// Algorithm from: Merrill, Garland, "Single-pass Parallel Prefix Scan with
/// Decoupled Look-back", NVIDIA Technical Report NVR-2016-002.

#ifndef KOKKOSSCAN_LOOKBACKSCAN_HPP_
#define KOKKOSSCAN_LOOKBACKSCAN_HPP_

#include <limits>
#include <sstream>
#include <stdexcept>
#include <type_traits>

#include <Kokkos_Core.hpp>

#include "KokkosScan_LookbackHandle.hpp"
#include "KokkosScan_LookbackScan_impl.hpp"

namespace KokkosScan {

#define KOKKOSSCAN_SAME_TYPE(A, B)                  \
  std::is_same<typename std::remove_const<A>::type, \
               typename std::remove_const<B>::type>::value

/*! \brief Inclusive prefix sum of \c input into \c output, over
    caller-provided slot buffers.

    \param space execution space instance to run on
    \param handle configuration; receives the run statistics
    \param input values to scan; every running sum must stay below the top bit
    \param output output[i] = input[0] + ... + input[i]; must not alias input
    \param buffers slot buffers sized for at least ceil(N / partition size)
   partitions, every slot unset and the counter zero

    Throws std::runtime_error if a partition gave up waiting on a predecessor.
*/
template <typename ExecSpace, typename Handle, typename InputView,
          typename OutputView, typename Device>
void lookback_scan_dispatch(const ExecSpace &space, Handle *handle,
                            const InputView &input, const OutputView &output,
                            const LookbackScanBuffers<typename Handle::word_t,
                                                      Device> &buffers) {
  using word_type = typename Handle::word_t;

  static_assert(Kokkos::is_view<InputView>::value,
                "lookback_scan: input is not a Kokkos::View.");
  static_assert(Kokkos::is_view<OutputView>::value,
                "lookback_scan: output is not a Kokkos::View.");
  static_assert(InputView::rank == 1,
                "lookback_scan: input must have rank 1");
  static_assert(OutputView::rank == 1,
                "lookback_scan: output must have rank 1");
  static_assert(std::is_same<typename OutputView::value_type,
                             typename OutputView::non_const_value_type>::value,
                "lookback_scan: The output must be nonconst.");
  static_assert(
      KOKKOSSCAN_SAME_TYPE(typename InputView::value_type, word_type),
      "lookback_scan: input value type must match the handle's word type "
      "(const doesn't matter)");
  static_assert(
      KOKKOSSCAN_SAME_TYPE(typename OutputView::value_type, word_type),
      "lookback_scan: output value type must match the handle's word type");
  static_assert(
      Kokkos::SpaceAccessibility<ExecSpace,
                                 typename InputView::memory_space>::accessible,
      "lookback_scan: ExecSpace must be able to access input");
  static_assert(
      Kokkos::SpaceAccessibility<ExecSpace,
                                 typename OutputView::memory_space>::accessible,
      "lookback_scan: ExecSpace must be able to access output");
  static_assert(
      Kokkos::SpaceAccessibility<ExecSpace,
                                 typename Device::memory_space>::accessible,
      "lookback_scan: ExecSpace must be able to access the slot buffers");

  if (input.extent(0) != output.extent(0)) {
    std::ostringstream os;
    os << "KokkosScan::lookback_scan: Dimensions do not match: input "
       << input.extent(0) << ", output " << output.extent(0);
    throw std::invalid_argument(os.str());
  }
  // a partition's output writes may not race another partition's input reads
  if (input.extent(0) != 0 &&
      static_cast<const void *>(input.data()) ==
          static_cast<const void *>(output.data())) {
    throw std::invalid_argument(
        "KokkosScan::lookback_scan: output must not alias input");
  }

  if (handle->get_check_payload_range() &&
      !Impl::input_fits_payload(space, input)) {
    std::ostringstream os;
    os << "KokkosScan::lookback_scan: the total of the input reaches the "
          "readiness bit; payloads are limited to "
       << TaggedWord<word_type>::max_payload;
    throw std::invalid_argument(os.str());
  }

  Impl::lookback_scan_dispatch(space, handle, input, output, buffers);
}

/*! \brief Inclusive prefix sum of \c input into \c output

    Allocates the slot buffers and sets them to unset before dispatching.
*/
template <typename ExecSpace, typename Handle, typename InputView,
          typename OutputView>
void lookback_scan(const ExecSpace &space, Handle *handle,
                   const InputView &input, const OutputView &output) {
  using word_type   = typename Handle::word_t;
  using device_type = typename Handle::device_t;

  const size_t partitionSize =
      size_t(Impl::resolve_team_size<ExecSpace>(*handle)) *
      handle->get_elements_per_thread();
  const size_t numPartitions =
      (input.extent(0) + partitionSize - 1) / partitionSize;
  if (numPartitions > size_t(std::numeric_limits<int>::max())) {
    std::ostringstream os;
    os << "KokkosScan::lookback_scan: " << numPartitions
       << " partitions exceed the league size limit";
    throw std::invalid_argument(os.str());
  }

  LookbackScanBuffers<word_type, device_type> buffers;
  buffers.reset(space, static_cast<int>(numPartitions));
  lookback_scan_dispatch(space, handle, input, output, buffers);
}

template <typename Handle, typename InputView, typename OutputView>
void lookback_scan(Handle *handle, const InputView &input,
                   const OutputView &output) {
  using execution_space = typename Handle::HandleExecSpace;
  lookback_scan(execution_space(), handle, input, output);
}

#undef KOKKOSSCAN_SAME_TYPE

}  // namespace KokkosScan

#endif  // KOKKOSSCAN_LOOKBACKSCAN_HPP_
