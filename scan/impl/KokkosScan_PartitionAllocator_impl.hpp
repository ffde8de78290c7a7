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

#ifndef KOKKOSSCAN_PARTITIONALLOCATOR_IMPL_HPP
#define KOKKOSSCAN_PARTITIONALLOCATOR_IMPL_HPP

/// \file KokkosScan_PartitionAllocator_impl.hpp
/// \brief Order-preserving partition identities for teams launched in an
/// arbitrary order.
///
/// The look-back walk needs partitions that are dense, contiguous and ordered
/// by the time they start, which the league rank does not guarantee. The team
/// that starts first takes partition 0 no matter which league rank it has, so
/// a team only ever waits on partitions already owned by a running team.

#include <Kokkos_Core.hpp>

namespace KokkosScan {
namespace Impl {

/// \brief Thread 0 takes the next partition index from \c counter; every
/// member of the team gets the same value.
template <typename TeamMember, typename CounterView>
KOKKOS_INLINE_FUNCTION typename CounterView::non_const_value_type
allocate_partition(const TeamMember &team, const CounterView &counter) {
  using index_type = typename CounterView::non_const_value_type;
  index_type partition;
  Kokkos::single(
      Kokkos::PerTeam(team),
      [&](index_type &p) { p = Kokkos::atomic_fetch_add(&counter(), index_type(1)); },
      partition);
  return partition;
}

}  // namespace Impl
}  // namespace KokkosScan

#endif  // KOKKOSSCAN_PARTITIONALLOCATOR_IMPL_HPP
