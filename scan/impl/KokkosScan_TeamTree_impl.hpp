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

#ifndef KOKKOSSCAN_TEAMTREE_IMPL_HPP
#define KOKKOSSCAN_TEAMTREE_IMPL_HPP

/// \file KokkosScan_TeamTree_impl.hpp
/// \brief Intra-team reduction and inclusive scan over team scratch memory
///
/// Both routines are executed by every member of the team. Each level of the
/// tree is bracketed by two barriers: one after every member has read its
/// neighbor's slot, and one after every member has written its combined value
/// back. Without the first barrier a member could overwrite a slot its
/// neighbor has not read yet.

#include <Kokkos_Core.hpp>

namespace KokkosScan {
namespace Impl {

/// \brief Sequentially fold \c N contiguous elements starting at \c begin,
/// retaining every running partial sum in \c partials.
///
/// Elements at or past \c end contribute the identity.
///
/// \return the thread's total, i.e. partials[N-1]
template <int N, typename InputView, typename Word>
KOKKOS_INLINE_FUNCTION Word thread_fold(const InputView &input,
                                        const size_t begin, const size_t end,
                                        Word (&partials)[N]) {
  Word acc = Word(0);
  for (int s = 0; s < N; ++s) {
    const size_t i = begin + s;
    if (i < end) {
      acc += input(i);
    }
    partials[s] = acc;
  }
  return acc;
}

/// \brief Combine \c value across the team; every member gets the total.
///
/// \c scratch must hold at least team_size() words. It may be reused as soon
/// as this returns.
template <typename TeamMember, typename ScratchView, typename Word>
KOKKOS_INLINE_FUNCTION Word team_tree_reduce(const TeamMember &team,
                                             const ScratchView &scratch,
                                             Word value) {
  const int rank = team.team_rank();
  const int size = team.team_size();

  scratch(rank) = value;
  team.team_barrier();
  for (int stride = 1; stride < size; stride <<= 1) {
    Word other = Word(0);
    if (rank + stride < size) {
      other = scratch(rank + stride);
    }
    team.team_barrier();
    value += other;
    scratch(rank) = value;
    team.team_barrier();
  }
  const Word total = scratch(0);
  // everyone has the total before the scratch is handed back
  team.team_barrier();
  return total;
}

/// \brief Inclusive scan of \c value across team ranks.
///
/// Member k gets the combine of the values of members 0..k. \c scratch must
/// hold at least team_size() words and is reusable on return.
template <typename TeamMember, typename ScratchView, typename Word>
KOKKOS_INLINE_FUNCTION Word team_tree_inclusive_scan(const TeamMember &team,
                                                     const ScratchView &scratch,
                                                     Word value) {
  const int rank = team.team_rank();
  const int size = team.team_size();

  scratch(rank) = value;
  team.team_barrier();
  for (int stride = 1; stride < size; stride <<= 1) {
    Word other = Word(0);
    if (rank >= stride) {
      other = scratch(rank - stride);
    }
    team.team_barrier();
    value += other;
    scratch(rank) = value;
    team.team_barrier();
  }
  return value;
}

}  // namespace Impl
}  // namespace KokkosScan

#endif  // KOKKOSSCAN_TEAMTREE_IMPL_HPP
