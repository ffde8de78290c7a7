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

#ifndef KOKKOSSCAN_TAGGEDWORD_HPP
#define KOKKOSSCAN_TAGGEDWORD_HPP

/// \file KokkosScan_TaggedWord.hpp
/// \brief A fixed-width unsigned word packing a readiness bit with a payload
///
/// The top bit of the word is the readiness flag and the remaining bits hold
/// the payload. A single atomic load answers both "is the slot published?" and
/// "what value was published?". The all-zero word is the unset state, so a
/// zero-initialized buffer holds only unset slots.
///
/// Payloads must stay strictly below the readiness bit. A value that reaches
/// it silently collides with the flag; debug builds of Kokkos catch this in
/// make_ready().

#include <type_traits>
#include <limits>

#include <Kokkos_Core.hpp>

namespace KokkosScan {

template <typename Word>
struct TaggedWord {
  static_assert(std::is_integral<Word>::value && std::is_unsigned<Word>::value,
                "KokkosScan::TaggedWord: Word must be an unsigned integral type");

  using word_type = Word;

  static constexpr int num_bits = std::numeric_limits<Word>::digits;

  /// \brief The readiness flag, i.e. the top bit of the word
  static constexpr Word ready_flag = Word(1) << (num_bits - 1);
  static constexpr Word payload_mask = ready_flag - Word(1);
  static constexpr Word max_payload  = payload_mask;

  /// \brief the unset state
  static constexpr Word unset = Word(0);

  KOKKOS_INLINE_FUNCTION
  static constexpr bool fits(const Word value) {
    return (value & ready_flag) == Word(0);
  }

  KOKKOS_INLINE_FUNCTION
  static Word make_ready(const Word value) {
    KOKKOS_ASSERT(fits(value));
    return ready_flag | value;
  }

  KOKKOS_INLINE_FUNCTION
  static constexpr bool is_ready(const Word word) {
    return (word & ready_flag) != Word(0);
  }

  KOKKOS_INLINE_FUNCTION
  static constexpr Word payload(const Word word) { return word & payload_mask; }

  /// \brief Publish \c value into \c slot as a single atomic store.
  ///
  /// Each slot is written exactly once per run, by its owning partition.
  KOKKOS_INLINE_FUNCTION
  static void publish(Word *slot, const Word value) {
    Kokkos::atomic_store(slot, make_ready(value));
  }

  /// \brief Atomically read \c slot; readiness and payload come from the same
  /// load.
  KOKKOS_INLINE_FUNCTION
  static Word poll(Word *slot) { return Kokkos::atomic_load(slot); }
};

}  // namespace KokkosScan

#endif  // KOKKOSSCAN_TAGGEDWORD_HPP
