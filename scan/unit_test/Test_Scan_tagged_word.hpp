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

#include <cstdint>

#include "KokkosScan_TaggedWord.hpp"

template <typename Word>
void test_tagged_word_encoding() {
  using tagged = KokkosScan::TaggedWord<Word>;

  EXPECT_EQ(tagged::ready_flag, Word(1) << (sizeof(Word) * 8 - 1));
  EXPECT_EQ(tagged::payload_mask, Word(~tagged::ready_flag));
  EXPECT_EQ(tagged::unset, Word(0));

  // a zeroed slot is unset and carries nothing
  EXPECT_FALSE(tagged::is_ready(tagged::unset));
  EXPECT_EQ(tagged::payload(tagged::unset), Word(0));

  for (Word v : {Word(0), Word(1), Word(31), Word(12345), tagged::max_payload}) {
    EXPECT_TRUE(tagged::fits(v));
    const Word w = tagged::make_ready(v);
    EXPECT_TRUE(tagged::is_ready(w));
    EXPECT_EQ(tagged::payload(w), v);
  }

  // a ready zero is distinguishable from an unset slot
  EXPECT_NE(tagged::make_ready(Word(0)), tagged::unset);

  EXPECT_FALSE(tagged::fits(tagged::ready_flag));
  EXPECT_FALSE(tagged::fits(Word(~Word(0))));
}

template <typename Word>
void test_tagged_word_publish_poll() {
  using tagged = KokkosScan::TaggedWord<Word>;

  Word slot = tagged::unset;
  EXPECT_FALSE(tagged::is_ready(tagged::poll(&slot)));

  tagged::publish(&slot, Word(4242));
  const Word w = tagged::poll(&slot);
  EXPECT_TRUE(tagged::is_ready(w));
  EXPECT_EQ(tagged::payload(w), Word(4242));
}

TEST_F(TestCategory, scan_tagged_word_uint32) {
  test_tagged_word_encoding<uint32_t>();
  test_tagged_word_publish_poll<uint32_t>();
}

TEST_F(TestCategory, scan_tagged_word_uint64) {
  test_tagged_word_encoding<uint64_t>();
  test_tagged_word_publish_poll<uint64_t>();
}
