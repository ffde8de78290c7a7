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

#ifndef KOKKOSSCAN_LOOKBACKHANDLE_HPP
#define KOKKOSSCAN_LOOKBACKHANDLE_HPP

#include <cassert>
#include <cstddef>
#include <stdexcept>
#include <type_traits>

#include <Kokkos_Core.hpp>

#include "KokkosScan_config.h"
#include "KokkosScan_TaggedWord.hpp"

namespace KokkosScan {

/*! \brief Configuration and run statistics for lookback_scan

    \tparam word_t_ unsigned scan value type; its top bit is reserved
    \tparam ExecutionSpace where the scan runs
    \tparam MemorySpace where the slot buffers live

    Two variants are provided:
    - DirectIndex: a team's partition is its league rank. This is only valid
   if teams start in league order, as they do on the host backends.
    - AllocatedIndex: a team takes its partition from an atomic counter when it
   starts, so partition order follows start order whatever the scheduler does.
*/
template <class word_t_, class ExecutionSpace,
          class MemorySpace = typename ExecutionSpace::memory_space>
class LookbackScanHandle {
 public:
  using HandleExecSpace   = ExecutionSpace;
  using HandleMemorySpace = MemorySpace;

  using execution_space = ExecutionSpace;
  using memory_space    = MemorySpace;
  using device_t        = Kokkos::Device<execution_space, memory_space>;

  using word_t       = typename std::remove_const<word_t_>::type;
  using const_word_t = const word_t;
  using tagged_word  = TaggedWord<word_t>;

  enum Variant { DirectIndex, AllocatedIndex };
  enum Status { Converged, Stalled, NotRun };

 private:
  // Inputs
  Variant variant;
  int team_size;
  int elements_per_thread;
  size_t max_spin;
  bool check_payload_range;
  bool verbose;

  // Outputs
  Status status;
  int num_partitions;
  size_t partition_size;
  size_t total_lookback_steps;
  int max_lookback_steps;
  int num_stalled;

 public:
  LookbackScanHandle(const Variant variant_ = AllocatedIndex)
      : variant(variant_),
        team_size(-1),
        elements_per_thread(default_elements_per_thread(variant_)),
        max_spin(KOKKOSSCAN_DEFAULT_MAX_SPIN),
        check_payload_range(false),
        verbose(false) {
    reset_stats();
  }

  /// \brief S = 1 for the one-element-per-thread variant, 8 for the allocated
  /// one
  static int default_elements_per_thread(const Variant v) {
    return v == DirectIndex ? 1 : 8;
  }

  Variant get_variant() const { return variant; }
  void set_variant(const Variant variant_) { this->variant = variant_; }

  /// \brief -1 picks a team size for the execution space
  int get_team_size() const { return team_size; }
  void set_team_size(const int ts) {
    if (ts == 0 || ts < -1) {
      throw std::invalid_argument(
          "lookback_scan: team size must be positive, or -1 for automatic");
    }
    this->team_size = ts;
  }

  int get_elements_per_thread() const { return elements_per_thread; }
  void set_elements_per_thread(const int ept) {
    if (ept != 1 && ept != 2 && ept != 4 && ept != 8) {
      throw std::invalid_argument(
          "lookback_scan: elements per thread must be 1, 2, 4 or 8");
    }
    this->elements_per_thread = ept;
  }

  /// \brief bound on consecutive unsuccessful polls of one predecessor; 0 for
  /// no bound
  size_t get_max_spin() const { return max_spin; }
  void set_max_spin(const size_t max_spin_) { this->max_spin = max_spin_; }

  bool get_check_payload_range() const { return check_payload_range; }
  void set_check_payload_range(const bool check) {
    this->check_payload_range = check;
  }

  bool get_verbose() const { return verbose; }
  void set_verbose(const bool verbose_) { this->verbose = verbose_; }

  Status get_status() const { return status; }

  int get_num_partitions() const {
    assert(get_status() != NotRun);
    return num_partitions;
  }
  size_t get_partition_size() const {
    assert(get_status() != NotRun);
    return partition_size;
  }
  size_t get_total_lookback_steps() const {
    assert(get_status() != NotRun);
    return total_lookback_steps;
  }
  int get_max_lookback_steps() const {
    assert(get_status() != NotRun);
    return max_lookback_steps;
  }
  int get_num_stalled() const {
    assert(get_status() != NotRun);
    return num_stalled;
  }

  void set_launch(const int num_partitions_, const size_t partition_size_) {
    num_partitions = num_partitions_;
    partition_size = partition_size_;
  }

  void set_stats(const size_t total_steps_, const int max_steps_,
                 const int num_stalled_) {
    total_lookback_steps = total_steps_;
    max_lookback_steps   = max_steps_;
    num_stalled          = num_stalled_;
    status               = num_stalled_ == 0 ? Converged : Stalled;
  }

  void reset_stats() {
    status               = NotRun;
    num_partitions       = 0;
    partition_size       = 0;
    total_lookback_steps = 0;
    max_lookback_steps   = 0;
    num_stalled          = 0;
  }
};

}  // namespace KokkosScan

#endif  // KOKKOSSCAN_LOOKBACKHANDLE_HPP
