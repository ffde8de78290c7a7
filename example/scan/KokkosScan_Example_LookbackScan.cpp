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

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <iostream>

#include <Kokkos_Core.hpp>

#include "KokkosScan_LookbackScan.hpp"

// Scans 10000 partitions of 256 elements holding 0, 1, ..., 31 repeated and
// checks every output element against a running sum on the host.
int main(int argc, char** argv) {
  using word_type = uint32_t;
  using EXSP      = Kokkos::DefaultExecutionSpace;
  using handle_t  = KokkosScan::LookbackScanHandle<word_type, EXSP>;
  using ViewType  = Kokkos::View<word_type*, EXSP>;

  constexpr size_t workgroupSize = 256;
  constexpr size_t numWorkgroups = 10000;
  constexpr size_t totalData     = workgroupSize * numWorkgroups;

  bool pass = false;

  Kokkos::initialize(argc, argv);
  {
    typename ViewType::HostMirror hostInput(
        Kokkos::view_alloc(Kokkos::WithoutInitializing, "input host"),
        totalData);
    uint64_t expectedTotal = 0;
    for (size_t i = 0; i < totalData; ++i) {
      hostInput(i) = word_type(i % 32);
      expectedTotal += hostInput(i);
    }
    if (expectedTotal >= KokkosScan::TaggedWord<word_type>::ready_flag) {
      std::cerr << "Expected total too big: " << expectedTotal << std::endl;
      Kokkos::finalize();
      return EXIT_FAILURE;
    }

    // One thread per element; host backends cap the team size below 256
    handle_t handle(handle_t::DirectIndex);
    handle.set_team_size(std::min<int>(
        workgroupSize,
        KokkosScan::Impl::lookback_scan_team_size_max<EXSP, word_type>()));
    handle.set_verbose(true);

    std::cout << "Scanning " << totalData << " elements on "
              << EXSP::name() << " with team size " << handle.get_team_size()
              << std::endl;

    Kokkos::Timer timer;
    ViewType input(Kokkos::view_alloc(Kokkos::WithoutInitializing, "input"),
                   totalData);
    ViewType output(Kokkos::view_alloc(Kokkos::WithoutInitializing, "output"),
                    totalData);
    Kokkos::deep_copy(input, hostInput);

    Kokkos::Profiling::pushRegion("Compute");
    KokkosScan::lookback_scan(EXSP(), &handle, input, output);
    Kokkos::Profiling::popRegion();

    Kokkos::Profiling::pushRegion("Copy buffer");
    auto result =
        Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), output);
    Kokkos::Profiling::popRegion();
    std::cout << "Getting data took " << timer.seconds() << " s" << std::endl;

    timer.reset();
    word_type agg  = 0;
    size_t badIdx  = totalData;
    for (size_t i = 0; i < totalData; ++i) {
      agg += hostInput(i);
      if (result(i) != agg) {
        badIdx = i;
        break;
      }
    }
    std::cout << "Confirming took " << timer.seconds() << " s" << std::endl;

    if (badIdx == totalData) {
      std::cout << "Scan of " << handle.get_num_partitions()
                << " partitions Passed! (max look-back steps "
                << handle.get_max_lookback_steps() << ")" << std::endl;
      pass = true;
    } else {
      std::cout << "Mismatch at element " << badIdx << ": got "
                << result(badIdx) << ", expected " << agg << std::endl
                << "Scan Failed." << std::endl;
    }
  }
  Kokkos::finalize();

  return (pass ? EXIT_SUCCESS : EXIT_FAILURE);
}
