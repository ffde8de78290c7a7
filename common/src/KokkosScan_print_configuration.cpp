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

#include "KokkosScan_config.h"
#include "KokkosScan_PrintConfiguration.hpp"

#include <Kokkos_Core.hpp>

#include <string>
#include <vector>

namespace KokkosScan {

namespace {
/*
 * Print helper functions
 */
constexpr const char* ScanVersionKey     = "Scan Version";
constexpr const char* EnabledBackendsKey = "Backends";
constexpr const char* DefaultMaxSpinKey  = "Default max spin";

void print_enabled_backends(std::ostream& os) {
  std::vector<std::string> backends;
#ifdef KOKKOS_ENABLE_SERIAL
  backends.emplace_back("SERIAL");
#endif
#ifdef KOKKOS_ENABLE_OPENMP
  backends.emplace_back("OPENMP");
#endif
#ifdef KOKKOS_ENABLE_THREADS
  backends.emplace_back("THREADS");
#endif
#ifdef KOKKOS_ENABLE_CUDA
  backends.emplace_back("CUDA");
#endif
#ifdef KOKKOS_ENABLE_HIP
  backends.emplace_back("HIP");
#endif
#ifdef KOKKOS_ENABLE_SYCL
  backends.emplace_back("SYCL");
#endif
  if (!backends.empty()) {
    auto backendsIte = backends.cbegin();
    os << *backendsIte;
    ++backendsIte;
    for (; backendsIte != backends.cend(); ++backendsIte) {
      os << ";" << *backendsIte;
    }
  }
}

void print_version(std::ostream& os) {
  os << ScanVersionKey << ": " << KOKKOSSCAN_VERSION << '\n';
}

}  // namespace

void print_configuration(std::ostream& os) {
  print_version(os);

  os << EnabledBackendsKey << ": ";
  print_enabled_backends(os);
  os << "\n";

  os << DefaultMaxSpinKey << ": " << KOKKOSSCAN_DEFAULT_MAX_SPIN << "\n";
}

}  // namespace KokkosScan
