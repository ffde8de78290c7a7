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

#ifndef KOKKOSSCAN_PRINT_CONFIGURATION_HPP
#define KOKKOSSCAN_PRINT_CONFIGURATION_HPP

#include <ostream>

namespace KokkosScan {

/// \brief Print the library version, the Kokkos backends and the build-time
/// defaults as "key: value" lines
void print_configuration(std::ostream& os);

}  // namespace KokkosScan

#endif  // KOKKOSSCAN_PRINT_CONFIGURATION_HPP
