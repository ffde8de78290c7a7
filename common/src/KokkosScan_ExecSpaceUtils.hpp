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

#ifndef KOKKOSSCAN_EXECSPACEUTILS_HPP
#define KOKKOSSCAN_EXECSPACEUTILS_HPP

#include <type_traits>

#include "Kokkos_Core.hpp"

namespace KokkosScan {

namespace Impl {

enum ExecSpaceType {
  Exec_SERIAL,
  Exec_OMP,
  Exec_THREADS,
  Exec_CUDA,
  Exec_HIP,
  Exec_SYCL,
  Exec_OTHER
};

template <typename ExecutionSpace>
constexpr ExecSpaceType get_exec_space_type() {
#if defined(KOKKOS_ENABLE_SERIAL)
  if (std::is_same<Kokkos::Serial, ExecutionSpace>::value) return Exec_SERIAL;
#endif
#if defined(KOKKOS_ENABLE_THREADS)
  if (std::is_same<Kokkos::Threads, ExecutionSpace>::value) return Exec_THREADS;
#endif
#if defined(KOKKOS_ENABLE_OPENMP)
  if (std::is_same<Kokkos::OpenMP, ExecutionSpace>::value) return Exec_OMP;
#endif
#if defined(KOKKOS_ENABLE_CUDA)
  if (std::is_same<Kokkos::Cuda, ExecutionSpace>::value) return Exec_CUDA;
#endif
#if defined(KOKKOS_ENABLE_HIP)
  if (std::is_same<Kokkos::HIP, ExecutionSpace>::value) return Exec_HIP;
#endif
#if defined(KOKKOS_ENABLE_SYCL)
  if (std::is_same<Kokkos::Experimental::SYCL, ExecutionSpace>::value)
    return Exec_SYCL;
#endif
  return Exec_OTHER;
}

template <typename ExecutionSpace>
constexpr bool is_gpu_exec_space() {
  return get_exec_space_type<ExecutionSpace>() == Exec_CUDA ||
         get_exec_space_type<ExecutionSpace>() == Exec_HIP ||
         get_exec_space_type<ExecutionSpace>() == Exec_SYCL;
}

/// \brief Team width used when the caller does not pick one.
///
/// GPU groups are 256 threads wide. On host spaces a team is a set of OS
/// threads spinning on a barrier, so a single-thread team is used unless the
/// caller asks for more.
template <typename ExecutionSpace>
constexpr int get_suggested_team_size() {
  return is_gpu_exec_space<ExecutionSpace>() ? 256 : 1;
}

}  // namespace Impl
}  // namespace KokkosScan

#endif  // KOKKOSSCAN_EXECSPACEUTILS_HPP
