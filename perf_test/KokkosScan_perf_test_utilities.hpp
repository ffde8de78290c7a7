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

#ifndef KOKKOSSCAN_PERF_TEST_UTILITIES_HPP
#define KOKKOSSCAN_PERF_TEST_UTILITIES_HPP

#include <cstdlib>
#include <stdexcept>
#include <iostream>
#include <sstream>
#include <string>

#include <strings.h>

namespace perf_test {

/// \brief Options shared by every scan perf test
struct CommonInputParams {
  int repeat      = 0;
  bool use_openmp = false;
  bool use_threads = false;
  bool use_cuda   = false;
  bool use_hip    = false;
};

inline std::string list_common_options() {
  std::ostringstream ss;
  ss << "\t[Optional] --repeat     :: how many times to repeat the kernel\n"
     << "\t[Optional] --openmp     :: run on the OpenMP backend\n"
     << "\t[Optional] --threads    :: run on the Threads backend\n"
     << "\t[Optional] --cuda       :: run on the Cuda backend\n"
     << "\t[Optional] --hip        :: run on the HIP backend\n";
  return ss.str();
}

inline bool check_arg_int(int const i, int const argc, char** argv,
                          char const* name, int& val) {
  if (0 != strcasecmp(argv[i], name)) return false;

  if (i + 1 == argc) {
    std::stringstream msg;
    msg << name << " input argument needs to be followed by an int";
    throw std::invalid_argument(msg.str());
  }
  val = std::atoi(argv[i + 1]);
  return true;
}

inline bool check_arg_bool(int const i, int const /*argc*/, char** argv,
                           char const* name, bool& val) {
  if (0 != strcasecmp(argv[i], name)) return false;
  val = true;
  return true;
}

inline bool check_arg_str(int const i, int const argc, char** argv,
                          char const* name, std::string& val) {
  if (0 != strcasecmp(argv[i], name)) return false;

  if (i + 1 == argc) {
    std::stringstream msg;
    msg << name << " input argument needs to be followed by a string";
    throw std::invalid_argument(msg.str());
  }
  val = std::string(argv[i + 1]);
  return true;
}

/// \brief Consume the common options, leaving the rest of argv in place
inline void parse_common_options(int& argc, char** argv,
                                 CommonInputParams& params) {
  int i = 1;
  while (i < argc) {
    int consumed = 0;
    if (check_arg_int(i, argc, argv, "--repeat", params.repeat)) {
      consumed = 2;
    } else if (check_arg_bool(i, argc, argv, "--openmp", params.use_openmp)) {
      consumed = 1;
    } else if (check_arg_bool(i, argc, argv, "--threads", params.use_threads)) {
      consumed = 1;
    } else if (check_arg_bool(i, argc, argv, "--cuda", params.use_cuda)) {
      consumed = 1;
    } else if (check_arg_bool(i, argc, argv, "--hip", params.use_hip)) {
      consumed = 1;
    }
    if (consumed) {
      for (int j = i; j + consumed < argc; ++j) {
        argv[j] = argv[j + consumed];
      }
      argc -= consumed;
    } else {
      ++i;
    }
  }
}

}  // namespace perf_test

#endif  // KOKKOSSCAN_PERF_TEST_UTILITIES_HPP
