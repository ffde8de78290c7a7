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

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include <Kokkos_Core.hpp>
#include <Kokkos_Random.hpp>

#include "KokkosScan_LookbackScan.hpp"

#include "KokkosScan_perf_test_utilities.hpp"

#include <Benchmark_Context.hpp>
#include <benchmark/benchmark.h>

struct lookback_scan_params : public perf_test::CommonInputParams {
  int n                 = 2560000;
  int team_size         = -1;
  int max_spin          = -1;
  std::string variant   = "allocated";
};

void print_options() {
  std::cerr << "Options\n" << std::endl;
  std::cerr << perf_test::list_common_options();

  std::cerr << "\t[Optional] --n         :: number of elements to scan"
            << std::endl;
  std::cerr << "\t[Optional] --team-size :: threads per partition, -1 for "
               "automatic"
            << std::endl;
  std::cerr << "\t[Optional] --variant   :: direct or allocated (default)"
            << std::endl;
  std::cerr << "\t[Optional] --max-spin  :: bound on polls of one "
               "predecessor, 0 for none"
            << std::endl;
}

lookback_scan_params parse_lookback_scan_options(int& argc, char** argv) {
  lookback_scan_params params;
  perf_test::parse_common_options(argc, argv, params);

  for (int i = 1; i < argc; ++i) {
    if (perf_test::check_arg_int(i, argc, argv, "--n", params.n)) {
      ++i;
    } else if (perf_test::check_arg_int(i, argc, argv, "--team-size",
                                        params.team_size)) {
      ++i;
    } else if (perf_test::check_arg_str(i, argc, argv, "--variant",
                                        params.variant)) {
      ++i;
    } else if (perf_test::check_arg_int(i, argc, argv, "--max-spin",
                                        params.max_spin)) {
      ++i;
    } else {
      std::cerr << "Unrecognized command line argument #" << i << ": "
                << argv[i] << std::endl;
      print_options();
      return params;
    }
  }
  return params;
}

template <typename ExecSpace>
static void KokkosScan_lookback(benchmark::State& state,
                                lookback_scan_params params) {
  const auto n = state.range(0);

  using word_type = uint32_t;
  using MemSpace  = typename ExecSpace::memory_space;
  using Device    = Kokkos::Device<ExecSpace, MemSpace>;
  using handle_t  = KokkosScan::LookbackScanHandle<word_type, ExecSpace>;

  handle_t handle(params.variant == "direct" ? handle_t::DirectIndex
                                             : handle_t::AllocatedIndex);
  handle.set_team_size(params.team_size);
  if (params.max_spin >= 0) handle.set_max_spin(params.max_spin);

  Kokkos::View<word_type*, Device> input(
      Kokkos::view_alloc(Kokkos::WithoutInitializing, "input"), n);
  Kokkos::View<word_type*, Device> output(
      Kokkos::view_alloc(Kokkos::WithoutInitializing, "output"), n);

  // Values below 32 keep the total under the readiness bit for
  // every n this benchmark accepts
  Kokkos::Random_XorShift64_Pool<ExecSpace> pool(123);
  Kokkos::fill_random(input, pool, word_type(32));

  ExecSpace space;
  const size_t partitionSize =
      size_t(KokkosScan::Impl::resolve_team_size<ExecSpace>(handle)) *
      handle.get_elements_per_thread();
  const int numPartitions = static_cast<int>((n + partitionSize - 1) /
                                             partitionSize);
  KokkosScan::LookbackScanBuffers<word_type, Device> buffers;

  // Do a warm-up run
  buffers.reset(space, numPartitions);
  KokkosScan::lookback_scan_dispatch(space, &handle, input, output, buffers);
  space.fence();
  double total_time = 0.0;

  for (auto _ : state) {
    // Slot reset is not part of the scan
    buffers.reset(space, numPartitions);
    space.fence();

    // Start timing
    Kokkos::Timer timer;
    KokkosScan::lookback_scan_dispatch(space, &handle, input, output,
                                       buffers);
    space.fence();

    double time = timer.seconds();
    total_time += time;
    state.SetIterationTime(time);
  }

  state.counters[ExecSpace::name()] = 1;
  state.counters["Partitions"]      = handle.get_num_partitions();
  state.counters["Partition size"]  = handle.get_partition_size();
  state.counters["Avg look-back steps"] =
      double(handle.get_total_lookback_steps()) / handle.get_num_partitions();
  state.counters["Max look-back steps"] = handle.get_max_lookback_steps();
  state.counters["Avg scan time (s):"] =
      benchmark::Counter(total_time, benchmark::Counter::kAvgIterations);
  // one read and one write per element
  const size_t bytesPerRun = 2 * sizeof(word_type) * n;
  state.counters["Avg bandwidth (B/s):"] = benchmark::Counter(
      bytesPerRun, benchmark::Counter::kIsIterationInvariantRate);
}

int main(int argc, char** argv) {
  Kokkos::initialize(argc, argv);
  benchmark::Initialize(&argc, argv);
  benchmark::SetDefaultTimeUnit(benchmark::kSecond);
  KokkosScanBenchmark::add_benchmark_context(true);

  const auto params    = parse_lookback_scan_options(argc, argv);
  const auto arg_names = std::vector<std::string>{"n"};
  const auto args      = std::vector<int64_t>{params.n};

  if (params.variant != "direct" && params.variant != "allocated") {
    std::cerr << "ERROR: unknown variant " << params.variant << std::endl;
    print_options();
    return 1;
  }

  if (params.use_openmp) {
#if defined(KOKKOS_ENABLE_OPENMP)
    KokkosScanBenchmark::register_benchmark(
        "KokkosScan_lookback", KokkosScan_lookback<Kokkos::OpenMP>,
        arg_names, args, params.repeat, params);
#else
    std::cout << "ERROR: OpenMP requested, but not available.\n";
    return 1;
#endif
  }

  if (params.use_threads) {
#if defined(KOKKOS_ENABLE_THREADS)
    KokkosScanBenchmark::register_benchmark(
        "KokkosScan_lookback", KokkosScan_lookback<Kokkos::Threads>,
        arg_names, args, params.repeat, params);
#else
    std::cout << "ERROR: Threads requested, but not available.\n";
    return 1;
#endif
  }

  if (params.use_cuda) {
#if defined(KOKKOS_ENABLE_CUDA)
    KokkosScanBenchmark::register_benchmark(
        "KokkosScan_lookback", KokkosScan_lookback<Kokkos::Cuda>, arg_names,
        args, params.repeat, params);
#else
    std::cout << "ERROR: CUDA requested, but not available.\n";
    return 1;
#endif
  }

  if (params.use_hip) {
#if defined(KOKKOS_ENABLE_HIP)
    KokkosScanBenchmark::register_benchmark(
        "KokkosScan_lookback", KokkosScan_lookback<Kokkos::HIP>, arg_names,
        args, params.repeat, params);
#else
    std::cout << "ERROR: HIP requested, but not available.\n";
    return 1;
#endif
  }

  if (true) {  // serial
#if defined(KOKKOS_ENABLE_SERIAL)
    KokkosScanBenchmark::register_benchmark(
        "KokkosScan_lookback", KokkosScan_lookback<Kokkos::Serial>,
        arg_names, args, params.repeat, params);
#else
    std::cout << "ERROR: Serial device requested, but not available.\n";
    return 1;
#endif
  }

  benchmark::RunSpecifiedBenchmarks();

  benchmark::Shutdown();
  Kokkos::finalize();
  return 0;
}
