/**
 * Simple marshalling benchmark: push/pop throughput for buffers, sequences and tuples.
 * Usage: bench_marshal [iters] [size]
 */
#include "stackbridge/All.h"
#include "stackbridge/buffer/HostAlloc.h"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <tuple>
#include <vector>

using namespace stackbridge;

int main(int argc, char** argv) {
  std::size_t iters = (argc > 1) ? static_cast<std::size_t>(std::strtoull(argv[1], nullptr, 10)) : 200000;
  std::size_t size  = (argc > 2) ? static_cast<std::size_t>(std::strtoull(argv[2], nullptr, 10)) : 24;

  vm::State st{config::Config{}};

  auto run = [&](const char* label, auto&& body) {
    buffer::buffer_stats_reset_for_tests();
    const auto t0 = std::chrono::steady_clock::now();
    for (std::size_t i = 0; i < iters; ++i) { body(i); }
    const auto t1 = std::chrono::steady_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count();
    auto bs = buffer::buffer_stats();
    std::cout << "[" << label << "]"
              << " iters=" << iters
              << " size=" << size
              << " time_ms=" << ms
              << " buffers_alloc=" << bs.numAllocated
              << " buffers_freed=" << bs.numFreed
              << " bytes_alloc=" << bs.bytesAllocated
              << " bytes_live=" << bs.bytesLive
              << " top=" << st.get_top()
              << "\n";
  };

  const std::string payload(size, 'x');
  run("buffer", [&](std::size_t) {
    marshal::push(buffer::OwnedBuffer::from_bytes(payload), st);
    (void)marshal::pop<buffer::OwnedBuffer>(st);
  });
  run("sequence", [&](std::size_t i) {
    marshal::push(std::vector<int64_t>{static_cast<int64_t>(i), 1, 2, 3}, st);
    (void)marshal::pop<std::vector<int64_t>>(st);
  });
  run("tuple", [&](std::size_t i) {
    marshal::push(std::make_tuple(static_cast<int64_t>(i), static_cast<double>(i) * 0.5, (i & 1U) != 0U), st);
    (void)marshal::pop<std::tuple<int64_t, double, bool>>(st);
  });
  return 0;
}
