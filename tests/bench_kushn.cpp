#include "crypto.hpp"
#include "scanner.hpp"
#include "temp_dir.hpp"
#include <catch2/benchmark/catch_benchmark.hpp>
#include <catch2/catch_test_macros.hpp>

// Hidden from the default run; select with the "[benchmark]" tag.

TEST_CASE("sha256_file on 64 KiB", "[.][benchmark]") {
  TempDir dir;
  auto file = dir.write("sample.bin", std::string(64 * 1024, '\0'));

  BENCHMARK("sha256_file 64KB") {
    return kushn::sha256_file(file);
  };
}

TEST_CASE("scan of 100 files", "[.][benchmark]") {
  TempDir dir;
  for (int i = 0; i < 100; ++i) {
    dir.write("file_" + std::to_string(i) + ".txt", "benchmark data");
  }
  kushn::Scanner scanner(kushn::IgnoreMatcher{});

  BENCHMARK("scan 100 files") {
    return scanner.scan(dir.path()).size();
  };
}
