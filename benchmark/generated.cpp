#include <cstddef>

#include "support/testcase_generation.hpp"
#include "traversal_benchmarks.hpp"

// NOLINTNEXTLINE
GENERATE_GENERATED_BENCHMARKS(
    straightPath,
    GenerateStraightPath, ->Range(1, size_t{1U} << size_t{9U})->Complexity());

// NOLINTNEXTLINE
GENERATE_GENERATED_BENCHMARKS(
    forkingPath,
    GenerateForkingPath, ->Range(1, size_t{1U} << size_t{10U})->Complexity());

// NOLINTNEXTLINE
GENERATE_GENERATED_BENCHMARKS(
    multiForkingPath,
    GenerateMultiForkingPath, ->DenseRange(1, 10, 1)->Complexity());
