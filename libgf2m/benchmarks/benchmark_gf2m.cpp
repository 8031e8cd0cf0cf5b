#include <cstddef>
#include <cstdint>
#include <vector>
#include <benchmark/benchmark.h>

#include "libgf2m/algebra/fields/gf2m_element.hpp"
#include "libgf2m/algebra/fields/gf2m_fields.hpp"
#include "libgf2m/algebra/fields/gf2m_lut_element.hpp"
#include "libgf2m/algebra/utils.hpp"

namespace libgf2m {

typedef gf2m_element<uint8_t, 0x11D> gf2_8_rs_computed;
typedef gf2m_element<uint16_t, 0x1100B> gf2_16_computed;

template<typename FieldT>
std::vector<FieldT> random_nonzero_vector(const std::size_t sz)
{
    std::vector<FieldT> result = random_vector<FieldT>(sz);
    for (std::size_t i = 0; i < sz; ++i)
    {
        if (result[i].is_zero())
        {
            result[i] = FieldT::one();
        }
    }
    return result;
}

template<typename FieldT>
static void BM_gf2m_mul_vec(benchmark::State &state)
{
    const size_t sz = state.range(0);
    const std::vector<FieldT> avec = random_vector<FieldT>(sz);
    const std::vector<FieldT> bvec = random_vector<FieldT>(sz);

    std::vector<FieldT> cvec(sz);

    for (auto _ : state)
    {
        for (size_t i = 0; i < sz; ++i)
        {
            cvec[i] = avec[i] * bvec[i];
        }
        benchmark::DoNotOptimize(cvec.data());
    }

    state.SetItemsProcessed(state.iterations() * sz);
}

BENCHMARK_TEMPLATE(BM_gf2m_mul_vec, gf2_8_rs_computed)->Range(1<<10, 1<<16)->Unit(benchmark::kMicrosecond);
BENCHMARK_TEMPLATE(BM_gf2m_mul_vec, gf2_8_rs)->Range(1<<10, 1<<16)->Unit(benchmark::kMicrosecond);
BENCHMARK_TEMPLATE(BM_gf2m_mul_vec, gf2_16_computed)->Range(1<<10, 1<<16)->Unit(benchmark::kMicrosecond);
BENCHMARK_TEMPLATE(BM_gf2m_mul_vec, gf2_16)->Range(1<<10, 1<<16)->Unit(benchmark::kMicrosecond);
BENCHMARK_TEMPLATE(BM_gf2m_mul_vec, gf2_32)->Range(1<<10, 1<<16)->Unit(benchmark::kMicrosecond);
BENCHMARK_TEMPLATE(BM_gf2m_mul_vec, gf2_63)->Range(1<<10, 1<<16)->Unit(benchmark::kMicrosecond);
BENCHMARK_TEMPLATE(BM_gf2m_mul_vec, gf2_64)->Range(1<<10, 1<<16)->Unit(benchmark::kMicrosecond);
BENCHMARK_TEMPLATE(BM_gf2m_mul_vec, gf2_128)->Range(1<<10, 1<<14)->Unit(benchmark::kMicrosecond);

template<typename FieldT>
static void BM_gf2m_mul_vec_data_dependency(benchmark::State &state)
{
    const size_t sz = state.range(0);
    const std::vector<FieldT> avec = random_vector<FieldT>(sz);
    const std::vector<FieldT> bvec = random_vector<FieldT>(sz);

    FieldT sum = FieldT::zero();

    for (auto _ : state)
    {
        for (size_t i = 0; i < sz; ++i)
        {
            sum += avec[i] * bvec[i];
        }
        benchmark::DoNotOptimize(sum);
    }

    state.SetItemsProcessed(state.iterations() * sz);
}

BENCHMARK_TEMPLATE(BM_gf2m_mul_vec_data_dependency, gf2_8_rs_computed)->Range(1<<10, 1<<16)->Unit(benchmark::kMicrosecond);
BENCHMARK_TEMPLATE(BM_gf2m_mul_vec_data_dependency, gf2_8_rs)->Range(1<<10, 1<<16)->Unit(benchmark::kMicrosecond);
BENCHMARK_TEMPLATE(BM_gf2m_mul_vec_data_dependency, gf2_63)->Range(1<<10, 1<<16)->Unit(benchmark::kMicrosecond);

template<typename FieldT>
static void BM_gf2m_inverse_vec(benchmark::State& state)
{
    const size_t sz = state.range(0);
    const std::vector<FieldT> vec = random_nonzero_vector<FieldT>(sz);

    std::vector<FieldT> result(sz);

    for (auto _ : state)
    {
        for (size_t i = 0; i < sz; ++i)
        {
            result[i] = vec[i].inverse();
        }
        benchmark::DoNotOptimize(result.data());
    }

    state.SetItemsProcessed(state.iterations() * sz);
}

BENCHMARK_TEMPLATE(BM_gf2m_inverse_vec, gf2_8_rs_computed)->Range(1<<10, 1<<14)->Unit(benchmark::kMicrosecond);
BENCHMARK_TEMPLATE(BM_gf2m_inverse_vec, gf2_8_rs)->Range(1<<10, 1<<14)->Unit(benchmark::kMicrosecond);
BENCHMARK_TEMPLATE(BM_gf2m_inverse_vec, gf2_16_computed)->Range(1<<10, 1<<14)->Unit(benchmark::kMicrosecond);
BENCHMARK_TEMPLATE(BM_gf2m_inverse_vec, gf2_16)->Range(1<<10, 1<<14)->Unit(benchmark::kMicrosecond);
BENCHMARK_TEMPLATE(BM_gf2m_inverse_vec, gf2_63)->Range(1<<10, 1<<14)->Unit(benchmark::kMicrosecond);

template<typename FieldT>
static void BM_gf2m_batch_inverse(benchmark::State& state)
{
    const size_t sz = state.range(0);
    const std::vector<FieldT> vec = random_nonzero_vector<FieldT>(sz);

    for (auto _ : state)
    {
        std::vector<FieldT> result = batch_inverse<FieldT>(vec);
        benchmark::DoNotOptimize(result.data());
    }

    state.SetItemsProcessed(state.iterations() * sz);
}

BENCHMARK_TEMPLATE(BM_gf2m_batch_inverse, gf2_16_computed)->Range(1<<10, 1<<14)->Unit(benchmark::kMicrosecond);
BENCHMARK_TEMPLATE(BM_gf2m_batch_inverse, gf2_63)->Range(1<<10, 1<<14)->Unit(benchmark::kMicrosecond);

}

BENCHMARK_MAIN();
