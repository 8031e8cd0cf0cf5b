#include "libgf2m/algebra/clmul.hpp"

#ifdef USE_ASM
#include <emmintrin.h>
#include <smmintrin.h>
#include <immintrin.h>
#include <wmmintrin.h>
#endif

namespace libgf2m {

const constexpr std::size_t word_traits<uint64_t>::num_bits;

#ifdef USE_ASM
template<>
wide_uint<uint64_t> clmul<uint64_t>(const uint64_t &a, const uint64_t &b)
{
    const __m128i product = _mm_clmulepi64_si128(_mm_loadl_epi64((const __m128i*) &a),
                                                  _mm_loadl_epi64((const __m128i*) &b), 0x00);

    uint64_t halves[2];
    _mm_storeu_si128((__m128i*) halves, product);

    return wide_uint<uint64_t>(halves[0], halves[1]);
}
#endif

} // namespace libgf2m
