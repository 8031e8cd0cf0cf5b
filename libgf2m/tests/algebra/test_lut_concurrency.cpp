#include <atomic>
#include <cstdint>
#include <gtest/gtest.h>
#include <thread>
#include <vector>

#include "libgf2m/algebra/fields/gf2m_element.hpp"
#include "libgf2m/algebra/fields/gf2m_fields.hpp"
#include "libgf2m/algebra/fields/gf2m_lut_element.hpp"
#include "libgf2m/algebra/fields/lut_tables.hpp"

namespace libgf2m {

/* Nothing else in this executable touches gf2_16, so the threads below race
   on the first construction of its tables. */
TEST(GF2mLutConcurrencyTest, FirstUseFromManyThreads) {
    typedef gf2m_element<uint16_t, gf2_16::modulus> computed16;

    const std::size_t num_threads = 8;
    std::atomic<bool> go(false);
    std::vector<const gf2m_lut_tables<uint16_t>*> tables(num_threads, nullptr);
    std::vector<gf2_16> products(num_threads);
    std::vector<gf2_16> inverses(num_threads);

    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < num_threads; ++i)
    {
        threads.emplace_back([&, i]() {
            while (!go.load())
            {
                std::this_thread::yield();
            }
            products[i] = gf2_16(0x1234) * gf2_16(0x5678);
            inverses[i] = gf2_16(0xBEEF).inverse();
            tables[i] = &gf2_16::tables();
        });
    }

    go.store(true);
    for (std::thread &t : threads)
    {
        t.join();
    }

    const computed16 expected_product = computed16(0x1234) * computed16(0x5678);
    const computed16 expected_inverse = computed16(0xBEEF).inverse();
    for (std::size_t i = 0; i < num_threads; ++i)
    {
        EXPECT_EQ(tables[i], tables[0]);
        EXPECT_EQ(products[i].value(), expected_product.value());
        EXPECT_EQ(inverses[i].value(), expected_inverse.value());
        EXPECT_EQ(inverses[i] * gf2_16(0xBEEF), gf2_16::one());
    }
}

} // namespace libgf2m
