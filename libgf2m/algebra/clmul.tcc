namespace libgf2m {

template<typename WordT>
WordT clmul_low(const WordT &a, const WordT &b)
{
    typedef word_traits<WordT> traits;

    WordT result = traits::zero();
    for (std::size_t i = 0; i < traits::num_bits; ++i)
    {
        if (traits::test_bit(b, i))
        {
            result = static_cast<WordT>(result ^ static_cast<WordT>(a << i));
        }
    }

    return result;
}

template<typename WordT>
WordT clmul_high(const WordT &a, const WordT &b)
{
    typedef word_traits<WordT> traits;

    /* bit 0 of b contributes nothing above bit W-1 */
    WordT result = traits::zero();
    for (std::size_t i = 1; i < traits::num_bits; ++i)
    {
        if (traits::test_bit(b, i))
        {
            result = static_cast<WordT>(result ^ static_cast<WordT>(a >> (traits::num_bits - i)));
        }
    }

    return result;
}

template<typename WordT>
typename word_traits<WordT>::double_word clmul(const WordT &a, const WordT &b)
{
    return word_traits<WordT>::combine(clmul_low(a, b), clmul_high(a, b));
}

} // namespace libgf2m
