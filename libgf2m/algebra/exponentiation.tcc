namespace libgf2m {

template<typename FieldT>
FieldT power(const FieldT &base, const std::size_t exponent)
{
    FieldT result = FieldT::one();
    FieldT base_power = base;

    /* base_power is base^(2^i) when bit i of exponent is examined */
    for (std::size_t remaining = exponent; remaining != 0; remaining >>= 1)
    {
        if (remaining & 1)
        {
            result *= base_power;
        }
        base_power.square();
    }

    return result;
}

template<typename WordT, uint64_t Modulus, std::size_t Degree>
gf2m_lut_element<WordT, Modulus, Degree> power(const gf2m_lut_element<WordT, Modulus, Degree> &base,
                                               const std::size_t exponent)
{
    typedef gf2m_lut_element<WordT, Modulus, Degree> FieldT;

    if (exponent == 0)
    {
        return FieldT::one();
    }
    if (base.is_zero())
    {
        return FieldT::zero();
    }

    /* both factors are below 2^16, so the product fits */
    const uint64_t order = FieldT::num_elements() - 1;
    const uint64_t log = static_cast<uint64_t>(base.log_alpha());
    return FieldT::alpha_pow(static_cast<long>((log * (exponent % order)) % order));
}

} // namespace libgf2m
