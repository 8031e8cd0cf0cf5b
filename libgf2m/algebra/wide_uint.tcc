/**@file
 *****************************************************************************
 Implementation of the double-width unsigned integer.
 *****************************************************************************
 * @author     This file is part of libgf2m (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/

#include <ios>
#include <iomanip>

namespace libgf2m {

template<typename WordT>
const constexpr std::size_t wide_uint<WordT>::half_bits;

template<typename WordT>
const constexpr std::size_t wide_uint<WordT>::num_bits;

template<typename WordT>
wide_uint<WordT>::wide_uint() : lower_(), upper_()
{
}

template<typename WordT>
wide_uint<WordT>::wide_uint(const WordT &lower) : lower_(lower), upper_()
{
}

template<typename WordT>
wide_uint<WordT>::wide_uint(const WordT &lower, const WordT &upper) :
    lower_(lower), upper_(upper)
{
}

template<typename WordT>
wide_uint<WordT> wide_uint<WordT>::widen(const WordT &value, const std::size_t shift)
{
    wide_uint<WordT> result(value);
    result <<= shift;
    return result;
}

template<typename WordT>
wide_uint<WordT>& wide_uint<WordT>::operator^=(const wide_uint<WordT> &other)
{
    this->lower_ = static_cast<WordT>(this->lower_ ^ other.lower_);
    this->upper_ = static_cast<WordT>(this->upper_ ^ other.upper_);
    return (*this);
}

template<typename WordT>
wide_uint<WordT>& wide_uint<WordT>::operator&=(const wide_uint<WordT> &other)
{
    this->lower_ = static_cast<WordT>(this->lower_ & other.lower_);
    this->upper_ = static_cast<WordT>(this->upper_ & other.upper_);
    return (*this);
}

template<typename WordT>
wide_uint<WordT>& wide_uint<WordT>::operator|=(const wide_uint<WordT> &other)
{
    this->lower_ = static_cast<WordT>(this->lower_ | other.lower_);
    this->upper_ = static_cast<WordT>(this->upper_ | other.upper_);
    return (*this);
}

template<typename WordT>
wide_uint<WordT>& wide_uint<WordT>::operator<<=(const std::size_t shift)
{
    if (shift == 0)
    {
        return (*this);
    }

    if (shift >= num_bits)
    {
        this->lower_ = WordT();
        this->upper_ = WordT();
    }
    else if (shift >= half_bits)
    {
        /* the low half moves up entirely; the old high half falls off */
        this->upper_ = static_cast<WordT>(this->lower_ << (shift - half_bits));
        this->lower_ = WordT();
    }
    else
    {
        /* the top shift bits of the low half spill into the high half */
        const WordT spill = static_cast<WordT>(this->lower_ >> (half_bits - shift));
        this->upper_ = static_cast<WordT>(static_cast<WordT>(this->upper_ << shift) | spill);
        this->lower_ = static_cast<WordT>(this->lower_ << shift);
    }

    return (*this);
}

template<typename WordT>
wide_uint<WordT>& wide_uint<WordT>::operator>>=(const std::size_t shift)
{
    if (shift == 0)
    {
        return (*this);
    }

    if (shift >= num_bits)
    {
        this->lower_ = WordT();
        this->upper_ = WordT();
    }
    else if (shift >= half_bits)
    {
        this->lower_ = static_cast<WordT>(this->upper_ >> (shift - half_bits));
        this->upper_ = WordT();
    }
    else
    {
        const WordT spill = static_cast<WordT>(this->upper_ << (half_bits - shift));
        this->lower_ = static_cast<WordT>(static_cast<WordT>(this->lower_ >> shift) | spill);
        this->upper_ = static_cast<WordT>(this->upper_ >> shift);
    }

    return (*this);
}

template<typename WordT>
wide_uint<WordT> wide_uint<WordT>::operator^(const wide_uint<WordT> &other) const
{
    wide_uint<WordT> result(*this);
    return (result ^= other);
}

template<typename WordT>
wide_uint<WordT> wide_uint<WordT>::operator&(const wide_uint<WordT> &other) const
{
    wide_uint<WordT> result(*this);
    return (result &= other);
}

template<typename WordT>
wide_uint<WordT> wide_uint<WordT>::operator|(const wide_uint<WordT> &other) const
{
    wide_uint<WordT> result(*this);
    return (result |= other);
}

template<typename WordT>
wide_uint<WordT> wide_uint<WordT>::operator~() const
{
    return wide_uint<WordT>(static_cast<WordT>(~this->lower_),
                            static_cast<WordT>(~this->upper_));
}

template<typename WordT>
wide_uint<WordT> wide_uint<WordT>::operator<<(const std::size_t shift) const
{
    wide_uint<WordT> result(*this);
    return (result <<= shift);
}

template<typename WordT>
wide_uint<WordT> wide_uint<WordT>::operator>>(const std::size_t shift) const
{
    wide_uint<WordT> result(*this);
    return (result >>= shift);
}

template<typename WordT>
bool wide_uint<WordT>::operator==(const wide_uint<WordT> &other) const
{
    return (this->lower_ == other.lower_) && (this->upper_ == other.upper_);
}

template<typename WordT>
bool wide_uint<WordT>::operator!=(const wide_uint<WordT> &other) const
{
    return !(this->operator==(other));
}

template<typename WordT>
bool wide_uint<WordT>::is_zero() const
{
    return (this->lower_ == WordT()) && (this->upper_ == WordT());
}

namespace detail {

template<typename WordT>
void write_hex_word(std::ostream &out, const WordT &word)
{
    out << std::setw(2 * sizeof(WordT)) << static_cast<unsigned long long>(word);
}

template<typename WordT>
void write_hex_word(std::ostream &out, const wide_uint<WordT> &word)
{
    write_hex_word(out, word.upper());
    write_hex_word(out, word.lower());
}

} // namespace detail

template<typename WordT>
std::ostream& operator<<(std::ostream &out, const wide_uint<WordT> &value)
{
    const std::ios_base::fmtflags flags = out.flags();
    const char fill = out.fill();

    out << "0x" << std::hex << std::setfill('0');
    detail::write_hex_word(out, value);

    out.flags(flags);
    out.fill(fill);
    return out;
}

} // namespace libgf2m
