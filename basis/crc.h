// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#ifndef CRC_H_23489275827847235
#define CRC_H_23489275827847235

#include <cstdint>
#include <string_view>
#include <type_traits>
#include <boost/crc.hpp>


namespace basis
{
uint16_t getCrc16(std::string_view bytes); //short tags, e.g. temp file names
uint32_t getCrc32(std::string_view bytes); //record and file checksums


//checksum over several non-contiguous byte ranges, e.g. record header + payload
template <class BoostCrc>
class CrcAccumulator
{
public:
    CrcAccumulator& update(std::string_view bytes)
    {
        if (!bytes.empty())
            crc_.process_bytes(bytes.data(), bytes.size());
        return *this;
    }

    template <class N>
    CrcAccumulator& updateNumber(const N& num)
    {
        static_assert(std::is_arithmetic_v<N>);
        crc_.process_bytes(&num, sizeof(num));
        return *this;
    }

    auto get() const { return crc_.checksum(); }

private:
    BoostCrc crc_;
};

using Crc32Accumulator = CrcAccumulator<boost::crc_32_type>;




//------------------------- implementation -------------------------------
inline
uint16_t getCrc16(std::string_view bytes)
{
    const auto rv = CrcAccumulator<boost::crc_16_type>().update(bytes).get();
    static_assert(sizeof(rv) == sizeof(uint16_t));
    return rv;
}


inline
uint32_t getCrc32(std::string_view bytes)
{
    const auto rv = Crc32Accumulator().update(bytes).get();
    static_assert(sizeof(rv) == sizeof(uint32_t));
    return rv;
}
}

#endif //CRC_H_23489275827847235
