#include "../include/hash32.hpp"

#include <algorithm>
#include <limits>
#include <zlib.h>

namespace
{
    // zlib takes uInt lengths, so large spans are fed in pieces
    template <typename update_fn>
    unsigned long feed(unsigned long state, const const_span_t& data, update_fn fn)
    {
        auto remaining = data;
        while (!remaining.empty())
        {
            auto take = std::min<size_t>(remaining.size(), std::numeric_limits<uInt>::max());
            state = fn(state, remaining.data(), static_cast<uInt>(take));
            remaining = remaining.subspan(take);
        }
        return state;
    }
}

crc32_hash::crc32_hash() : state_(crc32(0L, Z_NULL, 0))
{
}

void crc32_hash::update(const const_span_t& data)
{
    state_ = feed(state_, data, [](unsigned long s, const Bytef* p, uInt n) { return crc32(s, p, n); });
}

uint32_t crc32_hash::digest() const
{
    return static_cast<uint32_t>(state_);
}

adler32_hash::adler32_hash() : state_(adler32(0L, Z_NULL, 0))
{
}

void adler32_hash::update(const const_span_t& data)
{
    state_ = feed(state_, data, [](unsigned long s, const Bytef* p, uInt n) { return adler32(s, p, n); });
}

uint32_t adler32_hash::digest() const
{
    return static_cast<uint32_t>(state_);
}

std::unique_ptr<hash32> make_crc32_hash()
{
    return std::make_unique<crc32_hash>();
}

std::unique_ptr<hash32> make_adler32_hash()
{
    return std::make_unique<adler32_hash>();
}
