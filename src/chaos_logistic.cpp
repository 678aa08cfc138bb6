// ============================================================================
//  File: src/chaos_logistic.cpp — Suite logistique dérivée de la clé
//  Project: GBD7Z Envelope Cipher v1
// ============================================================================

#include "gbd7z/chaos_logistic.hpp"

#include <cmath>
#include <cstdint>

namespace gbd7z
{

Bytes logistic_chaos(const Bytes& key, size_t len)
{
    Bytes out;
    if(key.empty()) return out;
    out.reserve(len);

    uint64_t sum=0;
    for(uint8_t b : key) sum += b;

    double x = (double)(sum % 1024) / 1024.0 + 0.123456;
    double r = 3.9 + (double)(key[0] % 9) * 0.01;

    for(size_t i=0; i<len; ++i)
    {
        x = std::fmod(r * x * (1.0 - x), 1.0);
        const int v = (int)std::floor((x - std::floor(x)) * 256.0) & 0xFF;
        out.push_back((uint8_t)v);
        r += (double)((int)(key[i % key.size()] % 5) - 2) * 0.0003;
    }
    return out;
}

} // namespace gbd7z
