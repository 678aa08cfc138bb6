// ============================================================================
//  File: include/gbd7z/u128.hpp — Entier non signé 128 bits (2 limbs 64 bits)
//  Project: GBD7Z Envelope Cipher v1
//
//  • Arithmétique modulo 2^128 : add / sub (retenue), mul (64×64→128 par
//    demi-mots 32 bits), xor, inverse modulaire d’un impair.
//  • Conversion big-endian 16 octets (ordre du bloc).
//  • Pas de __int128 : le code reste portable (MSVC compris).
// ============================================================================

#pragma once
#include <cstdint>

namespace gbd7z
{

struct U128
{
    uint64_t hi = 0;
    uint64_t lo = 0;
};

inline bool operator==(const U128& a, const U128& b){ return a.hi==b.hi && a.lo==b.lo; }
inline bool operator!=(const U128& a, const U128& b){ return !(a==b); }

inline U128 u128_add(const U128& a, const U128& b)
{
    U128 r;
    r.lo = a.lo + b.lo;
    r.hi = a.hi + b.hi + (r.lo < a.lo ? 1u : 0u);
    return r;
}
inline U128 u128_sub(const U128& a, const U128& b)
{
    U128 r;
    r.lo = a.lo - b.lo;
    r.hi = a.hi - b.hi - (a.lo < b.lo ? 1u : 0u);
    return r;
}
inline U128 u128_xor(const U128& a, const U128& b)
{
    return U128{ a.hi ^ b.hi, a.lo ^ b.lo };
}

// Produit complet 64×64 → 128.
inline U128 u128_mul64(uint64_t a, uint64_t b)
{
    const uint64_t a0=a & 0xFFFFFFFFull, a1=a>>32;
    const uint64_t b0=b & 0xFFFFFFFFull, b1=b>>32;
    const uint64_t p00=a0*b0, p01=a0*b1, p10=a1*b0, p11=a1*b1;
    const uint64_t mid=(p00>>32) + (p01 & 0xFFFFFFFFull) + (p10 & 0xFFFFFFFFull);
    U128 r;
    r.lo = (p00 & 0xFFFFFFFFull) | (mid<<32);
    r.hi = p11 + (p01>>32) + (p10>>32) + (mid>>32);
    return r;
}

// a*b mod 2^128 (les termes hi*hi sortent du module).
inline U128 u128_mul(const U128& a, const U128& b)
{
    U128 r = u128_mul64(a.lo, b.lo);
    r.hi += a.lo*b.hi + a.hi*b.lo;
    return r;
}

// Inverse de m (impair) modulo 2^128 par relèvement de Hensel :
// x ← x*(2 - m*x) double le nombre de bits justes ; x0=m est juste sur 3 bits
// (m*m ≡ 1 mod 8), 6 tours donnent 192 ≥ 128 bits.
inline U128 u128_inverse_odd(const U128& m)
{
    const U128 two{0, 2};
    U128 x = m;
    for(int i=0; i<6; ++i) x = u128_mul(x, u128_sub(two, u128_mul(m, x)));
    return x;
}

inline U128 u128_from_be(const uint8_t* p)
{
    U128 r;
    for(int i=0; i<8; ++i)  r.hi = (r.hi<<8) | p[i];
    for(int i=8; i<16; ++i) r.lo = (r.lo<<8) | p[i];
    return r;
}
inline void u128_to_be(const U128& v, uint8_t* p)
{
    for(int i=0; i<8; ++i)
    {
        p[i]   = (uint8_t)(v.hi >> (56 - 8*i));
        p[8+i] = (uint8_t)(v.lo >> (56 - 8*i));
    }
}

} // namespace gbd7z
