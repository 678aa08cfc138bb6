// ============================================================================
//  File: include/gbd7z/keyed_hash.hpp — Tag d’intégrité 64 bits à clé
//  Project: GBD7Z Envelope Cipher v1
//
//  h = 0x9E3779B97F4A7C15
//  octet i : h = rotl64(h ^ b, 11) + mix_key64(key, i)
//  final   : h ^= h>>33 ; h *= 0xff51afd7ed558ccd ; h ^= h>>33
//
//  Somme de contrôle pour détecter mauvaise clé / altération ; aucune
//  résistance cryptographique aux collisions.
// ============================================================================

#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

#include "gbd7z/format.hpp"

namespace gbd7z
{

inline uint64_t rotl64(uint64_t v, unsigned s)
{
    s &= 63;
    if(s==0) return v;
    return (v << s) | (v >> (64 - s));
}

inline uint64_t mix_key64(const Bytes& key, uint64_t i)
{
    uint64_t v=kHashSeed;
    for(size_t j=0; j<key.size(); ++j) v = rotl64(v + key[j] + i, (unsigned)(j & 63));
    return v;
}

inline uint64_t keyed_hash64(const uint8_t* data, size_t n, const Bytes& key)
{
    uint64_t h=kHashSeed;
    for(size_t i=0; i<n; ++i) h = rotl64(h ^ data[i], 11) + mix_key64(key, i);
    h ^= h >> 33;
    h *= kHashFinal;
    h ^= h >> 33;
    return h;
}
inline uint64_t keyed_hash64(const Bytes& data, const Bytes& key)
{
    return keyed_hash64(data.data(), data.size(), key);
}

// 16 chiffres hex minuscules.
inline std::string hash_to_hex(uint64_t h)
{
    static const char* digits = "0123456789abcdef";
    std::string s(kHashHexLen, '0');
    for(size_t i=0; i<kHashHexLen; ++i) s[kHashHexLen-1-i] = digits[(h >> (4*i)) & 0xF];
    return s;
}

// Exactement 16 chiffres hex (majuscules acceptées).
inline bool hash_from_hex(const std::string& s, uint64_t& out)
{
    if(s.size()!=kHashHexLen) return false;
    uint64_t v=0;
    for(char c : s)
    {
        v <<= 4;
        if(c>='0'&&c<='9') v |= (uint64_t)(c-'0');
        else if(c>='a'&&c<='f') v |= (uint64_t)(10+(c-'a'));
        else if(c>='A'&&c<='F') v |= (uint64_t)(10+(c-'A'));
        else return false;
    }
    out=v;
    return true;
}

} // namespace gbd7z
