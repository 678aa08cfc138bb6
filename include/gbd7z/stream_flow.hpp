// ============================================================================
//  File: include/gbd7z/stream_flow.hpp — Couche flux chaînée (octet par octet)
//  Project: GBD7Z Envelope Cipher v1
//
//  chiffre i : k=key[i%n], c=chaos[i%m]
//              out = rotr8((in + k + c) & 0xFF, ((k^c)&7)+1) ^ prev ; prev = out
//  déchiffre : miroir exact ; prev = octet CHIFFRÉ (pas l’octet retrouvé).
//  prev initial = iv_byte(key) (repli s=s*31+b sur toute la clé, s0=0xA5).
// ============================================================================

#pragma once
#include <cstdint>

#include "gbd7z/format.hpp"

namespace gbd7z
{

inline uint8_t rotr8(uint8_t v, int r)
{
    r &= 7;
    if(r==0) return v;
    return (uint8_t)((v >> r) | (v << (8 - r)));
}
inline uint8_t rotl8(uint8_t v, int r)
{
    r &= 7;
    if(r==0) return v;
    return (uint8_t)((v << r) | (v >> (8 - r)));
}

uint8_t iv_byte(const Bytes& key);

// Pré : key et chaos non vides.
Bytes stream_flow_encrypt(const Bytes& data, const Bytes& key, const Bytes& chaos);
Bytes stream_flow_decrypt(const Bytes& cipher, const Bytes& key, const Bytes& chaos);

} // namespace gbd7z
