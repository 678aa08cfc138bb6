// ============================================================================
//  File: src/stream_flow.cpp — Couche flux chaînée
//  Project: GBD7Z Envelope Cipher v1
// ============================================================================

#include "gbd7z/stream_flow.hpp"

namespace gbd7z
{

uint8_t iv_byte(const Bytes& key)
{
    unsigned s=kIvSeed;
    for(uint8_t b : key) s = (s*31 + b) & 0xFFu;
    return (uint8_t)s;
}

Bytes stream_flow_encrypt(const Bytes& data, const Bytes& key, const Bytes& chaos)
{
    if(data.empty() || key.empty() || chaos.empty()) return data;
    Bytes out(data.size());

    uint8_t prev = iv_byte(key);
    for(size_t i=0; i<data.size(); ++i)
    {
        const uint8_t k  = key[i % key.size()];
        const uint8_t ch = chaos[i % chaos.size()];
        const uint8_t tmp = (uint8_t)(data[i] + k + ch);
        const int shift = ((k ^ ch) & 7) + 1;
        const uint8_t c = (uint8_t)(rotr8(tmp, shift) ^ prev);
        out[i] = c;
        prev = c;
    }
    return out;
}

Bytes stream_flow_decrypt(const Bytes& cipher, const Bytes& key, const Bytes& chaos)
{
    if(cipher.empty() || key.empty() || chaos.empty()) return cipher;
    Bytes out(cipher.size());

    uint8_t prev = iv_byte(key);
    for(size_t i=0; i<cipher.size(); ++i)
    {
        const uint8_t c  = cipher[i];
        const uint8_t k  = key[i % key.size()];
        const uint8_t ch = chaos[i % chaos.size()];
        const int shift = ((k ^ ch) & 7) + 1;
        const uint8_t tmp = rotl8((uint8_t)(c ^ prev), shift);
        out[i] = (uint8_t)(tmp - k - ch);
        prev = c;
    }
    return out;
}

} // namespace gbd7z
