// ============================================================================
//  File: src/block_sync.cpp — Couche bloc 128 bits (add / mul / permute / xor)
//  Project: GBD7Z Envelope Cipher v1
// ============================================================================

#include "gbd7z/block_sync.hpp"

#include <algorithm>
#include <cstdint>
#include <utility>

namespace gbd7z
{

namespace
{

inline size_t swap_target(int i, int round, const Bytes& chaos)
{
    return (size_t)((i + chaos[(size_t)(i + round) % chaos.size()]) % kBlockBytes);
}

void permute_bytes(uint8_t* b, const Bytes& chaos, int round)
{
    for(int i=0; i<kBlockBytes; ++i) std::swap(b[i], b[swap_target(i, round, chaos)]);
}

void unpermute_bytes(uint8_t* b, const Bytes& chaos, int round)
{
    for(int i=kBlockBytes-1; i>=0; --i) std::swap(b[i], b[swap_target(i, round, chaos)]);
}

// Applique fn à chaque bloc d’une copie bourrée à zéro, puis tronque.
template<typename BlockFn>
Bytes for_each_padded_block(const Bytes& data, BlockFn fn)
{
    if(data.empty()) return Bytes();
    const size_t padded = ((data.size() + kBlockBytes - 1) / kBlockBytes) * kBlockBytes;
    Bytes buf(padded, 0);
    std::copy(data.begin(), data.end(), buf.begin());
    for(size_t off=0; off<padded; off+=kBlockBytes) fn(buf.data()+off);
    buf.resize(data.size());
    return buf;
}

} // anon

U128 derive_odd_multiplier(const Bytes& key)
{
    uint8_t buf[kBlockBytes];
    for(int i=0; i<kBlockBytes; ++i) buf[i] = key[(size_t)i % key.size()];
    buf[kBlockBytes-1] |= 1;
    return u128_from_be(buf);
}

U128 derive_round_key(const Bytes& key, int round, int which)
{
    uint8_t buf[kBlockBytes];
    const int tweak = (round*31) ^ (which*13);
    for(int i=0; i<kBlockBytes; ++i)
    {
        const int v = key[(size_t)(i + round + which) % key.size()];
        buf[i] = (uint8_t)((v + tweak) & 0xFF);
    }
    return u128_from_be(buf);
}

BlockKeys derive_block_keys(const Bytes& key)
{
    BlockKeys bk;
    bk.mul     = derive_odd_multiplier(key);
    bk.mul_inv = u128_inverse_odd(bk.mul);
    for(int r=0; r<kBlockRounds; ++r)
    {
        bk.k1[r] = derive_round_key(key, r, 1);
        bk.k2[r] = derive_round_key(key, r, 2);
    }
    return bk;
}

void block_encrypt16(uint8_t* block, const BlockKeys& bk, const Bytes& chaos)
{
    U128 n = u128_from_be(block);
    for(int r=0; r<kBlockRounds; ++r)
    {
        n = u128_add(n, bk.k1[r]);
        n = u128_mul(n, bk.mul);
        u128_to_be(n, block);
        permute_bytes(block, chaos, r);
        n = u128_xor(u128_from_be(block), bk.k2[r]);
    }
    u128_to_be(n, block);
}

void block_decrypt16(uint8_t* block, const BlockKeys& bk, const Bytes& chaos)
{
    U128 n = u128_from_be(block);
    for(int r=kBlockRounds-1; r>=0; --r)
    {
        n = u128_xor(n, bk.k2[r]);
        u128_to_be(n, block);
        unpermute_bytes(block, chaos, r);
        n = u128_mul(u128_from_be(block), bk.mul_inv);
        n = u128_sub(n, bk.k1[r]);
    }
    u128_to_be(n, block);
}

Bytes block_sync_encrypt(const Bytes& data, const Bytes& key, const Bytes& chaos)
{
    if(data.empty() || key.empty() || chaos.empty()) return data;
    const BlockKeys bk = derive_block_keys(key);
    return for_each_padded_block(data, [&](uint8_t* b){ block_encrypt16(b, bk, chaos); });
}

Bytes block_sync_decrypt(const Bytes& data, const Bytes& key, const Bytes& chaos)
{
    if(data.empty() || key.empty() || chaos.empty()) return data;
    const BlockKeys bk = derive_block_keys(key);
    return for_each_padded_block(data, [&](uint8_t* b){ block_decrypt16(b, bk, chaos); });
}

} // namespace gbd7z
