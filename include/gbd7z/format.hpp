// ============================================================================
//  File: include/gbd7z/format.hpp — Constantes de format & helpers BE
//  Project: GBD7Z Envelope Cipher v1
//
//  FORMAT ENVELOPPE
//  ----------------
//   "GBD7Z:" + texte(payload) + "|" + hash(16 hex, minuscules) + "&7"
//
//  FORMAT PAYLOAD (BE, entiers signés 32 bits)
//  -------------------------------------------
//   origLen(i32) countsLen(i32)=origLen
//   counts[origLen](i32) bases[origLen](u8) cipher[reste]
// ============================================================================

#pragma once
#include <cstdint>
#include <cstddef>
#include <vector>

namespace gbd7z
{

using Bytes = std::vector<uint8_t>;

static constexpr const char* kMagic      = "GBD7Z:";
static constexpr size_t      kMagicLen   = 6;
static constexpr const char* kTail       = "&7";
static constexpr size_t      kTailLen    = 2;
static constexpr char        kSeparator  = '|';
static constexpr size_t      kHashHexLen = 16;

static constexpr int     kBlockBytes   = 16;
static constexpr int     kBlockRounds  = 7;
static constexpr size_t  kChaosLen     = 256;
static constexpr int     kAlphabetSize = 91;
static constexpr char    kAlphabetBase = '!';
static constexpr uint8_t kIvSeed       = 0xA5;

static constexpr uint64_t kHashSeed  = 0x9E3779B97F4A7C15ull;
static constexpr uint64_t kHashFinal = 0xff51afd7ed558ccdull;

static constexpr size_t kPayloadHeader = 8; // origLen + countsLen

// ---- IO BE helpers (buffer mémoire)
inline void put_i32be(Bytes& out, int32_t v)
{
    uint32_t u=(uint32_t)v;
    out.push_back(uint8_t(u>>24));
    out.push_back(uint8_t(u>>16));
    out.push_back(uint8_t(u>>8));
    out.push_back(uint8_t(u));
}
inline int32_t get_i32be(const uint8_t* p)
{
    uint32_t u=(uint32_t(p[0])<<24)|(uint32_t(p[1])<<16)|(uint32_t(p[2])<<8)|uint32_t(p[3]);
    return (int32_t)u;
}

} // namespace gbd7z
