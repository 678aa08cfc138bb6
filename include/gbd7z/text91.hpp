// ============================================================================
//  File: include/gbd7z/text91.hpp — Codage texte 2 caractères / octet
//  Project: GBD7Z Envelope Cipher v1
//
//  octet v → '!' + v/91, '!' + v%91   (alphabet '!'..'{', 91 symboles)
//  Décodage : paire (hi,lo) → (hi*91 + lo) & 0xFF. Les paires hors forme
//  canonique (hi*91+lo > 255) sont réduites mod 256, pas rejetées.
// ============================================================================

#pragma once
#include <cstdint>
#include <string>

#include "gbd7z/format.hpp"
#include "gbd7z/status.hpp"

namespace gbd7z
{

inline int text91_digit(char c)
{
    const int d = (int)(unsigned char)c - (int)kAlphabetBase;
    return (d>=0 && d<kAlphabetSize) ? d : -1;
}

inline std::string text91_encode(const Bytes& data)
{
    std::string s;
    s.reserve(data.size()*2);
    for(uint8_t v : data)
    {
        s.push_back((char)(kAlphabetBase + v / kAlphabetSize));
        s.push_back((char)(kAlphabetBase + v % kAlphabetSize));
    }
    return s;
}

inline Status text91_decode(const std::string& s, Bytes& out, std::string* err = nullptr)
{
    out.clear();
    if(s.size() & 1u) return fail(Status::FormatError, err, "payload length odd");
    Bytes tmp;
    tmp.reserve(s.size()/2);
    for(size_t i=0; i<s.size(); i+=2)
    {
        const int hi = text91_digit(s[i]);
        const int lo = text91_digit(s[i+1]);
        if(hi<0 || lo<0)
            return fail(Status::FormatError, err, "invalid char in payload at offset "+std::to_string(hi<0 ? i : i+1));
        tmp.push_back((uint8_t)((hi*kAlphabetSize + lo) & 0xFF));
    }
    out.swap(tmp);
    return Status::Ok;
}

} // namespace gbd7z
