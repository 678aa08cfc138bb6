// ============================================================================
//  File: src/trit_split.cpp — Décomposition base-3 (encode / decode)
//  Project: GBD7Z Envelope Cipher v1
// ============================================================================

#include "gbd7z/trit_split.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace gbd7z
{

TritSplit trit_split_encode(const Bytes& plain)
{
    TritSplit s;
    s.counts.reserve(plain.size());
    s.bases.reserve(plain.size());
    s.leaves.reserve(plain.size());

    for(uint8_t v : plain)
    {
        const int     levels = trit_levels(v);
        const int32_t count  = pow3(levels);
        const uint8_t base   = (uint8_t)(v==0 ? 0 : v / count);

        s.counts.push_back(count);
        s.bases.push_back(base);
        s.leaves.insert(s.leaves.end(), (size_t)count, base);
    }
    return s;
}

Status trit_split_decode(const Bytes& leaves,
                         const std::vector<int32_t>& counts,
                         const Bytes& bases,
                         Bytes& out_plain,
                         std::string* err)
{
    out_plain.clear();
    if(counts.size()!=bases.size())
        return fail(Status::FormatError, err, "counts/bases length mismatch");

    Bytes out;
    out.reserve(counts.size());
    size_t pos=0;
    for(size_t i=0; i<counts.size(); ++i)
    {
        const int32_t c = counts[i];
        if(c<=0)
            return fail(Status::FormatError, err, "invalid count at index "+std::to_string(i));
        if((uint64_t)c > (uint64_t)(leaves.size()-pos))
            return fail(Status::FormatError, err, "leaf array too short");

        const int64_t product = (int64_t)bases[i] * (int64_t)c;
        if(product>255)
        {
            return fail(Status::StateError, err,
                        "reconstructed byte out of range (base="+std::to_string(bases[i])+
                        ", count="+std::to_string(c)+", product="+std::to_string(product)+")");
        }
        out.push_back((uint8_t)product);
        pos += (size_t)c;
    }
    if(pos!=leaves.size())
        return fail(Status::FormatError, err, "extra leaves present");

    out_plain.swap(out);
    return Status::Ok;
}

int64_t trit_split_leaf_total(const std::vector<int32_t>& counts)
{
    int64_t total=0;
    for(int32_t c : counts)
    {
        if(c<=0) return -1;
        total += c;
    }
    return total;
}

} // namespace gbd7z
