// ============================================================================
//  File: src/payload_frame.cpp — Payload binaire (build / parse)
//  Project: GBD7Z Envelope Cipher v1
// ============================================================================

#include "gbd7z/payload_frame.hpp"

#include <cstdint>
#include <string>
#include <utility>

namespace gbd7z
{

Bytes payload_build(const std::vector<int32_t>& counts, const Bytes& bases, const Bytes& cipher)
{
    const int32_t orig_len = (int32_t)counts.size();
    Bytes out;
    out.reserve(kPayloadHeader + counts.size()*5 + cipher.size());
    put_i32be(out, orig_len);
    put_i32be(out, orig_len);
    for(int32_t c : counts) put_i32be(out, c);
    out.insert(out.end(), bases.begin(), bases.end());
    out.insert(out.end(), cipher.begin(), cipher.end());
    return out;
}

Status payload_parse(const Bytes& payload, PayloadParts& out, std::string* err)
{
    out = PayloadParts();
    if(payload.size() < kPayloadHeader)
        return fail(Status::FormatError, err, "payload too short for header");

    const int32_t orig_len   = get_i32be(payload.data());
    const int32_t counts_len = get_i32be(payload.data()+4);
    if(orig_len<0)
        return fail(Status::FormatError, err, "negative payload length");
    if(counts_len!=orig_len)
        return fail(Status::FormatError, err, "payload counts length mismatch");

    const uint64_t need = (uint64_t)kPayloadHeader + (uint64_t)orig_len*5u;
    if((uint64_t)payload.size() < need)
        return fail(Status::FormatError, err,
                    "payload truncated (need "+std::to_string(need)+
                    " bytes, have "+std::to_string(payload.size())+")");

    PayloadParts p;
    p.counts.reserve((size_t)orig_len);
    size_t idx = kPayloadHeader;
    for(int32_t i=0; i<orig_len; ++i, idx+=4) p.counts.push_back(get_i32be(payload.data()+idx));
    p.bases.assign(payload.begin()+idx, payload.begin()+idx+orig_len);
    idx += (size_t)orig_len;
    p.cipher.assign(payload.begin()+idx, payload.end());

    out = std::move(p);
    return Status::Ok;
}

} // namespace gbd7z
