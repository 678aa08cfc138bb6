// ============================================================================
//  File: src/envelope.cpp — Assemblage enveloppe & API publique
//  Project: GBD7Z Envelope Cipher v1
// ============================================================================

#include "gbd7z/envelope.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "gbd7z/block_sync.hpp"
#include "gbd7z/chaos_logistic.hpp"
#include "gbd7z/keyed_hash.hpp"
#include "gbd7z/payload_frame.hpp"
#include "gbd7z/stream_flow.hpp"
#include "gbd7z/text91.hpp"
#include "gbd7z/trit_split.hpp"

namespace gbd7z
{

namespace
{

bool has_prefix(const std::string& s, const char* p, size_t n)
{
    return s.size()>=n && s.compare(0, n, p)==0;
}
bool has_suffix(const std::string& s, const char* p, size_t n)
{
    return s.size()>=n && s.compare(s.size()-n, n, p)==0;
}

// Étapes 8 → 6 : découpe, décodage texte, contrôle du hash.
Status open_envelope(const Bytes& key, const std::string& envelope, Bytes& payload, std::string* err)
{
    payload.clear();
    EnvelopeParts parts;
    Status st = parse_envelope(envelope, parts, err);
    if(!ok(st)) return st;

    Bytes bin;
    st = text91_decode(parts.encoded_payload, bin, err);
    if(!ok(st)) return st;

    if(keyed_hash64(bin, key)!=parts.hash)
        return fail(Status::SecurityError, err, "hash mismatch (wrong key or corrupt data)");

    payload.swap(bin);
    return Status::Ok;
}

} // anon

std::string assemble_envelope(const Bytes& payload, uint64_t hash)
{
    std::string text = text91_encode(payload);
    std::string out;
    out.reserve(kMagicLen + text.size() + 1 + kHashHexLen + kTailLen);
    out += kMagic;
    out += text;
    out += kSeparator;
    out += hash_to_hex(hash);
    out += kTail;
    return out;
}

Status parse_envelope(const std::string& envelope, EnvelopeParts& out, std::string* err)
{
    out = EnvelopeParts();
    if(envelope.size() < kMagicLen + kTailLen
       || !has_prefix(envelope, kMagic, kMagicLen)
       || !has_suffix(envelope, kTail, kTailLen))
        return fail(Status::FormatError, err, "not a GBD7Z envelope");

    const std::string inner = envelope.substr(kMagicLen, envelope.size() - kMagicLen - kTailLen);
    const size_t sep = inner.rfind(kSeparator);
    if(sep==std::string::npos || sep==0)
        return fail(Status::FormatError, err, "invalid envelope format");

    const std::string hex = inner.substr(sep+1);
    if(hex.size()!=kHashHexLen)
        return fail(Status::FormatError, err, "bad hash (length "+std::to_string(hex.size())+")");
    uint64_t h=0;
    if(!hash_from_hex(hex, h))
        return fail(Status::FormatError, err, "bad hash (not hex)");

    out.encoded_payload = inner.substr(0, sep);
    out.hash = h;
    return Status::Ok;
}

Status encrypt(const Bytes& key, const Bytes& plain, std::string& out_envelope, std::string* err)
{
    out_envelope.clear();
    if(key.empty())
        return fail(Status::InvalidArgument, err, "key must be non-empty");
    if(plain.size() > (size_t)std::numeric_limits<int32_t>::max())
        return fail(Status::InvalidArgument, err, "plaintext too large");

    const TritSplit split  = trit_split_encode(plain);
    const Bytes     chaos  = logistic_chaos(key, kChaosLen);
    const Bytes     stream = stream_flow_encrypt(split.leaves, key, chaos);
    const Bytes     block  = block_sync_encrypt(stream, key, chaos);
    const Bytes     payload= payload_build(split.counts, split.bases, block);

    out_envelope = assemble_envelope(payload, keyed_hash64(payload, key));
    return Status::Ok;
}

Status decrypt(const Bytes& key, const std::string& envelope, Bytes& out_plain, std::string* err)
{
    out_plain.clear();
    if(key.empty())
        return fail(Status::InvalidArgument, err, "key must be non-empty");

    Bytes payload;
    Status st = open_envelope(key, envelope, payload, err);
    if(!ok(st)) return st;

    PayloadParts parts;
    st = payload_parse(payload, parts, err);
    if(!ok(st)) return st;

    const Bytes chaos  = logistic_chaos(key, kChaosLen);
    const Bytes stream = block_sync_decrypt(parts.cipher, key, chaos);
    const Bytes leaves = stream_flow_decrypt(stream, key, chaos);
    return trit_split_decode(leaves, parts.counts, parts.bases, out_plain, err);
}

Status verify_envelope(const Bytes& key, const std::string& envelope, std::string* err)
{
    if(key.empty())
        return fail(Status::InvalidArgument, err, "key must be non-empty");
    Bytes payload;
    return open_envelope(key, envelope, payload, err);
}

Status inspect_envelope(const std::string& envelope, EnvelopeInfo& info, std::string* err)
{
    info = EnvelopeInfo();
    EnvelopeParts parts;
    Status st = parse_envelope(envelope, parts, err);
    if(!ok(st)) return st;

    Bytes payload;
    st = text91_decode(parts.encoded_payload, payload, err);
    if(!ok(st)) return st;

    PayloadParts pp;
    st = payload_parse(payload, pp, err);
    if(!ok(st)) return st;

    const int64_t leaves = trit_split_leaf_total(pp.counts);
    if(leaves<0)
        return fail(Status::FormatError, err, "invalid count in payload");

    EnvelopeInfo r;
    r.text_len    = envelope.size();
    r.payload_len = payload.size();
    r.orig_len    = (uint32_t)pp.counts.size();
    r.leaf_count  = (uint64_t)leaves;
    r.cipher_len  = pp.cipher.size();
    r.hash        = parts.hash;
    r.leaf_count_matches = (r.leaf_count==(uint64_t)r.cipher_len);
    info = r;
    return Status::Ok;
}

bool selftest_roundtrip()
{
    struct Case { const char* key; std::string plain; };
    const std::vector<Case> cases = {
        { "k",      "" },
        { "secret", "hello" },
        { "key",    std::string("\x00\x1b\xf3\x51", 4) },
        { "\xff",   std::string(40, '\x51') }, // 81 = 3^4 : 81 feuilles / octet
    };
    for(const Case& c : cases)
    {
        const Bytes key = to_bytes(c.key);
        const Bytes plain = to_bytes(c.plain);
        std::string e1, e2;
        Bytes back;
        if(!ok(encrypt(key, plain, e1)) || !ok(encrypt(key, plain, e2))) return false;
        if(e1!=e2) return false;
        if(!ok(decrypt(key, e1, back)) || back!=plain) return false;
    }
    return true;
}

} // namespace gbd7z
