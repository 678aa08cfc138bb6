// ============================================================================
//  File: src/minitest_envelope.cpp — Tests payload / hash / texte / enveloppe
//  Project: GBD7Z Envelope Cipher v1
//
//  [E1] payload build / parse + erreurs de format
//  [E2] hash 64 bits & hex, codage texte base 91
//  [E3] enveloppes de référence, aller-retour, déterminisme
//  [E4] erreurs : clé vide, mauvaise clé, altération, hash tronqué, structure
//  [E5] inspect / verify / helpers fichiers
// ============================================================================

#include <cstdint>
#include <cstdio>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include "gbd7z/envelope.hpp"
#include "gbd7z/envelope_io.hpp"
#include "gbd7z/keyed_hash.hpp"
#include "gbd7z/payload_frame.hpp"
#include "gbd7z/text91.hpp"

using namespace gbd7z;

#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } }while(0)

static Bytes B(const std::string& s){ return Bytes(s.begin(), s.end()); }

// Enveloppes issues d’une exécution de référence de l’algorithme.
static const char* kEnvEmpty = "GBD7Z:!!!!!!!!!!!!!!!!|1607d1425a28b60f&7";
static const char* kEnvHello =
    R"KAT(GBD7Z:!!!!!!!&!!!!!!!&!!!!!!!"!!!!!!!"!!!!!!!<!!!!!!!<!!!!!!!$"."+!%!%!F"`#U#T!+"g!R"r"("P#a!1!i#H!o"I!n"*"4"7!."f#X#V#a!9#T!5"@";"$!W!Z"q"("@#=!1#H!d#6!6#R#9!(!>!z"M"U!;#V#/"9"f"G#e#@!3"_!3|722b6d717f13e4c8&7)KAT";

// ------------------ E1 : payload ---------------------------------------------
static bool test_payload(){
    Bytes p = payload_build({1,27}, Bytes{104,4}, Bytes{9,8,7});
    T_ASSERT( p.size()==8+2*5+3 );
    T_ASSERT( (Bytes(p.begin(), p.begin()+8)==Bytes{0,0,0,2, 0,0,0,2}) );
    T_ASSERT( (Bytes(p.begin()+8, p.begin()+16)==Bytes{0,0,0,1, 0,0,0,27}) );

    PayloadParts pp;
    T_ASSERT( payload_parse(p, pp)==Status::Ok );
    T_ASSERT( (pp.counts==std::vector<int32_t>{1,27}) );
    T_ASSERT( (pp.bases==Bytes{104,4}) );
    T_ASSERT( (pp.cipher==Bytes{9,8,7}) );

    // vide : 8 octets d’en-tête
    Bytes e = payload_build({}, Bytes(), Bytes());
    T_ASSERT( e==Bytes(8,0) );
    T_ASSERT( payload_parse(e, pp)==Status::Ok && pp.counts.empty() && pp.cipher.empty() );

    std::string why;
    T_ASSERT( payload_parse(Bytes{0,0,0}, pp, &why)==Status::FormatError );
    Bytes bad = p; bad[7]=3;                              // countsLen != origLen
    T_ASSERT( payload_parse(bad, pp, &why)==Status::FormatError );
    T_ASSERT( why.find("mismatch")!=std::string::npos );
    Bytes neg{0xFF,0xFF,0xFF,0xFF, 0xFF,0xFF,0xFF,0xFF}; // origLen = -1
    T_ASSERT( payload_parse(neg, pp)==Status::FormatError );
    Bytes trunc(p.begin(), p.begin()+12);                 // tableaux incomplets
    T_ASSERT( payload_parse(trunc, pp)==Status::FormatError );
    T_ASSERT( pp.counts.empty() );
    return true;
}

// ------------------ E2 : hash & texte ----------------------------------------
static bool test_hash_text(){
    T_ASSERT( keyed_hash64(Bytes(), B("k"))==0x9341ca263702a9e6ull );
    Bytes seq{0,1,2,3,4,5,6,7};
    T_ASSERT( keyed_hash64(seq, B("secret"))==0x2f3a45307a929d6full );
    T_ASSERT( hash_to_hex(0x2f3a45307a929d6full)=="2f3a45307a929d6f" );
    T_ASSERT( hash_to_hex(0x1ull)=="0000000000000001" );

    uint64_t h=0;
    T_ASSERT( hash_from_hex("2F3A45307A929D6F", h) && h==0x2f3a45307a929d6full );
    T_ASSERT( !hash_from_hex("2f3a45307a929d6", h) );
    T_ASSERT( !hash_from_hex("2f3a45307a929d6g", h) );

    // un octet modifié change toujours le hash (chaque étape est bijective)
    Bytes seq2 = seq; seq2[3]^=0x40;
    T_ASSERT( keyed_hash64(seq2, B("secret"))!=keyed_hash64(seq, B("secret")) );
    T_ASSERT( keyed_hash64(seq, B("secreu"))!=keyed_hash64(seq, B("secret")) );

    Bytes all(256);
    for(int i=0;i<256;++i) all[i]=(uint8_t)i;
    std::string t = text91_encode(all);
    T_ASSERT( t.size()==512 );
    T_ASSERT( t.substr(0,2)=="!!" );
    T_ASSERT( t.substr(2*255,2)==std::string(1,(char)('!'+2))+(char)('!'+73) ); // 255 = 2*91+73
    for(char c : t) T_ASSERT( c>='!' && c<='{' );
    Bytes back;
    T_ASSERT( text91_decode(t, back)==Status::Ok && back==all );

    T_ASSERT( text91_decode("!!!", back)==Status::FormatError );
    T_ASSERT( back.empty() );
    T_ASSERT( text91_decode("!|", back)==Status::FormatError );  // '|' hors alphabet
    T_ASSERT( text91_decode(" !", back)==Status::FormatError );
    // paire non canonique réduite mod 256 : '{'+'{' = 90*91+90
    T_ASSERT( text91_decode("{{", back)==Status::Ok && back==Bytes{(uint8_t)((90*91+90)&0xFF)} );
    return true;
}

// ------------------ E3 : enveloppes ------------------------------------------
static bool test_envelopes(){
    std::string env, why;
    T_ASSERT( encrypt(B("k"), Bytes(), env)==Status::Ok );
    T_ASSERT( env==kEnvEmpty );
    T_ASSERT( env.compare(0,6,"GBD7Z:")==0 && env.compare(env.size()-2,2,"&7")==0 );
    size_t bars=0; for(char c : env) bars += (c=='|');
    T_ASSERT( bars==1 );
    Bytes back{1};
    T_ASSERT( decrypt(B("k"), env, back)==Status::Ok && back.empty() );

    std::string e1, e2;
    T_ASSERT( encrypt(B("secret"), B("hello"), e1)==Status::Ok );
    T_ASSERT( encrypt(B("secret"), B("hello"), e2)==Status::Ok );
    T_ASSERT( e1==e2 );
    T_ASSERT( e1==kEnvHello );
    T_ASSERT( decrypt(B("secret"), e1, back)==Status::Ok && back==B("hello") );

    // binaire, clés variées, longueurs variées (blocs partiels compris)
    std::mt19937 rng(9001);
    for(int t=0;t<40;++t){
        Bytes key(1 + rng()%24), plain(rng()%70);
        for(auto& b : key)   b=(uint8_t)(rng()&0xFF);
        for(auto& b : plain) b=(uint8_t)(rng()&0xFF);
        if(t%5==0) for(auto& b : plain) b=(uint8_t)((rng()%2)? 243 : 0); // feuilles longues / zéros
        std::string e;
        T_ASSERT( encrypt(key, plain, e, &why)==Status::Ok );
        T_ASSERT( decrypt(key, e, back, &why)==Status::Ok );
        T_ASSERT( back==plain );
    }

    T_ASSERT( selftest_roundtrip() );
    return true;
}

// ------------------ E4 : erreurs ---------------------------------------------
static bool test_errors(){
    std::string env, why;
    Bytes back;
    T_ASSERT( encrypt(Bytes(), B("x"), env, &why)==Status::InvalidArgument );
    T_ASSERT( env.empty() && !why.empty() );
    T_ASSERT( decrypt(Bytes(), kEnvEmpty, back)==Status::InvalidArgument );

    const std::string hello = kEnvHello;
    T_ASSERT( decrypt(B("wrong!"), hello, back, &why)==Status::SecurityError );
    T_ASSERT( back.empty() );
    T_ASSERT( why.find("mismatch")!=std::string::npos );

    // hash tronqué à 15 caractères → FormatError (pas SecurityError)
    const size_t bar = hello.rfind('|');
    std::string h15 = hello.substr(0, bar+1+15) + "&7";
    T_ASSERT( decrypt(B("secret"), h15, back, &why)==Status::FormatError );
    T_ASSERT( why.find("bad hash")!=std::string::npos );

    // altération d’un caractère du payload (valeur voisine dans l’alphabet)
    for(size_t pos=6; pos<bar; ++pos){
        std::string t = hello;
        const int d = t[pos]-'!';
        t[pos] = (char)('!' + (d+1)%91);
        T_ASSERT( decrypt(B("secret"), t, back)==Status::SecurityError );
    }
    // altération du hash
    std::string th = hello;
    th[bar+1] = (th[bar+1]=='0')? '1' : '0';
    T_ASSERT( decrypt(B("secret"), th, back)==Status::SecurityError );

    // structure
    T_ASSERT( decrypt(B("secret"), "", back)==Status::FormatError );
    T_ASSERT( decrypt(B("secret"), "GBD7Z:&7", back)==Status::FormatError );
    T_ASSERT( decrypt(B("secret"), hello.substr(1), back)==Status::FormatError );
    T_ASSERT( decrypt(B("secret"), hello.substr(0, hello.size()-1), back)==Status::FormatError );
    T_ASSERT( decrypt(B("secret"), "GBD7Z:|1607d1425a28b60f&7", back)==Status::FormatError );
    T_ASSERT( decrypt(B("secret"), "GBD7Z:!!!!!!!!!!!!!!!!1607d1425a28b60f&7", back)==Status::FormatError );
    T_ASSERT( decrypt(B("k"), "GBD7Z:!!!!!!!!!!!!!!!!|1607d1425a28b60z&7", back)==Status::FormatError );
    T_ASSERT( decrypt(B("k"), "GBD7Z:!!!!!!!!!!!!!!!|1607d1425a28b60f&7", back)==Status::FormatError ); // longueur impaire
    // hash majuscule accepté
    T_ASSERT( decrypt(B("k"), "GBD7Z:!!!!!!!!!!!!!!!!|1607D1425A28B60F&7", back)==Status::Ok );

    // payload forgé (hash recalculé) : countsLen != origLen → FormatError après le hash
    Bytes forged = payload_build({1}, Bytes{7}, Bytes{0});
    forged[7]=2;
    std::string fenv = assemble_envelope(forged, keyed_hash64(forged, B("k")));
    T_ASSERT( decrypt(B("k"), fenv, back, &why)==Status::FormatError );

    // payload forgé : base*count > 255 → StateError
    Bytes big = payload_build({9}, Bytes{200}, Bytes(9, 0x11));
    std::string benv = assemble_envelope(big, keyed_hash64(big, B("k")));
    T_ASSERT( decrypt(B("k"), benv, back, &why)==Status::StateError );
    T_ASSERT( back.empty() );

    // payload forgé : count 0 → FormatError
    Bytes zero = payload_build({0}, Bytes{1}, Bytes());
    std::string zenv = assemble_envelope(zero, keyed_hash64(zero, B("k")));
    T_ASSERT( decrypt(B("k"), zenv, back)==Status::FormatError );
    return true;
}

// ------------------ E5 : inspect / verify / fichiers -------------------------
static bool test_inspect_and_files(){
    EnvelopeInfo info;
    T_ASSERT( inspect_envelope(kEnvHello, info)==Status::Ok );
    T_ASSERT( info.orig_len==5 );
    T_ASSERT( info.leaf_count==59 && info.cipher_len==59 && info.leaf_count_matches );
    T_ASSERT( info.payload_len==8+5*5+59 );
    T_ASSERT( info.hash==0x722b6d717f13e4c8ull );
    T_ASSERT( inspect_envelope("nope", info)==Status::FormatError );

    T_ASSERT( verify_envelope(B("secret"), kEnvHello)==Status::Ok );
    T_ASSERT( verify_envelope(B("wrong!"), kEnvHello)==Status::SecurityError );
    T_ASSERT( verify_envelope(Bytes(), kEnvHello)==Status::InvalidArgument );

    T_ASSERT( rstrip_line("abc \r\n")=="abc" );

    const std::string path = "minitest_envelope_tmp.txt";
    std::string why, loaded;
    T_ASSERT( write_envelope_file(path, kEnvHello, &why)==Status::Ok );
    T_ASSERT( read_envelope_file(path, loaded, &why)==Status::Ok );
    T_ASSERT( loaded==kEnvHello );
    Bytes raw;
    T_ASSERT( read_file_bytes(path, raw)==Status::Ok && raw.back()=='\n' );
    std::remove(path.c_str());

    T_ASSERT( read_file_bytes("does/not/exist.bin", raw, &why)==Status::IoError );
    T_ASSERT( raw.empty() && !why.empty() );
    return true;
}

int main(){
    bool ok = true;
    ok &= test_payload();
    std::cout << "[E1] payload frame     : " << (ok? "OK":"FAIL") << "\n";
    ok &= test_hash_text();
    std::cout << "[E2] hash & text91     : " << (ok? "OK":"FAIL") << "\n";
    ok &= test_envelopes();
    std::cout << "[E3] envelopes         : " << (ok? "OK":"FAIL") << "\n";
    ok &= test_errors();
    std::cout << "[E4] error kinds       : " << (ok? "OK":"FAIL") << "\n";
    ok &= test_inspect_and_files();
    std::cout << "[E5] inspect / files   : " << (ok? "OK":"FAIL") << "\n";
    std::cout << (ok? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
    return ok? 0 : 1;
}
