// ============================================================================
//  File: src/minitest_chaos_stream.cpp — Tests suite chaotique & couche flux
//  Project: GBD7Z Envelope Cipher v1
//
//  [C1] suite logistique : longueur, déterminisme, vecteurs de référence
//  [C2] IV + flux : vecteurs de référence, aller-retour, chaînage
//  Les vecteurs proviennent d’une exécution de référence de l’algorithme.
// ============================================================================

#include <cstdint>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include "gbd7z/chaos_logistic.hpp"
#include "gbd7z/stream_flow.hpp"

using namespace gbd7z;

#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } }while(0)

static Bytes B(const std::string& s){ return Bytes(s.begin(), s.end()); }

// ------------------ C1 : chaos ----------------------------------------------
static bool test_chaos(){
    const Bytes k = B("k"), secret = B("secret");
    Bytes c1 = logistic_chaos(k);
    T_ASSERT( c1.size()==kChaosLen );
    T_ASSERT( c1==logistic_chaos(k) );
    T_ASSERT( logistic_chaos(k, 10).size()==10 );
    // préfixe identique quelle que soit la longueur demandée
    T_ASSERT( Bytes(c1.begin(), c1.begin()+10)==logistic_chaos(k, 10) );

    const Bytes ref_k{179, 213, 140, 252, 14, 53, 168, 229};
    const Bytes ref_s{188, 197, 178, 213, 140, 251, 16, 60};
    T_ASSERT( Bytes(c1.begin(), c1.begin()+8)==ref_k );
    Bytes c2 = logistic_chaos(secret);
    T_ASSERT( Bytes(c2.begin(), c2.begin()+8)==ref_s );
    T_ASSERT( c1!=c2 );

    T_ASSERT( logistic_chaos(Bytes()).empty() );
    return true;
}

// ------------------ C2 : flux ------------------------------------------------
static bool test_stream(){
    const Bytes key = B("secret");
    const Bytes chaos = logistic_chaos(key);
    T_ASSERT( iv_byte(key)==149 );
    T_ASSERT( iv_byte(Bytes{0})==(uint8_t)(0xA5*31) );

    Bytes enc = stream_flow_encrypt(Bytes{1,2,3}, key, chaos);
    T_ASSERT( (enc==Bytes{165,179,181}) );
    T_ASSERT( (stream_flow_decrypt(enc, key, chaos)==Bytes{1,2,3}) );

    // rotations 8 bits
    T_ASSERT( rotr8(0x01, 1)==0x80 );
    T_ASSERT( rotl8(0x80, 1)==0x01 );
    T_ASSERT( rotr8(0xA5, 8)==0xA5 ); // rotation de 8 = identité

    // aller-retour aléatoire (longueur > chaos et > clé)
    std::mt19937 rng(1234);
    Bytes data(1000);
    for(auto& b : data) b = (uint8_t)(rng() & 0xFF);
    Bytes c = stream_flow_encrypt(data, key, chaos);
    T_ASSERT( c.size()==data.size() );
    T_ASSERT( stream_flow_decrypt(c, key, chaos)==data );

    // chaînage : modifier un octet clair change toute la suite chiffrée
    Bytes data2 = data;
    data2[10] ^= 0x01;
    Bytes c2 = stream_flow_encrypt(data2, key, chaos);
    T_ASSERT( Bytes(c.begin(), c.begin()+10)==Bytes(c2.begin(), c2.begin()+10) );
    T_ASSERT( c[10]!=c2[10] );

    T_ASSERT( stream_flow_encrypt(Bytes(), key, chaos).empty() );
    return true;
}

int main(){
    bool ok = true;
    ok &= test_chaos();
    std::cout << "[C1] logistic chaos : " << (ok? "OK":"FAIL") << "\n";
    ok &= test_stream();
    std::cout << "[C2] stream flow    : " << (ok? "OK":"FAIL") << "\n";
    std::cout << (ok? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
    return ok? 0 : 1;
}
