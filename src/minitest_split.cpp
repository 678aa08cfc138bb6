// ============================================================================
//  File: src/minitest_split.cpp — Tests décomposition base-3 (trit_split)
//  Project: GBD7Z Envelope Cipher v1
//
//  [S1] 256 valeurs : count = 3^k, base*count == v, decode(encode) == v
//  [S2] flux de feuilles : longueur Σcounts, valeurs = base répétée
//  [S3] erreurs decode : count <= 0, feuilles manquantes / en trop, base*count > 255
// ============================================================================

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "gbd7z/trit_split.hpp"

using namespace gbd7z;

// ------------------ ASSERT minimaliste --------------------------------------
#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } }while(0)

static bool is_pow3(int32_t c){
    if(c<=0) return false;
    while(c%3==0) c/=3;
    return c==1;
}

// ------------------ S1 : toutes les valeurs d’octet --------------------------
static bool test_all_bytes(){
    for(int v=0; v<256; ++v){
        Bytes one{(uint8_t)v};
        TritSplit s = trit_split_encode(one);
        T_ASSERT( s.counts.size()==1 && s.bases.size()==1 );
        T_ASSERT( is_pow3(s.counts[0]) );
        if(v==0){ T_ASSERT( s.counts[0]==1 && s.bases[0]==0 ); }
        else    { T_ASSERT( (int)s.bases[0]*s.counts[0]==v ); T_ASSERT( s.bases[0]%3!=0 ); }
        T_ASSERT( (int32_t)s.leaves.size()==s.counts[0] );

        Bytes back;
        T_ASSERT( trit_split_decode(s.leaves, s.counts, s.bases, back)==Status::Ok );
        T_ASSERT( back==one );
    }
    // 243 = 3^5 : le plus long développement
    TritSplit s = trit_split_encode(Bytes{243});
    T_ASSERT( s.counts[0]==243 && s.bases[0]==1 );
    return true;
}

// ------------------ S2 : flux multi-octets -----------------------------------
static bool test_leaf_stream(){
    const std::string hello="hello"; // h=104, e=101, l=4*27, l, o=37*3
    TritSplit s = trit_split_encode(Bytes(hello.begin(), hello.end()));
    T_ASSERT( (s.counts==std::vector<int32_t>{1,1,27,27,3}) );
    T_ASSERT( (s.bases==Bytes{104,101,4,4,37}) );
    T_ASSERT( s.leaves.size()==59 );
    T_ASSERT( trit_split_leaf_total(s.counts)==59 );
    for(size_t i=2;i<29;++i) T_ASSERT( s.leaves[i]==4 );
    T_ASSERT( s.leaves[56]==37 && s.leaves[58]==37 );

    Bytes back;
    T_ASSERT( trit_split_decode(s.leaves, s.counts, s.bases, back)==Status::Ok );
    T_ASSERT( std::string(back.begin(), back.end())==hello );

    // vide
    TritSplit e = trit_split_encode(Bytes());
    T_ASSERT( e.leaves.empty() && e.counts.empty() && e.bases.empty() );
    T_ASSERT( trit_split_decode(e.leaves, e.counts, e.bases, back)==Status::Ok && back.empty() );

    // les valeurs des feuilles ne sont pas relues
    Bytes scrambled(s.leaves.size(), 0xEE);
    T_ASSERT( trit_split_decode(scrambled, s.counts, s.bases, back)==Status::Ok );
    T_ASSERT( std::string(back.begin(), back.end())==hello );
    return true;
}

// ------------------ S3 : erreurs ---------------------------------------------
static bool test_decode_errors(){
    Bytes out{1,2,3};
    std::string why;

    T_ASSERT( trit_split_decode(Bytes{5}, {0}, Bytes{5}, out, &why)==Status::FormatError );
    T_ASSERT( out.empty() && !why.empty() );
    T_ASSERT( trit_split_decode(Bytes{5}, {-3}, Bytes{5}, out)==Status::FormatError );
    T_ASSERT( trit_split_leaf_total({1,-3})==-1 );

    // feuilles manquantes
    T_ASSERT( trit_split_decode(Bytes{4,4}, {3}, Bytes{4}, out)==Status::FormatError );
    // feuilles en trop
    T_ASSERT( trit_split_decode(Bytes{4,4,4,4}, {3}, Bytes{4}, out)==Status::FormatError );
    // tailles counts / bases différentes
    T_ASSERT( trit_split_decode(Bytes{4}, {1}, Bytes{4,4}, out)==Status::FormatError );

    // base*count > 255 → StateError
    why.clear();
    T_ASSERT( trit_split_decode(Bytes(9,200), {9}, Bytes{200}, out, &why)==Status::StateError );
    T_ASSERT( why.find("out of range")!=std::string::npos );
    T_ASSERT( trit_split_decode(Bytes{255}, {1}, Bytes{255}, out)==Status::Ok && out==Bytes{255} );
    return true;
}

// ------------------ DRIVER ---------------------------------------------------
int main(){
    bool ok = true;
    ok &= test_all_bytes();
    std::cout << "[S1] 256 byte values : " << (ok? "OK":"FAIL") << "\n";
    ok &= test_leaf_stream();
    std::cout << "[S2] leaf stream     : " << (ok? "OK":"FAIL") << "\n";
    ok &= test_decode_errors();
    std::cout << "[S3] decode errors   : " << (ok? "OK":"FAIL") << "\n";
    std::cout << (ok? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
    return ok? 0 : 1;
}
