#pragma once

#include <array>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include <openssl/sha.h>


namespace blockreader
{
/**
 * @return The SHA-256 digest of @p data as 64 lower-case hexadecimal characters.
 */
[[nodiscard]] inline std::string
sha256Hex( std::string_view data )
{
    std::array<unsigned char, SHA256_DIGEST_LENGTH> digest{};
    SHA256( reinterpret_cast<const unsigned char*>( data.data() ), data.size(), digest.data() );

    std::stringstream result;
    result << std::hex << std::setfill( '0' );
    for ( const auto byte : digest ) {
        result << std::setw( 2 ) << static_cast<int>( byte );
    }
    return std::move( result ).str();
}
}  // namespace blockreader
