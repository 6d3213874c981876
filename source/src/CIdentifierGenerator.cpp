#include "CIdentifierGenerator.hpp"

#include <algorithm>
#include <cctype>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <lap/core/CCrypto.hpp>

namespace scrub
{
    namespace
    {
        ::boost::uuids::uuid nextUuid()
        {
            // random_generator is seeded from the system entropy source
            static thread_local ::boost::uuids::random_generator generator;
            return generator();
        }
    }

    core::String IdentifierGenerator::NewHexId()
    {
        core::String hex = ::boost::uuids::to_string( nextUuid() ) + ::boost::uuids::to_string( nextUuid() );
        hex.erase( ::std::remove( hex.begin(), hex.end(), '-' ), hex.end() );
        return hex;
    }

    core::String IdentifierGenerator::NewUuid()
    {
        return ::boost::uuids::to_string( nextUuid() );
    }

    core::String IdentifierGenerator::NewHashId()
    {
        ::boost::uuids::uuid seed = nextUuid();
        core::String digest = core::Crypto::Util::computeSha256( seed.data, seed.size() );
        ::std::transform( digest.begin(), digest.end(), digest.begin(),
                          []( unsigned char c ) { return static_cast< core::Char >( ::std::tolower( c ) ); } );
        return digest;
    }

    core::String IdentifierGenerator::Generate( IdentifierKind kind )
    {
        switch ( kind ) {
        case IdentifierKind::kHex:
            return NewHexId();
        case IdentifierKind::kHash:
            return NewHashId();
        case IdentifierKind::kUuid:
        default:
            return NewUuid();
        }
    }
} // scrub
