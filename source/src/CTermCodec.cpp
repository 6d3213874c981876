#include "CTermCodec.hpp"

#include <algorithm>
#include <cctype>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <boost/archive/iterators/dataflow_exception.hpp>

namespace scrub
{
    core::Bool MatchTermSet::Contains( core::StringView term ) const noexcept
    {
        return ::std::find( m_terms.begin(), m_terms.end(), term ) != m_terms.end();
    }

    void MatchTermSet::add( const core::String& term )
    {
        if ( term.empty() || Contains( term ) ) return;

        m_terms.push_back( term );
        m_lowerTerms.push_back( TermCodec::ToLower( term ) );
    }

    core::String TermCodec::ToLower( core::StringView text )
    {
        core::String out( text.data(), text.size() );
        ::std::transform( out.begin(), out.end(), out.begin(),
                          []( unsigned char c ) { return static_cast< core::Char >( ::std::tolower( c ) ); } );
        return out;
    }

    core::String TermCodec::ToUpper( core::StringView text )
    {
        core::String out( text.data(), text.size() );
        ::std::transform( out.begin(), out.end(), out.begin(),
                          []( unsigned char c ) { return static_cast< core::Char >( ::std::toupper( c ) ); } );
        return out;
    }

    core::String TermCodec::Capitalize( core::StringView text )
    {
        core::String out = ToLower( text );
        if ( !out.empty() ) {
            out[0] = static_cast< core::Char >( ::std::toupper( static_cast< unsigned char >( out[0] ) ) );
        }
        return out;
    }

    const core::Vector< core::String >& TermCodec::DefaultSeeds() noexcept
    {
        static const core::Vector< core::String > seeds {
            "YXVnbWVudA==",
            "QXVnbWVudA==",
            "QVVHTUVOQA==",
            "YXVnbWVudHM=",
            "YXVnbWVudGVk"
        };
        return seeds;
    }

    core::Result< core::String > TermCodec::DecodeLiteral( core::StringView encoded ) noexcept
    {
        using result = core::Result< core::String >;
        using Base64Decoder = ::boost::archive::iterators::transform_width<
                                ::boost::archive::iterators::binary_from_base64< core::String::const_iterator >, 8, 6 >;

        core::String input( encoded.data(), encoded.size() );
        if ( input.empty() || ( input.size() % 4 ) != 0 ) {
            return result::FromError( ScrubErrc::kDecodeFailure );
        }

        core::Size padding = 0;
        while ( padding < 2 && input[ input.size() - 1 - padding ] == '=' ) {
            ++padding;
        }

        // '=' is only allowed as trailing padding
        if ( input.find( '=' ) < input.size() - padding ) {
            return result::FromError( ScrubErrc::kDecodeFailure );
        }
        ::std::fill( input.end() - static_cast< ::std::ptrdiff_t >( padding ), input.end(), 'A' );

        try {
            core::String decoded( Base64Decoder( input.cbegin() ), Base64Decoder( input.cend() ) );
            decoded.erase( decoded.size() - padding );

            if ( decoded.empty() ) {
                return result::FromError( ScrubErrc::kDecodeFailure );
            }
            return result::FromValue( decoded );
        } catch ( const ::boost::archive::iterators::dataflow_exception& e ) {
            SCRUB_LOG_DEBUG << "Invalid base64 literal: " << e.what();
            return result::FromError( ScrubErrc::kDecodeFailure );
        }
    }

    MatchTermSet TermCodec::Decode( const core::Vector< core::String >& seeds ) noexcept
    {
        MatchTermSet terms;

        for ( const auto& seed : seeds ) {
            auto decoded = DecodeLiteral( seed );
            if ( !decoded.HasValue() ) {
                SCRUB_LOG_WARN << "Skipping seed term that does not decode: " << seed;
                continue;
            }

            const core::String& base = decoded.Value();
            terms.add( base );
            terms.add( ToLower( base ) );
            terms.add( ToUpper( base ) );
            terms.add( Capitalize( base ) );
        }

        core::Vector< core::String > lowerForms;
        for ( const auto& term : terms.Terms() ) {
            core::String lower = ToLower( term );
            if ( ::std::find( lowerForms.begin(), lowerForms.end(), lower ) == lowerForms.end() ) {
                lowerForms.push_back( lower );
            }
        }

        for ( const auto& lower : lowerForms ) {
            if ( lower.size() <= SCRUB_MIN_DERIVED_TERM_LENGTH ) continue;

            terms.add( lower + "s" );
            terms.add( lower + "ed" );
            terms.add( lower + "ing" );
            terms.add( Capitalize( lower ) + "VIP" );
            terms.add( ToUpper( lower ) + "_" );
        }

        SCRUB_LOG_DEBUG << "Decoded " << static_cast< core::UInt32 >( seeds.size() ) << " seeds into "
                        << static_cast< core::UInt32 >( terms.size() ) << " terms";
        return terms;
    }

    core::Bool TermCodec::Matches( core::StringView haystack, const MatchTermSet& terms ) noexcept
    {
        if ( haystack.empty() ) return false;

        core::String lowered = ToLower( haystack );
        for ( const auto& term : terms.m_lowerTerms ) {
            if ( lowered.find( term ) != core::String::npos ) {
                return true;
            }
        }
        return false;
    }
} // scrub
