#include "CDocumentStoreAdapter.hpp"
#include "CIdentifierGenerator.hpp"

#include <lap/core/CFile.hpp>

namespace scrub
{
    core::Result< MutationOutcome > DocumentStoreAdapter::Purge( const DiscoveredStore& store, const MatchTermSet& ) noexcept
    {
        return core::Result< MutationOutcome >::FromValue( MutationOutcome::Unsupported( store.path, ScrubOperation::kPurge ) );
    }

    core::Result< MutationOutcome > DocumentStoreAdapter::Regenerate( const DiscoveredStore& store, const FieldPlan& plan ) noexcept
    {
        using result = core::Result< MutationOutcome >;

        auto parseResult = parseFromFile( store.path );
        if ( !parseResult.HasValue() ) {
            return result::FromError( parseResult.Error() );
        }

        Document root = ::std::move( parseResult.Value() );
        if ( !root.is_object() ) {
            SCRUB_LOG_ERROR << "Document root is not an object: " << store.path;
            return result::FromError( ScrubErrc::kParseFailure );
        }

        core::UInt32 changed = 0;
        for ( const auto& rule : plan ) {
            Document* field = FindField( root, rule.field );
            if ( field == nullptr ) continue;

            *field = IdentifierGenerator::Generate( rule.kind );
            ++changed;
            SCRUB_LOG_DEBUG << "Regenerated " << rule.field << " as " << ToString( rule.kind );
        }

        if ( changed == 0 ) {
            return result::FromValue( MutationOutcome::Counted( store.path, ScrubOperation::kRegenerate, 0 ) );
        }

        auto saveResult = saveToFile( store.path, root );
        if ( !saveResult.HasValue() ) {
            return result::FromError( saveResult.Error() );
        }

        SCRUB_LOG_INFO << "Regenerated " << changed << " fields in " << store.path;
        return result::FromValue( MutationOutcome::Counted( store.path, ScrubOperation::kRegenerate, changed ) );
    }

    DocumentStoreAdapter::Document* DocumentStoreAdapter::FindField( Document& root, const core::String& field ) noexcept
    {
        if ( !root.is_object() || field.empty() ) return nullptr;

        auto it = root.find( field );
        if ( it != root.end() ) {
            return &( *it );
        }

        Document* node = &root;
        core::Size start = 0;
        while ( start <= field.size() ) {
            core::Size dot = field.find( '.', start );
            core::String segment = field.substr( start, dot == core::String::npos ? core::String::npos : dot - start );

            if ( !node->is_object() || segment.empty() ) return nullptr;

            auto child = node->find( segment );
            if ( child == node->end() ) return nullptr;
            node = &( *child );

            if ( dot == core::String::npos ) break;
            start = dot + 1;
        }
        return ( node == &root ) ? nullptr : node;
    }

    core::Result< DocumentStoreAdapter::Document > DocumentStoreAdapter::parseFromFile( core::StringView strFile ) const noexcept
    {
        using result = core::Result< Document >;

        core::Vector< core::UInt8 > fileData;
        if ( !core::File::Util::ReadBinary( strFile.data(), fileData ) ) {
            SCRUB_LOG_WARN << "DocumentStoreAdapter::parseFromFile failed to read file: " << strFile.data();
            return result::FromError( ScrubErrc::kParseFailure );
        }

        core::String jsonContent( fileData.begin(), fileData.end() );

        try {
            return result::FromValue( Document::parse( jsonContent ) );
        } catch ( const nlohmann::json::parse_error& e ) {
            SCRUB_LOG_WARN.logFormat( "DocumentStoreAdapter::parseFromFile parse JSON %s failed with exception: %s!", strFile.data(), e.what() );
            return result::FromError( ScrubErrc::kParseFailure );
        }
    }

    core::Result< void > DocumentStoreAdapter::saveToFile( core::StringView strFile, const Document& root ) const noexcept
    {
        using result = core::Result< void >;

        try {
            ::std::string jsonContent = root.dump( 2 );

            if ( !core::File::Util::WriteBinary( strFile.data(),
                                                 reinterpret_cast< const core::UInt8* >( jsonContent.data() ),
                                                 jsonContent.size(),
                                                 false ) ) {
                SCRUB_LOG_WARN << "DocumentStoreAdapter::saveToFile failed to write file: " << strFile.data();
                return result::FromError( ScrubErrc::kWriteFailure );
            }
            return result::FromValue();
        } catch ( const nlohmann::json::exception& e ) {
            SCRUB_LOG_WARN.logFormat( "DocumentStoreAdapter::saveToFile %s failed with exception: %s!", strFile.data(), e.what() );
            return result::FromError( ScrubErrc::kWriteFailure );
        }
    }
} // scrub
