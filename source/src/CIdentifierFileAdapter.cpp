#include "CIdentifierFileAdapter.hpp"
#include "CIdentifierGenerator.hpp"
#include "CFileLock.hpp"

#include <algorithm>
#include <boost/filesystem/path.hpp>
#include <lap/core/CFile.hpp>

namespace scrub
{
    core::Result< MutationOutcome > IdentifierFileAdapter::Purge( const DiscoveredStore& store, const MatchTermSet& ) noexcept
    {
        return core::Result< MutationOutcome >::FromValue( MutationOutcome::Unsupported( store.path, ScrubOperation::kPurge ) );
    }

    core::Result< MutationOutcome > IdentifierFileAdapter::Regenerate( const DiscoveredStore& store, const FieldPlan& plan ) noexcept
    {
        using result = core::Result< MutationOutcome >;

        core::String fileName = ::boost::filesystem::path( store.path ).filename().string();

        auto rule = ::std::find_if( plan.begin(), plan.end(),
                                    [ &fileName ]( const FieldRule& r ) { return r.field == fileName; } );
        if ( rule == plan.end() ) {
            SCRUB_LOG_DEBUG << "Identifier file not planned: " << fileName;
            return result::FromValue( MutationOutcome::Counted( store.path, ScrubOperation::kRegenerate, 0 ) );
        }

        if ( !FileLock::IsWritable( store.path ) ) {
            auto unlocked = FileLock::Unlock( store.path );
            if ( !unlocked.HasValue() ) {
                return result::FromError( MakeErrorCode( ScrubErrc::kWriteFailure, 0 ) );
            }
        }

        // replace the file instead of truncating it in place
        if ( !core::File::Util::remove( store.path.data() ) ) {
            SCRUB_LOG_ERROR << "Failed to remove identifier file " << store.path;
            return result::FromError( ScrubErrc::kWriteFailure );
        }

        core::String value = IdentifierGenerator::Generate( rule->kind );
        if ( !core::File::Util::WriteBinary( store.path, reinterpret_cast< const core::UInt8* >( value.data() ), value.size(), false ) ) {
            SCRUB_LOG_ERROR << "Failed to write identifier file " << store.path;
            return result::FromError( ScrubErrc::kWriteFailure );
        }

        SCRUB_LOG_INFO << "Regenerated identifier file " << store.path;
        return result::FromValue( MutationOutcome::Counted( store.path, ScrubOperation::kRegenerate, 1 ) );
    }
} // scrub
