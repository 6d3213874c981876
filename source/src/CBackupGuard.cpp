#include "CBackupGuard.hpp"
#include "CFileLock.hpp"

#include <boost/filesystem.hpp>
#include <boost/system/error_code.hpp>
#include <lap/core/CFile.hpp>
#include <lap/core/CCrypto.hpp>

namespace scrub
{
    namespace fs = ::boost::filesystem;

    BackupGuard::BackupGuard( core::StringView suffix )
        : m_strSuffix( suffix.data(), suffix.size() )
    {
        ;
    }

    core::String BackupGuard::BackupPathFor( core::StringView path ) const
    {
        return core::String( path.data(), path.size() ) + m_strSuffix;
    }

    MutationOutcome BackupGuard::Guarded( const DiscoveredStore& store, ScrubOperation op, const Mutation& mutation ) const noexcept
    {
        // Phase 1: the store may have vanished since discovery
        ::boost::system::error_code ec;
        if ( !fs::is_regular_file( store.path, ec ) ) {
            SCRUB_LOG_WARN << "Store vanished before mutation: " << store.path;
            MutationOutcome outcome;
            outcome.path        = store.path;
            outcome.operation   = op;
            outcome.status      = OutcomeStatus::kNotFound;
            outcome.detail      = ScrubErrMessage( ScrubErrc::kNotFound );
            return outcome;
        }

        // Phase 2: snapshot, nothing is touched when it cannot be made
        auto backupResult = CreateBackup( store.path );
        if ( !backupResult.HasValue() ) {
            SCRUB_LOG_ERROR << "Backup failed, " << ToString( op ) << " skipped for " << store.path;
            MutationOutcome outcome = failed( store, op, core::String( backupResult.Error().Message() ) );
            outcome.status = OutcomeStatus::kFailedRestored;
            return outcome;
        }

        // Phase 3: mutate
        core::String detail;
        try {
            auto mutationResult = mutation();
            if ( mutationResult.HasValue() ) {
                return mutationResult.Value();
            }
            detail = core::String( mutationResult.Error().Message() );
        } catch ( const ::std::exception& e ) {
            SCRUB_LOG_ERROR << "Exception while mutating " << store.path << ": " << e.what();
            detail = e.what();
        }

        // Phase 4: roll back
        SCRUB_LOG_WARN << "Mutation of " << store.path << " failed (" << detail << "), restoring backup";
        MutationOutcome outcome = failed( store, op, detail );

        auto restoreResult = Restore( store.path );
        if ( restoreResult.HasValue() ) {
            outcome.status = OutcomeStatus::kFailedRestored;
        } else {
            SCRUB_LOG_FATAL << "Restore of " << store.path << " failed, manual recovery from " << backupResult.Value();
            outcome.status = OutcomeStatus::kFailedUnrecoverable;
            outcome.detail += "; ";
            outcome.detail += ScrubErrMessage( ScrubErrc::kRestoreFailure );
        }
        return outcome;
    }

    core::Result< core::String > BackupGuard::CreateBackup( const core::String& path ) const noexcept
    {
        using result = core::Result< core::String >;

        core::String backupPath = BackupPathFor( path );

        // a backup of a locked store is itself read-only
        if ( core::File::Util::exists( backupPath.data() ) && !FileLock::IsWritable( backupPath ) ) {
            auto unlocked = FileLock::Unlock( backupPath );
            if ( !unlocked.HasValue() ) {
                return result::FromError( MakeErrorCode( ScrubErrc::kBackupFailure, 0 ) );
            }
        }

        auto copyResult = copyPreservingMetadata( path, backupPath );
        if ( !copyResult.HasValue() ) {
            return result::FromError( MakeErrorCode( ScrubErrc::kBackupFailure, 0 ) );
        }

        auto verifyResult = verifyCopy( path, backupPath );
        if ( !verifyResult.HasValue() ) {
            return result::FromError( MakeErrorCode( ScrubErrc::kBackupFailure, 0 ) );
        }

        SCRUB_LOG_INFO << "Backup created: " << backupPath;
        return result::FromValue( backupPath );
    }

    core::Result< void > BackupGuard::Restore( const core::String& path ) const noexcept
    {
        using result = core::Result< void >;

        core::String backupPath = BackupPathFor( path );
        if ( !core::File::Util::exists( backupPath.data() ) ) {
            SCRUB_LOG_ERROR << "No backup to restore from: " << backupPath;
            return result::FromError( MakeErrorCode( ScrubErrc::kRestoreFailure, 0 ) );
        }

        if ( core::File::Util::exists( path.data() ) && !FileLock::IsWritable( path ) ) {
            // best effort, the copy below reports the real failure
            auto unlocked = FileLock::Unlock( path );
            if ( !unlocked.HasValue() ) {
                SCRUB_LOG_WARN << "Could not unlock " << path << " before restore";
            }
        }

        auto copyResult = copyPreservingMetadata( backupPath, path );
        if ( !copyResult.HasValue() ) {
            return result::FromError( MakeErrorCode( ScrubErrc::kRestoreFailure, 0 ) );
        }

        SCRUB_LOG_INFO << "Restored " << path << " from backup";
        return result::FromValue();
    }

    core::Result< void > BackupGuard::copyPreservingMetadata( const core::String& from, const core::String& to ) const noexcept
    {
        using result = core::Result< void >;

        ::boost::system::error_code ec;
        fs::copy_file( from, to, fs::copy_options::overwrite_existing, ec );
        if ( ec ) {
            SCRUB_LOG_ERROR << "Failed to copy " << from << " to " << to << ": " << ec.message();
            return result::FromError( MakeErrorCode( ScrubErrc::kWriteFailure, ec.value() ) );
        }

        ::std::time_t mtime = fs::last_write_time( from, ec );
        if ( !ec ) {
            fs::last_write_time( to, mtime, ec );
        }
        if ( ec ) {
            SCRUB_LOG_WARN << "Failed to carry modification time to " << to << ": " << ec.message();
        }

        return result::FromValue();
    }

    core::Result< void > BackupGuard::verifyCopy( const core::String& original, const core::String& copy ) const noexcept
    {
        using result = core::Result< void >;

        core::Vector< core::UInt8 > originalData;
        core::Vector< core::UInt8 > copyData;
        if ( !core::File::Util::ReadBinary( original.data(), originalData )
            || !core::File::Util::ReadBinary( copy.data(), copyData ) ) {
            SCRUB_LOG_ERROR << "Backup is not readable: " << copy;
            return result::FromError( ScrubErrc::kBackupFailure );
        }

        if ( originalData.size() != copyData.size() ) {
            SCRUB_LOG_ERROR << "Backup size mismatch: " << copy << " (" << copyData.size()
                            << " != " << originalData.size() << ")";
            return result::FromError( ScrubErrc::kBackupFailure );
        }

        if ( !originalData.empty()
            && core::Crypto::Util::computeSha256( originalData.data(), originalData.size() )
               != core::Crypto::Util::computeSha256( copyData.data(), copyData.size() ) ) {
            SCRUB_LOG_ERROR << "Backup checksum mismatch: " << copy;
            return result::FromError( ScrubErrc::kBackupFailure );
        }

        return result::FromValue();
    }

    MutationOutcome BackupGuard::failed( const DiscoveredStore& store, ScrubOperation op, const core::String& detail ) const noexcept
    {
        MutationOutcome outcome;
        outcome.path        = store.path;
        outcome.operation   = op;
        outcome.status      = OutcomeStatus::kFailedRestored;
        outcome.detail      = detail;
        return outcome;
    }
} // scrub
