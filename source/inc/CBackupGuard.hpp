/**
 * @file CBackupGuard.hpp
 * @brief Backup, mutate, restore-on-failure transaction around one store
 * @version 1.0
 * @date 2025-11-20
 */
#ifndef SCRUB_BACKUPGUARD_HPP
#define SCRUB_BACKUPGUARD_HPP

#include <functional>
#include <lap/core/CResult.hpp>
#include <lap/core/CString.hpp>
#include <lap/core/CMemory.hpp>

#include "CScrubDataType.hpp"

namespace scrub
{
    /**
     * @brief Wraps every in-place mutation of a store file
     *
     * Workflow:
     * 1. Re-check that the store exists (kNotFound outcome otherwise)
     * 2. Copy it to <path><suffix> keeping permissions and modification time,
     *    then verify the copy (size and SHA-256)
     * 3. Run the mutation
     * 4. On error or exception copy the backup back over the store
     *
     * Backups are never removed.
     */
    class BackupGuard final
    {
    public:
        IMP_OPERATOR_NEW(BackupGuard)

        using Mutation = ::std::function< core::Result< MutationOutcome >() >;

    public:
        MutationOutcome                 Guarded( const DiscoveredStore& store, ScrubOperation op, const Mutation& mutation ) const noexcept;

        core::Result< core::String >    CreateBackup( const core::String& path ) const noexcept;
        core::Result< void >            Restore( const core::String& path ) const noexcept;

        core::String                    BackupPathFor( core::StringView path ) const;
        const core::String&             GetSuffix() const noexcept      { return m_strSuffix; }

        explicit BackupGuard( core::StringView suffix = SCRUB_DEFAULT_BACKUP_SUFFIX );
        ~BackupGuard() = default;

    private:
        core::Result< void >            copyPreservingMetadata( const core::String& from, const core::String& to ) const noexcept;
        core::Result< void >            verifyCopy( const core::String& original, const core::String& copy ) const noexcept;

        MutationOutcome                 failed( const DiscoveredStore& store, ScrubOperation op, const core::String& detail ) const noexcept;

    private:
        core::String                    m_strSuffix;
    };
} // scrub

#endif
