/**
 * @file CStoreLocator.hpp
 * @brief Platform aware discovery of application store files
 * @version 1.0
 * @date 2025-11-20
 */
#ifndef SCRUB_STORELOCATOR_HPP
#define SCRUB_STORELOCATOR_HPP

#include <lap/core/CResult.hpp>
#include <lap/core/CString.hpp>
#include <lap/core/CMemory.hpp>

#include "CScrubDataType.hpp"

namespace scrub
{
    /**
     * @brief Resolves descriptors to existing store files
     *
     * Two modes:
     * - Discover: per descriptor the first existing candidate root of the OS
     *   class is the base, declared sub-paths below it that are regular files
     *   become stores
     * - DiscoverFamily: every directory below a family base whose name
     *   contains a product name is scanned for storage directories and
     *   identifier files
     *
     * Unreadable directories are skipped. Results keep descriptor order,
     * directory entries are visited sorted by name, each resolved path is
     * reported once and files carrying the backup suffix never show up.
     */
    class StoreLocator final
    {
    public:
        IMP_OPERATOR_NEW(StoreLocator)

    public:
        core::Vector< DiscoveredStore >     Discover( const core::Vector< ApplicationDescriptor >& descriptors ) const noexcept;
        core::Vector< DiscoveredStore >     DiscoverFamily( const EditorFamilyDescriptor& family ) const noexcept;

        /// @brief First existing candidate root of a descriptor, kNotFound if none exists
        core::Result< core::String >        ResolveBase( const ApplicationDescriptor& descriptor ) const noexcept;

        OsClass                             GetOsClass() const noexcept     { return m_osClass; }

        explicit StoreLocator( OsClass os = CurrentOsClass(), core::StringView backupSuffix = SCRUB_DEFAULT_BACKUP_SUFFIX );
        ~StoreLocator() = default;

        static core::Vector< core::String > SortedChildDirectories( const core::String& dir ) noexcept;

    private:
        void                                scanInstallation( const EditorFamilyDescriptor& family, const core::String& installDir,
                                                              const core::String& installName,
                                                              core::Vector< DiscoveredStore >& stores ) const noexcept;
        void                                scanStorageDirectory( const EditorFamilyDescriptor& family, const core::String& storageDir,
                                                                  const core::String& installName,
                                                                  core::Vector< DiscoveredStore >& stores ) const noexcept;
        void                                appendStore( core::Vector< DiscoveredStore >& stores, DiscoveredStore&& store ) const noexcept;

        core::Bool                          isCandidateFile( const core::String& path ) const noexcept;
        core::Bool                          isBackupName( const core::String& name ) const noexcept;

    private:
        OsClass                             m_osClass;
        core::String                        m_strBackupSuffix;
    };
} // scrub

#endif
