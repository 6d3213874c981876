/**
 * @file CTabularStoreAdapter.hpp
 * @brief Store adapter for SQLite key/value tables
 * @version 1.0
 * @date 2025-11-20
 */
#ifndef SCRUB_TABULARSTOREADAPTER_HPP
#define SCRUB_TABULARSTOREADAPTER_HPP

#include <sqlite3.h>
#include <lap/core/CMemory.hpp>

#include "IStoreAdapter.hpp"

namespace scrub
{
    /**
     * @brief Purges rows of a key/value table whose key matches a term
     *
     * Table layout:
     * ```sql
     * CREATE TABLE ItemTable (key TEXT UNIQUE ON CONFLICT REPLACE, value BLOB);
     * ```
     *
     * All deletions of one call run inside a single BEGIN IMMEDIATE
     * transaction. The database is opened without SQLITE_OPEN_CREATE and its
     * journal mode is left alone, a store is never created or converted.
     */
    class TabularStoreAdapter final : public IStoreAdapter
    {
    public:
        IMP_OPERATOR_NEW(TabularStoreAdapter)

    public:
        core::Result< MutationOutcome >     Purge( const DiscoveredStore& store, const MatchTermSet& terms ) noexcept override;
        core::Result< MutationOutcome >     Regenerate( const DiscoveredStore& store, const FieldPlan& plan ) noexcept override;
        core::Bool                          Applies( ScrubOperation op ) const noexcept override { return op == ScrubOperation::kPurge; }
        StoreFormat                         GetFormat() const noexcept override { return StoreFormat::kTabular; }

        explicit TabularStoreAdapter( core::StringView table = SCRUB_DEFAULT_TABULAR_TABLE );
        ~TabularStoreAdapter() = default;

    private:
        TabularStoreAdapter( const TabularStoreAdapter& ) = delete;
        TabularStoreAdapter& operator=( const TabularStoreAdapter& ) = delete;

        core::Result< sqlite3* >                        openDatabase( const core::String& path ) const noexcept;
        core::Result< core::Vector< core::String > >    selectMatchingKeys( sqlite3* db, const MatchTermSet& terms ) const noexcept;
        core::Result< core::UInt32 >                    deleteKeys( sqlite3* db, const core::Vector< core::String >& keys ) const noexcept;

        core::Result< void >                beginTransaction( sqlite3* db ) const noexcept;
        core::Result< void >                commitTransaction( sqlite3* db ) const noexcept;
        void                                rollbackTransaction( sqlite3* db ) const noexcept;

        core::ErrorCode                     makeErrorCode( core::Int32 sqliteCode, ScrubErrc fallback ) const noexcept;

    private:
        core::String                        m_strTable;
    };
} // scrub

#endif
