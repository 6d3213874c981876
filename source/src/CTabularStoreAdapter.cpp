#include "CTabularStoreAdapter.hpp"

namespace scrub
{
    namespace
    {
        struct DatabaseCloser
        {
            sqlite3* pDB{ nullptr };

            ~DatabaseCloser()
            {
                if ( pDB ) {
                    sqlite3_close( pDB );
                    pDB = nullptr;
                }
            }
        };
    }

    TabularStoreAdapter::TabularStoreAdapter( core::StringView table )
        : m_strTable( table.data(), table.size() )
    {
        ;
    }

    core::Result< MutationOutcome > TabularStoreAdapter::Purge( const DiscoveredStore& store, const MatchTermSet& terms ) noexcept
    {
        using result = core::Result< MutationOutcome >;

        auto dbResult = openDatabase( store.path );
        if ( !dbResult.HasValue() ) {
            return result::FromError( dbResult.Error() );
        }

        DatabaseCloser closer;
        closer.pDB = dbResult.Value();

        auto keysResult = selectMatchingKeys( closer.pDB, terms );
        if ( !keysResult.HasValue() ) {
            return result::FromError( keysResult.Error() );
        }

        const auto& keys = keysResult.Value();
        if ( keys.empty() ) {
            SCRUB_LOG_DEBUG << "No matching rows in " << store.path;
            return result::FromValue( MutationOutcome::Counted( store.path, ScrubOperation::kPurge, 0 ) );
        }

        auto deleteResult = deleteKeys( closer.pDB, keys );
        if ( !deleteResult.HasValue() ) {
            return result::FromError( deleteResult.Error() );
        }

        SCRUB_LOG_INFO << "Removed " << deleteResult.Value() << " rows from " << store.path;
        return result::FromValue( MutationOutcome::Counted( store.path, ScrubOperation::kPurge, deleteResult.Value() ) );
    }

    core::Result< MutationOutcome > TabularStoreAdapter::Regenerate( const DiscoveredStore& store, const FieldPlan& ) noexcept
    {
        return core::Result< MutationOutcome >::FromValue( MutationOutcome::Unsupported( store.path, ScrubOperation::kRegenerate ) );
    }

    // ==================== Database Access ====================

    core::Result< sqlite3* > TabularStoreAdapter::openDatabase( const core::String& path ) const noexcept
    {
        using result = core::Result< sqlite3* >;

        sqlite3* pDB = nullptr;
        core::Int32 rc = sqlite3_open_v2( path.c_str(), &pDB, SQLITE_OPEN_READWRITE, nullptr );
        if ( rc != SQLITE_OK ) {
            SCRUB_LOG_ERROR << "Failed to open SQLite database " << path << ": " << ( pDB ? sqlite3_errmsg( pDB ) : sqlite3_errstr( rc ) );
            if ( pDB ) sqlite3_close( pDB );
            return result::FromError( makeErrorCode( rc, ScrubErrc::kParseFailure ) );
        }

        sqlite3_busy_timeout( pDB, 1000 );

        // forces the header to be read, a foreign file fails here with SQLITE_NOTADB
        sqlite3_stmt* pStmt = nullptr;
        rc = sqlite3_prepare_v2( pDB, "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?;", -1, &pStmt, nullptr );
        if ( rc != SQLITE_OK ) {
            SCRUB_LOG_ERROR << "Not a readable database " << path << ": " << sqlite3_errmsg( pDB );
            sqlite3_close( pDB );
            return result::FromError( makeErrorCode( rc, ScrubErrc::kParseFailure ) );
        }

        sqlite3_bind_text( pStmt, 1, m_strTable.c_str(), -1, SQLITE_TRANSIENT );
        rc = sqlite3_step( pStmt );
        sqlite3_finalize( pStmt );

        if ( rc != SQLITE_ROW ) {
            if ( rc == SQLITE_DONE ) {
                SCRUB_LOG_ERROR << "Table " << m_strTable << " missing in " << path;
            } else {
                SCRUB_LOG_ERROR << "Failed to read schema of " << path << ": " << sqlite3_errmsg( pDB );
            }
            sqlite3_close( pDB );
            return result::FromError( MakeErrorCode( ScrubErrc::kParseFailure, rc ) );
        }

        return result::FromValue( pDB );
    }

    core::Result< core::Vector< core::String > > TabularStoreAdapter::selectMatchingKeys( sqlite3* db, const MatchTermSet& terms ) const noexcept
    {
        using result = core::Result< core::Vector< core::String > >;

        core::String selectSQL = "SELECT key FROM " + m_strTable + ";";
        sqlite3_stmt* pStmt = nullptr;
        core::Int32 rc = sqlite3_prepare_v2( db, selectSQL.c_str(), -1, &pStmt, nullptr );
        if ( rc != SQLITE_OK ) {
            SCRUB_LOG_ERROR << "Failed to prepare select statement: " << sqlite3_errmsg( db );
            return result::FromError( makeErrorCode( rc, ScrubErrc::kParseFailure ) );
        }

        core::Vector< core::String > keys;
        while ( ( rc = sqlite3_step( pStmt ) ) == SQLITE_ROW ) {
            const unsigned char* text = sqlite3_column_text( pStmt, 0 );
            if ( text == nullptr ) continue;

            core::String key( reinterpret_cast< const core::Char* >( text ),
                              static_cast< core::Size >( sqlite3_column_bytes( pStmt, 0 ) ) );
            if ( TermCodec::Matches( key, terms ) ) {
                keys.push_back( key );
            }
        }
        sqlite3_finalize( pStmt );

        if ( rc != SQLITE_DONE ) {
            SCRUB_LOG_ERROR << "Failed to read keys: " << sqlite3_errmsg( db );
            return result::FromError( makeErrorCode( rc, ScrubErrc::kParseFailure ) );
        }

        return result::FromValue( keys );
    }

    core::Result< core::UInt32 > TabularStoreAdapter::deleteKeys( sqlite3* db, const core::Vector< core::String >& keys ) const noexcept
    {
        using result = core::Result< core::UInt32 >;

        auto beginResult = beginTransaction( db );
        if ( !beginResult.HasValue() ) {
            return result::FromError( beginResult.Error() );
        }

        core::String deleteSQL = "DELETE FROM " + m_strTable + " WHERE key = ?;";
        sqlite3_stmt* pStmt = nullptr;
        core::Int32 rc = sqlite3_prepare_v2( db, deleteSQL.c_str(), -1, &pStmt, nullptr );
        if ( rc != SQLITE_OK ) {
            SCRUB_LOG_ERROR << "Failed to prepare delete statement: " << sqlite3_errmsg( db );
            rollbackTransaction( db );
            return result::FromError( makeErrorCode( rc, ScrubErrc::kWriteFailure ) );
        }

        core::UInt32 removed = 0;
        for ( const auto& key : keys ) {
            sqlite3_reset( pStmt );
            sqlite3_bind_text( pStmt, 1, key.c_str(), static_cast< core::Int32 >( key.size() ), SQLITE_TRANSIENT );

            rc = sqlite3_step( pStmt );
            if ( rc != SQLITE_DONE ) {
                SCRUB_LOG_ERROR << "Failed to delete key " << key << ": " << sqlite3_errmsg( db );
                sqlite3_finalize( pStmt );
                rollbackTransaction( db );
                return result::FromError( makeErrorCode( rc, ScrubErrc::kWriteFailure ) );
            }
            removed += static_cast< core::UInt32 >( sqlite3_changes( db ) );
        }
        sqlite3_finalize( pStmt );

        auto commitResult = commitTransaction( db );
        if ( !commitResult.HasValue() ) {
            rollbackTransaction( db );
            return result::FromError( commitResult.Error() );
        }

        return result::FromValue( removed );
    }

    // ==================== Transaction Management ====================

    core::Result< void > TabularStoreAdapter::beginTransaction( sqlite3* db ) const noexcept
    {
        char* errMsg = nullptr;
        core::Int32 rc = sqlite3_exec( db, "BEGIN IMMEDIATE;", nullptr, nullptr, &errMsg );

        if ( rc != SQLITE_OK ) {
            SCRUB_LOG_ERROR << "Failed to begin transaction: " << ( errMsg ? errMsg : "unknown error" );
            if ( errMsg ) sqlite3_free( errMsg );
            return core::Result< void >::FromError( makeErrorCode( rc, ScrubErrc::kWriteFailure ) );
        }
        return core::Result< void >::FromValue();
    }

    core::Result< void > TabularStoreAdapter::commitTransaction( sqlite3* db ) const noexcept
    {
        char* errMsg = nullptr;
        core::Int32 rc = sqlite3_exec( db, "COMMIT;", nullptr, nullptr, &errMsg );

        if ( rc != SQLITE_OK ) {
            SCRUB_LOG_ERROR << "Failed to commit transaction: " << ( errMsg ? errMsg : "unknown error" );
            if ( errMsg ) sqlite3_free( errMsg );
            return core::Result< void >::FromError( makeErrorCode( rc, ScrubErrc::kWriteFailure ) );
        }
        return core::Result< void >::FromValue();
    }

    void TabularStoreAdapter::rollbackTransaction( sqlite3* db ) const noexcept
    {
        if ( sqlite3_get_autocommit( db ) ) return;

        char* errMsg = nullptr;
        core::Int32 rc = sqlite3_exec( db, "ROLLBACK;", nullptr, nullptr, &errMsg );
        if ( rc != SQLITE_OK ) {
            SCRUB_LOG_ERROR << "Failed to rollback transaction: " << ( errMsg ? errMsg : "unknown error" );
            if ( errMsg ) sqlite3_free( errMsg );
        }
    }

    core::ErrorCode TabularStoreAdapter::makeErrorCode( core::Int32 sqliteCode, ScrubErrc fallback ) const noexcept
    {
        switch ( sqliteCode & 0xFF ) {
            case SQLITE_NOTADB:
            case SQLITE_CORRUPT:
            case SQLITE_FORMAT:
            case SQLITE_EMPTY:
            case SQLITE_CANTOPEN:
                return MakeErrorCode( ScrubErrc::kParseFailure, sqliteCode );
            case SQLITE_PERM:
            case SQLITE_READONLY:
            case SQLITE_AUTH:
                return MakeErrorCode( ScrubErrc::kWriteFailure, sqliteCode );
            default:
                return MakeErrorCode( fallback, sqliteCode );
        }
    }
} // scrub
