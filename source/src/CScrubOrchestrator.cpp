#include "CScrubOrchestrator.hpp"
#include "CFileLock.hpp"
#include "IStoreAdapter.hpp"

#include <sstream>
#include <boost/filesystem.hpp>
#include <boost/system/error_code.hpp>

namespace scrub
{
    namespace fs = ::boost::filesystem;

    // ==================== ScrubReport ====================

    void ScrubReport::Add( const MutationOutcome& outcome )
    {
        switch ( outcome.status ) {
        case OutcomeStatus::kSuccess:
            ++m_succeeded;
            break;
        case OutcomeStatus::kNoOp:
            ++m_noOps;
            break;
        case OutcomeStatus::kUnsupported:
            ++m_unsupported;
            break;
        default:
            ++m_failed;
            break;
        }
        m_outcomes.push_back( outcome );
    }

    core::Bool ScrubReport::AllFailed() const noexcept
    {
        return m_failed > 0 && m_succeeded == 0 && m_noOps == 0;
    }

    // ==================== ScrubOrchestrator ====================

    ScrubOrchestrator::ScrubOrchestrator( const ScrubConfig& config, OsClass os )
        : m_config( config )
        , m_locator( os, config.backupSuffix )
        , m_guard( config.backupSuffix )
    {
        ;
    }

    namespace
    {
        core::Mutex                                                     s_registryMutex;
        core::Map< core::String, core::SharedHandle< core::Mutex > >    s_pathMutexes;
    }

    core::String ScrubOrchestrator::pathKey( const core::String& path )
    {
        ::boost::system::error_code ec;
        fs::path canonical = fs::canonical( path, ec );
        return ec ? path : canonical.string();
    }

    core::SharedHandle< core::Mutex > ScrubOrchestrator::pathMutex( const core::String& key )
    {
        core::LockGuard lock( s_registryMutex );
        auto& entry = s_pathMutexes[ key ];
        if ( !entry ) {
            entry = ::std::make_shared< core::Mutex >();
        }
        return entry;
    }

    void ScrubOrchestrator::releasePathMutex( const core::String& key, core::SharedHandle< core::Mutex > mutex )
    {
        core::LockGuard lock( s_registryMutex );
        mutex.reset();

        // handles are only copied under the registry lock, so the count is exact here
        auto it = s_pathMutexes.find( key );
        if ( it != s_pathMutexes.end() && it->second.use_count() == 1 ) {
            s_pathMutexes.erase( it );
        }
    }

    core::Size ScrubOrchestrator::PathLockCount()
    {
        core::LockGuard lock( s_registryMutex );
        return s_pathMutexes.size();
    }

    core::Vector< DiscoveredStore > ScrubOrchestrator::DiscoverAll( const ScrubRequest& request ) const noexcept
    {
        core::Vector< DiscoveredStore > stores = m_locator.Discover( request.descriptors );

        if ( request.includeEditorFamily && m_config.includeEditorFamily ) {
            for ( auto& store : m_locator.DiscoverFamily( request.editorFamily ) ) {
                core::Bool duplicate = false;
                for ( const auto& known : stores ) {
                    ::boost::system::error_code ec;
                    if ( known.path == store.path || fs::equivalent( known.path, store.path, ec ) ) {
                        duplicate = true;
                        break;
                    }
                }
                if ( !duplicate ) {
                    stores.push_back( ::std::move( store ) );
                }
            }
        }
        return stores;
    }

    ScrubReport ScrubOrchestrator::Run( const ScrubRequest& request ) noexcept
    {
        ScrubReport report;

        MatchTermSet terms;
        if ( request.Requests( ScrubOperation::kPurge ) ) {
            terms = TermCodec::Decode( m_config.Seeds() );
            if ( terms.empty() ) {
                notify( MessageLevel::kWarning, "No usable search terms, purge will not match anything" );
            }
        }

        core::Vector< DiscoveredStore > stores = DiscoverAll( request );
        report.SetStoresFound( static_cast< core::UInt32 >( stores.size() ) );

        if ( stores.empty() ) {
            notify( MessageLevel::kWarning, "No stores found" );
            return report;
        }
        notify( MessageLevel::kInfo, "Found " + ::std::to_string( stores.size() ) + " stores" );

        for ( const auto& store : stores ) {
            for ( ScrubOperation op : { ScrubOperation::kPurge, ScrubOperation::kRegenerate } ) {
                if ( !request.Requests( op ) || !store.Supports( op ) ) continue;

                MutationOutcome outcome = Mutate( store, op, terms, request );
                notifyOutcome( store, outcome );
                report.Add( outcome );
            }
        }

        SCRUB_LOG_INFO << "Run finished: " << report.Succeeded() << " succeeded, " << report.NoOps() << " unchanged, "
                       << report.Unsupported() << " not applicable, " << report.Failed() << " failed";
        return report;
    }

    MutationOutcome ScrubOrchestrator::Mutate( const DiscoveredStore& store, ScrubOperation op,
                                               const MatchTermSet& terms, const ScrubRequest& request ) noexcept
    {
        auto adapter = CreateStoreAdapter( store.format, m_config );
        if ( !adapter || !adapter->Applies( op ) ) {
            return MutationOutcome::Unsupported( store.path, op );
        }

        const FieldPlan& plan = ( store.format == StoreFormat::kIdentifierFile ) ? request.filePlan : request.fieldPlan;

        // listener code never runs under the path lock
        notify( MessageLevel::kInfo, ::std::string( ToString( op ) ) + " " + store.appName + ": " + store.path );

        const core::String key = pathKey( store.path );
        auto mutex = pathMutex( key );

        MutationOutcome outcome;
        {
            core::LockGuard lock( *mutex );

            outcome = m_guard.Guarded( store, op, [ & ]() {
                return ( op == ScrubOperation::kPurge ) ? adapter->Purge( store, terms ) : adapter->Regenerate( store, plan );
            } );

            if ( op == ScrubOperation::kRegenerate
                && outcome.status == OutcomeStatus::kSuccess
                && store.lockAfterRegenerate
                && m_config.lockIdentifierStores ) {
                if ( !FileLock::Lock( store.path ) ) {
                    outcome.warning = ScrubErrMessage( ScrubErrc::kPermissionFailure );
                }
            }
        }

        releasePathMutex( key, ::std::move( mutex ) );
        return outcome;
    }

    void ScrubOrchestrator::notify( MessageLevel level, const core::String& message ) const noexcept
    {
        switch ( level ) {
        case MessageLevel::kWarning:
            SCRUB_LOG_WARN << message;
            break;
        case MessageLevel::kError:
            SCRUB_LOG_ERROR << message;
            break;
        default:
            SCRUB_LOG_INFO << message;
            break;
        }

        if ( m_pListener ) {
            m_pListener->OnMessage( level, message );
        }
    }

    void ScrubOrchestrator::notifyOutcome( const DiscoveredStore& store, const MutationOutcome& outcome ) const noexcept
    {
        ::std::ostringstream oss;
        oss << store.appName << " " << ToString( outcome.operation ) << " " << ToString( outcome.status );

        switch ( outcome.status ) {
        case OutcomeStatus::kSuccess:
            oss << " (" << outcome.count << " entries): " << outcome.path;
            notify( MessageLevel::kSuccess, oss.str() );
            break;
        case OutcomeStatus::kNoOp:
        case OutcomeStatus::kUnsupported:
            oss << ": " << outcome.path;
            notify( MessageLevel::kInfo, oss.str() );
            break;
        case OutcomeStatus::kNotFound:
            oss << ": " << outcome.path;
            notify( MessageLevel::kWarning, oss.str() );
            break;
        default:
            oss << ": " << outcome.path << " (" << outcome.detail << ")";
            notify( MessageLevel::kError, oss.str() );
            break;
        }

        if ( !outcome.warning.empty() ) {
            notify( MessageLevel::kWarning, "Could not lock " + outcome.path + ": " + outcome.warning );
        }
    }
} // scrub
