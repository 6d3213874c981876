#include "CScrubClient.hpp"

#include <cstdio>

namespace scrub
{
namespace client
{
    void ConsoleListener::OnMessage( MessageLevel level, core::StringView message ) noexcept
    {
        const char* prefix = "[INFO]";
        FILE* stream = stdout;

        switch ( level ) {
        case MessageLevel::kSuccess:
            prefix = "[SUCCESS]";
            break;
        case MessageLevel::kWarning:
            prefix = "[WARNING]";
            break;
        case MessageLevel::kError:
            prefix = "[ERROR]";
            stream = stderr;
            break;
        default:
            break;
        }
        fprintf( stream, "%s %.*s\n", prefix, static_cast< int >( message.size() ), message.data() );
    }

    ScrubClient::ScrubClient( const ScrubConfig& config )
        : m_config( config )
        , m_catalog( PlatformEnvironment::FromProcess() )
    {
        ;
    }

    core::Vector< ::std::pair< const ApplicationDescriptor*, core::String > > ScrubClient::ListInstalled() const noexcept
    {
        core::Vector< ::std::pair< const ApplicationDescriptor*, core::String > > installed;

        StoreLocator locator( m_catalog.GetEnvironment().os, m_config.backupSuffix );
        for ( const auto& descriptor : m_catalog.GetDescriptors() ) {
            auto base = locator.ResolveBase( descriptor );
            if ( base.HasValue() ) {
                installed.emplace_back( &descriptor, base.Value() );
            }
        }
        return installed;
    }

    core::Result< void > ScrubClient::ValidateKeys( const core::Vector< core::String >& appKeys ) const noexcept
    {
        for ( const auto& key : appKeys ) {
            if ( m_catalog.Find( key ) == nullptr ) {
                SCRUB_LOG_ERROR << "Unknown application: " << key;
                return core::Result< void >::FromError( MakeErrorCode( ScrubErrc::kInvalidArgument, 0 ) );
            }
        }
        return core::Result< void >::FromValue();
    }

    core::Int32 ScrubClient::Run( core::UInt32 operations, const core::Vector< core::String >& appKeys,
                                  core::Bool includeFamily ) noexcept
    {
        ScrubRequest request;
        request.descriptors         = m_catalog.Select( appKeys );
        // an explicit application selection leaves the family scan out
        request.includeEditorFamily = includeFamily && appKeys.empty();
        request.editorFamily        = m_catalog.GetEditorFamily();
        request.operations          = operations;
        request.fieldPlan           = m_catalog.GetFieldPlan();
        request.filePlan            = m_catalog.GetFilePlan();

        ScrubOrchestrator orchestrator( m_config, m_catalog.GetEnvironment().os );
        orchestrator.SetListener( &m_listener );

        ScrubReport report = orchestrator.Run( request );

        printf( "\nSummary: %u stores, %u succeeded, %u unchanged, %u not applicable, %u failed\n",
                report.StoresFound(), report.Succeeded(), report.NoOps(), report.Unsupported(), report.Failed() );

        if ( report.StoresFound() == 0 || report.AllFailed() ) {
            return 1;
        }
        return 0;
    }
} // client
} // scrub
