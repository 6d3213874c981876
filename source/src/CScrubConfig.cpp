#include "CScrubConfig.hpp"
#include "CTermCodec.hpp"

#include <lap/core/CConfig.hpp>

namespace scrub
{
    core::Result< ScrubConfig > ScrubConfig::Load() noexcept
    {
        using result = core::Result< ScrubConfig >;

        try {
            auto& configMgr = core::ConfigManager::getInstance();
            auto moduleConfig = configMgr.getModuleConfigJson( SCRUB_CONFIG_MODULE );

            if ( moduleConfig.is_null() || moduleConfig.empty() ) {
                SCRUB_LOG_WARN << "Scrub module config not found, using defaults";
                return result::FromValue( ScrubConfig() );
            }

            return FromJson( moduleConfig );
        } catch ( const ::std::exception& e ) {
            SCRUB_LOG_ERROR << "Failed to load scrub config: " << e.what();
            return result::FromError( MakeErrorCode( ScrubErrc::kInvalidArgument, 0 ) );
        }
    }

    core::Result< ScrubConfig > ScrubConfig::FromJson( const nlohmann::json& moduleConfig ) noexcept
    {
        using result = core::Result< ScrubConfig >;

        if ( !moduleConfig.is_object() ) {
            SCRUB_LOG_ERROR << "Scrub module config is not an object";
            return result::FromError( MakeErrorCode( ScrubErrc::kInvalidArgument, 0 ) );
        }

        try {
            ScrubConfig config;

            config.backupSuffix         = moduleConfig.value( "backupSuffix", SCRUB_DEFAULT_BACKUP_SUFFIX );
            config.lockIdentifierStores = moduleConfig.value( "lockIdentifierStores", true );
            config.includeEditorFamily  = moduleConfig.value( "includeEditorFamily", true );
            config.tabularTable         = moduleConfig.value( "tabularTable", SCRUB_DEFAULT_TABULAR_TABLE );

            if ( moduleConfig.contains( "seedTerms" ) ) {
                for ( const auto& seed : moduleConfig[ "seedTerms" ] ) {
                    config.seedTerms.push_back( seed.get< ::std::string >() );
                }
            }

            auto valid = config.Validate();
            if ( !valid.HasValue() ) {
                return result::FromError( valid.Error() );
            }
            return result::FromValue( config );
        } catch ( const nlohmann::json::exception& e ) {
            SCRUB_LOG_ERROR << "Invalid scrub config: " << e.what();
            return result::FromError( MakeErrorCode( ScrubErrc::kInvalidArgument, 0 ) );
        }
    }

    core::Result< void > ScrubConfig::Validate() const noexcept
    {
        using result = core::Result< void >;

        if ( backupSuffix.empty() ) {
            SCRUB_LOG_ERROR << "backupSuffix cannot be empty";
            return result::FromError( MakeErrorCode( ScrubErrc::kInvalidArgument, 0 ) );
        }

        if ( tabularTable.empty()
            || tabularTable.find_first_not_of( "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_" ) != core::String::npos ) {
            SCRUB_LOG_ERROR << "Invalid tabularTable: " << tabularTable;
            return result::FromError( MakeErrorCode( ScrubErrc::kInvalidArgument, 0 ) );
        }

        return result::FromValue();
    }

    const core::Vector< core::String >& ScrubConfig::Seeds() const noexcept
    {
        return seedTerms.empty() ? TermCodec::DefaultSeeds() : seedTerms;
    }
} // scrub
