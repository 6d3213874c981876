#include "CApplicationCatalog.hpp"
#include "CTermCodec.hpp"

#include <algorithm>
#include <cstdlib>
#include <lap/core/CPath.hpp>

namespace scrub
{
    namespace
    {
        const core::Char* getEnv( const core::Char* name )
        {
            const core::Char* value = ::std::getenv( name );
            return value ? value : "";
        }

        // base64 of file and field names, decoded when the catalog is built
        const core::Char* const kEncodedIdentifierFiles[] = {
            "UGVybWFuZW50RGV2aWNlSWQ=",         // JetBrains device id
            "UGVybWFuZW50VXNlcklk"              // JetBrains user id
        };
        const core::Char* const kEncodedMachineIdFile = "bWFjaGluZUlk";

        struct EncodedRule
        {
            const core::Char*   encodedField;
            IdentifierKind      kind;
        };

        const EncodedRule kEncodedTelemetryRules[] = {
            { "dGVsZW1ldHJ5Lm1hY2hpbmVJZA==",       IdentifierKind::kHash },
            { "dGVsZW1ldHJ5LmRldkRldmljZUlk",       IdentifierKind::kUuid },
            { "dGVsZW1ldHJ5Lm1hY01hY2hpbmVJZA==",   IdentifierKind::kHash }
        };

        void appendDecoded( core::Vector< core::String >& names, const core::Char* encoded )
        {
            auto decoded = TermCodec::DecodeLiteral( encoded );
            if ( decoded.HasValue() ) {
                names.push_back( decoded.Value() );
            } else {
                SCRUB_LOG_WARN << "Skipping catalog entry that does not decode: " << encoded;
            }
        }
    }

    PlatformEnvironment PlatformEnvironment::FromProcess() noexcept
    {
        PlatformEnvironment env;
        env.os              = CurrentOsClass();
        env.appData         = getEnv( "APPDATA" );
        env.localAppData    = getEnv( "LOCALAPPDATA" );
        env.home            = getEnv( env.os == OsClass::kWindows ? "USERPROFILE" : "HOME" );
        return env;
    }

    ApplicationCatalog::ApplicationCatalog( const PlatformEnvironment& environment )
        : m_environment( environment )
    {
        addVsCodeLike( "vscode",            "VS Code",              "Code" );
        addVsCodeLike( "vscode-insiders",   "VS Code Insiders",     "Code - Insiders" );
        addVsCodeLike( "cursor",            "Cursor",               "Cursor" );
        addVsCodeLike( "codium",            "VSCodium",             "VSCodium" );

        const core::Vector< core::String > versions{ "2024.3", "2024.2", "2024.1" };
        addJetBrainsIde( "intellij",        "IntelliJ IDEA",        "IntelliJIdea", versions );
        addJetBrainsIde( "pycharm",         "PyCharm",              "PyCharm",      versions );
        addJetBrainsIde( "webstorm",        "WebStorm",             "WebStorm",     versions );
        addJetBrainsIde( "phpstorm",        "PhpStorm",             "PhpStorm",     versions );

        addJetBrainsIdentifiers();
        buildEditorFamily();
        buildFieldPlan();
    }

    const ApplicationDescriptor* ApplicationCatalog::Find( core::StringView key ) const noexcept
    {
        for ( const auto& descriptor : m_descriptors ) {
            if ( descriptor.key == key ) return &descriptor;
        }
        return nullptr;
    }

    core::Vector< ApplicationDescriptor > ApplicationCatalog::Select( const core::Vector< core::String >& keys ) const noexcept
    {
        if ( keys.empty() ) return m_descriptors;

        core::Vector< ApplicationDescriptor > selected;
        for ( const auto& descriptor : m_descriptors ) {
            if ( ::std::find( keys.begin(), keys.end(), descriptor.key ) != keys.end() ) {
                selected.push_back( descriptor );
            }
        }
        return selected;
    }

    core::String ApplicationCatalog::join( const core::String& base, const core::String& sub ) const
    {
        // an unset environment variable yields no candidate root at all
        if ( base.empty() ) return core::String();
        return core::Path::appendString( base, sub );
    }

    void ApplicationCatalog::addVsCodeLike( const core::String& key, const core::String& name, const core::String& folder )
    {
        ApplicationDescriptor descriptor;
        descriptor.key          = key;
        descriptor.displayName  = name;
        descriptor.windowsRoots = { join( m_environment.appData, folder + "/User" ) };
        descriptor.macosRoots   = { join( m_environment.home, "Library/Application Support/" + folder + "/User" ) };
        descriptor.linuxRoots   = { join( m_environment.home, ".config/" + folder + "/User" ) };
        descriptor.stores       = {
            { "globalStorage/state.vscdb",  StoreFormat::kTabular,  false },
            { "globalStorage/storage.json", StoreFormat::kDocument, false }
        };
        descriptor.operations   = ScrubOperation::kPurge | ScrubOperation::kRegenerate;
        m_descriptors.push_back( descriptor );
    }

    void ApplicationCatalog::addJetBrainsIde( const core::String& key, const core::String& name,
                                              const core::String& product,
                                              const core::Vector< core::String >& versions )
    {
        ApplicationDescriptor descriptor;
        descriptor.key          = key;
        descriptor.displayName  = name;
        for ( const auto& version : versions ) {
            descriptor.windowsRoots.push_back( join( m_environment.appData, "JetBrains/" + product + version ) );
            descriptor.macosRoots.push_back( join( m_environment.home, "Library/Application Support/JetBrains/" + product + version ) );
            descriptor.linuxRoots.push_back( join( m_environment.home, ".config/JetBrains/" + product + version ) );
        }
        descriptor.stores       = {
            { "options/other.xml",          StoreFormat::kTree,     false },
            { "options/ide.general.xml",    StoreFormat::kTree,     false }
        };
        descriptor.operations   = static_cast< core::UInt32 >( ScrubOperation::kPurge );
        m_descriptors.push_back( descriptor );
    }

    void ApplicationCatalog::addJetBrainsIdentifiers()
    {
        ApplicationDescriptor descriptor;
        descriptor.key          = "jetbrains-ids";
        descriptor.displayName  = "JetBrains identifiers";
        descriptor.windowsRoots = { join( m_environment.appData, "JetBrains" ),
                                    join( m_environment.localAppData, "JetBrains" ),
                                    join( m_environment.home, "JetBrains" ) };
        descriptor.macosRoots   = { join( m_environment.home, "Library/Application Support/JetBrains" ),
                                    join( m_environment.home, "Library/Preferences/JetBrains" ),
                                    join( m_environment.home, "JetBrains" ) };
        descriptor.linuxRoots   = { join( m_environment.home, ".config/JetBrains" ),
                                    join( m_environment.home, ".local/share/JetBrains" ),
                                    join( m_environment.home, "JetBrains" ) };

        core::Vector< core::String > fileNames;
        for ( const auto* encoded : kEncodedIdentifierFiles ) {
            appendDecoded( fileNames, encoded );
        }
        for ( const auto& fileName : fileNames ) {
            descriptor.stores.push_back( { fileName, StoreFormat::kIdentifierFile, true } );
        }

        descriptor.operations   = static_cast< core::UInt32 >( ScrubOperation::kRegenerate );
        m_descriptors.push_back( descriptor );
    }

    void ApplicationCatalog::buildEditorFamily()
    {
        EditorFamilyDescriptor& family = m_editorFamily;
        family.key              = "vscode-family";
        family.displayName      = "VS Code family";
        family.windowsBases     = { m_environment.appData, m_environment.localAppData, m_environment.home };
        family.macosBases       = { join( m_environment.home, "Library/Application Support" ), m_environment.home };
        family.linuxBases       = { join( m_environment.home, ".config" ), join( m_environment.home, ".local/share" ), m_environment.home };
        family.productNames     = { "Code", "Code - Insiders", "VSCodium", "code-server", "Cursor", "Windsurf", "Zed" };
        family.globalStorageLayouts     = { "User/globalStorage", "data/User/globalStorage" };
        family.workspaceStorageLayouts  = { "User/workspaceStorage", "data/User/workspaceStorage" };

        core::Vector< core::String > machineIdFile;
        appendDecoded( machineIdFile, kEncodedMachineIdFile );
        for ( const auto& fileName : machineIdFile ) {
            family.identifierFileLayouts.push_back( fileName );
            family.identifierFileLayouts.push_back( "data/" + fileName );
        }

        family.storeFiles       = {
            { "state.vscdb",    StoreFormat::kTabular,  false },
            { "storage.json",   StoreFormat::kDocument, false }
        };
        family.operations       = ScrubOperation::kPurge | ScrubOperation::kRegenerate;
    }

    void ApplicationCatalog::buildFieldPlan()
    {
        m_fieldPlan.push_back( { "machineId",   IdentifierKind::kHex } );
        m_fieldPlan.push_back( { "devDeviceId", IdentifierKind::kUuid } );

        for ( const auto& rule : kEncodedTelemetryRules ) {
            auto decoded = TermCodec::DecodeLiteral( rule.encodedField );
            if ( !decoded.HasValue() ) {
                SCRUB_LOG_WARN << "Skipping field plan entry that does not decode: " << rule.encodedField;
                continue;
            }
            m_fieldPlan.push_back( { decoded.Value(), rule.kind } );
        }

        core::Vector< core::String > fileNames;
        for ( const auto* encoded : kEncodedIdentifierFiles ) {
            appendDecoded( fileNames, encoded );
        }
        appendDecoded( fileNames, kEncodedMachineIdFile );
        for ( const auto& fileName : fileNames ) {
            m_filePlan.push_back( { fileName, IdentifierKind::kUuid } );
        }
    }
} // scrub
