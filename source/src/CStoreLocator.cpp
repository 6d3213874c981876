#include "CStoreLocator.hpp"
#include "CTermCodec.hpp"

#include <algorithm>
#include <boost/filesystem.hpp>
#include <boost/system/error_code.hpp>
#include <lap/core/CPath.hpp>

namespace scrub
{
    namespace fs = ::boost::filesystem;

    StoreLocator::StoreLocator( OsClass os, core::StringView backupSuffix )
        : m_osClass( os )
        , m_strBackupSuffix( backupSuffix.data(), backupSuffix.size() )
    {
        ;
    }

    core::Result< core::String > StoreLocator::ResolveBase( const ApplicationDescriptor& descriptor ) const noexcept
    {
        using result = core::Result< core::String >;

        for ( const auto& root : descriptor.RootsFor( m_osClass ) ) {
            if ( root.empty() ) continue;

            ::boost::system::error_code ec;
            if ( fs::is_directory( root, ec ) ) {
                return result::FromValue( root );
            }
        }
        return result::FromError( ScrubErrc::kNotFound );
    }

    core::Vector< DiscoveredStore > StoreLocator::Discover( const core::Vector< ApplicationDescriptor >& descriptors ) const noexcept
    {
        core::Vector< DiscoveredStore > stores;

        for ( const auto& descriptor : descriptors ) {
            auto base = ResolveBase( descriptor );
            if ( !base.HasValue() ) {
                SCRUB_LOG_DEBUG << descriptor.displayName << " not installed";
                continue;
            }

            SCRUB_LOG_INFO << "Found " << descriptor.displayName << " at " << base.Value();
            for ( const auto& spec : descriptor.stores ) {
                core::String path = core::Path::appendString( base.Value(), spec.relativePath );
                if ( !isCandidateFile( path ) ) continue;

                DiscoveredStore store;
                store.path                  = path;
                store.appKey                = descriptor.key;
                store.appName               = descriptor.displayName;
                store.format                = spec.format;
                store.lockAfterRegenerate   = spec.lockAfterRegenerate;
                store.operations            = descriptor.operations;
                appendStore( stores, ::std::move( store ) );
            }
        }
        return stores;
    }

    core::Vector< DiscoveredStore > StoreLocator::DiscoverFamily( const EditorFamilyDescriptor& family ) const noexcept
    {
        core::Vector< DiscoveredStore > stores;

        core::Vector< core::String > products;
        for ( const auto& product : family.productNames ) {
            products.push_back( TermCodec::ToLower( product ) );
        }

        for ( const auto& base : family.BasesFor( m_osClass ) ) {
            if ( base.empty() ) continue;

            for ( const auto& child : SortedChildDirectories( base ) ) {
                core::String name = fs::path( child ).filename().string();
                core::String lowered = TermCodec::ToLower( name );

                core::Bool matched = ::std::any_of( products.begin(), products.end(),
                                                    [ &lowered ]( const core::String& p ) { return lowered.find( p ) != core::String::npos; } );
                if ( !matched ) continue;

                SCRUB_LOG_DEBUG << "Scanning " << family.displayName << " installation " << child;
                scanInstallation( family, child, name, stores );
            }
        }
        return stores;
    }

    void StoreLocator::scanInstallation( const EditorFamilyDescriptor& family, const core::String& installDir,
                                         const core::String& installName,
                                         core::Vector< DiscoveredStore >& stores ) const noexcept
    {
        ::boost::system::error_code ec;

        for ( const auto& layout : family.globalStorageLayouts ) {
            core::String dir = core::Path::appendString( installDir, layout );
            if ( fs::is_directory( dir, ec ) ) {
                scanStorageDirectory( family, dir, installName, stores );
            }
        }

        for ( const auto& layout : family.workspaceStorageLayouts ) {
            core::String dir = core::Path::appendString( installDir, layout );
            if ( !fs::is_directory( dir, ec ) ) continue;

            for ( const auto& workspace : SortedChildDirectories( dir ) ) {
                scanStorageDirectory( family, workspace, installName, stores );
            }
        }

        for ( const auto& layout : family.identifierFileLayouts ) {
            core::String path = core::Path::appendString( installDir, layout );
            if ( !isCandidateFile( path ) ) continue;

            DiscoveredStore store;
            store.path                  = path;
            store.appKey                = family.key;
            store.appName               = installName;
            store.format                = StoreFormat::kIdentifierFile;
            store.lockAfterRegenerate   = true;
            store.operations            = static_cast< core::UInt32 >( ScrubOperation::kRegenerate );
            appendStore( stores, ::std::move( store ) );
        }
    }

    void StoreLocator::scanStorageDirectory( const EditorFamilyDescriptor& family, const core::String& storageDir,
                                             const core::String& installName,
                                             core::Vector< DiscoveredStore >& stores ) const noexcept
    {
        for ( const auto& spec : family.storeFiles ) {
            core::String path = core::Path::appendString( storageDir, spec.relativePath );
            if ( !isCandidateFile( path ) ) continue;

            DiscoveredStore store;
            store.path                  = path;
            store.appKey                = family.key;
            store.appName               = installName;
            store.format                = spec.format;
            store.lockAfterRegenerate   = spec.lockAfterRegenerate;
            store.operations            = family.operations;
            appendStore( stores, ::std::move( store ) );
        }
    }

    void StoreLocator::appendStore( core::Vector< DiscoveredStore >& stores, DiscoveredStore&& store ) const noexcept
    {
        for ( const auto& known : stores ) {
            ::boost::system::error_code ec;
            if ( known.path == store.path || fs::equivalent( known.path, store.path, ec ) ) {
                SCRUB_LOG_DEBUG << "Skipping duplicate store " << store.path;
                return;
            }
        }

        SCRUB_LOG_DEBUG << "Discovered " << ToString( store.format ) << " store " << store.path;
        stores.push_back( ::std::move( store ) );
    }

    core::Vector< core::String > StoreLocator::SortedChildDirectories( const core::String& dir ) noexcept
    {
        core::Vector< core::String > children;

        ::boost::system::error_code ec;
        fs::directory_iterator it( dir, ec );
        if ( ec ) {
            SCRUB_LOG_DEBUG << "Cannot read directory " << dir << ": " << ec.message();
            return children;
        }

        for ( fs::directory_iterator end; it != end; it.increment( ec ) ) {
            if ( ec ) {
                SCRUB_LOG_DEBUG << "Stopped reading directory " << dir << ": " << ec.message();
                break;
            }

            ::boost::system::error_code statEc;
            if ( fs::is_directory( it->path(), statEc ) ) {
                children.push_back( it->path().string() );
            }
        }

        ::std::sort( children.begin(), children.end() );
        return children;
    }

    core::Bool StoreLocator::isCandidateFile( const core::String& path ) const noexcept
    {
        if ( isBackupName( path ) ) return false;

        ::boost::system::error_code ec;
        return fs::is_regular_file( path, ec );
    }

    core::Bool StoreLocator::isBackupName( const core::String& name ) const noexcept
    {
        return !m_strBackupSuffix.empty()
            && name.size() >= m_strBackupSuffix.size()
            && name.compare( name.size() - m_strBackupSuffix.size(), m_strBackupSuffix.size(), m_strBackupSuffix ) == 0;
    }
} // scrub
