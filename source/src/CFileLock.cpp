#include "CFileLock.hpp"

#include <boost/filesystem.hpp>
#include <boost/system/error_code.hpp>

#if defined( __APPLE__ )
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace scrub
{
    namespace fs = ::boost::filesystem;

    namespace
    {
        const fs::perms kWriteBits = fs::owner_write | fs::group_write | fs::others_write;

#if defined( __APPLE__ )
        void setImmutable( const core::String& path, core::Bool immutable )
        {
            struct stat st;
            if ( ::stat( path.c_str(), &st ) != 0 ) return;

            unsigned int flags = immutable ? ( st.st_flags | UF_IMMUTABLE ) : ( st.st_flags & ~UF_IMMUTABLE );
            if ( ::chflags( path.c_str(), flags ) != 0 ) {
                SCRUB_LOG_DEBUG << "chflags failed on " << path;
            }
        }
#endif
    }

    core::Bool FileLock::Lock( core::StringView path ) noexcept
    {
        core::String strPath( path.data(), path.size() );
        ::boost::system::error_code ec;

        fs::permissions( strPath, fs::remove_perms | kWriteBits, ec );
        if ( ec ) {
            SCRUB_LOG_WARN << "Failed to clear write permission of " << strPath << ": " << ec.message();
            return false;
        }

        // an immutable file rejects chmod, so the flag goes on last
#if defined( __APPLE__ )
        setImmutable( strPath, true );
#endif

        SCRUB_LOG_DEBUG << "Locked " << strPath;
        return true;
    }

    core::Result< void > FileLock::Unlock( core::StringView path ) noexcept
    {
        using result = core::Result< void >;

        core::String strPath( path.data(), path.size() );
        ::boost::system::error_code ec;

#if defined( __APPLE__ )
        setImmutable( strPath, false );
#endif

        fs::permissions( strPath, fs::add_perms | fs::owner_write | fs::owner_read, ec );
        if ( ec ) {
            SCRUB_LOG_WARN << "Failed to restore write permission of " << strPath << ": " << ec.message();
            return result::FromError( ScrubErrc::kPermissionFailure );
        }
        return result::FromValue();
    }

    core::Bool FileLock::IsWritable( core::StringView path ) noexcept
    {
        ::boost::system::error_code ec;
        fs::file_status status = fs::status( core::String( path.data(), path.size() ), ec );
        if ( ec ) return false;

        return ( status.permissions() & kWriteBits ) != fs::no_perms;
    }
} // scrub
