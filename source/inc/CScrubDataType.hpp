/**
 * @file CScrubDataType.hpp
 * @brief Common types, constants and log macros of the StoreScrub module
 * @version 1.0
 * @date 2025-11-20
 */
#ifndef SCRUB_DATATYPE_HPP
#define SCRUB_DATATYPE_HPP

// core
#include <lap/core/CTypedef.hpp>
#include <lap/core/CString.hpp>
#include <lap/log/CLog.hpp>

// scrub common
#include "CScrubErrorDomain.hpp"

namespace scrub
{
    // ========================================================================
    // Logging Configuration
    // ========================================================================
    #define SCRUB_LOG_CONTEXT_ID            "SCRB"
    #define SCRUB_LOG_CONTEXT_DESC          "StoreScrub log ctx"

#ifdef SCRUB_DEBUG
    #define SCRUB_LOG                       LAP_LOG( SCRUB_LOG_CONTEXT_ID, SCRUB_LOG_CONTEXT_DESC, ::lap::log::LogLevel::kVerbose )
    #define SCRUB_LOG_VERBOSE               SCRUB_LOG.LogVerbose().WithLocation( __FILE__, __LINE__ )
    #define SCRUB_LOG_DEBUG                 SCRUB_LOG.LogDebug().WithLocation( __FILE__, __LINE__ )
#else
    #define SCRUB_LOG                       LAP_LOG( SCRUB_LOG_CONTEXT_ID, SCRUB_LOG_CONTEXT_DESC, ::lap::log::LogLevel::kInfo )
    #define SCRUB_LOG_VERBOSE               SCRUB_LOG.LogOff()
    #define SCRUB_LOG_DEBUG                 SCRUB_LOG.LogOff()
#endif
    #define SCRUB_LOG_INFO                  SCRUB_LOG.LogInfo().WithLocation( __FILE__, __LINE__ )
    #define SCRUB_LOG_WARN                  SCRUB_LOG.LogWarn().WithLocation( __FILE__, __LINE__ )
    #define SCRUB_LOG_ERROR                 SCRUB_LOG.LogError().WithLocation( __FILE__, __LINE__ )
    #define SCRUB_LOG_FATAL                 SCRUB_LOG.LogFatal().WithLocation( __FILE__, __LINE__ )

    // ========================================================================
    // Default Configuration
    // ========================================================================
    #define SCRUB_CONFIG_MODULE             "scrub"
    #define SCRUB_DEFAULT_BACKUP_SUFFIX     ".backup"
    #define SCRUB_DEFAULT_TABULAR_TABLE     "ItemTable"
    #define SCRUB_MIN_DERIVED_TERM_LENGTH   3U          // only longer terms get suffixed variants
    #define SCRUB_HEX_ID_LENGTH             64U
    #define SCRUB_UUID_LENGTH               36U

    enum class OsClass : core::UInt8
    {
        kWindows    = 0,
        kMacOS      = 1,
        kLinux      = 2
    };

    enum class StoreFormat : core::UInt8
    {
        kTabular            = 0,    // key/value rows in an SQLite table
        kDocument           = 1,    // JSON object document
        kTree               = 2,    // XML option tree
        kIdentifierFile     = 3     // file whose whole content is one identifier
    };

    enum class ScrubOperation : core::UInt32
    {
        kPurge          = 1 << 0,
        kRegenerate     = 1 << 1
    };

    constexpr core::UInt32 operator| ( ScrubOperation left, ScrubOperation right )
    {
        return static_cast< core::UInt32 >( left ) | static_cast< core::UInt32 >( right );
    }

    enum class OutcomeStatus : core::UInt8
    {
        kSuccess                = 0,
        kNoOp                   = 1,
        kUnsupported            = 2,
        kFailedRestored         = 3,
        kFailedUnrecoverable    = 4,
        kNotFound               = 5     // store vanished between discovery and mutation
    };

    enum class IdentifierKind : core::UInt8
    {
        kHex    = 0,    // 64 lowercase hex characters
        kUuid   = 1,    // canonical version-4 UUID
        kHash   = 2     // hex SHA-256 of fresh random bytes
    };

    enum class MessageLevel : core::UInt8
    {
        kInfo       = 0,
        kSuccess    = 1,
        kWarning    = 2,
        kError      = 3
    };

    struct FieldRule
    {
        core::String        field;
        IdentifierKind      kind;
    };

    using FieldPlan = core::Vector< FieldRule >;

    /**
     * @brief One store file an application keeps below its base directory
     */
    struct StoreSpec
    {
        core::String        relativePath;
        StoreFormat         format;
        core::Bool          lockAfterRegenerate{ false };
    };

    /**
     * @brief Static definition of one supported application
     *
     * Candidate roots are tried in order, the first existing one is the base.
     */
    struct ApplicationDescriptor
    {
        core::String                    key;
        core::String                    displayName;
        core::Vector< core::String >    windowsRoots;
        core::Vector< core::String >    macosRoots;
        core::Vector< core::String >    linuxRoots;
        core::Vector< StoreSpec >       stores;
        core::UInt32                    operations{ 0 };

        const core::Vector< core::String >& RootsFor( OsClass os ) const noexcept;
        core::Bool                          Supports( ScrubOperation op ) const noexcept;
    };

    /**
     * @brief Static definition of a family of editors found by directory scan
     *
     * Every subdirectory of a base directory whose name contains one of the
     * product names is an installation. Storage directories inside it are
     * located by layout, workspace storage directories are enumerated child by
     * child.
     */
    struct EditorFamilyDescriptor
    {
        core::String                    key;
        core::String                    displayName;
        core::Vector< core::String >    windowsBases;
        core::Vector< core::String >    macosBases;
        core::Vector< core::String >    linuxBases;
        core::Vector< core::String >    productNames;
        core::Vector< core::String >    globalStorageLayouts;
        core::Vector< core::String >    workspaceStorageLayouts;
        core::Vector< core::String >    identifierFileLayouts;
        core::Vector< StoreSpec >       storeFiles;
        core::UInt32                    operations{ 0 };

        const core::Vector< core::String >& BasesFor( OsClass os ) const noexcept;
    };

    struct DiscoveredStore
    {
        core::String        path;
        core::String        appKey;
        core::String        appName;
        StoreFormat         format;
        core::Bool          lockAfterRegenerate{ false };
        core::UInt32        operations{ 0 };

        core::Bool          Supports( ScrubOperation op ) const noexcept
        {
            return ( operations & static_cast< core::UInt32 >( op ) ) != 0;
        }
    };

    struct MutationOutcome
    {
        core::String        path;
        ScrubOperation      operation{ ScrubOperation::kPurge };
        OutcomeStatus       status{ OutcomeStatus::kNoOp };
        core::UInt32        count{ 0 };
        core::String        detail;     // error detail, verbatim
        core::String        warning;    // soft warning on an otherwise successful outcome

        core::Bool          Failed() const noexcept
        {
            return status == OutcomeStatus::kFailedRestored
                || status == OutcomeStatus::kFailedUnrecoverable
                || status == OutcomeStatus::kNotFound;
        }

        static MutationOutcome Counted( const core::String& path, ScrubOperation op, core::UInt32 count ) noexcept;
        static MutationOutcome Unsupported( const core::String& path, ScrubOperation op ) noexcept;
    };

    const core::Char*   ToString( StoreFormat format ) noexcept;
    const core::Char*   ToString( OutcomeStatus status ) noexcept;
    const core::Char*   ToString( ScrubOperation op ) noexcept;
    const core::Char*   ToString( IdentifierKind kind ) noexcept;

    OsClass             CurrentOsClass() noexcept;
} // scrub

#endif
