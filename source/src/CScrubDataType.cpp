#include "CScrubDataType.hpp"

namespace scrub
{
    const core::Vector< core::String >& ApplicationDescriptor::RootsFor( OsClass os ) const noexcept
    {
        switch ( os ) {
        case OsClass::kWindows:
            return windowsRoots;
        case OsClass::kMacOS:
            return macosRoots;
        default:
            return linuxRoots;
        }
    }

    core::Bool ApplicationDescriptor::Supports( ScrubOperation op ) const noexcept
    {
        return ( operations & static_cast< core::UInt32 >( op ) ) != 0;
    }

    const core::Vector< core::String >& EditorFamilyDescriptor::BasesFor( OsClass os ) const noexcept
    {
        switch ( os ) {
        case OsClass::kWindows:
            return windowsBases;
        case OsClass::kMacOS:
            return macosBases;
        default:
            return linuxBases;
        }
    }

    MutationOutcome MutationOutcome::Counted( const core::String& path, ScrubOperation op, core::UInt32 count ) noexcept
    {
        MutationOutcome outcome;
        outcome.path        = path;
        outcome.operation   = op;
        outcome.count       = count;
        outcome.status      = ( count == 0 ) ? OutcomeStatus::kNoOp : OutcomeStatus::kSuccess;
        return outcome;
    }

    MutationOutcome MutationOutcome::Unsupported( const core::String& path, ScrubOperation op ) noexcept
    {
        MutationOutcome outcome;
        outcome.path        = path;
        outcome.operation   = op;
        outcome.status      = OutcomeStatus::kUnsupported;
        return outcome;
    }

    const core::Char* ToString( StoreFormat format ) noexcept
    {
        switch ( format ) {
        case StoreFormat::kTabular:         return "tabular";
        case StoreFormat::kDocument:        return "document";
        case StoreFormat::kTree:            return "tree";
        case StoreFormat::kIdentifierFile:  return "identifier-file";
        default:                            return "unknown";
        }
    }

    const core::Char* ToString( OutcomeStatus status ) noexcept
    {
        switch ( status ) {
        case OutcomeStatus::kSuccess:               return "success";
        case OutcomeStatus::kNoOp:                  return "no-op";
        case OutcomeStatus::kUnsupported:           return "unsupported";
        case OutcomeStatus::kFailedRestored:        return "failed-restored";
        case OutcomeStatus::kFailedUnrecoverable:   return "failed-unrecoverable";
        case OutcomeStatus::kNotFound:              return "not-found";
        default:                                    return "unknown";
        }
    }

    const core::Char* ToString( ScrubOperation op ) noexcept
    {
        switch ( op ) {
        case ScrubOperation::kPurge:        return "purge";
        case ScrubOperation::kRegenerate:   return "regenerate";
        default:                            return "unknown";
        }
    }

    const core::Char* ToString( IdentifierKind kind ) noexcept
    {
        switch ( kind ) {
        case IdentifierKind::kHex:  return "hex";
        case IdentifierKind::kUuid: return "uuid";
        case IdentifierKind::kHash: return "hash";
        default:                    return "unknown";
        }
    }

    OsClass CurrentOsClass() noexcept
    {
#if defined( _WIN32 )
        return OsClass::kWindows;
#elif defined( __APPLE__ )
        return OsClass::kMacOS;
#else
        return OsClass::kLinux;
#endif
    }
} // scrub
