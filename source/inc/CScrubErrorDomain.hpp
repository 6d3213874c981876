/**
 * @file CScrubErrorDomain.hpp
 * @brief Error domain of the StoreScrub module
 * @version 1.0
 * @date 2025-11-20
 *
 * Error taxonomy of the discovery / mutation engine. Errors travel as
 * core::ErrorCode inside core::Result, exactly like the other lap modules.
 */
#ifndef SCRUB_ERRORDOMAIN_HPP
#define SCRUB_ERRORDOMAIN_HPP

#include <exception>
#include <cerrno>
#include <cstring>
#include <lap/core/CErrorCode.hpp>
#include <lap/core/CException.hpp>
#include <lap/core/CMemory.hpp>

namespace scrub
{
    namespace core = ::lap::core;

    enum class ScrubErrc : core::ErrorDomain::CodeType
    {
        kNotFound                   = 1,
        kDecodeFailure              = 2,
        kParseFailure               = 3,
        kWriteFailure               = 4,
        kRestoreFailure             = 5,
        kPermissionFailure          = 6,
        kBackupFailure              = 7,
        kUnsupported                = 8,
        kInvalidArgument            = 9
    };

    inline constexpr const core::Char* ScrubErrMessage( ScrubErrc errCode )
    {
        switch ( errCode ) {
        case ScrubErrc::kNotFound:
            return "The store or base path does not exist.";
        case ScrubErrc::kDecodeFailure:
            return "An encoded term or literal could not be decoded.";
        case ScrubErrc::kParseFailure:
            return "The store content is not valid for its format.";
        case ScrubErrc::kWriteFailure:
            return "Writing the mutated store failed.";
        case ScrubErrc::kRestoreFailure:
            return "Copying the backup back over the store failed, store state is undefined.";
        case ScrubErrc::kPermissionFailure:
            return std::strerror( EACCES );
        case ScrubErrc::kBackupFailure:
            return "The backup copy could not be created or verified.";
        case ScrubErrc::kUnsupported:
            return "The operation is not applicable to this store format.";
        case ScrubErrc::kInvalidArgument:
            return "Invalid argument provided to the function.";
        default:
            return "Unknown error";
        }
    }

    class ScrubException : public core::Exception
    {
    public:
        IMP_OPERATOR_NEW(ScrubException)

        explicit ScrubException ( core::ErrorCode errorCode ) noexcept
            : core::Exception( errorCode )
        {
            ;
        }

        ~ScrubException() noexcept
        {
            ;
        }

        const core::Char* what() const noexcept
        {
            return ScrubErrMessage( static_cast< ScrubErrc > ( Error().Value() ) );
        }
    };

    class ScrubErrorDomain final : public core::ErrorDomain
    {
    public:
        IMP_OPERATOR_NEW(ScrubErrorDomain)

        using Errc          = ScrubErrc;
        using Exception     = ScrubException;

    public:
        const core::Char*                       Name () const noexcept override                                             { return "ScrubErrorDomain"; }
        const core::Char*                       Message ( CodeType errorCode ) const noexcept override                      { return ScrubErrMessage( static_cast< Errc >( errorCode ) ); }
        void                                    ThrowAsException ( const core::ErrorCode &errorCode ) const override        { throw ScrubException( errorCode ); }

        constexpr ScrubErrorDomain () noexcept
            : core::ErrorDomain( 0x8000000000000301 )
        {
            ;
        }
    };

    static constexpr ScrubErrorDomain g_scrubErrorDomain;

    constexpr const core::ErrorDomain& GetScrubDomain () noexcept
    {
        return g_scrubErrorDomain;
    }

    constexpr core::ErrorCode MakeErrorCode ( ScrubErrc code, core::ErrorDomain::SupportDataType data ) noexcept
    {
        return { static_cast< core::ErrorDomain::CodeType >( code ), GetScrubDomain(), data };
    }
} // scrub

#endif
