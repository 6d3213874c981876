/**
 * @file IStoreAdapter.hpp
 * @brief Store Adapter Interface - one mutation contract for every store format
 * @version 1.0
 * @date 2025-11-20
 *
 * Adapters purge matching entries or regenerate planned identifier fields of
 * one store file. They never take backups themselves, that is the job of the
 * BackupGuard wrapped around every call.
 *
 * Error Handling:
 * - All methods return core::Result<MutationOutcome>
 * - An operation that does not apply to the format is a value with status
 *   kUnsupported, not an error
 * - Content that cannot be read is ScrubErrc::kParseFailure, content that
 *   cannot be written back is ScrubErrc::kWriteFailure
 * - A store is left byte-for-byte untouched when nothing matched
 */
#ifndef SCRUB_ISTOREADAPTER_HPP
#define SCRUB_ISTOREADAPTER_HPP

#include <lap/core/CResult.hpp>
#include <lap/core/CString.hpp>
#include <lap/core/CMemory.hpp>

#include "CScrubDataType.hpp"
#include "CTermCodec.hpp"

namespace scrub
{
    class IStoreAdapter
    {
    public:
        IMP_OPERATOR_NEW(IStoreAdapter)

        virtual ~IStoreAdapter() noexcept = default;

        /**
         * @brief Remove every addressable entry whose key or text matches
         *
         * @param store The store to edit in place
         * @param terms Term variants to match case-insensitively
         * @return Outcome counting removed entries, kNoOp when none matched
         */
        virtual core::Result< MutationOutcome >     Purge( const DiscoveredStore& store, const MatchTermSet& terms ) noexcept = 0;

        /**
         * @brief Overwrite each planned field present in the store with a fresh identifier
         *
         * @param store The store to edit in place
         * @param plan Field name to identifier kind mapping
         * @return Outcome counting changed fields, kNoOp when none was present
         */
        virtual core::Result< MutationOutcome >     Regenerate( const DiscoveredStore& store, const FieldPlan& plan ) noexcept = 0;

        /// @brief False for operations that always end as kUnsupported on this format
        virtual core::Bool                          Applies( ScrubOperation op ) const noexcept = 0;

        virtual StoreFormat                         GetFormat() const noexcept = 0;
    };

    class ScrubConfig;

    /**
     * @brief Create the adapter for a store format
     *
     * @return nullptr only for an unknown format tag
     */
    core::UniqueHandle< IStoreAdapter >             CreateStoreAdapter( StoreFormat format, const ScrubConfig& config ) noexcept;
} // scrub

#endif
