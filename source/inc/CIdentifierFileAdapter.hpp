/**
 * @file CIdentifierFileAdapter.hpp
 * @brief Store adapter for files whose whole content is one identifier
 * @version 1.0
 * @date 2025-11-20
 */
#ifndef SCRUB_IDENTIFIERFILEADAPTER_HPP
#define SCRUB_IDENTIFIERFILEADAPTER_HPP

#include <lap/core/CMemory.hpp>

#include "IStoreAdapter.hpp"

namespace scrub
{
    /**
     * @brief Replaces the content of a raw identifier file
     *
     * The file name selects the plan entry (e.g. "PermanentDeviceId",
     * "machineId"). A file locked by an earlier run is unlocked and replaced.
     */
    class IdentifierFileAdapter final : public IStoreAdapter
    {
    public:
        IMP_OPERATOR_NEW(IdentifierFileAdapter)

    public:
        core::Result< MutationOutcome >     Purge( const DiscoveredStore& store, const MatchTermSet& terms ) noexcept override;
        core::Result< MutationOutcome >     Regenerate( const DiscoveredStore& store, const FieldPlan& plan ) noexcept override;
        core::Bool                          Applies( ScrubOperation op ) const noexcept override { return op == ScrubOperation::kRegenerate; }
        StoreFormat                         GetFormat() const noexcept override { return StoreFormat::kIdentifierFile; }

        IdentifierFileAdapter() = default;
        ~IdentifierFileAdapter() = default;
    };
} // scrub

#endif
