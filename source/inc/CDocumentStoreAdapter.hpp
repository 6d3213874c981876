/**
 * @file CDocumentStoreAdapter.hpp
 * @brief Store adapter for JSON documents
 * @version 1.0
 * @date 2025-11-20
 */
#ifndef SCRUB_DOCUMENTSTOREADAPTER_HPP
#define SCRUB_DOCUMENTSTOREADAPTER_HPP

#include <nlohmann/json.hpp>
#include <lap/core/CMemory.hpp>

#include "IStoreAdapter.hpp"

namespace scrub
{
    /**
     * @brief Regenerates identifier fields of a JSON object document
     *
     * A planned field is looked up as a top-level key first. Names with dots
     * that are not top-level keys are followed through nested objects
     * ("a.b" -> root["a"]["b"]). The whole document is written back with two
     * space indentation, member order and unplanned values are kept.
     */
    class DocumentStoreAdapter final : public IStoreAdapter
    {
    public:
        IMP_OPERATOR_NEW(DocumentStoreAdapter)

        using Document = nlohmann::ordered_json;

    public:
        core::Result< MutationOutcome >     Purge( const DiscoveredStore& store, const MatchTermSet& terms ) noexcept override;
        core::Result< MutationOutcome >     Regenerate( const DiscoveredStore& store, const FieldPlan& plan ) noexcept override;
        core::Bool                          Applies( ScrubOperation op ) const noexcept override { return op == ScrubOperation::kRegenerate; }
        StoreFormat                         GetFormat() const noexcept override { return StoreFormat::kDocument; }

        DocumentStoreAdapter() = default;
        ~DocumentStoreAdapter() = default;

        /// @brief Locate a field, nullptr when absent
        static Document*                    FindField( Document& root, const core::String& field ) noexcept;

    private:
        core::Result< Document >            parseFromFile( core::StringView strFile ) const noexcept;
        core::Result< void >                saveToFile( core::StringView strFile, const Document& root ) const noexcept;
    };
} // scrub

#endif
