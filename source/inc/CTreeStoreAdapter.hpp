/**
 * @file CTreeStoreAdapter.hpp
 * @brief Store adapter for XML option trees
 * @version 1.0
 * @date 2025-11-20
 */
#ifndef SCRUB_TREESTOREADAPTER_HPP
#define SCRUB_TREESTOREADAPTER_HPP

#include <pugixml.hpp>
#include <lap/core/CMemory.hpp>

#include "IStoreAdapter.hpp"

namespace scrub
{
    /**
     * @brief Purges matching elements from an XML option tree
     *
     * An element below the root is removed when one of its direct text nodes
     * or one of its attribute values matches. Elements inside a removed
     * element go with it and are not counted again. Two list passes run
     * before that walk and drop recent project entries (RecentProjectMetaInfo)
     * and recent file entries (RecentFiles) by their option value.
     *
     * Comments, processing instructions, the DOCTYPE and the XML declaration
     * are kept.
     */
    class TreeStoreAdapter final : public IStoreAdapter
    {
    public:
        IMP_OPERATOR_NEW(TreeStoreAdapter)

    public:
        core::Result< MutationOutcome >     Purge( const DiscoveredStore& store, const MatchTermSet& terms ) noexcept override;
        core::Result< MutationOutcome >     Regenerate( const DiscoveredStore& store, const FieldPlan& plan ) noexcept override;
        core::Bool                          Applies( ScrubOperation op ) const noexcept override { return op == ScrubOperation::kPurge; }
        StoreFormat                         GetFormat() const noexcept override { return StoreFormat::kTree; }

        TreeStoreAdapter() = default;
        ~TreeStoreAdapter() = default;

    private:
        core::UInt32                        purgeMatchingElements( pugi::xml_node root, const MatchTermSet& terms ) const;
        core::UInt32                        purgeRecentProjects( pugi::xml_document& doc, const MatchTermSet& terms ) const;
        core::UInt32                        purgeRecentFiles( pugi::xml_document& doc, const MatchTermSet& terms ) const;

        static core::Bool                   elementMatches( const pugi::xml_node& element, const MatchTermSet& terms ) noexcept;
        /// Adds node unless an ancestor is already collected, drops collected descendants of node
        static void                         appendOutermost( core::Vector< pugi::xml_node >& entries, const pugi::xml_node& node );
        static core::UInt32                 removeAll( const core::Vector< pugi::xml_node >& entries );
        static void                         collectFlagged( const pugi::xml_node& node, const MatchTermSet& terms,
                                                            core::Vector< pugi::xml_node >& flagged );
    };
} // scrub

#endif
