#include "CTreeStoreAdapter.hpp"

#include <algorithm>

namespace scrub
{
    core::Result< MutationOutcome > TreeStoreAdapter::Purge( const DiscoveredStore& store, const MatchTermSet& terms ) noexcept
    {
        using result = core::Result< MutationOutcome >;

        pugi::xml_document doc;
        pugi::xml_parse_result parsed = doc.load_file( store.path.c_str(),
                                                       pugi::parse_default | pugi::parse_declaration | pugi::parse_comments
                                                       | pugi::parse_pi | pugi::parse_doctype,
                                                       pugi::encoding_auto );
        if ( !parsed ) {
            SCRUB_LOG_WARN.logFormat( "TreeStoreAdapter::Purge parse XML %s failed at offset %d: %s!",
                                      store.path.c_str(), static_cast< core::Int32 >( parsed.offset ), parsed.description() );
            return result::FromError( ScrubErrc::kParseFailure );
        }

        pugi::xml_node root = doc.document_element();
        if ( !root ) {
            SCRUB_LOG_WARN << "XML document without root element: " << store.path;
            return result::FromError( ScrubErrc::kParseFailure );
        }

        core::UInt32 removed = 0;
        try {
            // list passes first, so a recent project entry leaves as a whole
            removed += purgeRecentProjects( doc, terms );
            removed += purgeRecentFiles( doc, terms );
            removed += purgeMatchingElements( root, terms );
        } catch ( const pugi::xpath_exception& e ) {
            SCRUB_LOG_ERROR << "XPath evaluation failed: " << e.what();
            return result::FromError( ScrubErrc::kParseFailure );
        }

        if ( removed == 0 ) {
            SCRUB_LOG_DEBUG << "No matching elements in " << store.path;
            return result::FromValue( MutationOutcome::Counted( store.path, ScrubOperation::kPurge, 0 ) );
        }

        if ( doc.first_child().type() != pugi::node_declaration ) {
            pugi::xml_node decl = doc.prepend_child( pugi::node_declaration );
            decl.append_attribute( "version" ) = "1.0";
            decl.append_attribute( "encoding" ) = "UTF-8";
        }

        if ( !doc.save_file( store.path.c_str(), "  ", pugi::format_default, pugi::encoding_utf8 ) ) {
            SCRUB_LOG_ERROR << "Failed to write XML document " << store.path;
            return result::FromError( ScrubErrc::kWriteFailure );
        }

        SCRUB_LOG_INFO << "Removed " << removed << " elements from " << store.path;
        return result::FromValue( MutationOutcome::Counted( store.path, ScrubOperation::kPurge, removed ) );
    }

    core::Result< MutationOutcome > TreeStoreAdapter::Regenerate( const DiscoveredStore& store, const FieldPlan& ) noexcept
    {
        return core::Result< MutationOutcome >::FromValue( MutationOutcome::Unsupported( store.path, ScrubOperation::kRegenerate ) );
    }

    core::Bool TreeStoreAdapter::elementMatches( const pugi::xml_node& element, const MatchTermSet& terms ) noexcept
    {
        for ( pugi::xml_node child = element.first_child(); child; child = child.next_sibling() ) {
            if ( ( child.type() == pugi::node_pcdata || child.type() == pugi::node_cdata )
                && TermCodec::Matches( child.value(), terms ) ) {
                return true;
            }
        }

        for ( pugi::xml_attribute attr = element.first_attribute(); attr; attr = attr.next_attribute() ) {
            if ( TermCodec::Matches( attr.value(), terms ) ) {
                return true;
            }
        }
        return false;
    }

    void TreeStoreAdapter::appendOutermost( core::Vector< pugi::xml_node >& entries, const pugi::xml_node& node )
    {
        // a node inside a collected entry leaves with it
        for ( pugi::xml_node ancestor = node; ancestor; ancestor = ancestor.parent() ) {
            if ( ::std::find( entries.begin(), entries.end(), ancestor ) != entries.end() ) return;
        }

        // a node holding collected entries replaces them
        entries.erase( ::std::remove_if( entries.begin(), entries.end(),
                                         [ &node ]( const pugi::xml_node& entry ) {
                                             for ( pugi::xml_node up = entry.parent(); up; up = up.parent() ) {
                                                 if ( up == node ) return true;
                                             }
                                             return false;
                                         } ),
                       entries.end() );
        entries.push_back( node );
    }

    void TreeStoreAdapter::collectFlagged( const pugi::xml_node& node, const MatchTermSet& terms,
                                           core::Vector< pugi::xml_node >& flagged )
    {
        for ( pugi::xml_node child = node.first_child(); child; child = child.next_sibling() ) {
            if ( child.type() != pugi::node_element ) continue;

            if ( elementMatches( child, terms ) ) {
                // descendants leave with their flagged ancestor
                flagged.push_back( child );
                continue;
            }
            collectFlagged( child, terms, flagged );
        }
    }

    core::UInt32 TreeStoreAdapter::purgeMatchingElements( pugi::xml_node root, const MatchTermSet& terms ) const
    {
        core::Vector< pugi::xml_node > flagged;
        collectFlagged( root, terms, flagged );

        core::UInt32 removed = 0;
        for ( auto& element : flagged ) {
            pugi::xml_node parent = element.parent();
            if ( parent && parent.remove_child( element ) ) {
                ++removed;
            }
        }
        return removed;
    }

    core::UInt32 TreeStoreAdapter::purgeRecentProjects( pugi::xml_document& doc, const MatchTermSet& terms ) const
    {
        // entries of every list are collected before any is removed, lists may nest
        core::Vector< pugi::xml_node > entries;
        for ( const auto& projectsNode : doc.select_nodes( "//RecentProjectMetaInfo" ) ) {
            pugi::xml_node recentProjects = projectsNode.node();

            for ( const auto& optionNode : recentProjects.select_nodes( ".//option[@name='projectPath']" ) ) {
                pugi::xml_node option = optionNode.node();
                if ( !TermCodec::Matches( option.attribute( "value" ).value(), terms ) ) continue;

                // the whole project entry holding the path goes
                pugi::xml_node entry = ( option.parent() == recentProjects ) ? option : option.parent();
                appendOutermost( entries, entry );
            }
        }
        return removeAll( entries );
    }

    core::UInt32 TreeStoreAdapter::purgeRecentFiles( pugi::xml_document& doc, const MatchTermSet& terms ) const
    {
        core::Vector< pugi::xml_node > entries;
        for ( const auto& recentFilesNode : doc.select_nodes( "//RecentFiles" ) ) {
            for ( const auto& optionNode : recentFilesNode.node().select_nodes( ".//option" ) ) {
                pugi::xml_node option = optionNode.node();
                if ( TermCodec::Matches( option.attribute( "value" ).value(), terms ) ) {
                    appendOutermost( entries, option );
                }
            }
        }
        return removeAll( entries );
    }

    core::UInt32 TreeStoreAdapter::removeAll( const core::Vector< pugi::xml_node >& entries )
    {
        core::UInt32 removed = 0;
        for ( const auto& entry : entries ) {
            if ( entry.parent().remove_child( entry ) ) {
                ++removed;
            }
        }
        return removed;
    }
} // scrub
