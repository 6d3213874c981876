/**
 * @file CScrubClient.hpp
 * @brief Command line front end of the scrub engine
 * @version 1.0
 * @date 2025-11-20
 */
#ifndef SCRUB_CLIENT_SCRUBCLIENT_HPP
#define SCRUB_CLIENT_SCRUBCLIENT_HPP

#include <lap/core/CString.hpp>

#include "CScrub.hpp"

namespace scrub
{
namespace client
{
    /**
     * @brief Prints run messages to the console, one line each
     */
    class ConsoleListener final : public IScrubListener
    {
    public:
        void OnMessage( MessageLevel level, core::StringView message ) noexcept override;
    };

    class ScrubClient final
    {
    public:
        /// @brief Installed applications with their resolved base directory
        core::Vector< ::std::pair< const ApplicationDescriptor*, core::String > >   ListInstalled() const noexcept;

        /**
         * @brief Run operations over the selected applications
         *
         * @param operations ScrubOperation bits
         * @param appKeys Descriptor keys, empty selects all
         * @param includeFamily Also scan the editor family, ignored when appKeys is not empty
         * @return Process exit code: 1 if nothing was found or every targeted store failed
         */
        core::Int32                         Run( core::UInt32 operations, const core::Vector< core::String >& appKeys,
                                                 core::Bool includeFamily ) noexcept;

        /// @brief kInvalidArgument when a key is not in the catalog
        core::Result< void >                ValidateKeys( const core::Vector< core::String >& appKeys ) const noexcept;

        const ApplicationCatalog&           GetCatalog() const noexcept     { return m_catalog; }

        explicit ScrubClient( const ScrubConfig& config );
        ~ScrubClient() = default;

    private:
        ScrubConfig                         m_config;
        ApplicationCatalog                  m_catalog;
        ConsoleListener                     m_listener;
    };
} // client
} // scrub

#endif
