/**
 * @file CScrubConfig.hpp
 * @brief StoreScrub module configuration
 * @version 1.0
 * @date 2025-11-20
 *
 * Loaded from core::ConfigManager module "scrub". Missing module or keys fall
 * back to the defaults below.
 *
 * Example:
 * ```json
 * "scrub": {
 *     "backupSuffix": ".backup",
 *     "lockIdentifierStores": true,
 *     "includeEditorFamily": true,
 *     "seedTerms": [ "YXVnbWVudA==" ],
 *     "tabularTable": "ItemTable"
 * }
 * ```
 */
#ifndef SCRUB_CONFIG_HPP
#define SCRUB_CONFIG_HPP

#include <nlohmann/json.hpp>
#include <lap/core/CResult.hpp>
#include <lap/core/CString.hpp>

#include "CScrubDataType.hpp"

namespace scrub
{
    class ScrubConfig final
    {
    public:
        core::String                    backupSuffix{ SCRUB_DEFAULT_BACKUP_SUFFIX };
        core::Bool                      lockIdentifierStores{ true };
        core::Bool                      includeEditorFamily{ true };
        core::Vector< core::String >    seedTerms;          // empty means the built-in seeds
        core::String                    tabularTable{ SCRUB_DEFAULT_TABULAR_TABLE };

        /// @brief Read module "scrub" from core::ConfigManager
        static core::Result< ScrubConfig >  Load() noexcept;

        static core::Result< ScrubConfig >  FromJson( const nlohmann::json& moduleConfig ) noexcept;

        core::Result< void >                Validate() const noexcept;

        const core::Vector< core::String >& Seeds() const noexcept;
    };
} // scrub

#endif
