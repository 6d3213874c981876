#include "IStoreAdapter.hpp"
#include "CTabularStoreAdapter.hpp"
#include "CDocumentStoreAdapter.hpp"
#include "CTreeStoreAdapter.hpp"
#include "CIdentifierFileAdapter.hpp"
#include "CScrubConfig.hpp"

namespace scrub
{
    core::UniqueHandle< IStoreAdapter > CreateStoreAdapter( StoreFormat format, const ScrubConfig& config ) noexcept
    {
        switch ( format ) {
        case StoreFormat::kTabular:
            return ::std::make_unique< TabularStoreAdapter >( config.tabularTable );
        case StoreFormat::kDocument:
            return ::std::make_unique< DocumentStoreAdapter >();
        case StoreFormat::kTree:
            return ::std::make_unique< TreeStoreAdapter >();
        case StoreFormat::kIdentifierFile:
            return ::std::make_unique< IdentifierFileAdapter >();
        default:
            SCRUB_LOG_ERROR << "Store format is not recognized: " << static_cast< core::UInt32 >( format );
            return nullptr;
        }
    }
} // scrub
