/**
 * @file CScrub.hpp
 * @brief StoreScrub public header
 * @version 1.0
 * @date 2025-11-20
 */
#ifndef SCRUB_SCRUB_HPP
#define SCRUB_SCRUB_HPP

#include <lap/core/CCore.hpp>
#include <lap/log/CLog.hpp>

// scrub common
#include "CScrubDataType.hpp"
#include "CScrubErrorDomain.hpp"
#include "CScrubConfig.hpp"

// matching and identifiers
#include "CTermCodec.hpp"
#include "CIdentifierGenerator.hpp"

// discovery
#include "CApplicationCatalog.hpp"
#include "CStoreLocator.hpp"

// mutation
#include "IStoreAdapter.hpp"
#include "CBackupGuard.hpp"
#include "CFileLock.hpp"

#include "CScrubOrchestrator.hpp"

#endif
