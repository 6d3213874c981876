/**
 * @file CFileLock.hpp
 * @brief Best effort read-only / immutable marking of store files
 * @version 1.0
 * @date 2025-11-20
 */
#ifndef SCRUB_FILELOCK_HPP
#define SCRUB_FILELOCK_HPP

#include <lap/core/CResult.hpp>
#include <lap/core/CString.hpp>

#include "CScrubDataType.hpp"

namespace scrub
{
    class FileLock final
    {
    public:
        /**
         * @brief Mark a file as not writable
         *
         * Every write permission bit is cleared. On macOS the user immutable
         * flag is set afterwards, failures there are only logged.
         *
         * @return false if the permission change could not be applied
         */
        static core::Bool                   Lock( core::StringView path ) noexcept;

        /// @brief Undo Lock: clear the immutable flag and grant owner write
        static core::Result< void >         Unlock( core::StringView path ) noexcept;

        static core::Bool                   IsWritable( core::StringView path ) noexcept;

    private:
        FileLock() = delete;
    };
} // scrub

#endif
