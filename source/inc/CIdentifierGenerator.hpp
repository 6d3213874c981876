/**
 * @file CIdentifierGenerator.hpp
 * @brief Fresh random identifiers for regenerated fields
 * @version 1.0
 * @date 2025-11-20
 */
#ifndef SCRUB_IDENTIFIERGENERATOR_HPP
#define SCRUB_IDENTIFIERGENERATOR_HPP

#include <lap/core/CString.hpp>

#include "CScrubDataType.hpp"

namespace scrub
{
    /**
     * @brief Stateless producer of random identifiers
     *
     * Every call draws new random bytes, two calls never return the same
     * value in practice.
     */
    class IdentifierGenerator final
    {
    public:
        /// 64 lowercase hex characters from two random 128 bit values
        static core::String         NewHexId();
        /// Canonical hyphenated version 4 UUID
        static core::String         NewUuid();
        /// Lowercase hex SHA-256 of a random 128 bit value
        static core::String         NewHashId();

        static core::String         Generate( IdentifierKind kind );

    private:
        IdentifierGenerator() = delete;
    };
} // scrub

#endif
