/**
 * @file CTermCodec.hpp
 * @brief Decoding of obfuscated seed terms and case-insensitive term matching
 * @version 1.0
 * @date 2025-11-20
 */
#ifndef SCRUB_TERMCODEC_HPP
#define SCRUB_TERMCODEC_HPP

#include <lap/core/CResult.hpp>
#include <lap/core/CString.hpp>

#include "CScrubDataType.hpp"

namespace scrub
{
    /**
     * @brief Ordered, duplicate free list of term variants
     *
     * Built once per invocation by TermCodec::Decode and never changed
     * afterwards. A lowercase copy of every term is kept for matching.
     */
    class MatchTermSet final
    {
    public:
        const core::Vector< core::String >&     Terms() const noexcept          { return m_terms; }
        core::Size                              size() const noexcept           { return m_terms.size(); }
        core::Bool                              empty() const noexcept          { return m_terms.empty(); }
        core::Bool                              Contains( core::StringView term ) const noexcept;

    private:
        friend class TermCodec;

        void                                    add( const core::String& term );

        core::Vector< core::String >            m_terms;
        core::Vector< core::String >            m_lowerTerms;
    };

    class TermCodec final
    {
    public:
        /**
         * @brief Decode seed terms and expand them into their variants
         *
         * Every seed contributes itself, its lowercase, uppercase and
         * capitalized form. Then every distinct lowercase form longer than
         * three characters contributes the suffixed forms "s", "ed", "ing",
         * the capitalized form + "VIP" and the uppercase form + "_".
         * Seeds that do not decode are logged and skipped.
         */
        static MatchTermSet                         Decode( const core::Vector< core::String >& seeds ) noexcept;

        /// @brief Decode one embedded base64 literal
        static core::Result< core::String >         DecodeLiteral( core::StringView encoded ) noexcept;

        /// @brief True iff haystack is non-empty and contains any term, ignoring case
        static core::Bool                           Matches( core::StringView haystack, const MatchTermSet& terms ) noexcept;

        static const core::Vector< core::String >&  DefaultSeeds() noexcept;

        static core::String                         ToLower( core::StringView text );
        static core::String                         ToUpper( core::StringView text );
        static core::String                         Capitalize( core::StringView text );

    private:
        TermCodec() = delete;
    };
} // scrub

#endif
