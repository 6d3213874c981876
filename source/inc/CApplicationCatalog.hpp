/**
 * @file CApplicationCatalog.hpp
 * @brief Static tables of supported applications, editor family and field plans
 * @version 1.0
 * @date 2025-11-20
 */
#ifndef SCRUB_APPLICATIONCATALOG_HPP
#define SCRUB_APPLICATIONCATALOG_HPP

#include <lap/core/CString.hpp>
#include <lap/core/CMemory.hpp>

#include "CScrubDataType.hpp"

namespace scrub
{
    /**
     * @brief The directories candidate roots are built from
     *
     * Taken from the process environment by FromProcess(), tests build one
     * pointing at a scratch tree.
     */
    struct PlatformEnvironment
    {
        OsClass         os{ OsClass::kLinux };
        core::String    home;
        core::String    appData;            // %APPDATA%, Windows only
        core::String    localAppData;       // %LOCALAPPDATA%, Windows only

        static PlatformEnvironment  FromProcess() noexcept;
    };

    /**
     * @brief Immutable catalog built once per process
     *
     * Holds the application descriptors (VS Code like editors, JetBrains
     * IDEs, JetBrains identifier files), the editor family scanned by
     * directory name and the plans used for regeneration.
     */
    class ApplicationCatalog final
    {
    public:
        IMP_OPERATOR_NEW(ApplicationCatalog)

    public:
        const core::Vector< ApplicationDescriptor >&    GetDescriptors() const noexcept     { return m_descriptors; }
        const EditorFamilyDescriptor&                   GetEditorFamily() const noexcept    { return m_editorFamily; }
        /// Plan for document fields
        const FieldPlan&                                GetFieldPlan() const noexcept       { return m_fieldPlan; }
        /// Plan for raw identifier files, keyed by file name
        const FieldPlan&                                GetFilePlan() const noexcept        { return m_filePlan; }
        const PlatformEnvironment&                      GetEnvironment() const noexcept     { return m_environment; }

        /// @brief Descriptor by key, nullptr if unknown
        const ApplicationDescriptor*                    Find( core::StringView key ) const noexcept;

        /// @brief Descriptors whose key is in keys, all of them for an empty list
        core::Vector< ApplicationDescriptor >           Select( const core::Vector< core::String >& keys ) const noexcept;

        explicit ApplicationCatalog( const PlatformEnvironment& environment );
        ~ApplicationCatalog() = default;

    private:
        void                                            addVsCodeLike( const core::String& key, const core::String& name, const core::String& folder );
        void                                            addJetBrainsIde( const core::String& key, const core::String& name,
                                                                         const core::String& product,
                                                                         const core::Vector< core::String >& versions );
        void                                            addJetBrainsIdentifiers();
        void                                            buildEditorFamily();
        void                                            buildFieldPlan();

        core::String                                    join( const core::String& base, const core::String& sub ) const;

    private:
        PlatformEnvironment                             m_environment;
        core::Vector< ApplicationDescriptor >           m_descriptors;
        EditorFamilyDescriptor                          m_editorFamily;
        FieldPlan                                       m_fieldPlan;
        FieldPlan                                       m_filePlan;
    };
} // scrub

#endif
