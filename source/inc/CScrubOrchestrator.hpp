/**
 * @file CScrubOrchestrator.hpp
 * @brief Discovery, guarded mutation and reporting over all requested stores
 * @version 1.0
 * @date 2025-11-20
 */
#ifndef SCRUB_ORCHESTRATOR_HPP
#define SCRUB_ORCHESTRATOR_HPP

#include <lap/core/CResult.hpp>
#include <lap/core/CString.hpp>
#include <lap/core/CMemory.hpp>
#include <lap/core/CSync.hpp>

#include "CScrubDataType.hpp"
#include "CScrubConfig.hpp"
#include "CStoreLocator.hpp"
#include "CBackupGuard.hpp"
#include "CTermCodec.hpp"

namespace scrub
{
    /**
     * @brief Receives progress messages of a run
     *
     * Calls are fire and forget, a listener cannot influence the run.
     */
    class IScrubListener
    {
    public:
        virtual ~IScrubListener() noexcept = default;

        virtual void                        OnMessage( MessageLevel level, core::StringView message ) noexcept = 0;
    };

    struct ScrubRequest
    {
        core::Vector< ApplicationDescriptor >   descriptors;
        core::Bool                              includeEditorFamily{ false };
        EditorFamilyDescriptor                  editorFamily;
        core::UInt32                            operations{ 0 };
        FieldPlan                               fieldPlan;          // document fields
        FieldPlan                               filePlan;           // identifier files by name

        core::Bool                              Requests( ScrubOperation op ) const noexcept
        {
            return ( operations & static_cast< core::UInt32 >( op ) ) != 0;
        }
    };

    class ScrubReport final
    {
    public:
        void                                    Add( const MutationOutcome& outcome );

        const core::Vector< MutationOutcome >&  Outcomes() const noexcept       { return m_outcomes; }
        core::UInt32                            Succeeded() const noexcept      { return m_succeeded; }
        core::UInt32                            NoOps() const noexcept          { return m_noOps; }
        core::UInt32                            Unsupported() const noexcept    { return m_unsupported; }
        core::UInt32                            Failed() const noexcept         { return m_failed; }
        core::UInt32                            StoresFound() const noexcept    { return m_storesFound; }

        void                                    SetStoresFound( core::UInt32 count ) noexcept { m_storesFound = count; }

        /// @brief True iff at least one store was targeted and every targeted store failed
        core::Bool                              AllFailed() const noexcept;

    private:
        core::Vector< MutationOutcome >         m_outcomes;
        core::UInt32                            m_succeeded{ 0 };
        core::UInt32                            m_noOps{ 0 };
        core::UInt32                            m_unsupported{ 0 };
        core::UInt32                            m_failed{ 0 };
        core::UInt32                            m_storesFound{ 0 };
    };

    /**
     * @brief Runs requested operations over every discovered store
     *
     * A failing store never stops the run. Mutations of one resolved path are
     * serialized process wide, also across orchestrator instances. The path
     * lock is not held while the listener is called.
     */
    class ScrubOrchestrator final
    {
    public:
        IMP_OPERATOR_NEW(ScrubOrchestrator)

    public:
        ScrubReport                         Run( const ScrubRequest& request ) noexcept;

        /// @brief Stores of the request, descriptor stores first, each path once
        core::Vector< DiscoveredStore >     DiscoverAll( const ScrubRequest& request ) const noexcept;

        MutationOutcome                     Mutate( const DiscoveredStore& store, ScrubOperation op,
                                                    const MatchTermSet& terms, const ScrubRequest& request ) noexcept;

        /// @brief Number of paths currently being mutated, entries are dropped when the last mutation ends
        static core::Size                   PathLockCount();

        void                                SetListener( IScrubListener* listener ) noexcept   { m_pListener = listener; }
        const ScrubConfig&                  GetConfig() const noexcept                          { return m_config; }

        explicit ScrubOrchestrator( const ScrubConfig& config, OsClass os = CurrentOsClass() );
        ~ScrubOrchestrator() = default;

    private:
        ScrubOrchestrator( const ScrubOrchestrator& ) = delete;
        ScrubOrchestrator& operator=( const ScrubOrchestrator& ) = delete;

        void                                notify( MessageLevel level, const core::String& message ) const noexcept;
        void                                notifyOutcome( const DiscoveredStore& store, const MutationOutcome& outcome ) const noexcept;

        static core::String                         pathKey( const core::String& path );
        static core::SharedHandle< core::Mutex >    pathMutex( const core::String& key );
        static void                                 releasePathMutex( const core::String& key, core::SharedHandle< core::Mutex > mutex );

    private:
        ScrubConfig                         m_config;
        StoreLocator                        m_locator;
        BackupGuard                         m_guard;
        IScrubListener*                     m_pListener{ nullptr };
    };
} // scrub

#endif
