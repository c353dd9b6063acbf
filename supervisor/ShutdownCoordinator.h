/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#ifndef ShutdownCoordinator_H_
#define ShutdownCoordinator_H_
// -------------------------------------------------------------------------
#include <memory>
#include <atomic>
#include <string>
#include <vector>
#include <utility>
#include <sigc++/sigc++.h>
#include "ProcessRegistry.h"
#include "LivenessMonitor.h"
#include "ProcessTree.h"
#include "Debug.h"
// -------------------------------------------------------------------------
namespace devvisor
{
    /*!
     * Shutdown coordinator - the stop sequence of the whole group.
     *
     * 1. stop the liveness monitor;
     * 2. take the registry in reverse startup order;
     * 3. send SIGINT to every alive process (its descendants first);
     * 4. wait for all of them under one common timeout, polling every 100 msec;
     * 5. SIGKILL (with descendants) whatever is still alive, and every descendant
     *    that has outlived its service (unless its PID now belongs to another process);
     * 6. mark everything Stopped, remove it from the registry, drain output relays.
     *
     * The sequence runs at most once: repeated or concurrent calls of shutdown() return false.
     */
    class ShutdownCoordinator
    {
        public:
            enum class State
            {
                Idle,
                ShuttingDown,
                Terminated
            };

            ShutdownCoordinator( std::shared_ptr<ProcessRegistry> registry,
                                 std::shared_ptr<LivenessMonitor> monitor,
                                 std::shared_ptr<DebugStream> log );

            void setStopTimeout( size_t msec );
            size_t getStopTimeout() const;

            void setPollPeriod( size_t msec );
            void setDrainTimeout( size_t msec );

            /*! Run the stop sequence. Never throws.
             * \return false if the sequence has already been started
             */
            bool shutdown() noexcept;

            State state() const;

            //! number of processes killed after the timeout in the last sequence
            size_t killed() const;

            //! emitted for every process right after the graceful stop request
            typedef sigc::signal<void, std::shared_ptr<ManagedProcess>> Signalled_Signal;
            Signalled_Signal signal_process_signalled();

        private:
            //! PID and its start time
            typedef std::pair<ProcessTree::PID, unsigned long long> Descendant;

            void stopAll();
            //! \return descendants of the process at the moment of the request
            std::vector<Descendant> requestStop( const std::shared_ptr<ManagedProcess>& mp );
            bool reap( const std::shared_ptr<ManagedProcess>& mp, bool block );
            void forceKill( const std::shared_ptr<ManagedProcess>& mp );

            std::shared_ptr<ProcessRegistry> registry_;
            std::shared_ptr<LivenessMonitor> monitor_;
            std::shared_ptr<DebugStream> mylog;

            std::atomic<State> state_{State::Idle};
            std::atomic<size_t> killed_{0};

            size_t stopTimeout_msec_ = 10000;
            size_t pollPeriod_msec_ = 100;
            size_t drainTimeout_msec_ = 1000;

            Signalled_Signal s_signalled;
    };

    std::string to_string( ShutdownCoordinator::State st );

} // end of namespace devvisor
// -------------------------------------------------------------------------
#endif // ShutdownCoordinator_H_
// -------------------------------------------------------------------------
