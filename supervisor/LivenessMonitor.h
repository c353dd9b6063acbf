/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#ifndef LivenessMonitor_H_
#define LivenessMonitor_H_
// -------------------------------------------------------------------------
#include <memory>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <sigc++/sigc++.h>
#include "ProcessRegistry.h"
#include "Debug.h"
// -------------------------------------------------------------------------
namespace devvisor
{
    /*!
     * Liveness monitor.
     * Polls every registered process with waitpid(WNOHANG) once per interval.
     * A process that has exited is marked Exited, logged, removed from the registry
     * and reported through signal_process_exited(). When the registry becomes empty
     * signal_all_exited() is emitted.
     *
     * Signals are emitted from the monitor thread; connect slots before start().
     */
    class LivenessMonitor
    {
        public:
            LivenessMonitor( std::shared_ptr<ProcessRegistry> registry, std::shared_ptr<DebugStream> log );
            ~LivenessMonitor();

            void setPollInterval( size_t msec );
            size_t getPollInterval() const;

            /*! Once *flag is raised, exits are no longer reported:
             * the processes belong to the shutdown sequence.
             */
            void setStopRequest( const std::atomic<bool>* flag );

            void start();
            void stop();
            bool isRunning() const;

            /*! One poll over the registry.
             * \return number of processes found exited
             */
            size_t tick();

            //! true after the registry has been emptied by exits
            bool allExited() const;

            typedef sigc::signal<void, std::shared_ptr<ManagedProcess>> ProcessExited_Signal;
            ProcessExited_Signal signal_process_exited();

            typedef sigc::signal<void> AllExited_Signal;
            AllExited_Signal signal_all_exited();

            /*! waitpid() status -> exit code (128+N for a signal death) */
            static int decodeStatus( int status );

        private:
            void monitorLoop();

            std::shared_ptr<ProcessRegistry> registry_;
            std::shared_ptr<DebugStream> mylog;

            std::thread monitorThread_;
            std::atomic<bool> running_{false};
            std::atomic<bool> allExited_{false};
            size_t pollInterval_msec_ = 1000;
            const std::atomic<bool>* stopRequest_ = nullptr;

            std::mutex waitMutex_;
            std::condition_variable waitCond_;

            ProcessExited_Signal s_exited;
            AllExited_Signal s_all_exited;
    };

} // end of namespace devvisor
// -------------------------------------------------------------------------
#endif // LivenessMonitor_H_
// -------------------------------------------------------------------------
