/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#ifndef ProcessTree_H_
#define ProcessTree_H_
// -------------------------------------------------------------------------
#include <vector>
#include <Poco/Process.h>
// -------------------------------------------------------------------------
namespace devvisor
{
    /*!
     * Helpers over /proc for process trees.
     * "go run" starts the compiled service as its own child, so a stop request
     * has to reach the whole tree, not only the launched process.
     */
    class ProcessTree
    {
        public:
            typedef Poco::Process::PID PID;

            /*! Start time of the process in clock ticks since boot (/proc/<pid>/stat field 22).
             * \return 0 if the process does not exist
             */
            static unsigned long long startTime( PID pid ) noexcept;

            /*! true if pid is alive and is still the process started at startTime
             * (the PID has not been reused by another process)
             */
            static bool isSame( PID pid, unsigned long long startTime ) noexcept;

            //! All descendants of pid, leaves first (pid itself is not included)
            static std::vector<PID> descendants( PID pid );

            //! true if the process exists and is not a zombie
            static bool isAlive( PID pid ) noexcept;

            /*! Send sig to all descendants of pid (leaves first) and then to pid.
             * \return false if the signal could not be sent to pid itself
             */
            static bool signalTree( PID pid, int sig );
    };

} // end of namespace devvisor
// -------------------------------------------------------------------------
#endif // ProcessTree_H_
// -------------------------------------------------------------------------
