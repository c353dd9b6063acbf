/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#ifndef Supervisor_H_
#define Supervisor_H_
// -------------------------------------------------------------------------
#include <memory>
#include <atomic>
#include <string>
#include <vector>
#include <iostream>
#include "TopologyResolver.h"
#include "ProcessRegistry.h"
#include "PortReclaimer.h"
#include "ProcessLauncher.h"
#include "LivenessMonitor.h"
#include "ShutdownCoordinator.h"
#include "Debug.h"
// -------------------------------------------------------------------------
namespace devvisor
{
    /*!
     * Supervisor - one run of the service group.
     * startAll() launches the services in topology order (a service that fails
     * to launch is skipped), run() watches them until a stop request or until
     * every service has exited.
     */
    class Supervisor
    {
        public:
            explicit Supervisor( const TopologyResolver::Topology& topology, std::shared_ptr<DebugStream> log = nullptr );
            ~Supervisor();

            /*! \return number of launched services */
            size_t startAll();

            /*! Monitor the services until stopRequest is set or all services have exited.
             * \return exit code of the program: 0 - stopped by request, 1 - all services are down
             */
            int run( const std::atomic<bool>& stopRequest );

            //! stop the group (see ShutdownCoordinator)
            bool shutdown();

            /*! Print what would be launched, in startup order (dry-run mode). */
            void printRunList( std::ostream& out ) const;

            //! names of services that could not be launched by the last startAll()
            std::vector<std::string> failed() const;

            const TopologyResolver::Topology& topology() const;

            std::shared_ptr<ProcessRegistry> registry();
            std::shared_ptr<PortReclaimer> reclaimer();
            std::shared_ptr<ProcessLauncher> launcher();
            std::shared_ptr<LivenessMonitor> monitor();
            std::shared_ptr<ShutdownCoordinator> coordinator();

            std::shared_ptr<DebugStream> log();

        private:
            TopologyResolver::Topology topology_;
            std::shared_ptr<DebugStream> mylog;

            std::shared_ptr<ProcessRegistry> registry_;
            std::shared_ptr<PortReclaimer> reclaimer_;
            std::shared_ptr<ProcessLauncher> launcher_;
            std::shared_ptr<LivenessMonitor> monitor_;
            std::shared_ptr<ShutdownCoordinator> coordinator_;

            std::vector<std::string> failed_;
    };

} // end of namespace devvisor
// -------------------------------------------------------------------------
#endif // Supervisor_H_
// -------------------------------------------------------------------------
