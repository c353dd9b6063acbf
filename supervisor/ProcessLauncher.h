/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#ifndef ProcessLauncher_H_
#define ProcessLauncher_H_
// -------------------------------------------------------------------------
#include <memory>
#include <string>
#include <vector>
#include <Poco/Process.h>
#include <Poco/Pipe.h>
#include "ServiceInfo.h"
#include "ProcessRegistry.h"
#include "PortReclaimer.h"
#include "Debug.h"
// -------------------------------------------------------------------------
namespace devvisor
{
    /*!
     * Process launcher.
     * Checks the entry point, frees the port, spawns the child
     * (cwd = project root, stdout+stderr into one pipe, PORT in the environment),
     * registers it and starts its output relay.
     *
     * Every child is the leader of its own process group, so an interrupt from the
     * terminal reaches only the supervisor and the services are stopped in order.
     *
     * Command line of a child: runner words + entry point + expanded args,
     * e.g. "go run ./cmd/auth-service --listen=:8083".
     * With an empty runner the entry point itself is executed.
     */
    class ProcessLauncher
    {
        public:
            ProcessLauncher( const SupervisorSettings& settings,
                             std::shared_ptr<ProcessRegistry> registry,
                             std::shared_ptr<PortReclaimer> reclaimer,
                             std::shared_ptr<DebugStream> log );

            /*! Launch one service.
             * \throw LaunchError (NotFound, SpawnFailed, Duplicate)
             */
            std::shared_ptr<ManagedProcess> launch( const ServiceSpec& spec );

            //! absolute path of the service entry point
            std::string entryPoint( const ServiceSpec& spec ) const;

            //! program to execute (first element) and its arguments
            std::vector<std::string> commandLine( const ServiceSpec& spec ) const;

            //! variables added to the inherited environment of the child
            Poco::Process::Env environment( const ServiceSpec& spec ) const;

            const SupervisorSettings& settings() const;

        private:
            /*! fork + exec in a new process group, stdin from /dev/null.
             * \throw LaunchError(SpawnFailed) if the child could not be executed
             */
            Poco::Process::PID spawn( const ServiceSpec& spec,
                                      const std::vector<std::string>& cmd,
                                      const Poco::Process::Env& env,
                                      Poco::Pipe& outPipe );

            void discard( Poco::Process::PID pid );

            SupervisorSettings settings_;
            std::shared_ptr<ProcessRegistry> registry_;
            std::shared_ptr<PortReclaimer> reclaimer_;
            std::shared_ptr<DebugStream> mylog;
    };

} // end of namespace devvisor
// -------------------------------------------------------------------------
#endif // ProcessLauncher_H_
// -------------------------------------------------------------------------
