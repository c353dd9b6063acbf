/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#include <chrono>
#include <thread>
#include <iomanip>
#include "Supervisor.h"
#include "Exceptions.h"
// -------------------------------------------------------------------------
namespace devvisor
{
    // -------------------------------------------------------------------------
    Supervisor::Supervisor( const TopologyResolver::Topology& topology, std::shared_ptr<DebugStream> log ):
        topology_(topology),
        mylog(log)
    {
        if( !mylog )
        {
            mylog = std::make_shared<DebugStream>();
            mylog->level(Debug::value("info,warn,crit"));
        }

        mylog->setLogName("devvisor");

        const SupervisorSettings& s = topology_.settings;

        registry_ = std::make_shared<ProcessRegistry>();

        reclaimer_ = std::make_shared<PortReclaimer>(mylog);
        reclaimer_->setGrace(s.reclaimGrace_msec);

        launcher_ = std::make_shared<ProcessLauncher>(s, registry_, reclaimer_, mylog);

        monitor_ = std::make_shared<LivenessMonitor>(registry_, mylog);
        monitor_->setPollInterval(s.pollInterval_msec);

        coordinator_ = std::make_shared<ShutdownCoordinator>(registry_, monitor_, mylog);
        coordinator_->setStopTimeout(s.stopTimeout_msec);
    }
    // -------------------------------------------------------------------------
    Supervisor::~Supervisor()
    {
        // nothing must outlive the supervisor
        if( !registry_->empty() )
            coordinator_->shutdown();

        monitor_->stop();
    }
    // -------------------------------------------------------------------------
    size_t Supervisor::startAll()
    {
        failed_.clear();
        size_t started = 0;

        mylog->info() << "starting " << topology_.services.size() << " service(s), project root: "
                      << topology_.settings.projectRoot << std::endl;

        for( const auto& spec : topology_.services )
        {
            try
            {
                launcher_->launch(spec);
                started++;
            }
            catch( const LaunchError& ex )
            {
                failed_.push_back(spec.name);
                mylog->crit() << "LaunchError(" << to_string(ex.kind()) << "): " << ex.what() << std::endl;
            }
        }

        if( started == 0 )
            mylog->crit() << "no service could be launched" << std::endl;
        else
            mylog->info() << started << " of " << topology_.services.size()
                          << " service(s) started (press Ctrl+C to stop)" << std::endl;

        return started;
    }
    // -------------------------------------------------------------------------
    int Supervisor::run( const std::atomic<bool>& stopRequest )
    {
        monitor_->setStopRequest(&stopRequest);
        monitor_->start();

        while( true )
        {
            if( stopRequest )
            {
                mylog->info() << "termination requested" << std::endl;
                shutdown();
                monitor_->setStopRequest(nullptr);
                return 0;
            }

            if( monitor_->allExited() )
            {
                // nothing is left to stop
                monitor_->stop();
                monitor_->setStopRequest(nullptr);
                return 1;
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }
    // -------------------------------------------------------------------------
    bool Supervisor::shutdown()
    {
        return coordinator_->shutdown();
    }
    // -------------------------------------------------------------------------
    void Supervisor::printRunList( std::ostream& out ) const
    {
        const SupervisorSettings& s = topology_.settings;

        out << "=== devvisor Run List";

        if( !s.name.empty() )
            out << " for " << s.name;

        out << " ===" << std::endl;
        out << std::endl;

        out << "Project root:  " << s.projectRoot << std::endl;
        out << "Runner:        ";

        if( s.runner.empty() )
            out << "(none, entry points are executed directly)";
        else
        {
            for( size_t i = 0; i < s.runner.size(); i++ )
                out << (i ? " " : "") << s.runner[i];
        }

        out << std::endl;
        out << "Port variable: " << s.portVariable << std::endl;
        out << "Reclaim ports: " << (s.reclaim ? "yes" : "no")
            << " (grace " << s.reclaimGrace_msec << " msec)" << std::endl;
        out << "Stop timeout:  " << s.stopTimeout_msec << " msec" << std::endl;
        out << std::endl;

        int num = 1;

        for( const auto& spec : topology_.services )
        {
            out << std::setw(3) << num++ << ". " << spec.name << " (port " << spec.port << ")" << std::endl;

            out << "     command: ";
            const auto cmd = launcher_->commandLine(spec);

            for( size_t i = 0; i < cmd.size(); i++ )
                out << (i ? " " : "") << cmd[i];

            out << std::endl;

            out << "     env:    ";

            for( const auto& kv : launcher_->environment(spec) )
                out << " " << kv.first << "=" << kv.second;

            out << std::endl;
        }

        out << std::endl;
        out << "Total: " << topology_.services.size() << " service(s)" << std::endl;
    }
    // -------------------------------------------------------------------------
    std::vector<std::string> Supervisor::failed() const
    {
        return failed_;
    }
    // -------------------------------------------------------------------------
    const TopologyResolver::Topology& Supervisor::topology() const
    {
        return topology_;
    }
    // -------------------------------------------------------------------------
    std::shared_ptr<ProcessRegistry> Supervisor::registry()
    {
        return registry_;
    }
    // -------------------------------------------------------------------------
    std::shared_ptr<PortReclaimer> Supervisor::reclaimer()
    {
        return reclaimer_;
    }
    // -------------------------------------------------------------------------
    std::shared_ptr<ProcessLauncher> Supervisor::launcher()
    {
        return launcher_;
    }
    // -------------------------------------------------------------------------
    std::shared_ptr<LivenessMonitor> Supervisor::monitor()
    {
        return monitor_;
    }
    // -------------------------------------------------------------------------
    std::shared_ptr<ShutdownCoordinator> Supervisor::coordinator()
    {
        return coordinator_;
    }
    // -------------------------------------------------------------------------
    std::shared_ptr<DebugStream> Supervisor::log()
    {
        return mylog;
    }
    // -------------------------------------------------------------------------
} // end of namespace devvisor
// -------------------------------------------------------------------------
