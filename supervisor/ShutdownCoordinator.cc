/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#include <sys/wait.h>
#include <signal.h>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <thread>
#include <Poco/Process.h>
#include <Poco/Exception.h>
#include "ShutdownCoordinator.h"
#include "ProcessTree.h"
#include "OutputRelay.h"
// -------------------------------------------------------------------------
namespace devvisor
{
    // -------------------------------------------------------------------------
    std::string to_string( ShutdownCoordinator::State st )
    {
        switch( st )
        {
            case ShutdownCoordinator::State::Idle:
                return "idle";

            case ShutdownCoordinator::State::ShuttingDown:
                return "shutting-down";

            case ShutdownCoordinator::State::Terminated:
                return "terminated";
        }

        return "unknown";
    }
    // -------------------------------------------------------------------------
    ShutdownCoordinator::ShutdownCoordinator( std::shared_ptr<ProcessRegistry> registry,
            std::shared_ptr<LivenessMonitor> monitor,
            std::shared_ptr<DebugStream> log ):
        registry_(registry),
        monitor_(monitor),
        mylog(log)
    {
        if( !mylog )
            mylog = std::make_shared<DebugStream>();
    }
    // -------------------------------------------------------------------------
    void ShutdownCoordinator::setStopTimeout( size_t msec )
    {
        stopTimeout_msec_ = msec;
    }
    // -------------------------------------------------------------------------
    size_t ShutdownCoordinator::getStopTimeout() const
    {
        return stopTimeout_msec_;
    }
    // -------------------------------------------------------------------------
    void ShutdownCoordinator::setPollPeriod( size_t msec )
    {
        pollPeriod_msec_ = msec;
    }
    // -------------------------------------------------------------------------
    void ShutdownCoordinator::setDrainTimeout( size_t msec )
    {
        drainTimeout_msec_ = msec;
    }
    // -------------------------------------------------------------------------
    ShutdownCoordinator::State ShutdownCoordinator::state() const
    {
        return state_;
    }
    // -------------------------------------------------------------------------
    size_t ShutdownCoordinator::killed() const
    {
        return killed_;
    }
    // -------------------------------------------------------------------------
    ShutdownCoordinator::Signalled_Signal ShutdownCoordinator::signal_process_signalled()
    {
        return s_signalled;
    }
    // -------------------------------------------------------------------------
    bool ShutdownCoordinator::shutdown() noexcept
    {
        State expected = State::Idle;

        if( !state_.compare_exchange_strong(expected, State::ShuttingDown) )
        {
            mylog->level1() << "shutdown is already " << to_string(expected) << std::endl;
            return false;
        }

        try
        {
            stopAll();
        }
        catch( const std::exception& ex )
        {
            mylog->crit() << "shutdown: " << ex.what() << std::endl;
        }

        state_ = State::Terminated;
        return true;
    }
    // -------------------------------------------------------------------------
    void ShutdownCoordinator::stopAll()
    {
        mylog->info() << "stopping all services..." << std::endl;

        // the monitor must not reap processes we are stopping
        if( monitor_ )
            monitor_->stop();

        const auto targets = registry_->reverseSnapshot();
        std::vector<std::shared_ptr<ManagedProcess>> pending;
        std::vector<Descendant> descendants;
        killed_ = 0;

        for( const auto& mp : targets )
        {
            // exited before we got to it
            if( reap(mp, false) )
                continue;

            auto tree = requestStop(mp);
            descendants.insert(descendants.end(), tree.begin(), tree.end());
            pending.push_back(mp);
        }

        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(stopTimeout_msec_);

        while( !pending.empty() )
        {
            for( auto it = pending.begin(); it != pending.end(); )
            {
                if( reap(*it, false) )
                    it = pending.erase(it);
                else
                    ++it;
            }

            if( pending.empty() || std::chrono::steady_clock::now() >= deadline )
                break;

            std::this_thread::sleep_for(std::chrono::milliseconds(pollPeriod_msec_));
        }

        for( const auto& mp : pending )
        {
            mylog->warn() << "ShutdownTimeout: " << mp->spec.name << " (PID " << mp->pid
                          << ") did not stop in " << stopTimeout_msec_ << " msec, killing" << std::endl;
            forceKill(mp);
        }

        // background children of a shell ignore SIGINT and outlive their parent
        for( const auto& d : descendants )
        {
            const ProcessTree::PID p = d.first;

            // gone, or the PID has been reused by an unrelated process
            if( !ProcessTree::isSame(p, d.second) )
                continue;

            mylog->warn() << "PID " << p << " survived its service, killing" << std::endl;

            if( ::kill(p, SIGKILL) != 0 && errno != ESRCH )
                mylog->warn() << "can't send SIGKILL to PID " << p << ": " << strerror(errno) << std::endl;
        }

        for( const auto& mp : targets )
        {
            mp->status = ProcessStatus::Stopped;
            registry_->remove(mp);
        }

        for( const auto& mp : targets )
        {
            if( mp->relay && !mp->relay->waitFinished(drainTimeout_msec_) )
                mylog->level1() << mp->spec.name << ": output is still open (held by a descendant), relay detached" << std::endl;
        }

        mylog->info() << "all services stopped" << std::endl;
    }
    // -------------------------------------------------------------------------
    std::vector<ShutdownCoordinator::Descendant> ShutdownCoordinator::requestStop( const std::shared_ptr<ManagedProcess>& mp )
    {
        mp->status = ProcessStatus::Stopping;
        mylog->info() << "stopping " << mp->spec.name << " (PID " << mp->pid << ")" << std::endl;

        std::vector<Descendant> tree;

        try
        {
            for( const auto& p : ProcessTree::descendants(mp->pid) )
            {
                const unsigned long long st = ProcessTree::startTime(p);

                if( st != 0 )
                    tree.emplace_back(p, st);
            }

            // leaves first, so that "go run" does not outlive its service
            for( const auto& d : tree )
            {
                const ProcessTree::PID p = d.first;

                if( ::kill(p, SIGINT) != 0 && errno != ESRCH )
                    mylog->warn() << mp->spec.name << ": can't send SIGINT to PID " << p << ": " << strerror(errno) << std::endl;
            }

            Poco::Process::requestTermination(mp->pid);
        }
        catch( const Poco::Exception& ex )
        {
            mylog->warn() << mp->spec.name << ": stop request failed: " << ex.displayText() << std::endl;
        }
        catch( const std::exception& ex )
        {
            mylog->warn() << mp->spec.name << ": stop request failed: " << ex.what() << std::endl;
        }

        s_signalled.emit(mp);
        return tree;
    }
    // -------------------------------------------------------------------------
    bool ShutdownCoordinator::reap( const std::shared_ptr<ManagedProcess>& mp, bool block )
    {
        int status = 0;
        pid_t result = 0;

        do
        {
            result = waitpid(mp->pid, &status, block ? 0 : WNOHANG);
        }
        while( result < 0 && errno == EINTR );

        if( result == 0 )
            return false;

        if( result == mp->pid )
            mp->exitCode = LivenessMonitor::decodeStatus(status);
        else
        {
            if( errno != ECHILD )
                mylog->warn() << mp->spec.name << " waitpid error: " << strerror(errno) << std::endl;

            mp->exitCode = -1;
        }

        mp->status = ProcessStatus::Stopped;
        mylog->info() << mp->spec.name << " stopped (exit code " << mp->exitCode << ")" << std::endl;
        return true;
    }
    // -------------------------------------------------------------------------
    void ShutdownCoordinator::forceKill( const std::shared_ptr<ManagedProcess>& mp )
    {
        if( !ProcessTree::signalTree(mp->pid, SIGKILL) && errno != ESRCH )
            mylog->warn() << mp->spec.name << ": can't send SIGKILL to PID " << mp->pid << ": " << strerror(errno) << std::endl;

        killed_++;
        reap(mp, true);
    }
    // -------------------------------------------------------------------------
} // end of namespace devvisor
// -------------------------------------------------------------------------
