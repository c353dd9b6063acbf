/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#include <sys/wait.h>
#include <cerrno>
#include <cstring>
#include <chrono>
#include "LivenessMonitor.h"
#include "OutputRelay.h"
// -------------------------------------------------------------------------
namespace devvisor
{
    // -------------------------------------------------------------------------
    LivenessMonitor::LivenessMonitor( std::shared_ptr<ProcessRegistry> registry, std::shared_ptr<DebugStream> log ):
        registry_(registry),
        mylog(log)
    {
        if( !mylog )
            mylog = std::make_shared<DebugStream>();
    }
    // -------------------------------------------------------------------------
    LivenessMonitor::~LivenessMonitor()
    {
        stop();

        if( monitorThread_.joinable() )
            monitorThread_.join();
    }
    // -------------------------------------------------------------------------
    void LivenessMonitor::setPollInterval( size_t msec )
    {
        pollInterval_msec_ = msec;
    }
    // -------------------------------------------------------------------------
    size_t LivenessMonitor::getPollInterval() const
    {
        return pollInterval_msec_;
    }
    // -------------------------------------------------------------------------
    void LivenessMonitor::setStopRequest( const std::atomic<bool>* flag )
    {
        stopRequest_ = flag;
    }
    // -------------------------------------------------------------------------
    void LivenessMonitor::start()
    {
        if( running_ )
            return;

        if( monitorThread_.joinable() )
            monitorThread_.join();

        running_ = true;
        monitorThread_ = std::thread(&LivenessMonitor::monitorLoop, this);
        mylog->level1() << "liveness monitoring started (interval: " << pollInterval_msec_ << " msec)" << std::endl;
    }
    // -------------------------------------------------------------------------
    void LivenessMonitor::stop()
    {
        {
            std::lock_guard<std::mutex> l(waitMutex_);

            if( !running_ )
                return;

            running_ = false;
        }

        waitCond_.notify_all();

        // stop() may be called from a slot connected to our own signals
        if( monitorThread_.joinable() && monitorThread_.get_id() != std::this_thread::get_id() )
            monitorThread_.join();

        mylog->level1() << "liveness monitoring stopped" << std::endl;
    }
    // -------------------------------------------------------------------------
    bool LivenessMonitor::isRunning() const
    {
        return running_;
    }
    // -------------------------------------------------------------------------
    bool LivenessMonitor::allExited() const
    {
        return allExited_;
    }
    // -------------------------------------------------------------------------
    void LivenessMonitor::monitorLoop()
    {
        while( running_ )
        {
            try
            {
                tick();
            }
            catch( const std::exception& ex )
            {
                mylog->crit() << "liveness monitor: " << ex.what() << std::endl;
            }

            std::unique_lock<std::mutex> l(waitMutex_);
            waitCond_.wait_for(l, std::chrono::milliseconds(pollInterval_msec_), [this]
            {
                return !running_;
            });
        }
    }
    // -------------------------------------------------------------------------
    size_t LivenessMonitor::tick()
    {
        size_t exited = 0;
        bool removed = false;

        mylog->level2() << "liveness tick: " << registry_->size() << " process(es)" << std::endl;

        for( const auto& mp : registry_->snapshot() )
        {
            if( stopRequest_ && *stopRequest_ )
            {
                mylog->level1() << "liveness tick skipped: termination requested" << std::endl;
                break;
            }

            // the shutdown sequence owns stopping processes
            if( mp->status != ProcessStatus::Running )
                continue;

            int status = 0;
            pid_t result = waitpid(mp->pid, &status, WNOHANG);

            if( result == 0 )
                continue;

            int exitCode = -1;

            if( result == mp->pid )
                exitCode = decodeStatus(status);
            else if( errno == ECHILD )
                mylog->system() << mp->spec.name << " (PID " << mp->pid << ") already reaped (ECHILD)" << std::endl;
            else
            {
                if( errno != EINTR )
                    mylog->warn() << mp->spec.name << " waitpid error: " << strerror(errno) << std::endl;

                continue;
            }

            mp->exitCode = exitCode;
            mp->status = ProcessStatus::Exited;
            exited++;

            // let the relay print the last lines of the service first
            if( mp->relay )
                mp->relay->waitFinished(100);

            mylog->crit() << "UnexpectedExit: " << mp->spec.name << " (port " << mp->spec.port
                          << ") exited with code " << exitCode << std::endl;

            if( registry_->remove(mp) )
            {
                removed = true;
                s_exited.emit(mp);
            }
        }

        if( removed && registry_->empty() )
        {
            allExited_ = true;
            mylog->crit() << "AllServicesDown: all services have exited" << std::endl;
            s_all_exited.emit();
        }

        return exited;
    }
    // -------------------------------------------------------------------------
    int LivenessMonitor::decodeStatus( int status )
    {
        if( WIFEXITED(status) )
            return WEXITSTATUS(status);

        if( WIFSIGNALED(status) )
            return 128 + WTERMSIG(status);

        return -1;
    }
    // -------------------------------------------------------------------------
    LivenessMonitor::ProcessExited_Signal LivenessMonitor::signal_process_exited()
    {
        return s_exited;
    }
    // -------------------------------------------------------------------------
    LivenessMonitor::AllExited_Signal LivenessMonitor::signal_all_exited()
    {
        return s_all_exited;
    }
    // -------------------------------------------------------------------------
} // end of namespace devvisor
// -------------------------------------------------------------------------
