/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#include <unistd.h>
#include <signal.h>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <thread>
#include <sstream>
#include <Poco/Pipe.h>
#include <Poco/PipeStream.h>
#include <Poco/Exception.h>
#include <Poco/Timespan.h>
#include <Poco/Net/SocketAddress.h>
#include <Poco/Net/StreamSocket.h>
#include "PortReclaimer.h"
#include "ProcessTree.h"
#include "VisorTypes.h"
#include "Exceptions.h"
// -------------------------------------------------------------------------
namespace devvisor
{
    // -------------------------------------------------------------------------
    PortReclaimer::PortReclaimer( std::shared_ptr<DebugStream> log ):
        mylog(log)
    {
        if( !mylog )
        {
            mylog = std::make_shared<DebugStream>();
            mylog->setLogName("PortReclaimer");
        }
    }
    // -------------------------------------------------------------------------
    void PortReclaimer::setGrace( size_t msec )
    {
        grace_msec_ = msec;
    }
    // -------------------------------------------------------------------------
    size_t PortReclaimer::getGrace() const
    {
        return grace_msec_;
    }
    // -------------------------------------------------------------------------
    void PortReclaimer::setLsofCommand( const std::string& cmd )
    {
        lsof_ = cmd;
    }
    // -------------------------------------------------------------------------
    std::shared_ptr<DebugStream> PortReclaimer::log()
    {
        return mylog;
    }
    // -------------------------------------------------------------------------
    std::vector<Poco::Process::PID> PortReclaimer::listeners( int port )
    {
        std::vector<std::string> args = { "-t", "-i", "tcp:" + std::to_string(port), "-s", "TCP:LISTEN" };

        mylog->level1() << "port " << port << ": " << lsof_ << " -t -i tcp:" << port << " -s TCP:LISTEN" << std::endl;

        std::vector<std::string> lines;
        std::string errText;
        int exitCode = 0;

        try
        {
            Poco::Pipe outPipe;
            Poco::Pipe errPipe;

            Poco::ProcessHandle ph = Poco::Process::launch(lsof_, args, nullptr, &outPipe, &errPipe);

            // both pipes are drained at once: lsof may fill either of them first
            std::thread errReader([&errPipe, &errText]
            {
                Poco::PipeInputStream estr(errPipe);
                std::string eline;

                while( std::getline(estr, eline) )
                {
                    eline = trim(eline);

                    if( !eline.empty() )
                        errText += ( errText.empty() ? "" : "; " ) + eline;
                }
            });

            Poco::PipeInputStream istr(outPipe);
            std::string line;

            while( std::getline(istr, line) )
            {
                line = trim(line);

                if( !line.empty() )
                    lines.push_back(line);
            }

            errReader.join();
            exitCode = ph.wait();
        }
        catch( const Poco::Exception& ex )
        {
            throw PortReclaimError("port " + std::to_string(port) + ": can't run " + lsof_ + ": " + ex.displayText());
        }

        // exit code 1 without output: nobody listens on the port
        if( exitCode == 1 && lines.empty() )
            return {};

        if( exitCode != 0 )
        {
            std::ostringstream err;
            err << "port " << port << ": " << lsof_ << " failed with exit code " << exitCode;

            if( !errText.empty() )
                err << " (" << errText << ")";

            throw PortReclaimError(err.str());
        }

        std::vector<Poco::Process::PID> pids;

        for( const auto& l : lines )
        {
            int pid = 0;

            if( !str_to_int(l, pid) || pid <= 0 )
                throw PortReclaimError("port " + std::to_string(port) + ": bad PID '" + l + "' in " + lsof_ + " output");

            pids.push_back(pid);
        }

        return pids;
    }
    // -------------------------------------------------------------------------
    void PortReclaimer::reclaim( int port ) noexcept
    {
        try
        {
            for( const auto& pid : listeners(port) )
                terminate(port, pid);

            if( isListening(port) )
                mylog->warn() << "port " << port << " is still in use after reclaim" << std::endl;
        }
        catch( const PortReclaimError& ex )
        {
            mylog->warn() << ex.what() << std::endl;
        }
        catch( const std::exception& ex )
        {
            mylog->warn() << "port " << port << ": reclaim failed: " << ex.what() << std::endl;
        }
    }
    // -------------------------------------------------------------------------
    void PortReclaimer::terminate( int port, Poco::Process::PID pid )
    {
        if( pid == ::getpid() )
        {
            mylog->warn() << "port " << port << " is held by the supervisor itself (PID " << pid << "), skipped" << std::endl;
            return;
        }

        if( !ProcessTree::isAlive(pid) )
            return;

        mylog->info() << "freeing port " << port << ": terminating PID " << pid << std::endl;

        if( ::kill(pid, SIGTERM) != 0 )
        {
            if( errno == ESRCH )
                return;

            mylog->warn() << "port " << port << ": can't send SIGTERM to PID " << pid
                          << ": " << strerror(errno) << std::endl;
        }

        if( waitGone(pid, grace_msec_) )
            return;

        mylog->warn() << "port " << port << ": PID " << pid << " did not exit in "
                      << grace_msec_ << " msec, killing" << std::endl;

        if( ::kill(pid, SIGKILL) != 0 && errno != ESRCH )
        {
            mylog->warn() << "port " << port << ": can't send SIGKILL to PID " << pid
                          << ": " << strerror(errno) << std::endl;
            return;
        }

        if( !waitGone(pid, grace_msec_) )
            mylog->warn() << "port " << port << ": PID " << pid << " is still alive after SIGKILL" << std::endl;
    }
    // -------------------------------------------------------------------------
    bool PortReclaimer::waitGone( Poco::Process::PID pid, size_t msec )
    {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(msec);

        while( ProcessTree::isAlive(pid) )
        {
            if( std::chrono::steady_clock::now() >= deadline )
                return false;

            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }

        return true;
    }
    // -------------------------------------------------------------------------
    bool PortReclaimer::isListening( int port, size_t timeout_msec ) noexcept
    {
        try
        {
            Poco::Net::SocketAddress addr("127.0.0.1", (Poco::UInt16)port);
            Poco::Net::StreamSocket socket;
            Poco::Timespan timeout(timeout_msec / 1000, (timeout_msec % 1000) * 1000);
            socket.connect(addr, timeout);
            socket.close();
            return true;
        }
        catch( const Poco::Exception& )
        {
            return false;
        }
        catch( const std::exception& )
        {
            return false;
        }
    }
    // -------------------------------------------------------------------------
} // end of namespace devvisor
// -------------------------------------------------------------------------
