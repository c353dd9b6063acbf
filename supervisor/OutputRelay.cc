/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#include <chrono>
#include <Poco/PipeStream.h>
#include <Poco/Exception.h>
#include "OutputRelay.h"
// -------------------------------------------------------------------------
namespace devvisor
{
    // -------------------------------------------------------------------------
    OutputRelay::OutputRelay( const std::string& serviceName, const Poco::Pipe& pipe, std::shared_ptr<DebugStream> log ):
        name_(serviceName),
        pipe_(pipe),
        mylog(log)
    {
    }
    // -------------------------------------------------------------------------
    OutputRelay::~OutputRelay()
    {
        // the last reference is released by the relay thread itself
        if( thr_.joinable() )
            thr_.detach();
    }
    // -------------------------------------------------------------------------
    void OutputRelay::start()
    {
        if( thr_.joinable() )
            return;

        // the thread keeps the relay alive until the end of stream
        auto self = shared_from_this();
        thr_ = std::thread([self]
        {
            self->run();
        });
    }
    // -------------------------------------------------------------------------
    void OutputRelay::run()
    {
        try
        {
            Poco::PipeInputStream istr(pipe_);
            std::string line;

            while( std::getline(istr, line) )
            {
                auto end = line.find_last_not_of(" \t\r\n");

                if( end == std::string::npos )
                    continue;

                line.erase(end + 1);
                mylog->tagged(name_) << line << std::endl;
                lines_++;
            }
        }
        catch( const Poco::Exception& ex )
        {
            mylog->warn() << name_ << ": output relay error: " << ex.displayText() << std::endl;
        }
        catch( const std::exception& ex )
        {
            mylog->warn() << name_ << ": output relay error: " << ex.what() << std::endl;
        }

        {
            std::lock_guard<std::mutex> l(mut_);
            finished_ = true;
        }

        cv_.notify_all();
    }
    // -------------------------------------------------------------------------
    bool OutputRelay::finished() const
    {
        return finished_;
    }
    // -------------------------------------------------------------------------
    bool OutputRelay::waitFinished( size_t timeout_msec )
    {
        std::unique_lock<std::mutex> l(mut_);
        return cv_.wait_for(l, std::chrono::milliseconds(timeout_msec), [this]
        {
            return finished_.load();
        });
    }
    // -------------------------------------------------------------------------
    size_t OutputRelay::lines() const
    {
        return lines_;
    }
    // -------------------------------------------------------------------------
    std::string OutputRelay::getServiceName() const
    {
        return name_;
    }
    // -------------------------------------------------------------------------
} // end of namespace devvisor
// -------------------------------------------------------------------------
