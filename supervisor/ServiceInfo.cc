/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#include <sstream>
#include "ServiceInfo.h"
// -------------------------------------------------------------------------
namespace devvisor
{
    // -------------------------------------------------------------------------
    std::string to_string( ProcessStatus st )
    {
        switch( st )
        {
            case ProcessStatus::Starting:
                return "starting";

            case ProcessStatus::Running:
                return "running";

            case ProcessStatus::Exited:
                return "exited";

            case ProcessStatus::Stopping:
                return "stopping";

            case ProcessStatus::Stopped:
                return "stopped";
        }

        return "unknown";
    }
    // -------------------------------------------------------------------------
    std::string ServiceSpec::str() const
    {
        std::ostringstream s;
        s << name << ":" << port;
        return s.str();
    }
    // -------------------------------------------------------------------------
    ManagedProcess::ManagedProcess( const ServiceSpec& s, Poco::Process::PID p ):
        spec(s),
        pid(p),
        startTime(std::chrono::steady_clock::now())
    {
    }
    // -------------------------------------------------------------------------
    std::string ManagedProcess::str() const
    {
        std::ostringstream s;
        s << spec.name << ":" << spec.port << " (PID " << pid << ")";
        return s.str();
    }
    // -------------------------------------------------------------------------
} // end of namespace devvisor
// -------------------------------------------------------------------------
