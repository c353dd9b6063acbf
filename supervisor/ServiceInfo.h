/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#ifndef ServiceInfo_H_
#define ServiceInfo_H_
// -------------------------------------------------------------------------
#include <string>
#include <vector>
#include <memory>
#include <atomic>
#include <chrono>
#include <utility>
#include <Poco/Process.h>
// -------------------------------------------------------------------------
namespace devvisor
{
    class OutputRelay;

    // Managed process states
    enum class ProcessStatus
    {
        Starting,   // Spawned, not yet registered
        Running,    // Registered and running
        Exited,     // Exited on its own (see exitCode)
        Stopping,   // Graceful stop requested
        Stopped     // Stopped by the shutdown sequence
    };

    std::string to_string( ProcessStatus st );

    /*! Immutable description of one service instance to launch */
    struct ServiceSpec
    {
        std::string name;           //!< unique within a run (with "-<port>" suffix for multi-instance services)
        std::string serviceName;    //!< name from the configuration (without suffix)
        std::string command;        //!< entry point, relative to the project root or absolute
        int port = 0;               //!< 1..65535
        std::vector<std::string> args; //!< extra arguments (may contain ${PORT})

        std::string str() const;    //!< "name:port"
    };

    /*! Global settings of one supervisor run */
    struct SupervisorSettings
    {
        std::string name;
        std::string projectRoot = ".";
        std::vector<std::string> runner = { "go", "run" }; //!< empty - run the entry point directly
        std::string portVariable = "PORT";
        size_t pollInterval_msec = 1000;
        size_t stopTimeout_msec = 10000;
        size_t reclaimGrace_msec = 500;
        bool reclaim = true;

        //! Environment for every child (in document order)
        std::vector< std::pair<std::string, std::string> > environment;
    };

    /*! Runtime record of a spawned service (owned by the ProcessRegistry) */
    struct ManagedProcess
    {
        ManagedProcess( const ServiceSpec& s, Poco::Process::PID p );

        const ServiceSpec spec;
        const Poco::Process::PID pid;

        std::atomic<ProcessStatus> status{ProcessStatus::Starting};
        std::atomic<int> exitCode{0};
        const std::chrono::steady_clock::time_point startTime;

        //! Relay of the combined stdout/stderr of the child
        std::shared_ptr<OutputRelay> relay;

        std::string str() const;    //!< "name:port (PID n)"
    };

} // end of namespace devvisor
// -------------------------------------------------------------------------
#endif // ServiceInfo_H_
// -------------------------------------------------------------------------
