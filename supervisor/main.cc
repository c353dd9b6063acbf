/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#include <iostream>
#include <csignal>
#include <atomic>
#include "VisorTypes.h"
#include "Exceptions.h"
#include "TopologyResolver.h"
#include "Supervisor.h"
#include "Debug.h"
// -------------------------------------------------------------------------
using namespace std;
using namespace devvisor;
// -------------------------------------------------------------------------
static std::atomic<bool> g_shutdown{false};
// -------------------------------------------------------------------------
static void signal_handler( int sig )
{
    if( sig == SIGTERM || sig == SIGINT )
        g_shutdown = true;
}
// -------------------------------------------------------------------------
static void print_help( const std::string& prog )
{
    cout << prog << " --confile devvisor.xml [OPTIONS]\n"
         << "\n"
         << "Development process supervisor - starts the gateway and the services,\n"
         << "frees their ports, relays their output and stops them all on Ctrl+C.\n"
         << "\n"
         << "Options:\n"
         << "  --confile FILE        Configuration file (required)\n"
         << "  --name NAME           DevVisor section name (default: first found)\n"
         << "  --project-root DIR    Override projectRoot\n"
         << "  --runner \"CMD ARGS\"   Override runner (\"\" runs the entry point directly)\n"
         << "  --poll-interval MS    Liveness poll interval in ms (default: 1000)\n"
         << "  --stop-timeout MS     Graceful shutdown timeout in ms (default: 10000)\n"
         << "  --reclaim-grace MS    SIGTERM grace before SIGKILL when freeing a port (default: 500)\n"
         << "  --no-reclaim          Don't touch ports before launch\n"
         << "  --logfile FILE        Also write the log to FILE\n"
         << "  --log-levels LIST     Log levels, e.g. \"info,warn,crit,level1\" (default: info,warn,crit)\n"
         << "                        Service output is relayed at the info level: without\n"
         << "                        \"info\" in LIST the output of the services is not shown\n"
         << "  --runlist, --dry-run  Show what will be launched without starting\n"
         << "  --verbose, -v         Enable all log levels\n"
         << "  --help, -h            Show this help\n"
         << "\n"
         << "Log levels:\n";

    Debug::showTags(cout);
    cout << endl;
}
// -------------------------------------------------------------------------
static bool parse_msec( const std::string& opt, const std::string& val, size_t& result )
{
    int v = 0;

    if( !str_to_int(val, v) || v <= 0 )
    {
        cerr << "bad value '" << val << "' for " << opt << " (positive number of milliseconds expected)" << endl;
        return false;
    }

    result = v;
    return true;
}
// -------------------------------------------------------------------------
int main( int argc, char* argv[] )
{
    std::string confFile;
    std::string sectionName;
    std::string projectRoot;
    std::string runner;
    bool hasRunner = false;
    size_t pollInterval = 0;
    size_t stopTimeout = 0;
    size_t reclaimGrace = 0;
    bool noReclaim = false;
    std::string logFile;
    std::string logLevels = "info,warn,crit";
    bool verbose = false;
    bool dryRun = false;

    for( int i = 1; i < argc; i++ )
    {
        std::string arg = argv[i];

        if( arg == "--help" || arg == "-h" )
        {
            print_help(argv[0]);
            return 0;
        }

        if( arg == "--confile" && i + 1 < argc )
        {
            confFile = argv[++i];
            continue;
        }

        if( arg == "--name" && i + 1 < argc )
        {
            sectionName = argv[++i];
            continue;
        }

        if( arg == "--project-root" && i + 1 < argc )
        {
            projectRoot = argv[++i];
            continue;
        }

        if( arg == "--runner" && i + 1 < argc )
        {
            runner = argv[++i];
            hasRunner = true;
            continue;
        }

        if( arg == "--poll-interval" && i + 1 < argc )
        {
            if( !parse_msec(arg, argv[++i], pollInterval) )
                return 1;

            continue;
        }

        if( arg == "--stop-timeout" && i + 1 < argc )
        {
            if( !parse_msec(arg, argv[++i], stopTimeout) )
                return 1;

            continue;
        }

        if( arg == "--reclaim-grace" && i + 1 < argc )
        {
            if( !parse_msec(arg, argv[++i], reclaimGrace) )
                return 1;

            continue;
        }

        if( arg == "--no-reclaim" )
        {
            noReclaim = true;
            continue;
        }

        if( arg == "--logfile" && i + 1 < argc )
        {
            logFile = argv[++i];
            continue;
        }

        if( arg == "--log-levels" && i + 1 < argc )
        {
            logLevels = argv[++i];
            continue;
        }

        if( arg == "--runlist" || arg == "--dry-run" )
        {
            dryRun = true;
            continue;
        }

        if( arg == "--verbose" || arg == "-v" )
        {
            verbose = true;
            continue;
        }

        cerr << "unknown or incomplete option: " << arg << endl;
        print_help(argv[0]);
        return 1;
    }

    if( confFile.empty() )
    {
        cerr << "Error: --confile is required" << endl;
        print_help(argv[0]);
        return 1;
    }

    auto dlog = std::make_shared<DebugStream>();
    dlog->setLogName("devvisor");
    dlog->level( verbose ? Debug::ANY : Debug::value(logLevels) );

    if( !logFile.empty() )
        dlog->logFile(logFile);

    if( !dlog->debugging(Debug::INFO) )
        cerr << "(devvisor): 'info' is not in --log-levels, the output of the services will not be shown" << endl;

    // the main thread runs the stop sequence, the handler only raises the flag
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGINT, signal_handler);

    try
    {
        auto topology = TopologyResolver::load(confFile, sectionName);
        SupervisorSettings& s = topology.settings;

        if( !projectRoot.empty() )
            s.projectRoot = projectRoot;

        if( hasRunner )
            s.runner = TopologyResolver::parseArgs(runner);

        if( pollInterval > 0 )
            s.pollInterval_msec = pollInterval;

        if( stopTimeout > 0 )
            s.stopTimeout_msec = stopTimeout;

        if( reclaimGrace > 0 )
            s.reclaimGrace_msec = reclaimGrace;

        if( noReclaim )
            s.reclaim = false;

        Supervisor sv(topology, dlog);

        if( dryRun )
        {
            sv.printRunList(cout);
            return 0;
        }

        if( sv.startAll() == 0 )
            return 1;

        int exitCode = sv.run(g_shutdown);
        dlog->info() << "devvisor exits with code " << exitCode << endl;
        return exitCode;
    }
    catch( const ConfigError& ex )
    {
        dlog->crit() << "ConfigError: " << ex.what() << endl;
    }
    catch( const devvisor::Exception& ex )
    {
        dlog->crit() << ex << endl;
    }
    catch( const std::exception& ex )
    {
        dlog->crit() << "Error: " << ex.what() << endl;
    }

    return 1;
}
// -------------------------------------------------------------------------
