/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#include <dirent.h>
#include <signal.h>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <map>
#include "ProcessTree.h"
// -------------------------------------------------------------------------
namespace devvisor
{
    // -------------------------------------------------------------------------
    namespace
    {
        struct ProcStat
        {
            char state = '?';
            ProcessTree::PID ppid = 0;
            unsigned long long startTime = 0;
        };
        // -------------------------------------------------------------------------
        // "pid (comm) state ppid pgrp ... starttime ..."; comm may contain spaces and ')'
        bool readStat( ProcessTree::PID pid, ProcStat& st )
        {
            std::ifstream f("/proc/" + std::to_string(pid) + "/stat");

            if( !f )
                return false;

            std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
            size_t r_paren = content.rfind(')');

            if( r_paren == std::string::npos || r_paren + 2 >= content.size() )
                return false;

            std::istringstream iss(content.substr(r_paren + 2));
            iss >> st.state >> st.ppid;

            // fields 5..21
            std::string skip;

            for( int i = 5; i <= 21 && iss; i++ )
                iss >> skip;

            iss >> st.startTime;
            return !iss.fail();
        }
        // -------------------------------------------------------------------------
        // pid -> ppid for every process in /proc
        std::multimap<ProcessTree::PID, ProcessTree::PID> scanChildren()
        {
            std::multimap<ProcessTree::PID, ProcessTree::PID> tree;

            DIR* dir = opendir("/proc");

            if( !dir )
                return tree;

            struct dirent* entry;

            while( (entry = readdir(dir)) != NULL )
            {
                if( !isdigit(entry->d_name[0]) )
                    continue;

                ProcessTree::PID pid = std::atoi(entry->d_name);
                ProcStat st;

                if( readStat(pid, st) )
                    tree.emplace(st.ppid, pid);
            }

            closedir(dir);
            return tree;
        }
        // -------------------------------------------------------------------------
        void collect( const std::multimap<ProcessTree::PID, ProcessTree::PID>& tree,
                      ProcessTree::PID pid, std::vector<ProcessTree::PID>& result, int depth )
        {
            // protection against pid reuse loops
            if( depth > 64 )
                return;

            auto range = tree.equal_range(pid);

            for( auto it = range.first; it != range.second; ++it )
            {
                collect(tree, it->second, result, depth + 1);
                result.push_back(it->second);
            }
        }
    }
    // -------------------------------------------------------------------------
    unsigned long long ProcessTree::startTime( PID pid ) noexcept
    {
        ProcStat st;

        if( pid <= 0 || !readStat(pid, st) )
            return 0;

        return st.startTime;
    }
    // -------------------------------------------------------------------------
    bool ProcessTree::isSame( PID pid, unsigned long long startTime ) noexcept
    {
        if( startTime == 0 || !isAlive(pid) )
            return false;

        return ( ProcessTree::startTime(pid) == startTime );
    }
    // -------------------------------------------------------------------------
    std::vector<ProcessTree::PID> ProcessTree::descendants( PID pid )
    {
        std::vector<PID> result;

        if( pid <= 0 )
            return result;

        collect(scanChildren(), pid, result, 0);
        return result;
    }
    // -------------------------------------------------------------------------
    bool ProcessTree::isAlive( PID pid ) noexcept
    {
        if( pid <= 0 )
            return false;

        if( ::kill(pid, 0) != 0 && errno != EPERM )
            return false;

        ProcStat st;

        if( !readStat(pid, st) )
            return false;

        return st.state != 'Z' && st.state != 'X';
    }
    // -------------------------------------------------------------------------
    bool ProcessTree::signalTree( PID pid, int sig )
    {
        if( pid <= 0 )
            return false;

        // descendants are best effort: they may exit while we walk the tree
        for( const auto& p : descendants(pid) )
            ::kill(p, sig);

        return ( ::kill(pid, sig) == 0 );
    }
    // -------------------------------------------------------------------------
} // end of namespace devvisor
// -------------------------------------------------------------------------
