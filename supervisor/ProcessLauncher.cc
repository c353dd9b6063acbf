/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#include <sys/wait.h>
#include <unistd.h>
#include <fcntl.h>
#include <signal.h>
#include <cerrno>
#include <cstring>
#include <map>
#include <sstream>
#include <Poco/Pipe.h>
#include <Poco/Path.h>
#include <Poco/File.h>
#include <Poco/Environment.h>
#include <Poco/Exception.h>
#include "ProcessLauncher.h"
#include "ProcessTree.h"
#include "OutputRelay.h"
#include "VisorTypes.h"
#include "Exceptions.h"
// -------------------------------------------------------------------------
extern char** environ;
// -------------------------------------------------------------------------
namespace devvisor
{
    // -------------------------------------------------------------------------
    ProcessLauncher::ProcessLauncher( const SupervisorSettings& settings,
                                      std::shared_ptr<ProcessRegistry> registry,
                                      std::shared_ptr<PortReclaimer> reclaimer,
                                      std::shared_ptr<DebugStream> log ):
        settings_(settings),
        registry_(registry),
        reclaimer_(reclaimer),
        mylog(log)
    {
        if( !mylog )
            mylog = std::make_shared<DebugStream>();

        if( !registry_ )
            registry_ = std::make_shared<ProcessRegistry>();

        if( !reclaimer_ )
            reclaimer_ = std::make_shared<PortReclaimer>(mylog);
    }
    // -------------------------------------------------------------------------
    const SupervisorSettings& ProcessLauncher::settings() const
    {
        return settings_;
    }
    // -------------------------------------------------------------------------
    std::string ProcessLauncher::entryPoint( const ServiceSpec& spec ) const
    {
        Poco::Path p(spec.command);

        if( p.isAbsolute() )
            return p.toString();

        Poco::Path root(settings_.projectRoot);
        root.makeDirectory();
        return Poco::Path(root.absolute(), p).toString();
    }
    // -------------------------------------------------------------------------
    Poco::Process::Env ProcessLauncher::environment( const ServiceSpec& spec ) const
    {
        Poco::Process::Env env;

        // variables already set in the supervisor environment are kept
        for( const auto& kv : settings_.environment )
        {
            if( !Poco::Environment::has(kv.first) && env.find(kv.first) == env.end() )
                env[kv.first] = expand_vars(kv.second, env);
        }

        env[settings_.portVariable] = std::to_string(spec.port);
        return env;
    }
    // -------------------------------------------------------------------------
    std::vector<std::string> ProcessLauncher::commandLine( const ServiceSpec& spec ) const
    {
        std::vector<std::string> cmd;

        if( settings_.runner.empty() )
            cmd.push_back(entryPoint(spec));
        else
        {
            cmd = settings_.runner;
            cmd.push_back(spec.command);
        }

        std::map<std::string, std::string> vars;

        for( const auto& kv : environment(spec) )
            vars[kv.first] = kv.second;

        vars["PORT"] = std::to_string(spec.port);
        vars["SERVICE_NAME"] = spec.name;

        for( const auto& a : spec.args )
            cmd.push_back( expand_vars(a, vars) );

        return cmd;
    }
    // -------------------------------------------------------------------------
    std::shared_ptr<ManagedProcess> ProcessLauncher::launch( const ServiceSpec& spec )
    {
        const std::string entry = entryPoint(spec);
        bool exists = false;

        try
        {
            exists = Poco::File(entry).exists();
        }
        catch( const Poco::Exception& ex )
        {
            mylog->level1() << spec.name << ": can't check " << entry << ": " << ex.displayText() << std::endl;
        }

        if( !exists )
            throw LaunchError(LaunchError::NotFound, spec.name + ": entry point not found: " + entry);

        if( settings_.reclaim )
            reclaimer_->reclaim(spec.port);

        std::vector<std::string> cmd = commandLine(spec);
        Poco::Process::Env env = environment(spec);

        if( mylog->is_level1() )
        {
            std::ostringstream s;

            for( const auto& c : cmd )
                s << " " << c;

            mylog->level1() << spec.name << ": cwd=" << settings_.projectRoot << " argv:" << s.str() << std::endl;

            for( const auto& kv : env )
                mylog->level1() << spec.name << ": env " << kv.first << "=" << kv.second << std::endl;
        }

        mylog->info() << "starting " << spec.name << " (port " << spec.port << "): " << spec.command << std::endl;

        Poco::Pipe outPipe;
        bool isDir = false;

        try
        {
            isDir = Poco::File(settings_.projectRoot).isDirectory();
        }
        catch( const Poco::Exception& ex )
        {
            mylog->level1() << spec.name << ": can't check " << settings_.projectRoot << ": " << ex.displayText() << std::endl;
        }

        if( !isDir )
            throw LaunchError(LaunchError::SpawnFailed, spec.name + ": project root is not a directory: " + settings_.projectRoot);

        Poco::Process::PID pid = spawn(spec, cmd, env, outPipe);

        auto mp = std::make_shared<ManagedProcess>(spec, pid);
        mp->relay = std::make_shared<OutputRelay>(spec.name, outPipe, mylog);

        if( !registry_->add(mp) )
        {
            discard(pid);
            throw LaunchError(LaunchError::Duplicate, spec.name + ": name or port " + std::to_string(spec.port) + " is already registered");
        }

        mp->status = ProcessStatus::Running;
        mp->relay->start();

        mylog->info() << spec.name << " started with PID " << pid << std::endl;
        return mp;
    }
    // -------------------------------------------------------------------------
    Poco::Process::PID ProcessLauncher::spawn( const ServiceSpec& spec,
            const std::vector<std::string>& cmd,
            const Poco::Process::Env& env,
            Poco::Pipe& outPipe )
    {
        // everything the child needs is prepared before fork()
        std::vector<std::string> envList;

        for( char** e = environ; e && *e; ++e )
        {
            const std::string var(*e);
            auto pos = var.find('=');

            if( pos != std::string::npos && env.find(var.substr(0, pos)) != env.end() )
                continue;

            envList.push_back(var);
        }

        for( const auto& kv : env )
            envList.push_back(kv.first + "=" + kv.second);

        std::vector<char*> argv;

        for( const auto& a : cmd )
            argv.push_back( const_cast<char*>(a.c_str()) );

        argv.push_back(nullptr);

        std::vector<char*> envp;

        for( const auto& e : envList )
            envp.push_back( const_cast<char*>(e.c_str()) );

        envp.push_back(nullptr);

        const std::string cwd = settings_.projectRoot;
        const int outFd = outPipe.writeHandle();

        long maxFd = ::sysconf(_SC_OPEN_MAX);

        if( maxFd < 0 )
            maxFd = 1024;

        // the child reports a failed exec through this pipe
        int errPipe[2];

        if( ::pipe2(errPipe, O_CLOEXEC) != 0 )
            throw LaunchError(LaunchError::SpawnFailed, spec.name + ": can't create pipe: " + strerror(errno));

        int nullFd = ::open("/dev/null", O_RDONLY | O_CLOEXEC);

        pid_t pid = ::fork();

        if( pid < 0 )
        {
            int err = errno;
            ::close(errPipe[0]);
            ::close(errPipe[1]);

            if( nullFd >= 0 )
                ::close(nullFd);

            throw LaunchError(LaunchError::SpawnFailed, spec.name + ": fork failed: " + strerror(err));
        }

        if( pid == 0 )
        {
            int err = 0;

            // own process group: a terminal interrupt is not delivered to the services
            if( ::setpgid(0, 0) != 0 || ::chdir(cwd.c_str()) != 0 )
                err = errno;
            else if( (nullFd >= 0 && ::dup2(nullFd, STDIN_FILENO) < 0)
                     || ::dup2(outFd, STDOUT_FILENO) < 0
                     || ::dup2(outFd, STDERR_FILENO) < 0 )
                err = errno;

            if( err == 0 )
            {
                // pipes of the other services must not leak into this one
                for( int fd = 3; fd < maxFd; fd++ )
                {
                    if( fd != errPipe[1] )
                        ::close(fd);
                }

                environ = envp.data();
                ::execvp(argv[0], argv.data());
                err = errno;
            }

            ssize_t n = ::write(errPipe[1], &err, sizeof(err));
            (void)n;
            _exit(127);
        }

        ::close(errPipe[1]);

        if( nullFd >= 0 )
            ::close(nullFd);

        outPipe.close(Poco::Pipe::CLOSE_WRITE);

        int childErr = 0;
        ssize_t n = 0;

        do
        {
            n = ::read(errPipe[0], &childErr, sizeof(childErr));
        }
        while( n < 0 && errno == EINTR );

        ::close(errPipe[0]);

        if( n > 0 )
        {
            int status = 0;

            while( waitpid(pid, &status, 0) < 0 && errno == EINTR )
                ;

            throw LaunchError(LaunchError::SpawnFailed, spec.name + ": failed to start " + cmd.front() + ": " + strerror(childErr));
        }

        return pid;
    }
    // -------------------------------------------------------------------------
    void ProcessLauncher::discard( Poco::Process::PID pid )
    {
        ProcessTree::signalTree(pid, SIGKILL);

        int status = 0;

        while( waitpid(pid, &status, 0) < 0 && errno == EINTR )
            ;
    }
    // -------------------------------------------------------------------------
} // end of namespace devvisor
// -------------------------------------------------------------------------
