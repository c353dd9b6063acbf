/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#ifndef PortReclaimer_H_
#define PortReclaimer_H_
// -------------------------------------------------------------------------
#include <memory>
#include <string>
#include <vector>
#include <Poco/Process.h>
#include "Debug.h"
// -------------------------------------------------------------------------
namespace devvisor
{
    /*!
     * Port reclaimer - frees a TCP port before a service binds it.
     * Every process listening on the port (found with "lsof -t -i tcp:PORT -s TCP:LISTEN")
     * gets SIGTERM, and SIGKILL if it is still alive after the grace interval.
     * Reclaiming a free port does nothing.
     */
    class PortReclaimer
    {
        public:
            explicit PortReclaimer( std::shared_ptr<DebugStream> log = nullptr );

            void setGrace( size_t msec );
            size_t getGrace() const;

            //! lsof binary (name or path)
            void setLsofCommand( const std::string& cmd );

            /*! Free the port. Never throws: query failures are logged as warnings. */
            void reclaim( int port ) noexcept;

            /*! PIDs of processes in TCP LISTEN state on the port
             * \throw PortReclaimError if the query failed
             */
            std::vector<Poco::Process::PID> listeners( int port );

            //! true if something accepts TCP connections on localhost:port
            static bool isListening( int port, size_t timeout_msec = 300 ) noexcept;

            std::shared_ptr<DebugStream> log();

        private:
            void terminate( int port, Poco::Process::PID pid );
            bool waitGone( Poco::Process::PID pid, size_t msec );

            size_t grace_msec_ = 500;
            std::string lsof_ = "lsof";
            std::shared_ptr<DebugStream> mylog;
    };

} // end of namespace devvisor
// -------------------------------------------------------------------------
#endif // PortReclaimer_H_
// -------------------------------------------------------------------------
