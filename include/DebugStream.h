// -*- C++ -*-

// Created by Lars Gullik BjЬnnes
// Copyright 1999 Lars Gullik BjЬnnes (larsbj@lyx.org)
// Released into the public domain.

// Primarily developed for use in the LyX Project http://www.lyx.org/
// but should be adaptable to any project.

// (c) 2002 adapted for UniSet by Lav, GNU LGPL license
// Modify for UniSet by pv@etersoft.ru, GNU LGPL license
// adapted for devvisor, GNU LGPL license

#ifndef DEBUGSTREAM_H
#define DEBUGSTREAM_H

#include <iostream>
#include <string>
#include <sigc++/sigc++.h>
#include "Debug.h"

/** DebugStream is a ostream intended for debug output.
    It has also support for a logfile. Debug output is output to cout
    and if the logfile is set, to the logfile.

    Every line is passed to the screen (and the logfile) as a whole,
    so lines written from different threads never mix.

    Example of Usage:
    DebugStream debug;
    debug.level(Debug::INFO);
    debug.debug(Debug::WARN) << "WARN\n";
    debug[Debug::INFO] << "INFO\n";
    debug << "Always\n";

    Will output:
    [2026-10-17 12:00:00] [INFO] INFO
    Always

    Service output lines are printed with the service name instead of the level:
    debug.tagged("users") << "listening on :8081" << endl;

    [2026-10-17 12:00:00] [users] listening on :8081
*/
class DebugStream : public std::ostream
{
	public:
		/// Constructor, sets the debug level to t.
		explicit DebugStream(Debug::type t = Debug::NONE);

		/// Constructor, sets the log file to f, and the debug level to t.
		explicit
		DebugStream(char const* f, Debug::type t = Debug::NONE, bool truncate = false );

		///
		virtual ~DebugStream();

		typedef sigc::signal<void, const std::string&> StreamEvent_Signal;

		/** Emitted for every complete line written to the stream (with the trailing '\n') */
		StreamEvent_Signal signal_stream_event();

		/// Sets the debug level to t.
		void level(Debug::type t) noexcept
		{
			dt = Debug::type(t & Debug::ANY);
		}

		/// Returns the current debug level.
		Debug::type level() const noexcept
		{
			return dt;
		}

		/// Adds t to the current debug level.
		void addLevel(Debug::type t) noexcept
		{
			dt = Debug::type(dt | t);
		}

		/// Deletes t from the current debug level.
		void delLevel(Debug::type t) noexcept
		{
			dt = Debug::type(dt & ~t);
		}

		/// Sets the debugstreams' logfile to f.
		virtual void logFile( const std::string& f, bool truncate = false );

		inline std::string getLogFile() const noexcept
		{
			return fname;
		}

		// the logfile name can be set without enabling it
		inline void setLogFile( const std::string& n ) noexcept
		{
			fname = n;
		}

		inline bool isOnLogFile() const noexcept
		{
			return isWriteLogFile;
		}

		inline void onLogFile( bool truncate = false )
		{
			logFile(fname, truncate);
		}

		inline void offLogFile()
		{
			logFile("");
		}

		// enable print on screen
		void enableOnScreen();

		// disable print onscreen
		void disableOnScreen();

		/// Returns true if t is part of the current debug level.
		inline bool debugging(Debug::type t = Debug::ANY) const noexcept
		{
			return (dt & t);
		}

		/** Returns the no-op stream if t is not part of the
		    current debug level otherwise the real debug stream
		    is used (after the "[date time] [LEVEL] " prefix).
		*/
		std::ostream& debug(Debug::type t = Debug::ANY) noexcept;

		/** This is an operator to give a more convenient use:
		    dbgstream[Debug::INFO] << "Info!\n";
		*/
		std::ostream& operator[](Debug::type t) noexcept
		{
			return debug(t);
		}

		/** Continuation of a line (without date, time and level) */
		inline std::ostream& to_end(Debug::type t) noexcept
		{
			return this->operator()(t);
		}

		std::ostream& operator()(Debug::type t) noexcept;

		/** Line prefixed with "[date time] [tag] " instead of the level name.
		    Written only when t is part of the current debug level.
		*/
		std::ostream& tagged( const std::string& tag, Debug::type t = Debug::INFO ) noexcept;

		inline void showDateTime(bool s) noexcept
		{
			show_datetime = s;
		}

		inline void showMilliseconds( bool s ) noexcept
		{
			show_msec = s;
		}

		inline void showLogType(bool s) noexcept
		{
			show_logtype = s;
		}

		inline void showLocalTime( bool s ) noexcept
		{
			show_localtime = s;
		}

		inline std::ostream& log(Debug::type l) noexcept
		{
			return this->operator[](l);
		}

		// -----------------------------------------------------
		// shortcuts
		// log.level1()  - output with prefix "[date time] [LEVEL1] ...",
		// if( log.is_level1() ) - check whether the level is enabled

#define DMANIP(FNAME,LEVEL) \
	inline std::ostream& FNAME( bool showdatetime=true ) noexcept \
	{\
		if( showdatetime )\
			return operator[](Debug::LEVEL); \
		return  operator()(Debug::LEVEL); \
	} \
	\
	inline bool is_##FNAME() const  noexcept\
	{ return debugging(Debug::LEVEL); }

		DMANIP(level1, LEVEL1)
		DMANIP(level2, LEVEL2)
		DMANIP(level3, LEVEL3)
		DMANIP(level4, LEVEL4)
		DMANIP(level5, LEVEL5)
		DMANIP(level6, LEVEL6)
		DMANIP(level7, LEVEL7)
		DMANIP(level8, LEVEL8)
		DMANIP(level9, LEVEL9)
		DMANIP(info, INFO)
		DMANIP(init, INIT)
		DMANIP(warn, WARN)
		DMANIP(crit, CRIT)
		DMANIP(system, SYSTEM)
		DMANIP(exception, EXCEPTION)
		DMANIP(any, ANY)
#undef DMANIP

		/** "YYYY-MM-DD HH:MM:SS[.mmm]" for the current moment */
		std::string dateTime() const;

		std::ostream& printDateTime(Debug::type t) noexcept;

		inline void setLogName( const std::string& n ) noexcept
		{
			logname = n;
		}

		inline std::string  getLogName() const noexcept
		{
			return logname;
		}

		DebugStream( const DebugStream& ) = delete;
		DebugStream& operator=( const DebugStream& ) = delete;

	protected:
		void sbuf_overflow( const std::string& s ) noexcept;
		void reopen();

		std::ostream& header( const std::string& tag ) noexcept;

		/// The current debug level
		Debug::type dt = { Debug::NONE };
		/// The no-op stream.
		std::ostream nullstream;
		///
		struct debugstream_internal;
		///
		debugstream_internal* internal = { 0 };
		bool show_datetime = { true };
		bool show_logtype = { true };
		bool show_msec = { false };
		bool show_localtime = { true };
		std::string fname = { "" };

		StreamEvent_Signal s_stream;
		std::string logname = { "" };

		bool isWriteLogFile = { false };
		bool onScreen = { true };
};

// ------------------------------------------------------------------------------------------------
#endif
