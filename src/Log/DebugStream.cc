// Created by Lars Gullik Bj�nnes
// Copyright 1999 Lars Gullik Bj�nnes (larsbj@lyx.org)
// Released into the public domain.

// Primarily developed for use in the LyX Project http://www.lyx.org/
// but should be adaptable to any project.

// (c) 2002 adapted for UniSet by Lav, GNU LGPL license
// adapted for devvisor, GNU LGPL license

#include "Debug.h"

#include <iostream>
#include <sstream>
#include <iomanip>
#include <ctime>
#include "DebugExtBuf.h"
#include "VisorTypes.h"

using std::ostream;
using std::cout;
using std::cerr;
using std::ios;
//--------------------------------------------------------------------------
/// Constructor, sets the debug level to t.
DebugStream::DebugStream(Debug::type t)
	: dt(t), nullstream(new nullbuf), internal(new debugstream_internal),
	  show_datetime(true), show_logtype(true),
	  fname(""),
	  logname("")
{
	delete rdbuf(new linebuf(new teebuf(cout.rdbuf(), &internal->sbuf)));
	internal->sbuf.signal_overflow().connect(sigc::mem_fun(*this, &DebugStream::sbuf_overflow));
}

//--------------------------------------------------------------------------
/// Constructor, sets the log file to f, and the debug level to t.
DebugStream::DebugStream(char const* f, Debug::type t, bool truncate )
	: dt(t), nullstream(new nullbuf),
	  internal(new debugstream_internal),
	  show_datetime(true), show_logtype(true),
	  fname(f),
	  logname("")
{
	std::ios_base::openmode mode = ios::out;
	mode |= truncate ? ios::trunc : ios::app;

	internal->fbuf.open(f, mode);
	isWriteLogFile = internal->fbuf.is_open();

	delete rdbuf(new linebuf(new threebuf(cout.rdbuf(),
										  &internal->fbuf, &internal->sbuf)));

	internal->sbuf.signal_overflow().connect(sigc::mem_fun(*this, &DebugStream::sbuf_overflow));
}
//--------------------------------------------------------------------------
void DebugStream::sbuf_overflow( const std::string& s ) noexcept
{
	try
	{
		s_stream.emit(s);
	}
	catch( const std::exception& ex )
	{
		cerr << "(DebugStream): stream event handler failed: " << ex.what() << std::endl;
	}
}
//--------------------------------------------------------------------------
DebugStream::~DebugStream()
{
	delete nullstream.rdbuf(0); // Without this we leak
	delete rdbuf(0);            // Without this we leak
	delete internal;
}
//--------------------------------------------------------------------------
/// Sets the debugstreams' logfile to f.
void DebugStream::logFile( const std::string& f, bool truncate )
{
	if( !f.empty() && f != fname )
		fname = f;

	internal->fbuf.close();
	isWriteLogFile = false;

	if( !f.empty() )
	{
		std::ios_base::openmode mode = ios::out;
		mode |= truncate ? ios::trunc : ios::app;

		if( !internal->fbuf.open(f.c_str(), mode) )
			cerr << "(DebugStream): can't open logfile '" << f << "'" << std::endl;
		else
			isWriteLogFile = true;
	}

	reopen();
}
//--------------------------------------------------------------------------
void DebugStream::reopen()
{
	if( isWriteLogFile )
	{
		if( onScreen )
		{
			delete rdbuf(new linebuf(new threebuf(cout.rdbuf(),
												  &internal->fbuf, &internal->sbuf)));
		}
		else
		{
			// print to cout disabled
			delete rdbuf(new linebuf(new teebuf(&internal->fbuf, &internal->sbuf)));
		}
	}
	else
	{
		if( onScreen )
			delete rdbuf(new linebuf(new teebuf(cout.rdbuf(), &internal->sbuf)));
		else
			delete rdbuf(new linebuf(new teebuf(&internal->nbuf, &internal->sbuf)));
	}
}
//--------------------------------------------------------------------------
void DebugStream::enableOnScreen()
{
	onScreen = true;
	reopen();
}
//--------------------------------------------------------------------------
void DebugStream::disableOnScreen()
{
	onScreen = false;
	reopen();
}
//--------------------------------------------------------------------------
std::ostream& DebugStream::header( const std::string& tag ) noexcept
{
	// the prefix is written in one piece to leave the stream format flags untouched
	std::ostringstream s;

	if( show_datetime )
		s << "[" << dateTime() << "] ";

	if( !tag.empty() )
		s << "[" << tag << "] ";

	const std::string h = s.str();
	write(h.data(), h.size());
	return *this;
}
//--------------------------------------------------------------------------
std::ostream& DebugStream::debug(Debug::type t) noexcept
{
	if( dt & t )
		return header( show_logtype ? Debug::tag(t) : "" );

	return nullstream;
}
//--------------------------------------------------------------------------
std::ostream& DebugStream::tagged( const std::string& tag, Debug::type t ) noexcept
{
	if( dt & t )
		return header(tag);

	return nullstream;
}
//--------------------------------------------------------------------------
std::ostream& DebugStream::operator()(Debug::type t) noexcept
{
	if( dt & t )
		return *this;

	return nullstream;
}
//--------------------------------------------------------------------------
std::string DebugStream::dateTime() const
{
	timespec tv = devvisor::now_to_timespec();
	std::tm tms;

	if( show_localtime )
		localtime_r(&tv.tv_sec, &tms);
	else
		gmtime_r(&tv.tv_sec, &tms);

	std::ostringstream s;
	s << std::put_time(&tms, "%Y-%m-%d %H:%M:%S");

	if( show_msec )
		s << "." << std::setw(3) << std::setfill('0') << (tv.tv_nsec / 1000000);

	return s.str();
}
//--------------------------------------------------------------------------
std::ostream& DebugStream::printDateTime(Debug::type t) noexcept
{
	if( dt & t )
	{
		const std::string s = dateTime();
		return write(s.data(), s.size());
	}

	return nullstream;
}
//--------------------------------------------------------------------------
DebugStream::StreamEvent_Signal DebugStream::signal_stream_event()
{
	return s_stream;
}
//--------------------------------------------------------------------------
