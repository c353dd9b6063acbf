#ifndef DEBUGEXTBUF_H
#define DEBUGEXTBUF_H

// Created by Lars Gullik Bjønnes
// Copyright 1999 Lars Gullik Bjønnes (larsbj@lyx.org)
// Released into the public domain.

// Primarily developed for use in the LyX Project http://www.lyx.org/
// but should be adaptable to any project.

// (c) 2002 adapted for UniSet by Lav, GNU GPL license
// adapted for devvisor, GNU LGPL license

#include <fstream>
#include <iostream>
#include <sstream>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <sigc++/sigc++.h>
#include "Debug.h"

/** This is a streambuffer that never prints out anything, at least
    that is the intention. You can call it a no-op streambuffer, and
    the ostream that uses it will be a no-op stream.
*/
class nullbuf : public std::streambuf
{
	protected:
		///
		virtual std::streamsize xsputn(char_type const*, std::streamsize n) override
		{
			// fakes a purge of the buffer by returning n
			return n;
		}
		///
		virtual int_type overflow(int_type c = traits_type::eof()) override
		{
			// fakes success by returning c
			return c == traits_type::eof() ? ' ' : c;
		}
};

/** A streambuf that sends the output to two different streambufs. These
    can be any kind of streambufs.
*/
class teebuf : public std::streambuf
{
	public:
		///
		teebuf(std::streambuf* b1, std::streambuf* b2)
			: std::streambuf(), sb1(b1), sb2(b2) {}
	protected:
		///
		virtual int sync() override
		{
			sb2->pubsync();
			return sb1->pubsync();
		}
		///
		virtual std::streamsize xsputn(char_type const* p, std::streamsize n) override
		{
			sb2->sputn(p, n);
			return sb1->sputn(p, n);
		}
		///
		virtual int_type overflow(int_type c = traits_type::eof()) override
		{
			sb2->sputc(c);
			return sb1->sputc(c);
		}
	private:
		///
		std::streambuf* sb1;
		///
		std::streambuf* sb2;
};

/** A streambuf that sends the output to three different streambufs. These
    can be any kind of streambufs.
*/
class threebuf : public std::streambuf
{
	public:
		///
		threebuf(std::streambuf* b1, std::streambuf* b2, std::streambuf* b3)
			: std::streambuf(), sb1(b1), sb2(b2), sb3(b3) {}
	protected:
		///
		virtual int sync() override
		{
			sb2->pubsync();
			sb3->pubsync();
			return sb1->pubsync();
		}
		///
		virtual std::streamsize xsputn(char_type const* p, std::streamsize n) override
		{
			sb2->sputn(p, n);
			sb3->sputn(p, n);
			return sb1->sputn(p, n);
		}
		///
		virtual int_type overflow(int_type c = traits_type::eof()) override
		{
			sb2->sputc(c);
			sb3->sputc(c);
			return sb1->sputc(c);
		}
	private:
		///
		std::streambuf* sb1;
		///
		std::streambuf* sb2;
		///
		std::streambuf* sb3;
};

/** A streambuf that collects the text written by each thread separately
    and passes it to the target streambuf one whole line at a time.
    Lines written concurrently by different threads may interleave,
    but never mix inside one line.
*/
class linebuf : public std::streambuf
{
	public:
		explicit linebuf( std::streambuf* target ): sb(target) {}

		virtual ~linebuf()
		{
			pending_lines().erase(this);
		}

	protected:
		virtual int sync() override
		{
			std::lock_guard<std::mutex> l(mut);
			return sb->pubsync();
		}

		virtual std::streamsize xsputn(char_type const* p, std::streamsize n) override
		{
			std::string& line = pending();

			for( std::streamsize i = 0; i < n; i++ )
			{
				line.push_back(p[i]);

				if( p[i] == '\n' )
					emit(line);
			}

			return n;
		}

		virtual int_type overflow(int_type c = traits_type::eof()) override
		{
			if( traits_type::eq_int_type(c, traits_type::eof()) )
				return traits_type::not_eof(c);

			std::string& line = pending();
			line.push_back(traits_type::to_char_type(c));

			if( c == '\n' )
				emit(line);

			return c;
		}

	private:
		typedef std::unordered_map<const linebuf*, std::string> LineMap;

		static LineMap& pending_lines()
		{
			thread_local LineMap lines;
			return lines;
		}

		std::string& pending()
		{
			return pending_lines()[this];
		}

		void emit( std::string& line )
		{
			{
				std::lock_guard<std::mutex> l(mut);
				sb->sputn(line.data(), line.size());
				sb->pubsync();
			}

			line.clear();
		}

		std::unique_ptr<std::streambuf> sb;
		std::mutex mut;
};

///
class stringsigbuf : public std::streambuf
{
	public:
		stringsigbuf(): sb(new std::stringbuf())
		{
		}

		~stringsigbuf()
		{
			delete sb;
		}

		typedef sigc::signal<void, const std::string&> StrBufOverflow_Signal;
		inline StrBufOverflow_Signal signal_overflow()
		{
			return s_overflow;
		}

	protected:
		///
		virtual int sync() override
		{
			std::lock_guard<std::mutex> l(mut);
			return sb->pubsync();
		}

		///
		virtual std::streamsize xsputn(char_type const* p, std::streamsize n) override
		{
			std::lock_guard<std::mutex> l(mut);
			std::streamsize r = sb->sputn(p, n);
			s_overflow.emit( sb->str() );
			sb->str("");
			return r;
		}
		///
		virtual int_type overflow(int_type c = traits_type::eof()) override
		{
			std::lock_guard<std::mutex> l(mut);
			int_type r = sb->sputc(c);

			if( r == '\n' )
			{
				s_overflow.emit( sb->str() );
				sb->str("");
			}

			return r;
		}
	private:
		///
		StrBufOverflow_Signal s_overflow;
		std::stringbuf* sb;
		std::mutex mut;
};
//--------------------------------------------------------------------------
/// So that public parts of DebugStream does not need to know about filebuf
struct DebugStream::debugstream_internal
{
	/// Used when logging to file.
	std::filebuf fbuf;
	stringsigbuf sbuf;
	nullbuf nbuf;
};
//--------------------------------------------------------------------------
#endif
