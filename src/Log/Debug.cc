/* This file is part of
* ======================================================
*
*           LyX, The Document Processor
*
*           Copyright 1999-2000 The LyX Team.
*
* ====================================================== */
// (c) 2002 adapted for UniSet by Lav, GNU LGPL license
// adapted for devvisor, GNU LGPL license

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

#include "Debug.h"

using std::ostream;
using std::setw;
using std::endl;

struct error_item
{
	Debug::type level;
	char const* name;
	char const* desc;
};

static error_item errorTags[] =
{
	{ Debug::NONE,      "none",      ("No debugging message")},
	{ Debug::INIT,      "init",      ("Program initialisation")},
	{ Debug::INFO,      "info",      ("General information")},
	{ Debug::WARN,      "warn",      ("Warning messages")},
	{ Debug::CRIT,      "crit",      ("Critical messages")},
	{ Debug::SYSTEM,    "system",    ("OS level diagnostics (signals, waitpid)")},
	{ Debug::LEVEL1,    "level1",    ("Supervisor debug level1 (argv, environment, reclaim queries)")},
	{ Debug::LEVEL2,    "level2",    ("Supervisor debug level2 (monitor ticks)")},
	{ Debug::LEVEL3,    "level3",    ("Supervisor debug level3")},
	{ Debug::LEVEL4,    "level4",    ("Supervisor debug level4")},
	{ Debug::LEVEL5,    "level5",    ("Supervisor debug level5")},
	{ Debug::LEVEL6,    "level6",    ("Supervisor debug level6")},
	{ Debug::LEVEL7,    "level7",    ("Supervisor debug level7")},
	{ Debug::LEVEL8,    "level8",    ("Supervisor debug level8")},
	{ Debug::LEVEL9,    "level9",    ("Supervisor debug level9")},
	{ Debug::ANY,       "any",       ("All debugging messages")},
	{ Debug::EXCEPTION, "exception", ("Exception debug messages")},

};


static const int numErrorTags = sizeof(errorTags) / sizeof(error_item);


Debug::type const Debug::ANY = Debug::type(
								   Debug::INFO | Debug::INIT | Debug::WARN | Debug::CRIT |
								   Debug::LEVEL1 | Debug::LEVEL2 | Debug::LEVEL3 | Debug::LEVEL4 |
								   Debug::LEVEL5 | Debug::LEVEL6 | Debug::LEVEL7 | Debug::LEVEL8 |
								   Debug::LEVEL9 | Debug::SYSTEM | Debug::EXCEPTION );


Debug::type Debug::value( std::string const& val)
{
	type l = Debug::NONE;
	std::string v(val);

	while (!v.empty())
	{
		std::string::size_type st = v.find(',');
		std::string tmp(v.substr(0, st));

		if(tmp.empty())
			break;

		bool del = false;

		if( tmp[0] == '-' )
		{
			del = true;
			tmp = tmp.substr(1, tmp.size());
		}

		for (int i = 0 ; i < numErrorTags ; ++i)
			if (tmp == errorTags[i].name)
			{
				if( del )
					l = Debug::type(l & ~(errorTags[i].level));
				else
					l |= errorTags[i].level;

				break;
			}

		if (st == std::string::npos) break;

		v.erase(0, st + 1);
	}

	return l;
}


void Debug::showLevel(ostream& o, Debug::type level) noexcept
{
	// Show what features are traced
	for (int i = 0 ; i < numErrorTags ; ++i)
		if (errorTags[i].level != Debug::ANY
				&& errorTags[i].level != Debug::NONE
				&& errorTags[i].level & level)
			o << "Debugging `" << errorTags[i].name
			  << "' (" << errorTags[i].desc << ')' << endl;
}

void Debug::showTags(ostream& os) noexcept
{
	for (int i = 0 ; i < numErrorTags ; ++i)
		os << setw(7) << errorTags[i].level
		   << setw(10) << errorTags[i].name
		   << "  " << errorTags[i].desc << '\n';

	os.flush();
}

std::ostream& operator<<(std::ostream& os, Debug::type level ) noexcept
{
	for (int i = 0 ; i < numErrorTags ; ++i)
	{
		if( errorTags[i].level & level)
			return os << errorTags[i].name;
	}

	return os << "???Debuglevel";
}

std::string Debug::str( Debug::type level ) noexcept
{
	if( level == Debug::NONE )
		return "NONE";

	if( level == Debug::ANY )
		return "ANY";

	std::ostringstream s;
	bool first = true;

	for (int i = 0 ; i < numErrorTags ; ++i)
	{
		if (errorTags[i].level != Debug::ANY
				&& errorTags[i].level != Debug::NONE
				&& errorTags[i].level & level)
		{
			if( first )
			{
				first = false;
				s << errorTags[i].name;
			}
			else
				s << "," << errorTags[i].name;
		}
	}

	return s.str();
}

std::string Debug::tag( Debug::type level ) noexcept
{
	for (int i = 0 ; i < numErrorTags ; ++i)
	{
		if( errorTags[i].level != Debug::NONE
				&& errorTags[i].level != Debug::ANY
				&& (errorTags[i].level & level) )
		{
			std::string s(errorTags[i].name);
			std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
			{
				return std::toupper(c);
			});

			return s;
		}
	}

	return "LOG";
}
