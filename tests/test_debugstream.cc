#include <catch.hpp>
// -----------------------------------------------------------------------------
#include <sstream>
#include <fstream>
#include <thread>
#include <mutex>
#include <regex>
#include <vector>
#include <cstdio>
#include <unistd.h>
#include "DebugStream.h"
// -----------------------------------------------------------------------------
using namespace std;
// -----------------------------------------------------------------------------
TEST_CASE("Debugstream: set levels", "[debugstream][set]" )
{
	DebugStream d;

	d.level(Debug::value("level1"));
	REQUIRE(d.is_level1());

	d.level( Debug::value("level2"));
	REQUIRE(d.is_level2());
	REQUIRE_FALSE(d.is_level1());

	d.level( Debug::type(Debug::LEVEL1 | Debug::LEVEL2) );
	REQUIRE(d.is_level2());
	REQUIRE(d.is_level1());

	d.level(Debug::value("level1,-level2"));
	REQUIRE(d.is_level1());
	REQUIRE_FALSE(d.is_level2());

	d.level(Debug::value("any,-level2"));
	REQUIRE(d.is_level1());
	REQUIRE(d.is_level9());
	REQUIRE(d.is_crit());
	REQUIRE_FALSE(d.is_level2());

	d.level(Debug::value("info,warn,crit"));
	REQUIRE(d.is_info());
	REQUIRE(d.is_warn());
	REQUIRE(d.is_crit());
	REQUIRE_FALSE(d.is_level1());
	REQUIRE_FALSE(d.is_system());

	d.level(Debug::value("unknown"));
	REQUIRE(d.level() == Debug::NONE);
}
// -----------------------------------------------------------------------------
TEST_CASE("Debugstream: add and del levels", "[debugstream][add]" )
{
	DebugStream d;

	d.level(Debug::LEVEL1);
	d.addLevel(Debug::LEVEL2);
	d.addLevel(Debug::value("level3"));
	REQUIRE(d.is_level1());
	REQUIRE(d.is_level2());
	REQUIRE(d.is_level3());

	d.delLevel(Debug::LEVEL1);
	REQUIRE_FALSE(d.is_level1());
	REQUIRE(d.is_level2());
}
// -----------------------------------------------------------------------------
TEST_CASE("Debug: level names", "[debugstream][debug]" )
{
	REQUIRE( Debug::str(Debug::NONE) == "NONE" );
	REQUIRE( Debug::str(Debug::ANY) == "ANY" );
	REQUIRE( Debug::str(Debug::WARN) == "warn" );
	REQUIRE( Debug::str(Debug::type(Debug::INFO | Debug::WARN)) == "info,warn" );
	REQUIRE( Debug::tag(Debug::CRIT) == "CRIT" );
	REQUIRE( Debug::tag(Debug::EXCEPTION) == "EXCEPTION" );
	REQUIRE( Debug::tag(Debug::LEVEL1) == "LEVEL1" );
}
// -----------------------------------------------------------------------------
class LineCollector
{
	public:
		void add( const std::string& s )
		{
			std::lock_guard<std::mutex> l(mut);
			lines.push_back(s);
		}

		std::mutex mut;
		std::vector<std::string> lines;
};
// -----------------------------------------------------------------------------
TEST_CASE("Debugstream: line format", "[debugstream][format]" )
{
	DebugStream d(Debug::value("info,warn,crit"));
	d.disableOnScreen();

	LineCollector c;
	d.signal_stream_event().connect( sigc::mem_fun(c, &LineCollector::add) );

	d.warn() << "port 8080 is busy" << endl;
	d.tagged("auth") << "listening on :8083" << endl;
	d.level1() << "hidden" << endl;
	d.tagged("auth", Debug::LEVEL1) << "hidden too" << endl;

	REQUIRE( c.lines.size() == 2 );

	const std::regex dt(R"(\[\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\] )");
	REQUIRE( std::regex_search(c.lines[0], dt) );
	REQUIRE( c.lines[0].find("] [WARN] port 8080 is busy\n") != std::string::npos );
	REQUIRE( std::regex_search(c.lines[1], dt) );
	REQUIRE( c.lines[1].find("] [auth] listening on :8083\n") != std::string::npos );

	c.lines.clear();
	d.showDateTime(false);
	d.showLogType(false);
	d.crit() << "plain" << endl;
	d.tagged("auth") << "text" << endl;
	d << "always" << endl;

	REQUIRE( c.lines.size() == 3 );
	REQUIRE( c.lines[0] == "plain\n" );
	REQUIRE( c.lines[1] == "[auth] text\n" );
	REQUIRE( c.lines[2] == "always\n" );

	c.lines.clear();
	d.showDateTime(true);
	d.showMilliseconds(true);
	d.info() << "msec" << endl;
	REQUIRE( c.lines.size() == 1 );
	REQUIRE( std::regex_search(c.lines[0], std::regex(R"(^\[\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\.\d{3}\] msec)")) );
}
// -----------------------------------------------------------------------------
TEST_CASE("Debugstream: tagged lines follow the info level", "[debugstream][tagged]" )
{
	DebugStream d(Debug::value("warn,crit"));
	d.disableOnScreen();
	REQUIRE_FALSE( d.debugging(Debug::INFO) );

	LineCollector c;
	d.signal_stream_event().connect( sigc::mem_fun(c, &LineCollector::add) );

	d.tagged("auth") << "listening on :8083" << endl;
	d.tagged("auth", Debug::WARN) << "slow start" << endl;
	REQUIRE( c.lines.size() == 1 );
	REQUIRE( c.lines[0].find("] [auth] slow start\n") != std::string::npos );

	d.addLevel(Debug::INFO);
	REQUIRE( d.debugging(Debug::INFO) );
	d.tagged("auth") << "listening on :8083" << endl;
	REQUIRE( c.lines.size() == 2 );
	REQUIRE( c.lines[1].find("] [auth] listening on :8083\n") != std::string::npos );
}
// -----------------------------------------------------------------------------
TEST_CASE("Debugstream: a line is passed as a whole", "[debugstream][lines]" )
{
	DebugStream d(Debug::INFO);
	d.disableOnScreen();
	d.showDateTime(false);
	d.showLogType(false);

	LineCollector c;
	d.signal_stream_event().connect( sigc::mem_fun(c, &LineCollector::add) );

	d.info() << "part1 ";
	REQUIRE( c.lines.empty() );
	d << "part2 " << 42;
	REQUIRE( c.lines.empty() );
	d << endl;

	REQUIRE( c.lines.size() == 1 );
	REQUIRE( c.lines[0] == "part1 part2 42\n" );
}
// -----------------------------------------------------------------------------
TEST_CASE("Debugstream: lines from different threads do not mix", "[debugstream][threads]" )
{
	DebugStream d(Debug::INFO);
	d.disableOnScreen();
	d.showDateTime(false);

	LineCollector c;
	d.signal_stream_event().connect( sigc::mem_fun(c, &LineCollector::add) );

	const int num = 500;

	auto writer = [&d, num]( const std::string& name )
	{
		for( int i = 0; i < num; i++ )
			d.tagged(name) << "line " << i << " from " << name << endl;
	};

	std::thread t1(writer, "svc1");
	std::thread t2(writer, "svc2");
	std::thread t3(writer, "svc3");
	t1.join();
	t2.join();
	t3.join();

	REQUIRE( c.lines.size() == 3 * num );

	const std::regex re(R"(^\[(svc\d)\] line \d+ from (svc\d)\n$)");

	for( const auto& l : c.lines )
	{
		std::smatch m;
		REQUIRE( std::regex_match(l, m, re) );
		REQUIRE( m[1] == m[2] );
	}
}
// -----------------------------------------------------------------------------
TEST_CASE("Debugstream: logfile", "[debugstream][logfile]" )
{
	const std::string fname = "/tmp/" + std::to_string(getpid()) + "_devvisor_debugstream.log";
	std::remove(fname.c_str());

	{
		DebugStream d(Debug::INFO);
		d.disableOnScreen();
		d.showDateTime(false);
		REQUIRE_FALSE( d.isOnLogFile() );

		d.logFile(fname, true);
		REQUIRE( d.isOnLogFile() );
		REQUIRE( d.getLogFile() == fname );

		d.info() << "to file" << endl;
		d.tagged("auth") << "service line" << endl;

		d.offLogFile();
		REQUIRE_FALSE( d.isOnLogFile() );
		d.info() << "not in file" << endl;
	}

	std::ifstream f(fname);
	REQUIRE( f.is_open() );

	std::string line;
	REQUIRE( std::getline(f, line) );
	REQUIRE( line == "[INFO] to file" );
	REQUIRE( std::getline(f, line) );
	REQUIRE( line == "[auth] service line" );
	REQUIRE_FALSE( std::getline(f, line) );

	f.close();
	std::remove(fname.c_str());
}
// -----------------------------------------------------------------------------
TEST_CASE("Debugstream: logname", "[debugstream][logname]" )
{
	DebugStream d;
	REQUIRE( d.getLogName().empty() );
	d.setLogName("devvisor");
	REQUIRE( d.getLogName() == "devvisor" );
}
// -----------------------------------------------------------------------------
