#include <catch.hpp>
// -----------------------------------------------------------------------------
#include <iostream>
#include <sstream>
// -----------------------------------------------------------------------------
#include "Exceptions.h"
#include "VisorXML.h"
// -----------------------------------------------------------------------------
using namespace std;
using namespace devvisor;
// -----------------------------------------------------------------------------
TEST_CASE("VisorXML", "[visorxml][basic]" )
{
    SECTION( "Default constructor" )
    {
        VisorXML xml;
        CHECK_FALSE( xml.isOpen() );
        CHECK( xml.getFirstNode() == nullptr );
    }

    SECTION( "Bad file" )
    {
        REQUIRE_THROWS_AS( VisorXML("unknown.xml"), devvisor::NameNotFound );
        REQUIRE_THROWS_AS( VisorXML("tests_visorxml_badfile.xml"), devvisor::Exception );
        REQUIRE_THROWS_AS( VisorXML(""), devvisor::NameNotFound );
    }

    SECTION( "Correct file" )
    {
        VisorXML xml("tests_visorxml.xml");
        CHECK( xml.isOpen() );
        CHECK( xml.getFileName() == "tests_visorxml.xml" );

        xmlNode* tnode = xml.findNodeLevel1(xml.getFirstNode(), "TestData");
        REQUIRE( tnode != NULL );
        CHECK( xml.getProp(tnode, "text") == "text" );
        CHECK( xml.getIntProp(tnode, "x") == 10 );
        CHECK( xml.getIntProp(tnode, "text") == 0 );
        CHECK( xml.getPIntProp(tnode, "y", -20) == 100 );
        CHECK( xml.getPIntProp(tnode, "zero", 20) == 20 );
        CHECK( xml.getPIntProp(tnode, "negative", 20) == 20 );
        CHECK( xml.getPIntProp(tnode, "unknown", 20) == 20 );

        CHECK( xml.getProp2(tnode, "unknown", "def") == "def" );
        CHECK( xml.getProp2(tnode, "text", "def") == "text" );
        CHECK( xml.getProp(tnode, "unknown").empty() );

        xml.close();
        CHECK_FALSE( xml.isOpen() );
        CHECK( xml.getFileName().empty() );
    }
}
// -----------------------------------------------------------------------------
TEST_CASE("VisorXML: findNodeLevel1", "[visorxml][find]" )
{
    VisorXML xml("tests_visorxml.xml");

    // only direct children are searched
    CHECK( xml.findNodeLevel1(xml.getFirstNode(), "DevVisor") == NULL );

    xmlNode* settings = xml.findNodeLevel1(xml.getFirstNode(), "settings");
    REQUIRE( settings != NULL );

    xmlNode* dv = xml.findNodeLevel1(settings, "DevVisor");
    REQUIRE( dv != NULL );
    CHECK( xml.getProp(dv, "name") == "dev" );

    xmlNode* stage = xml.findNodeLevel1(settings, "DevVisor", "stage");
    REQUIRE( stage != NULL );
    CHECK( xml.getProp(stage, "projectRoot") == "/srv/stage" );

    CHECK( xml.findNodeLevel1(settings, "DevVisor", "unknown") == NULL );
    CHECK( xml.findNodeLevel1(NULL, "settings") == NULL );
}
// -----------------------------------------------------------------------------
TEST_CASE("VisorXML: XInclude", "[visorxml][xinclude]" )
{
    VisorXML xml("tests_visorxml.xml");

    xmlNode* settings = xml.findNodeLevel1(xml.getFirstNode(), "settings");
    xmlNode* dv = xml.findNodeLevel1(settings, "DevVisor", "dev");
    REQUIRE( dv != NULL );

    xmlNode* services = xml.findNodeLevel1(dv, "Services");
    REQUIRE( services != NULL );

    VisorXML::iterator it(services);
    REQUIRE( it.goChildren() );
    CHECK( it.getProp("name") == "auth" );
    REQUIRE( it.goNext() );
    CHECK( it.getProp("name") == "users" );
    CHECK_FALSE( it.goNext() );
}
// -----------------------------------------------------------------------------
TEST_CASE("VisorXML::iterator", "[visorxml][iterator][basic]" )
{
    VisorXML xml("tests_visorxml.xml");

    VisorXML::iterator it(xml.getFirstNode());
    CHECK( it.getName() == "Configure" );
    REQUIRE( it.goChildren() );
    CHECK( it.getName() == "UserData" );
    REQUIRE( it.goNext() );
    CHECK( it.getName() == "settings" );
    REQUIRE( it.goNext() );
    CHECK( it.getName() == "TestData" );
    CHECK( it.getIntProp("x") == 10 );
    CHECK( it.getPIntProp("y", 0) == 100 );
    CHECK( it.getProp2("unknown", "def") == "def" );
    CHECK_FALSE( it.goNext() );

    // a failed move keeps the current node
    CHECK( it.getName() == "TestData" );
    CHECK_FALSE( it.goChildren() );
    CHECK( it.getName() == "TestData" );

    // empty iterator
    VisorXML::iterator empty;
    CHECK( empty.getCurrent() == nullptr );
    CHECK( empty.getProp("name").empty() );
    CHECK_FALSE( empty.goNext() );
    CHECK_FALSE( empty.goChildren() );
}
// -----------------------------------------------------------------------------
