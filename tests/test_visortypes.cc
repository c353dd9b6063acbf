#include <catch.hpp>
// -----------------------------------------------------------------------------
#include <cstdlib>
#include "VisorTypes.h"
// -----------------------------------------------------------------------------
using namespace std;
using namespace devvisor;
// -----------------------------------------------------------------------------
TEST_CASE("VisorTypes: str_to_int", "[vtypes][str_to_int]" )
{
    int v = 0;
    REQUIRE( str_to_int("8080", v) );
    REQUIRE( v == 8080 );

    REQUIRE( str_to_int(" -5 ", v) );
    REQUIRE( v == -5 );

    v = 7;
    REQUIRE_FALSE( str_to_int("", v) );
    REQUIRE_FALSE( str_to_int("   ", v) );
    REQUIRE_FALSE( str_to_int("80a", v) );
    REQUIRE_FALSE( str_to_int("8 0", v) );
    REQUIRE_FALSE( str_to_int("http", v) );
    REQUIRE_FALSE( str_to_int("99999999999999", v) );
    REQUIRE( v == 7 );
}
// -----------------------------------------------------------------------------
TEST_CASE("VisorTypes: trim", "[vtypes][trim]" )
{
    REQUIRE( trim("  text \t\r\n") == "text" );
    REQUIRE( trim("text") == "text" );
    REQUIRE( trim(" a b ") == "a b" );
    REQUIRE( trim(" \n ") == "" );
    REQUIRE( trim("") == "" );
}
// -----------------------------------------------------------------------------
TEST_CASE("VisorTypes: expand_vars", "[vtypes][expand_vars]" )
{
    std::map<std::string, std::string> vars = { {"PORT", "8083"}, {"SERVICE_NAME", "auth"} };

    REQUIRE( expand_vars("--listen=:${PORT}", vars) == "--listen=:8083" );
    REQUIRE( expand_vars("--name=$SERVICE_NAME", vars) == "--name=auth" );
    REQUIRE( expand_vars("${SERVICE_NAME}:${PORT}/x", vars) == "auth:8083/x" );
    REQUIRE( expand_vars("no vars", vars) == "no vars" );

    // from the process environment
    setenv("DEVVISOR_TEST_VAR", "env-value", 1);
    REQUIRE( expand_vars("v=${DEVVISOR_TEST_VAR}", vars) == "v=env-value" );

    // vars override the environment
    setenv("PORT", "1", 1);
    REQUIRE( expand_vars("${PORT}", vars) == "8083" );
    unsetenv("PORT");

    // unknown variables are removed
    unsetenv("DEVVISOR_TEST_UNKNOWN");
    REQUIRE( expand_vars("[${DEVVISOR_TEST_UNKNOWN}]", vars) == "[]" );
}
// -----------------------------------------------------------------------------
TEST_CASE("VisorTypes: now_to_timespec", "[vtypes][timespec]" )
{
    auto t1 = now_to_timespec();
    auto t2 = now_to_timespec();
    REQUIRE( t1.tv_sec > 0 );
    REQUIRE( (t2.tv_sec > t1.tv_sec || (t2.tv_sec == t1.tv_sec && t2.tv_nsec >= t1.tv_nsec)) );
}
// -----------------------------------------------------------------------------
