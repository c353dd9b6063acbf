/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <climits>
#include <chrono>
#include <regex>
#include "VisorTypes.h"
// -------------------------------------------------------------------------
using namespace std;
// -------------------------------------------------------------------------
bool devvisor::str_to_int( const std::string& str, int& result ) noexcept
{
    const std::string s = trim(str);

    if( s.empty() )
        return false;

    const char* begin = s.c_str();
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(begin, &end, 10);

    if( errno != 0 || end == begin || *end != '\0' )
        return false;

    if( v < INT_MIN || v > INT_MAX )
        return false;

    result = static_cast<int>(v);
    return true;
}
// -------------------------------------------------------------------------
std::string devvisor::trim( const std::string& s )
{
    static const char* ws = " \t\r\n";

    auto first = s.find_first_not_of(ws);

    if( first == string::npos )
        return "";

    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}
// -------------------------------------------------------------------------
std::string devvisor::expand_vars( const std::string& s, const std::map<std::string, std::string>& vars )
{
    // ${VAR} или $VAR
    static const std::regex varRegex(R"(\$\{([^}]+)\}|\$([A-Za-z_][A-Za-z0-9_]*))");

    std::string result;
    auto begin = std::sregex_iterator(s.begin(), s.end(), varRegex);
    auto end = std::sregex_iterator();
    std::string::size_type last = 0;

    for( auto it = begin; it != end; ++it )
    {
        const auto& m = *it;
        std::string name = m[1].matched ? m[1].str() : m[2].str();

        result += s.substr(last, m.position() - last);

        auto vit = vars.find(name);

        if( vit != vars.end() )
            result += vit->second;
        else
        {
            const char* value = std::getenv(name.c_str());

            if( value )
                result += value;
        }

        last = m.position() + m.length();
    }

    result += s.substr(last);
    return result;
}
// -------------------------------------------------------------------------
timespec devvisor::now_to_timespec()
{
    auto d = std::chrono::system_clock::now().time_since_epoch();
    auto sec = std::chrono::duration_cast<std::chrono::seconds>(d);
    auto nsec = std::chrono::duration_cast<std::chrono::nanoseconds>(d - sec);

    struct timespec ts;
    ts.tv_sec = sec.count();
    ts.tv_nsec = nsec.count();
    return ts;
}
// -------------------------------------------------------------------------
