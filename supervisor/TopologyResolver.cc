/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#include <set>
#include <sstream>
#include "TopologyResolver.h"
#include "VisorTypes.h"
#include "Exceptions.h"
// -------------------------------------------------------------------------
namespace devvisor
{
    // -------------------------------------------------------------------------
    TopologyResolver::Topology TopologyResolver::load( const std::string& xmlFile, const std::string& sectionName )
    {
        std::shared_ptr<VisorXML> xml;

        try
        {
            xml = std::make_shared<VisorXML>(xmlFile);
        }
        catch( const NameNotFound& ex )
        {
            throw ConfigError("configuration: " + std::string(ex.what()));
        }

        return load(xml, sectionName);
    }
    // -------------------------------------------------------------------------
    TopologyResolver::Topology TopologyResolver::load( const std::shared_ptr<VisorXML>& xml, const std::string& sectionName )
    {
        if( !xml || !xml->isOpen() )
            throw ConfigError("configuration: document is not loaded");

        xmlNode* section = findSection(xml, sectionName);

        if( !section )
        {
            if( sectionName.empty() )
                throw ConfigError("configuration: DevVisor section not found in " + xml->getFileName());

            throw ConfigError("configuration: DevVisor section '" + sectionName + "' not found in " + xml->getFileName());
        }

        Topology topology;
        loadSettings(section, topology.settings);
        loadEnvironment(section, topology.settings);
        loadGateway(section, topology);
        loadServices(section, topology);

        validate(topology.services);
        return topology;
    }
    // -------------------------------------------------------------------------
    xmlNode* TopologyResolver::findSection( const std::shared_ptr<VisorXML>& xml, const std::string& sectionName )
    {
        xmlNode* root = xml->getFirstNode();

        if( !root )
            return nullptr;

        if( std::string((const char*)root->name) == "DevVisor" )
        {
            if( sectionName.empty() || VisorXML::getProp(root, "name") == sectionName )
                return root;
        }

        // Search in settings section first
        xmlNode* settings = xml->findNodeLevel1(root, "settings");

        if( settings )
        {
            xmlNode* node = xml->findNodeLevel1(settings, "DevVisor", sectionName);

            if( node )
                return node;
        }

        // Try root level
        return xml->findNodeLevel1(root, "DevVisor", sectionName);
    }
    // -------------------------------------------------------------------------
    void TopologyResolver::loadSettings( xmlNode* node, SupervisorSettings& settings )
    {
        VisorXML::iterator it(node);

        settings.name = it.getProp("name");
        settings.projectRoot = it.getProp2("projectRoot", ".");

        // runner="" means "run the entry point directly"
        if( xmlHasProp(node, (const xmlChar*)"runner") )
            settings.runner = parseArgs(it.getProp("runner"));

        settings.portVariable = it.getProp2("portVariable", settings.portVariable);
        settings.pollInterval_msec = it.getPIntProp("pollInterval", settings.pollInterval_msec);
        settings.stopTimeout_msec = it.getPIntProp("stopTimeout", settings.stopTimeout_msec);
        settings.reclaimGrace_msec = it.getPIntProp("reclaimGrace", settings.reclaimGrace_msec);

        if( !it.getProp("reclaim").empty() )
            settings.reclaim = ( it.getIntProp("reclaim") != 0 );
    }
    // -------------------------------------------------------------------------
    void TopologyResolver::loadEnvironment( xmlNode* node, SupervisorSettings& settings )
    {
        VisorXML::iterator it(node);

        if( !it.goChildren() )
            return;

        do
        {
            if( it.getName() == "Environment" )
            {
                VisorXML::iterator eit(it.getCurrent());

                if( !eit.goChildren() )
                    continue;

                do
                {
                    if( eit.getName() == "var" )
                    {
                        std::string varName = eit.getProp("name");

                        if( !varName.empty() )
                            settings.environment.emplace_back(varName, eit.getProp("value"));
                    }
                }
                while( eit.goNext() );
            }
        }
        while( it.goNext() );
    }
    // -------------------------------------------------------------------------
    void TopologyResolver::loadGateway( xmlNode* node, Topology& topology )
    {
        VisorXML::iterator it(node);
        xmlNode* gw = nullptr;

        if( it.goChildren() )
        {
            do
            {
                if( it.getName() == "Gateway" )
                {
                    gw = it.getCurrent();
                    break;
                }
            }
            while( it.goNext() );
        }

        if( !gw )
            throw ConfigError("configuration: gateway entry is missing");

        VisorXML::iterator git(gw);
        std::string portStr = trim(git.getProp("port"));

        if( portStr.empty() )
            throw ConfigError("configuration: gateway port is missing");

        ServiceSpec spec;
        spec.serviceName = git.getProp2("name", "gateway");
        spec.name = spec.serviceName;
        spec.command = git.getProp2("command", "./cmd/" + spec.serviceName);
        spec.port = parsePort(portStr);
        spec.args = parseArgs(git.getProp("args"));

        topology.services.insert(topology.services.begin(), spec);
    }
    // -------------------------------------------------------------------------
    void TopologyResolver::loadServices( xmlNode* node, Topology& topology )
    {
        VisorXML::iterator it(node);

        if( !it.goChildren() )
            return;

        do
        {
            if( it.getName() != "Services" )
                continue;

            VisorXML::iterator sit(it.getCurrent());

            if( !sit.goChildren() )
                continue;

            do
            {
                if( sit.getName() != "service" )
                    continue;

                const std::string name = sit.getProp("name");

                if( name.empty() )
                    throw ConfigError("configuration: <service> without name");

                const std::string command = sit.getProp2("command", "./cmd/" + name);
                const std::vector<std::string> args = parseArgs(sit.getProp("args"));

                std::vector<int> ports;
                VisorXML::iterator eit(sit.getCurrent());

                if( eit.goChildren() )
                {
                    do
                    {
                        if( eit.getName() == "endpoint" )
                            ports.push_back( parseEndpointPort(eit.getProp("url")) );
                    }
                    while( eit.goNext() );
                }

                if( ports.empty() )
                    throw ConfigError("configuration: service '" + name + "' has no endpoints");

                for( const auto& port : ports )
                {
                    ServiceSpec spec;
                    spec.serviceName = name;
                    spec.name = ( ports.size() > 1 ) ? name + "-" + std::to_string(port) : name;
                    spec.command = command;
                    spec.port = port;
                    spec.args = args;
                    topology.services.push_back(spec);
                }
            }
            while( sit.goNext() );
        }
        while( it.goNext() );
    }
    // -------------------------------------------------------------------------
    int TopologyResolver::parsePort( const std::string& s )
    {
        std::string p = trim(s);

        // ":8080" or "host:8080"
        auto pos = p.rfind(':');

        if( pos != std::string::npos )
            p = p.substr(pos + 1);

        int port = 0;

        if( !str_to_int(p, port) || port < 1 || port > 65535 )
            throw ConfigError("configuration: bad port '" + s + "' (must be an integer in 1..65535)");

        return port;
    }
    // -------------------------------------------------------------------------
    int TopologyResolver::parseEndpointPort( const std::string& url )
    {
        std::string rest = trim(url);

        if( rest.empty() )
            throw ConfigError("configuration: endpoint without url");

        auto pos = rest.find("://");

        if( pos != std::string::npos )
            rest = rest.substr(pos + 3);

        std::string authority = rest.substr(0, rest.find_first_of("/?#"));

        auto at = authority.rfind('@');

        if( at != std::string::npos )
            authority = authority.substr(at + 1);

        std::string portStr;

        if( !authority.empty() && authority[0] == '[' )
        {
            // [ipv6]:port
            auto rb = authority.find(']');

            if( rb != std::string::npos && rb + 1 < authority.size() && authority[rb + 1] == ':' )
                portStr = authority.substr(rb + 2);
        }
        else
        {
            auto colon = authority.rfind(':');

            if( colon != std::string::npos )
                portStr = authority.substr(colon + 1);
        }

        if( portStr.empty() )
            throw ConfigError("configuration: endpoint '" + url + "' has no port");

        int port = 0;

        if( !str_to_int(portStr, port) || port < 1 || port > 65535 )
            throw ConfigError("configuration: endpoint '" + url + "' has a bad port (must be an integer in 1..65535)");

        return port;
    }
    // -------------------------------------------------------------------------
    std::vector<std::string> TopologyResolver::parseArgs( const std::string& argsStr )
    {
        std::vector<std::string> args;

        std::string current;
        bool inQuotes = false;
        char quoteChar = 0;

        for( size_t i = 0; i < argsStr.length(); i++ )
        {
            char c = argsStr[i];

            if( !inQuotes && (c == '"' || c == '\'') )
            {
                inQuotes = true;
                quoteChar = c;
            }
            else if( inQuotes && c == quoteChar )
            {
                inQuotes = false;
                quoteChar = 0;
            }
            else if( !inQuotes && (c == ' ' || c == '\t' || c == '\n') )
            {
                if( !current.empty() )
                {
                    args.push_back(current);
                    current.clear();
                }
            }
            else
            {
                current += c;
            }
        }

        if( !current.empty() )
            args.push_back(current);

        return args;
    }
    // -------------------------------------------------------------------------
    void TopologyResolver::validate( const std::vector<ServiceSpec>& services )
    {
        std::set<int> ports;
        std::set<std::string> names;

        for( const auto& s : services )
        {
            if( !ports.insert(s.port).second )
            {
                std::ostringstream err;
                err << "configuration: port " << s.port << " is used more than once (" << s.name << ")";
                throw ConfigError(err.str());
            }

            if( !names.insert(s.name).second )
                throw ConfigError("configuration: service name '" + s.name + "' is used more than once");
        }
    }
    // -------------------------------------------------------------------------
} // end of namespace devvisor
// -------------------------------------------------------------------------
