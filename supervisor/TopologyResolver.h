/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#ifndef TopologyResolver_H_
#define TopologyResolver_H_
// -------------------------------------------------------------------------
#include <memory>
#include <string>
#include <vector>
#include "ServiceInfo.h"
#include "VisorXML.h"
// -------------------------------------------------------------------------
namespace devvisor
{
    /*!
     * Topology resolver.
     * Builds the ordered list of services to launch from the XML configuration:
     * the gateway first, then one ServiceSpec per endpoint in document order.
     * Starts nothing.
     *
     * Expected XML structure:
     * <DevVisor name="dev" projectRoot="/home/dev/go-gateway" runner="go run"
     *           portVariable="PORT" pollInterval="1000" stopTimeout="10000" reclaimGrace="500">
     *   <Gateway name="gateway" command="./cmd/api-gateway" port=":8080"/>
     *   <Services>
     *     <service name="auth" command="./cmd/auth-service" args="--listen=:${PORT}">
     *       <endpoint url="http://localhost:8083"/>
     *     </service>
     *     <service name="service-a">
     *       <endpoint url="http://localhost:8081"/>
     *       <endpoint url="http://localhost:8084"/>
     *     </service>
     *   </Services>
     *   <Environment>
     *     <var name="APP_ENV" value="dev"/>
     *   </Environment>
     * </DevVisor>
     *
     * The DevVisor section is searched under <settings> first, then at the root level.
     * A service with several endpoints gets one spec per endpoint named "<name>-<port>".
     * A service without 'command' runs "./cmd/<name>".
     */
    class TopologyResolver
    {
        public:
            struct Topology
            {
                SupervisorSettings settings;
                std::vector<ServiceSpec> services; //!< gateway first
            };

            /*! \throw ConfigError */
            static Topology load( const std::string& xmlFile, const std::string& sectionName = "" );

            /*! \throw ConfigError */
            static Topology load( const std::shared_ptr<VisorXML>& xml, const std::string& sectionName = "" );

            /*! "8080" or ":8080" -> 8080
             * \throw ConfigError if not an integer in 1..65535
             */
            static int parsePort( const std::string& s );

            /*! "scheme://host:port[/path]" -> port
             * \throw ConfigError if the URL has no port or the port is invalid
             */
            static int parseEndpointPort( const std::string& url );

            /*! split by spaces, respect quotes */
            static std::vector<std::string> parseArgs( const std::string& argsStr );

            /*! \throw ConfigError on duplicate ports or names */
            static void validate( const std::vector<ServiceSpec>& services );

        private:
            static xmlNode* findSection( const std::shared_ptr<VisorXML>& xml, const std::string& sectionName );
            static void loadSettings( xmlNode* node, SupervisorSettings& settings );
            static void loadGateway( xmlNode* node, Topology& topology );
            static void loadServices( xmlNode* node, Topology& topology );
            static void loadEnvironment( xmlNode* node, SupervisorSettings& settings );
    };

} // end of namespace devvisor
// -------------------------------------------------------------------------
#endif // TopologyResolver_H_
// -------------------------------------------------------------------------
