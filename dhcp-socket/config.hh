/*
 * config.hh
 *
 *  Created on: 2026. 10. 16.
 */

#ifndef CONFIG_HH_
#define CONFIG_HH_

#include "allocator.hh"
#include <netinet/in.h>
#include <string>
#include <vector>

#define DEFAULT_WORKERS 4
#define MAX_WORKERS 64
#define DEFAULT_DB_TIMEOUT 5

struct ServerConfig
{
	std::vector<struct in_addr> listenAddresses;
	LeasePolicy policy;
	int workers;

	std::string dbHost;
	std::string dbUser;
	std::string dbPass;
	std::string dbName;
	int dbTimeout;

	bool daemonize;
	bool verbose;
	bool help;

	ServerConfig();
};

/*
 * Parses the command line into config. Returns 0 on success, -1 with a
 * message in error otherwise. Listen addresses default to 0.0.0.0.
 */
int parseConfig(int argc, char** argv, ServerConfig* config, std::string* error);

void printUsage(const char* name);

#endif /* CONFIG_HH_ */
