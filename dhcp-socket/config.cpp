/*
 * config.cpp
 *
 *  Created on: 2026. 10. 16.
 */

#include "config.hh"
#include "ip.hh"
#include <getopt.h>
#include <stdio.h>
#include <stdlib.h>
#include <errno.h>

enum LongOption
{
	OPT_LEASE_TIME = 1,
	OPT_MAX_LEASE_TIME,
	OPT_OFFER_TIME,
	OPT_DECLINE_TIME,
	OPT_SILENT_NAK,
	OPT_NO_INFORM,
	OPT_DB_TIMEOUT
};

ServerConfig::ServerConfig()
{
	workers = DEFAULT_WORKERS;
	dbHost = "localhost";
	dbName = "dhcp";
	dbTimeout = DEFAULT_DB_TIMEOUT;
	daemonize = false;
	verbose = false;
	help = false;
}

static bool read_seconds(const char* arg, uint32_t* value)
{
	char* end = 0;
	errno = 0;
	unsigned long ret = strtoul(arg, &end, 10);
	if(errno != 0 || end == arg || *end != '\0' || arg[0] == '-')
		return false;
	if(ret == 0 || ret > 0xFFFFFFFFul)
		return false;
	*value = (uint32_t)ret;
	return true;
}

static bool read_int(const char* arg, int min, int max, int* value)
{
	char* end = 0;
	errno = 0;
	long ret = strtol(arg, &end, 10);
	if(errno != 0 || end == arg || *end != '\0')
		return false;
	if(ret < min || ret > max)
		return false;
	*value = (int)ret;
	return true;
}

int parseConfig(int argc, char** argv, ServerConfig* config, std::string* error)
{
	static int long_opt;
	int option_index;

	static struct option long_options[] =
	{
			{"listen",   required_argument,       0, 'l'},
			{"workers",   required_argument,       0, 'w'},
			{"db-host",   required_argument,       0, 'H'},
			{"db-user",   required_argument,       0, 'u'},
			{"db-pass",   required_argument,       0, 'p'},
			{"db-name",   required_argument,       0, 'n'},
			{"daemon",   no_argument,       0, 'd'},
			{"verbose",   no_argument,       0, 'v'},
			{"help",   no_argument,       0, 'h'},
			{"lease-time",   required_argument,       &long_opt, OPT_LEASE_TIME},
			{"max-lease-time",   required_argument,       &long_opt, OPT_MAX_LEASE_TIME},
			{"offer-time",   required_argument,       &long_opt, OPT_OFFER_TIME},
			{"decline-time",   required_argument,       &long_opt, OPT_DECLINE_TIME},
			{"silent-nak",   no_argument,       &long_opt, OPT_SILENT_NAK},
			{"no-inform",   no_argument,       &long_opt, OPT_NO_INFORM},
			{"db-timeout",   required_argument,       &long_opt, OPT_DB_TIMEOUT},
			{0, 0, 0, 0}
	};

	ServerConfig parsed;

	optind = 0;
	opterr = 0;
	while (1)
	{
		long_opt = 0;
		int c = getopt_long (argc, argv, "l:w:H:u:p:n:dvh",
				long_options, &option_index);

		/* Detect the end of the options. */
		if (c == -1)
			break;

		if(long_opt)
		{
			switch(long_opt)
			{
			case OPT_LEASE_TIME:
				if(!read_seconds(optarg, &parsed.policy.leaseTime))
				{
					*error = std::string("invalid lease time: ") + optarg;
					return -1;
				}
				break;
			case OPT_MAX_LEASE_TIME:
				if(!read_seconds(optarg, &parsed.policy.maxLeaseTime))
				{
					*error = std::string("invalid max lease time: ") + optarg;
					return -1;
				}
				break;
			case OPT_OFFER_TIME:
				if(!read_seconds(optarg, &parsed.policy.offerTime))
				{
					*error = std::string("invalid offer time: ") + optarg;
					return -1;
				}
				break;
			case OPT_DECLINE_TIME:
				if(!read_seconds(optarg, &parsed.policy.declineTime))
				{
					*error = std::string("invalid decline time: ") + optarg;
					return -1;
				}
				break;
			case OPT_SILENT_NAK:
				parsed.policy.silentNak = true;
				break;
			case OPT_NO_INFORM:
				parsed.policy.inform = false;
				break;
			case OPT_DB_TIMEOUT:
				if(!read_int(optarg, 1, 3600, &parsed.dbTimeout))
				{
					*error = std::string("invalid database timeout: ") + optarg;
					return -1;
				}
				break;
			}
		}
		else
		{
			switch (c)
			{
			case 0:
				break;

			case 'l':
			{
				struct in_addr addr;
				if(!IP::readIP(optarg, &addr))
				{
					*error = std::string("invalid listen address: ") + optarg;
					return -1;
				}
				parsed.listenAddresses.push_back(addr);
				break;
			}
			case 'w':
			{
				if(!read_int(optarg, 1, MAX_WORKERS, &parsed.workers))
				{
					*error = std::string("invalid worker count: ") + optarg;
					return -1;
				}
				break;
			}
			case 'H':
				parsed.dbHost = optarg;
				break;
			case 'u':
				parsed.dbUser = optarg;
				break;
			case 'p':
				parsed.dbPass = optarg;
				break;
			case 'n':
				parsed.dbName = optarg;
				break;
			case 'd':
				parsed.daemonize = true;
				break;
			case 'v':
				parsed.verbose = true;
				break;
			case 'h':
				parsed.help = true;
				*config = parsed;
				return 0;
			default:
				if(optopt)
					*error = std::string("unknown or incomplete option: -") + (char)optopt;
				else
					*error = std::string("unknown option: ") + argv[optind - 1];
				return -1;
			}
		}
	}

	if(optind < argc)
	{
		*error = std::string("unexpected argument: ") + argv[optind];
		return -1;
	}

	if(parsed.dbUser.empty() || parsed.dbPass.empty())
	{
		*error = "missing database credentials (--db-user, --db-pass)";
		return -1;
	}

	if(parsed.policy.leaseTime > parsed.policy.maxLeaseTime)
		parsed.policy.leaseTime = parsed.policy.maxLeaseTime;

	if(parsed.listenAddresses.empty())
		parsed.listenAddresses.push_back(IP::ANY);

	*config = parsed;
	return 0;
}

void printUsage(const char* name)
{
	printf("Usage : %s options\n", name);
	printf("--listen -l [listen IP] [--listen another] (default 0.0.0.0)\n"
			"--lease-time [seconds] (default %d)\n"
			"--max-lease-time [seconds] (default %d)\n"
			"--offer-time [seconds] (default %d)\n"
			"--decline-time [seconds] (default %d)\n"
			"--workers -w [count] (default %d, at most %d)\n"
			"--silent-nak never answer with NAK\n"
			"--no-inform ignore DHCPINFORM\n"
			"--db-host -H [host] (default localhost)\n"
			"--db-user -u [user]\n"
			"--db-pass -p [password]\n"
			"--db-name -n [schema] (default dhcp)\n"
			"--db-timeout [seconds] (default %d)\n"
			"--daemon -d daemonize\n"
			"--verbose -v debug logging\n"
			"--help -h\n",
			DEFAULT_LEASE_TIME, DEFAULT_MAX_LEASE_TIME, DEFAULT_OFFER_TIME,
			DEFAULT_DECLINE_TIME, DEFAULT_WORKERS, MAX_WORKERS, DEFAULT_DB_TIMEOUT);
}
