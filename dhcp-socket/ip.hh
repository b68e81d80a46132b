/*
 * ip.hh
 *
 *  Created on: 2026. 10. 16.
 */

#ifndef IP_HH_
#define IP_HH_

#include <netinet/in.h>
#include <stdint.h>
#include <string>

class IP
{
public:
	static const struct in_addr ANY;
	static const struct in_addr BROADCAST;

	static uint32_t toHost(struct in_addr addr);
	static struct in_addr fromHost(uint32_t addr);

	static bool isZero(struct in_addr addr);

	// Netmask for a prefix length, clamped to 0-32.
	static struct in_addr netmask(int prefix);
	static struct in_addr broadcast(struct in_addr network, int prefix);
	static bool contains(struct in_addr network, int prefix, struct in_addr addr);

	static char* printIP(struct in_addr addr, char* buf, int len);
	static std::string toString(struct in_addr addr);

	// Strict dotted-quad parser; returns false on anything else.
	static bool readIP(const char* buf, struct in_addr* addr);
};

inline bool operator==(const struct in_addr& a, const struct in_addr& b)
{
	return a.s_addr == b.s_addr;
}

inline bool operator!=(const struct in_addr& a, const struct in_addr& b)
{
	return a.s_addr != b.s_addr;
}

#endif /* IP_HH_ */
