/*
 * mac_address.hh
 *
 *  Created on: 2026. 10. 16.
 */

#ifndef MAC_ADDRESS_HH_
#define MAC_ADDRESS_HH_

#include <net/ethernet.h>
#include <stddef.h>
#include <stdint.h>
#include <string>

class MacAddress
{
private:
	uint8_t octet[ETH_ALEN];
public:
	MacAddress();
	explicit MacAddress(const uint8_t* bytes);

	const uint8_t* getBytes() const;
	bool isZero() const;

	// "AA:BB:CC:DD:EE:FF"
	char* printMAC(char* buf, int len) const;
	std::string toString() const;

	// Accepts exactly six colon-separated hex pairs, either case.
	static bool readMAC(const char* buf, MacAddress* mac);

	bool operator==(const MacAddress& other) const;
	bool operator!=(const MacAddress& other) const;
	bool operator<(const MacAddress& other) const;

	static const MacAddress NONE;
};

std::size_t hash_value(const MacAddress& mac);

#endif /* MAC_ADDRESS_HH_ */
