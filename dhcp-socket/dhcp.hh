/*
 * dhcp.hh
 *
 *  Created on: 2026. 10. 16.
 */

#ifndef DHCP_HH_
#define DHCP_HH_

#include "dhcp_option.hh"
#include "mac_address.hh"
#include "message_type.hh"
#include "packet.hh"
#include <boost/optional.hpp>
#include <netinet/in.h>
#include <stdint.h>
#include <string>
#include <vector>

#define DHCP_SERVER_PORT 67
#define DHCP_CLIENT_PORT 68

#define DHCP_HEADER_LEN 240
#define DHCP_MAGIC_OFFSET 236
#define DHCP_CHADDR_OFFSET 28
#define DHCP_CHADDR_LEN 16

#define BOOTREQUEST 1
#define BOOTREPLY 2
#define HTYPE_ETHER 1
#define BOOTP_BROADCAST 0x8000

enum DecodeError
{
	DECODE_OK = 0,
	DECODE_TOO_SMALL,
	DECODE_INVALID_HARDWARE_ADDRESS
};

const char* decodeErrorName(DecodeError error);

struct DHCPPacket
{
	uint8_t op;
	uint8_t htype;
	uint8_t hlen;
	uint8_t hops;
	uint32_t xid;
	uint16_t secs;
	uint16_t flags;
	struct in_addr ciaddr;
	struct in_addr yiaddr;
	struct in_addr siaddr;
	struct in_addr giaddr;
	MacAddress chaddr;
	std::vector<DHCPOption> options;

	DHCPPacket();

	boost::optional<MessageType> getMessageType() const;
	boost::optional<struct in_addr> getRequestedIP() const;
	boost::optional<struct in_addr> getServerIdentifier() const;
	boost::optional<uint32_t> getLeaseTime() const;
	boost::optional<std::string> getHostname() const;

	bool operator==(const DHCPPacket& other) const;
};

class DHCP
{
public:
	static const uint8_t MAGIC_COOKIE[4];

	static DecodeError decode(const Packet& packet, DHCPPacket* out);

	// Returns the encoded length, or -1 if the packet buffer is too small.
	static int encode(const DHCPPacket& dhcp, Packet* packet);
};

#endif /* DHCP_HH_ */
