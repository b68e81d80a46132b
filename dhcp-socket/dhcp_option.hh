/*
 * dhcp_option.hh
 *
 *  Created on: 2026. 10. 16.
 */

#ifndef DHCP_OPTION_HH_
#define DHCP_OPTION_HH_

#include "message_type.hh"
#include "packet.hh"
#include <boost/variant.hpp>
#include <netinet/in.h>
#include <stdint.h>
#include <string>
#include <vector>

enum DHCPOptionCode
{
	OPTION_PAD = 0,
	OPTION_SUBNET_MASK = 1,
	OPTION_ROUTER = 3,
	OPTION_DNS_SERVER = 6,
	OPTION_HOSTNAME = 12,
	OPTION_DOMAIN_NAME = 15,
	OPTION_REQUESTED_IP = 50,
	OPTION_LEASE_TIME = 51,
	OPTION_MESSAGE_TYPE = 53,
	OPTION_SERVER_IDENTIFIER = 54,
	OPTION_RENEWAL_TIME = 58,
	OPTION_REBINDING_TIME = 59,
	OPTION_END = 255
};

#define DHCP_OPTION_MAX_LEN 255

struct SubnetMaskOption
{
	struct in_addr address;
	SubnetMaskOption();
	explicit SubnetMaskOption(struct in_addr address);
};

struct RouterOption
{
	std::vector<struct in_addr> addresses;
	RouterOption();
	explicit RouterOption(const std::vector<struct in_addr>& addresses);
};

struct DNSServerOption
{
	std::vector<struct in_addr> addresses;
	DNSServerOption();
	explicit DNSServerOption(const std::vector<struct in_addr>& addresses);
};

struct HostnameOption
{
	std::string name;
	HostnameOption();
	explicit HostnameOption(const std::string& name);
};

struct DomainNameOption
{
	std::string name;
	DomainNameOption();
	explicit DomainNameOption(const std::string& name);
};

struct RequestedIPOption
{
	struct in_addr address;
	RequestedIPOption();
	explicit RequestedIPOption(struct in_addr address);
};

struct LeaseTimeOption
{
	uint32_t seconds;
	LeaseTimeOption();
	explicit LeaseTimeOption(uint32_t seconds);
};

struct MessageTypeOption
{
	MessageType type;
	MessageTypeOption();
	explicit MessageTypeOption(MessageType type);
};

struct ServerIdentifierOption
{
	struct in_addr address;
	ServerIdentifierOption();
	explicit ServerIdentifierOption(struct in_addr address);
};

struct RenewalTimeOption
{
	uint32_t seconds;
	RenewalTimeOption();
	explicit RenewalTimeOption(uint32_t seconds);
};

struct RebindingTimeOption
{
	uint32_t seconds;
	RebindingTimeOption();
	explicit RebindingTimeOption(uint32_t seconds);
};

// Anything this server does not interpret, kept verbatim.
struct UnknownOption
{
	uint8_t code;
	std::vector<uint8_t> data;
	UnknownOption();
	UnknownOption(uint8_t code, const std::vector<uint8_t>& data);
};

bool operator==(const SubnetMaskOption& a, const SubnetMaskOption& b);
bool operator==(const RouterOption& a, const RouterOption& b);
bool operator==(const DNSServerOption& a, const DNSServerOption& b);
bool operator==(const HostnameOption& a, const HostnameOption& b);
bool operator==(const DomainNameOption& a, const DomainNameOption& b);
bool operator==(const RequestedIPOption& a, const RequestedIPOption& b);
bool operator==(const LeaseTimeOption& a, const LeaseTimeOption& b);
bool operator==(const MessageTypeOption& a, const MessageTypeOption& b);
bool operator==(const ServerIdentifierOption& a, const ServerIdentifierOption& b);
bool operator==(const RenewalTimeOption& a, const RenewalTimeOption& b);
bool operator==(const RebindingTimeOption& a, const RebindingTimeOption& b);
bool operator==(const UnknownOption& a, const UnknownOption& b);

typedef boost::variant<
		SubnetMaskOption,
		RouterOption,
		DNSServerOption,
		HostnameOption,
		DomainNameOption,
		RequestedIPOption,
		LeaseTimeOption,
		MessageTypeOption,
		ServerIdentifierOption,
		RenewalTimeOption,
		RebindingTimeOption,
		UnknownOption> DHCPOption;

// Interpret one option payload by code. Shapes that do not match the
// registry come back as UnknownOption.
DHCPOption parseOption(uint8_t code, const uint8_t* data, int len);

uint8_t optionCode(const DHCPOption& option);

// Payload bytes only, at most DHCP_OPTION_MAX_LEN.
std::vector<uint8_t> encodeOptionPayload(const DHCPOption& option);

// Writes code, length and payload at offset. Returns bytes written or -1.
int encodeOption(const DHCPOption& option, Packet* packet, int offset);

#endif /* DHCP_OPTION_HH_ */
