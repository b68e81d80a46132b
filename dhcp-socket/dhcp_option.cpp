/*
 * dhcp_option.cpp
 *
 *  Created on: 2026. 10. 16.
 */

#include "dhcp_option.hh"
#include "ip.hh"
#include <memory.h>

SubnetMaskOption::SubnetMaskOption() { address = IP::ANY; }
SubnetMaskOption::SubnetMaskOption(struct in_addr address) : address(address) {}

RouterOption::RouterOption() {}
RouterOption::RouterOption(const std::vector<struct in_addr>& addresses) : addresses(addresses) {}

DNSServerOption::DNSServerOption() {}
DNSServerOption::DNSServerOption(const std::vector<struct in_addr>& addresses) : addresses(addresses) {}

HostnameOption::HostnameOption() {}
HostnameOption::HostnameOption(const std::string& name) : name(name) {}

DomainNameOption::DomainNameOption() {}
DomainNameOption::DomainNameOption(const std::string& name) : name(name) {}

RequestedIPOption::RequestedIPOption() { address = IP::ANY; }
RequestedIPOption::RequestedIPOption(struct in_addr address) : address(address) {}

LeaseTimeOption::LeaseTimeOption() : seconds(0) {}
LeaseTimeOption::LeaseTimeOption(uint32_t seconds) : seconds(seconds) {}

MessageTypeOption::MessageTypeOption() : type(DHCPDISCOVER) {}
MessageTypeOption::MessageTypeOption(MessageType type) : type(type) {}

ServerIdentifierOption::ServerIdentifierOption() { address = IP::ANY; }
ServerIdentifierOption::ServerIdentifierOption(struct in_addr address) : address(address) {}

RenewalTimeOption::RenewalTimeOption() : seconds(0) {}
RenewalTimeOption::RenewalTimeOption(uint32_t seconds) : seconds(seconds) {}

RebindingTimeOption::RebindingTimeOption() : seconds(0) {}
RebindingTimeOption::RebindingTimeOption(uint32_t seconds) : seconds(seconds) {}

UnknownOption::UnknownOption() : code(OPTION_PAD) {}
UnknownOption::UnknownOption(uint8_t code, const std::vector<uint8_t>& data) : code(code), data(data) {}

bool operator==(const SubnetMaskOption& a, const SubnetMaskOption& b) { return a.address == b.address; }
bool operator==(const RouterOption& a, const RouterOption& b) { return a.addresses == b.addresses; }
bool operator==(const DNSServerOption& a, const DNSServerOption& b) { return a.addresses == b.addresses; }
bool operator==(const HostnameOption& a, const HostnameOption& b) { return a.name == b.name; }
bool operator==(const DomainNameOption& a, const DomainNameOption& b) { return a.name == b.name; }
bool operator==(const RequestedIPOption& a, const RequestedIPOption& b) { return a.address == b.address; }
bool operator==(const LeaseTimeOption& a, const LeaseTimeOption& b) { return a.seconds == b.seconds; }
bool operator==(const MessageTypeOption& a, const MessageTypeOption& b) { return a.type == b.type; }
bool operator==(const ServerIdentifierOption& a, const ServerIdentifierOption& b) { return a.address == b.address; }
bool operator==(const RenewalTimeOption& a, const RenewalTimeOption& b) { return a.seconds == b.seconds; }
bool operator==(const RebindingTimeOption& a, const RebindingTimeOption& b) { return a.seconds == b.seconds; }
bool operator==(const UnknownOption& a, const UnknownOption& b) { return a.code == b.code && a.data == b.data; }

static struct in_addr read_address(const uint8_t* data)
{
	struct in_addr ret;
	memcpy(&ret, data, sizeof(ret));
	return ret;
}

static uint32_t read_u32(const uint8_t* data)
{
	return ((uint32_t)data[0] << 24) | ((uint32_t)data[1] << 16)
			| ((uint32_t)data[2] << 8) | (uint32_t)data[3];
}

static std::vector<struct in_addr> read_address_list(const uint8_t* data, int len)
{
	std::vector<struct in_addr> ret;
	for(int k = 0; k + 4 <= len; k += 4)
		ret.push_back(read_address(data + k));
	return ret;
}

DHCPOption parseOption(uint8_t code, const uint8_t* data, int len)
{
	switch(code)
	{
	case OPTION_SUBNET_MASK:
		if(len == 4)
			return SubnetMaskOption(read_address(data));
		break;
	case OPTION_ROUTER:
		if(len > 0 && len % 4 == 0)
			return RouterOption(read_address_list(data, len));
		break;
	case OPTION_DNS_SERVER:
		if(len > 0 && len % 4 == 0)
			return DNSServerOption(read_address_list(data, len));
		break;
	case OPTION_HOSTNAME:
		if(len > 0)
			return HostnameOption(std::string((const char*)data, len));
		break;
	case OPTION_DOMAIN_NAME:
		if(len > 0)
			return DomainNameOption(std::string((const char*)data, len));
		break;
	case OPTION_REQUESTED_IP:
		if(len == 4)
			return RequestedIPOption(read_address(data));
		break;
	case OPTION_LEASE_TIME:
		if(len == 4)
			return LeaseTimeOption(read_u32(data));
		break;
	case OPTION_MESSAGE_TYPE:
		if(len == 1)
		{
			boost::optional<MessageType> type = messageTypeFromU8(data[0]);
			if(type)
				return MessageTypeOption(*type);
		}
		break;
	case OPTION_SERVER_IDENTIFIER:
		if(len == 4)
			return ServerIdentifierOption(read_address(data));
		break;
	case OPTION_RENEWAL_TIME:
		if(len == 4)
			return RenewalTimeOption(read_u32(data));
		break;
	case OPTION_REBINDING_TIME:
		if(len == 4)
			return RebindingTimeOption(read_u32(data));
		break;
	default:
		break;
	}
	return UnknownOption(code, std::vector<uint8_t>(data, data + len));
}

class OptionCodeVisitor : public boost::static_visitor<uint8_t>
{
public:
	uint8_t operator()(const SubnetMaskOption&) const { return OPTION_SUBNET_MASK; }
	uint8_t operator()(const RouterOption&) const { return OPTION_ROUTER; }
	uint8_t operator()(const DNSServerOption&) const { return OPTION_DNS_SERVER; }
	uint8_t operator()(const HostnameOption&) const { return OPTION_HOSTNAME; }
	uint8_t operator()(const DomainNameOption&) const { return OPTION_DOMAIN_NAME; }
	uint8_t operator()(const RequestedIPOption&) const { return OPTION_REQUESTED_IP; }
	uint8_t operator()(const LeaseTimeOption&) const { return OPTION_LEASE_TIME; }
	uint8_t operator()(const MessageTypeOption&) const { return OPTION_MESSAGE_TYPE; }
	uint8_t operator()(const ServerIdentifierOption&) const { return OPTION_SERVER_IDENTIFIER; }
	uint8_t operator()(const RenewalTimeOption&) const { return OPTION_RENEWAL_TIME; }
	uint8_t operator()(const RebindingTimeOption&) const { return OPTION_REBINDING_TIME; }
	uint8_t operator()(const UnknownOption& option) const { return option.code; }
};

class OptionPayloadVisitor : public boost::static_visitor<void>
{
private:
	std::vector<uint8_t>& out;

	void writeAddress(struct in_addr addr) const
	{
		const uint8_t* bytes = (const uint8_t*)&addr;
		out.insert(out.end(), bytes, bytes + 4);
	}
	void writeAddressList(const std::vector<struct in_addr>& list) const
	{
		for(std::vector<struct in_addr>::const_iterator iter = list.begin();
				iter != list.end() && out.size() + 4 <= DHCP_OPTION_MAX_LEN;
				++iter)
			writeAddress(*iter);
	}
	void writeU32(uint32_t value) const
	{
		out.push_back((value >> 24) & 0xFF);
		out.push_back((value >> 16) & 0xFF);
		out.push_back((value >> 8) & 0xFF);
		out.push_back(value & 0xFF);
	}
	void writeText(const std::string& text) const
	{
		size_t len = text.size() > DHCP_OPTION_MAX_LEN ? DHCP_OPTION_MAX_LEN : text.size();
		out.insert(out.end(), text.begin(), text.begin() + len);
	}
public:
	OptionPayloadVisitor(std::vector<uint8_t>& out) : out(out) {}

	void operator()(const SubnetMaskOption& option) const { writeAddress(option.address); }
	void operator()(const RouterOption& option) const { writeAddressList(option.addresses); }
	void operator()(const DNSServerOption& option) const { writeAddressList(option.addresses); }
	void operator()(const HostnameOption& option) const { writeText(option.name); }
	void operator()(const DomainNameOption& option) const { writeText(option.name); }
	void operator()(const RequestedIPOption& option) const { writeAddress(option.address); }
	void operator()(const LeaseTimeOption& option) const { writeU32(option.seconds); }
	void operator()(const MessageTypeOption& option) const { out.push_back(messageTypeToU8(option.type)); }
	void operator()(const ServerIdentifierOption& option) const { writeAddress(option.address); }
	void operator()(const RenewalTimeOption& option) const { writeU32(option.seconds); }
	void operator()(const RebindingTimeOption& option) const { writeU32(option.seconds); }
	void operator()(const UnknownOption& option) const
	{
		size_t len = option.data.size() > DHCP_OPTION_MAX_LEN ? DHCP_OPTION_MAX_LEN : option.data.size();
		out.insert(out.end(), option.data.begin(), option.data.begin() + len);
	}
};

uint8_t optionCode(const DHCPOption& option)
{
	return boost::apply_visitor(OptionCodeVisitor(), option);
}

std::vector<uint8_t> encodeOptionPayload(const DHCPOption& option)
{
	std::vector<uint8_t> ret;
	OptionPayloadVisitor visitor(ret);
	boost::apply_visitor(visitor, option);
	return ret;
}

int encodeOption(const DHCPOption& option, Packet* packet, int offset)
{
	std::vector<uint8_t> payload = encodeOptionPayload(option);
	int len = (int)payload.size();

	if(!packet->writeByte(offset, optionCode(option)))
		return -1;
	if(!packet->writeByte(offset + 1, (uint8_t)len))
		return -1;
	if(len > 0 && !packet->writeByteArray(offset + 2, offset + 2 + len, &payload[0]))
		return -1;
	return 2 + len;
}
