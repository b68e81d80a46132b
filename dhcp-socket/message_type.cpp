/*
 * message_type.cpp
 *
 *  Created on: 2026. 10. 16.
 */

#include "message_type.hh"

uint8_t messageTypeToU8(MessageType type)
{
	return (uint8_t)type;
}

boost::optional<MessageType> messageTypeFromU8(uint8_t value)
{
	switch(value)
	{
	case 1: return DHCPDISCOVER;
	case 2: return DHCPOFFER;
	case 3: return DHCPREQUEST;
	case 4: return DHCPDECLINE;
	case 5: return DHCPACK;
	case 6: return DHCPNAK;
	case 7: return DHCPRELEASE;
	case 8: return DHCPINFORM;
	default:
		return boost::none;
	}
}

const char* messageTypeName(MessageType type)
{
	switch(type)
	{
	case DHCPDISCOVER: return "DISCOVER";
	case DHCPOFFER: return "OFFER";
	case DHCPREQUEST: return "REQUEST";
	case DHCPDECLINE: return "DECLINE";
	case DHCPACK: return "ACK";
	case DHCPNAK: return "NAK";
	case DHCPRELEASE: return "RELEASE";
	case DHCPINFORM: return "INFORM";
	}
	return "UNKNOWN";
}
