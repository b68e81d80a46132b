/*
 * socket.cpp
 *
 *  Created on: 2026. 10. 16.
 */

#include "socket.hh"
#include "ip.hh"
#include <unistd.h>
#include <fcntl.h>
#include <sys/socket.h>
#include <arpa/inet.h>
#include <errno.h>
#include <string.h>
#include <memory.h>
#include <syslog.h>

UDPSocket::UDPSocket(struct in_addr localIP, int port)
{
	this->localIP = localIP;
	char ip_buf[32];
	IP::printIP(localIP, ip_buf, sizeof(ip_buf));

	sock = socket(AF_INET, SOCK_DGRAM, 0);
	if(sock < 0)
	{
		syslog(LOG_ERR, "cannot open udp socket: %s", strerror(errno));
		return;
	}

	int val = 1;
	if(setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &val, sizeof(val)) < 0)
	{
		syslog(LOG_ERR, "cannot set SO_REUSEADDR on %s: %s", ip_buf, strerror(errno));
		close(sock);
		sock = -1;
		return;
	}

	val = 1;
	if(setsockopt(sock, SOL_SOCKET, SO_BROADCAST, &val, sizeof(val)) < 0)
	{
		syslog(LOG_ERR, "cannot set SO_BROADCAST on %s: %s", ip_buf, strerror(errno));
		close(sock);
		sock = -1;
		return;
	}

	int flags = fcntl(sock, F_GETFL, 0);
	if(flags < 0 || fcntl(sock, F_SETFL, flags | O_NONBLOCK) < 0)
	{
		syslog(LOG_ERR, "cannot set non-blocking mode on %s: %s", ip_buf, strerror(errno));
		close(sock);
		sock = -1;
		return;
	}

	struct sockaddr_in addr;
	memset(&addr, 0, sizeof(addr));
	addr.sin_family = AF_INET;
	addr.sin_port = htons(port);
	addr.sin_addr = localIP;
	if(bind(sock, (struct sockaddr*)&addr, sizeof(addr)) < 0)
	{
		syslog(LOG_ERR, "cannot bind %s:%d: %s", ip_buf, port, strerror(errno));
		close(sock);
		sock = -1;
		return;
	}
}

UDPSocket::~UDPSocket()
{
	if(sock >= 0)
	{
		close(sock);
		sock = -1;
	}
}

bool UDPSocket::isValid() const
{
	return sock >= 0;
}

int UDPSocket::getFD() const
{
	return sock;
}

struct in_addr UDPSocket::getLocalIP() const
{
	return localIP;
}

int UDPSocket::readPacket(void* buffer, int length)
{
	struct sockaddr_in from;
	socklen_t len = sizeof(from);
	return recvfrom(sock, buffer, length, MSG_DONTWAIT | MSG_TRUNC, (struct sockaddr*)&from, &len);
}

int UDPSocket::writePacket(const void* buffer, int length, int port)
{
	struct sockaddr_in to;
	memset(&to, 0, sizeof(to));
	to.sin_family = AF_INET;
	to.sin_port = htons(port);
	to.sin_addr = IP::BROADCAST;

	return sendto(sock, buffer, length, 0, (struct sockaddr*)&to, sizeof(to));
}
