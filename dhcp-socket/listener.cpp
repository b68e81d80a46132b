/*
 * listener.cpp
 *
 *  Created on: 2026. 10. 16.
 */

#include "listener.hh"
#include "dispatcher.hh"
#include "dhcp.hh"
#include "ip.hh"

#include <sys/eventfd.h>
#include <event.h>
#include <stdio.h>
#include <unistd.h>
#include <stdlib.h>
#include <errno.h>
#include <string.h>
#include <syslog.h>

using namespace std;

static void terminate_listener(int fd, short what, void *arg)
{
	syslog(LOG_INFO, "Terminating listener...");
	eventfd_t v;
	if(eventfd_read(fd, &v) < 0)
		syslog(LOG_WARNING, "cannot read term event: %s", strerror(errno));
	struct event_base* evbase = (struct event_base*) arg;
	event_base_loopexit(evbase, NULL);
}

void Listener::read_packet(int fd, short what, void *arg)
{
	Listener* listener = (Listener*)arg;

	for(int burst = 0; burst < IO_BURST; burst++)
	{
		Packet* packet = new Packet(MY_PACKET_LEN);
		int readLen = listener->sock->readPacket(packet->getData(), packet->getCapacity());
		if(readLen < 0)
		{
			delete packet;
			break;
		}
		if(readLen > packet->getCapacity())
		{
			syslog(LOG_WARNING, "Dropped oversized datagram (%d bytes)", readLen);
			delete packet;
			continue;
		}
		packet->setLength(readLen);
		listener->dispatcher->dispatch(listener, packet);
	}
}

void Listener::send_packet(int fd, short what, void *arg)
{
	Listener* listener = (Listener*)arg;

	queue<Packet*> temp;
	pthread_mutex_lock(&listener->sendPacketLock);
	eventfd_t v = 0;
	if(eventfd_read(fd, &v) < 0)
		v = 0;
	for(eventfd_t count = 0; count < v && !listener->sendPacketRequestQueue.empty(); count++)
	{
		temp.push(listener->sendPacketRequestQueue.front());
		listener->sendPacketRequestQueue.pop();
	}
	pthread_mutex_unlock(&listener->sendPacketLock);

	bool failed = false;
	while(!temp.empty())
	{
		Packet* packet = temp.front();
		temp.pop();

		if(!failed && listener->sock->writePacket(packet->getData(), packet->getLength(), DHCP_CLIENT_PORT) < 0)
		{
			char ip_buf[32];
			syslog(LOG_ERR, "cannot send reply from %s: %s",
					IP::printIP(listener->getLocalIP(), ip_buf, sizeof(ip_buf)), strerror(errno));
			failed = true;
		}
		delete packet;
	}

	if(failed)
		event_base_loopexit(listener->evbase, NULL);
}

Listener::Listener(struct in_addr localIP, Dispatcher* dispatcher)
{
	this->dispatcher = dispatcher;
	this->sock = new UDPSocket(localIP, DHCP_SERVER_PORT);
	this->evbase = 0;
	this->termEvent = 0;
	this->readEvent = 0;
	this->sendEvent = 0;

	pthread_mutex_init(&this->sendPacketLock, NULL);

	termEventFD = eventfd(0,0);
	if(termEventFD < 0)
	{
		syslog(LOG_ERR, "cannot create term event");
		exit(1);
	}

	sendPacketFD = eventfd(0,0);
	if(sendPacketFD < 0)
	{
		syslog(LOG_ERR, "cannot create send event");
		exit(1);
	}

	evbase = event_base_new();
	if(evbase == 0)
	{
		syslog(LOG_ERR, "cannot create event base");
		exit(1);
	}

	termEvent = event_new(evbase, termEventFD,
			EV_READ, terminate_listener, evbase);
	event_add(termEvent, NULL);

	sendEvent = event_new(evbase, sendPacketFD,
			EV_READ | EV_PERSIST, Listener::send_packet, this);
	event_add(sendEvent, NULL);

	if(sock->isValid())
	{
		readEvent = event_new(evbase, sock->getFD(),
				EV_READ | EV_PERSIST, Listener::read_packet, this);
		event_add(readEvent, NULL);
	}
}

Listener::~Listener()
{
	if(readEvent)
		event_free(readEvent);
	event_free(sendEvent);
	event_free(termEvent);
	event_base_free(evbase);

	while(!sendPacketRequestQueue.empty())
	{
		delete sendPacketRequestQueue.front();
		sendPacketRequestQueue.pop();
	}

	pthread_mutex_destroy(&this->sendPacketLock);
	close(termEventFD);
	close(sendPacketFD);
	delete sock;
}

bool Listener::isValid() const
{
	return sock->isValid();
}

struct in_addr Listener::getLocalIP() const
{
	return sock->getLocalIP();
}

void Listener::serve(void)
{
	char ip_buf[32];
	syslog(LOG_INFO, "Listening on %s:%d", IP::printIP(getLocalIP(), ip_buf, sizeof(ip_buf)), DHCP_SERVER_PORT);

	while(!event_base_got_exit(evbase))
		event_base_loop(evbase, 0);
}

void Listener::terminate()
{
	eventfd_t v = 1;
	eventfd_write(this->termEventFD, v);
}

void Listener::sendPacketRequest(Packet* packet)
{
	pthread_mutex_lock(&this->sendPacketLock);
	this->sendPacketRequestQueue.push(packet);
	eventfd_t v = 1;
	eventfd_write(this->sendPacketFD, v);
	pthread_mutex_unlock(&this->sendPacketLock);
}
