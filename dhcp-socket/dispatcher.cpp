/*
 * dispatcher.cpp
 *
 *  Created on: 2026. 10. 16.
 */

#include "dispatcher.hh"
#include "listener.hh"
#include "dhcp.hh"
#include <sys/eventfd.h>
#include <unistd.h>
#include <stdlib.h>
#include <errno.h>
#include <string.h>
#include <syslog.h>

using namespace std;

static void terminate_worker(int fd, short what, void *arg)
{
	eventfd_t v;
	if(eventfd_read(fd, &v) < 0)
		syslog(LOG_WARNING, "cannot read term event: %s", strerror(errno));
	struct event_base* evbase = (struct event_base*) arg;
	event_base_loopexit(evbase, NULL);
}

Dispatcher::Dispatcher(Allocator* allocator, int workerCount)
{
	this->allocator = allocator;
	this->droppedJobs = 0;
	this->lastDropReport = 0;

	pthread_mutex_init(&this->jobLock, NULL);

	jobFD = eventfd(0, EFD_SEMAPHORE | EFD_NONBLOCK);
	if(jobFD < 0)
	{
		syslog(LOG_ERR, "cannot create job event");
		exit(1);
	}

	for(int k = 0; k < workerCount; k++)
	{
		struct worker* w = new struct worker;
		w->dispatcher = this;
		w->running = false;

		w->termEventFD = eventfd(0,0);
		if(w->termEventFD < 0)
		{
			syslog(LOG_ERR, "cannot create term event");
			exit(1);
		}

		w->evbase = event_base_new();
		if(w->evbase == 0)
		{
			syslog(LOG_ERR, "cannot create event base");
			exit(1);
		}

		w->termEvent = event_new(w->evbase, w->termEventFD,
				EV_READ, terminate_worker, w->evbase);
		event_add(w->termEvent, NULL);

		w->jobEvent = event_new(w->evbase, jobFD,
				EV_READ | EV_PERSIST, Dispatcher::take_job, this);
		event_add(w->jobEvent, NULL);

		workers.push_back(w);
	}
}

Dispatcher::~Dispatcher()
{
	for(vector<struct worker*>::iterator iter = workers.begin(); iter != workers.end(); ++iter)
	{
		struct worker* w = *iter;
		event_free(w->jobEvent);
		event_free(w->termEvent);
		event_base_free(w->evbase);
		close(w->termEventFD);
		delete w;
	}

	while(!jobQueue.empty())
	{
		delete jobQueue.front().packet;
		jobQueue.pop();
	}

	pthread_mutex_destroy(&this->jobLock);
	close(jobFD);
}

void* Dispatcher::serve_worker(void* arg)
{
	struct worker* w = (struct worker*)arg;

	while(!event_base_got_exit(w->evbase))
		event_base_loop(w->evbase, 0);

	return 0;
}

int Dispatcher::start()
{
	int started = 0;
	for(vector<struct worker*>::iterator iter = workers.begin(); iter != workers.end(); ++iter)
	{
		int ret = pthread_create(&(*iter)->thread, 0, Dispatcher::serve_worker, *iter);
		if(ret != 0)
		{
			syslog(LOG_ERR, "cannot start worker: %s", strerror(ret));
			continue;
		}
		(*iter)->running = true;
		started++;
	}
	syslog(LOG_INFO, "%d workers started", started);
	return started;
}

void Dispatcher::terminate()
{
	for(vector<struct worker*>::iterator iter = workers.begin(); iter != workers.end(); ++iter)
	{
		eventfd_t v = 1;
		eventfd_write((*iter)->termEventFD, v);
	}
}

void Dispatcher::join()
{
	for(vector<struct worker*>::iterator iter = workers.begin(); iter != workers.end(); ++iter)
	{
		if(!(*iter)->running)
			continue;
		pthread_join((*iter)->thread, 0);
		(*iter)->running = false;
	}
}

void Dispatcher::dispatch(Listener* listener, Packet* packet)
{
	struct dhcp_job job;
	job.listener = listener;
	job.packet = packet;

	pthread_mutex_lock(&this->jobLock);
	if(jobQueue.size() >= MAX_PENDING_JOBS)
	{
		droppedJobs++;
		time_t now = time(0);
		if(now != lastDropReport)
		{
			syslog(LOG_WARNING, "Job queue full, %lu packets dropped", droppedJobs);
			lastDropReport = now;
			droppedJobs = 0;
		}
		pthread_mutex_unlock(&this->jobLock);
		delete packet;
		return;
	}
	jobQueue.push(job);
	eventfd_t v = 1;
	eventfd_write(this->jobFD, v);
	pthread_mutex_unlock(&this->jobLock);
}

size_t Dispatcher::getPendingJobs()
{
	pthread_mutex_lock(&this->jobLock);
	size_t ret = jobQueue.size();
	pthread_mutex_unlock(&this->jobLock);
	return ret;
}

void Dispatcher::take_job(int fd, short what, void *arg)
{
	Dispatcher* dispatcher = (Dispatcher*)arg;

	struct dhcp_job job;
	pthread_mutex_lock(&dispatcher->jobLock);
	eventfd_t v;
	if(eventfd_read(fd, &v) < 0 || dispatcher->jobQueue.empty())
	{
		// another worker took it
		pthread_mutex_unlock(&dispatcher->jobLock);
		return;
	}
	job = dispatcher->jobQueue.front();
	dispatcher->jobQueue.pop();
	pthread_mutex_unlock(&dispatcher->jobLock);

	dispatcher->process(job);
	delete job.packet;
}

void Dispatcher::process(const struct dhcp_job& job)
{
	DHCPPacket request;
	DecodeError error = DHCP::decode(*job.packet, &request);
	if(error != DECODE_OK)
	{
		syslog(LOG_WARNING, "Dropped malformed DHCP packet (%d bytes): %s",
				job.packet->getLength(), decodeErrorName(error));
		return;
	}

	DHCPPacket reply;
	if(!allocator->handle(request, job.listener->getLocalIP(), &reply))
		return;

	Packet* out = new Packet(MY_PACKET_LEN);
	if(DHCP::encode(reply, out) < 0)
	{
		syslog(LOG_ERR, "cannot encode DHCP %s reply",
				reply.getMessageType() ? messageTypeName(*reply.getMessageType()) : "unknown");
		delete out;
		return;
	}
	job.listener->sendPacketRequest(out);
}
