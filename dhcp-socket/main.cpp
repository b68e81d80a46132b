/*
 * main.cpp
 *
 *  Created on: 2026. 10. 16.
 */

#include "config.hh"
#include "database.hh"
#include "allocator.hh"
#include "dispatcher.hh"
#include "listener.hh"
#include "ip.hh"
#include <signal.h>
#include <pthread.h>
#include <string.h>
#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <unistd.h>
#include <syslog.h>
#include <vector>

#define DAEMON_NAME "dhcp-socket"

using namespace std;

static vector<Listener*> listeners;

static void exit_handle(int num)
{
	for(vector<Listener*>::iterator iter = listeners.begin(); iter != listeners.end(); ++iter)
		(*iter)->terminate();
}

static void* serve(void* arg)
{
	Listener* listener = (Listener*)arg;

	listener->serve();

	return 0;
}

int main(int argc, char** argv)
{
	pid_t pid, sid;

	ServerConfig config;
	std::string error;
	if(parseConfig(argc, argv, &config, &error) < 0)
	{
		fprintf(stderr, "%s\n", error.c_str());
		printUsage(argv[0]);
		return 1;
	}
	if(config.help)
	{
		printUsage(argv[0]);
		return 0;
	}

	setlogmask(LOG_UPTO(config.verbose ? LOG_DEBUG : LOG_INFO));
	openlog(DAEMON_NAME, LOG_CONS | LOG_PERROR | LOG_PID, LOG_DAEMON);

	syslog(LOG_INFO, "%s daemon starting up", DAEMON_NAME);

	if(config.daemonize)
	{
		printf("starting the daemonizing process\n");

		pid = fork();
		if (pid < 0)
		{
			syslog(LOG_ERR, "cannot fork: %s", strerror(errno));
			return 1;
		}

		if (pid > 0)
		{
			printf("daemon pid: %d\n", pid);
			return 0;
		}

		umask(0);

		sid = setsid();
		if (sid < 0)
		{
			syslog(LOG_ERR, "cannot create session: %s", strerror(errno));
			return 1;
		}

		close(STDIN_FILENO);
		close(STDOUT_FILENO);
		close(STDERR_FILENO);
	}

	Database* db = 0;
	try
	{
		db = new Database(config.dbHost.c_str(), config.dbUser.c_str(), config.dbPass.c_str(),
				config.dbName.c_str(), config.dbTimeout);
	}
	catch(StoreError &e)
	{
		syslog(LOG_ERR, "%s", e.what());
		return 1;
	}

	Allocator allocator(db, config.policy);
	Dispatcher* dispatcher = new Dispatcher(&allocator, config.workers);

	for(vector<struct in_addr>::iterator iter = config.listenAddresses.begin();
			iter != config.listenAddresses.end(); ++iter)
	{
		Listener* listener = new Listener(*iter, dispatcher);
		if(!listener->isValid())
		{
			char ip_buf[32];
			syslog(LOG_ERR, "Listener on %s is not started", IP::printIP(*iter, ip_buf, sizeof(ip_buf)));
			delete listener;
			continue;
		}
		listeners.push_back(listener);
	}

	if(listeners.empty() || dispatcher->start() == 0)
	{
		syslog(LOG_ERR, "nothing to serve");
		for(vector<Listener*>::iterator iter = listeners.begin(); iter != listeners.end(); ++iter)
			delete *iter;
		listeners.clear();
		delete dispatcher;
		delete db;
		return 1;
	}

	signal(SIGINT, exit_handle);
	signal(SIGTERM, exit_handle);

	vector<pthread_t> threads;
	for(vector<Listener*>::iterator iter = listeners.begin(); iter != listeners.end(); ++iter)
	{
		pthread_t thread;
		int ret = pthread_create(&thread, 0, serve, *iter);
		if(ret != 0)
		{
			syslog(LOG_ERR, "cannot start listener: %s", strerror(ret));
			continue;
		}
		threads.push_back(thread);
	}

	for(vector<pthread_t>::iterator iter = threads.begin(); iter != threads.end(); ++iter)
		pthread_join(*iter, 0);

	signal(SIGINT, SIG_DFL);
	signal(SIGTERM, SIG_DFL);

	dispatcher->terminate();
	dispatcher->join();
	delete dispatcher;

	for(vector<Listener*>::iterator iter = listeners.begin(); iter != listeners.end(); ++iter)
		delete *iter;
	listeners.clear();

	delete db;

	syslog(LOG_INFO, "%s daemon exiting", DAEMON_NAME);
	closelog();
	return 0;
}
