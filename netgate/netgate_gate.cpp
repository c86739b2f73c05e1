/*
 * netgate_gate.cpp
 *
 *  Created on: 18 Oct 2026
 *
 *  Gate: probe loop and exec handoff
 */


#include "netgate.h"
#include "netgate_inc.h"

#include <time.h>

namespace netgate {

Gate::Gate(const Target& _target, const Config& _config, FILE* _diag):
	target(_target), config(_config), diag(_diag), nprobes(0)
{}

Gate::~Gate() {

}

bool Gate::probe()
{
	Netclient client(target.host.c_str(), target.port, config.connect_timeout);
	if (!client.is_connected() && config.verbose){
		fprintf(diag, "probe %s failed: %s\n", target.spec.c_str(), client.error().c_str());
	}
	return client.is_connected();
}

void Gate::pause(int msec)
{
	struct timespec ts;
	ts.tv_sec = msec/1000;
	ts.tv_nsec = (msec%1000)*1000000L;

	// a signal landing between this check and nanosleep() waits out the interval
	if (stop_requested()){
		return;
	}
	while (nanosleep(&ts, &ts) < 0 && errno == EINTR){
		if (stop_requested()){
			return;
		}
	}
}

int Gate::wait_for_ready()
{
	while(1){
		if (stop_requested()){
			return EXIT_SIGNAL + stop_requested();
		}
		++nprobes;
		if (probe()){
			if (config.verbose > 1) fprintf(diag, "%s ready after %d probes\n", target.spec.c_str(), nprobes);
			return 0;
		}
		if (stop_requested()){
			return EXIT_SIGNAL + stop_requested();
		}
		fprintf(diag, "Waiting for %s to be available...\n", target.spec.c_str());
		fflush(diag);
		pause(config.interval);
	}
}

int Gate::run(const Command& command)
{
	if (command.empty()){
		fprintf(diag, "ERROR: no command to run\n");
		return EXIT_USAGE;
	}
	int rc = wait_for_ready();
	if (rc != 0){
		return rc;
	}
	fprintf(diag, "%s is available - running command\n", target.spec.c_str());
	fflush(diag);
	return handoff(command);
}

int Gate::handoff(const Command& command)
{
	std::vector<char*> argv;
	for (unsigned ii = 0; ii < command.size(); ++ii){
		argv.push_back(const_cast<char*>(command[ii].c_str()));
	}
	argv.push_back(0);

	fflush(stdout);
	execvp(argv[0], argv.data());

	int err = errno;
	fprintf(diag, "ERROR: failed to run %s: %s\n", argv[0], strerror(err));
	return err == ENOENT? EXIT_NOTFOUND: EXIT_NOEXEC;
}

}	// namespace netgate
