/*
 * netgate.h
 *
 *  Created on: 18 Oct 2026
 *
 *  netgate: block until a TCP service accepts connections, then exec a command
 */

#ifndef NETGATE_NETGATE_H_
#define NETGATE_NETGATE_H_

#include <stdio.h>

#include <vector>
#include <string>

namespace netgate {

int getenvint(const char* key, int def);

struct Target {
	std::string host;
	int port;
	std::string spec;	// argument as given, used in notices
	Target(): port(0) {}
};

/* split HOST:PORT on the last colon. [HOST]:PORT loses the brackets.
 * returns 0 on success, -1 if either part is empty or the port is not 1..65535
 */
int parse_target(const std::string& spec, Target& target);

typedef std::vector<std::string> Command;

/* argv[0..ret) are options and target, everything after the first "--"
 * goes to command verbatim. returns argc when there is no "--"
 */
int split_command_line(int argc, const char** argv, Command& command);

enum ExitCodes {
	EXIT_USAGE = 1,
	EXIT_NOEXEC = 126,
	EXIT_NOTFOUND = 127,
	EXIT_SIGNAL = 128
};

const int INTERVAL_DEF = 2000;		// msec
const int CONNECT_TO = 2000;		// msec

struct Config {
	int interval;			// msec between probes
	int connect_timeout;		// msec, per probe
	int verbose;
	Config();
};

class Netclient {
protected:
	const std::string addr;
	const int port;
	int skt;
	std::string why;
public:
	Netclient(const char* _addr, int _port, int timeout_msec = CONNECT_TO);
	virtual ~Netclient();

	bool is_connected() const {
		return skt >= 0;
	}
	const std::string& error() const {
		return why;
	}
private:
	Netclient(const Netclient&);
	Netclient& operator=(const Netclient&);
};

int install_stop_handlers();
int stop_requested();			// signal number, 0 if none
void request_stop(int signo);
void clear_stop();

class Gate {
protected:
	const Target target;
	const Config config;
	FILE* diag;
	int nprobes;
public:
	Gate(const Target& _target, const Config& _config, FILE* _diag = stderr);
	virtual ~Gate();

	/* probe until the target is reachable.
	 * returns 0 when available, EXIT_SIGNAL+signo if stopped while waiting
	 */
	int wait_for_ready();

	/* wait_for_ready() then handoff(command).
	 * only returns on failure, with the exit status to use
	 */
	int run(const Command& command);

	virtual bool probe();
	virtual void pause(int msec);
	virtual int handoff(const Command& command);

	int probes() const {
		return nprobes;
	}
};

} 	// namespace netgate

#endif /* NETGATE_NETGATE_H_ */
