/*
 * netgate.cpp
 *
 *  Created on: 18 Oct 2026
 *
 *  target parsing, command line split, probe client
 */


#include "netgate.h"
#include "netgate_inc.h"

#include <ctype.h>

#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>

#include <netdb.h>
#include <poll.h>
#include <fcntl.h>
#include <time.h>

namespace netgate {

int getenvint(const char* key, int def)
{
	const char *val = ::getenv(key);
	if (val){
		return strtol(val, 0, 0);
	}else{
		return def;
	}
}

Config::Config():
	interval(getenvint("NETGATE_INTERVAL", INTERVAL_DEF)),
	connect_timeout(CONNECT_TO),
	verbose(getenvint("NETGATE_VERBOSE", 0))
{}

int parse_target(const std::string& spec, Target& target)
{
	std::string::size_type colon = spec.rfind(':');
	if (colon == std::string::npos){
		return -1;
	}
	std::string host = spec.substr(0, colon);
	std::string port = spec.substr(colon+1);

	if (host.size() >= 2 && host[0] == '[' && host[host.size()-1] == ']'){
		host = host.substr(1, host.size()-2);
	}
	if (host.empty() || port.empty() || port.size() > 5){
		return -1;
	}
	for (unsigned ii = 0; ii < port.size(); ++ii){
		if (!isdigit((unsigned char)port[ii])){
			return -1;
		}
	}
	int pn = strtol(port.c_str(), 0, 10);
	if (pn < 1 || pn > 65535){
		return -1;
	}
	target.host = host;
	target.port = pn;
	target.spec = spec;
	return 0;
}

int split_command_line(int argc, const char** argv, Command& command)
{
	command.clear();
	for (int ii = 1; ii < argc; ++ii){
		if (strcmp(argv[ii], "--") == 0){
			for (int ic = ii+1; ic < argc; ++ic){
				command.push_back(argv[ic]);
			}
			return ii;
		}
	}
	return argc;
}

/* returns connected socket or -1, with errno style code in err */
static int connect(const struct addrinfo* ai, int timeout, int& err)
{
	int sockfd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
	if (sockfd < 0){
		err = errno;
		return -1;
	}
	int flags = fcntl(sockfd, F_GETFL, 0);
	if (flags < 0 || fcntl(sockfd, F_SETFL, flags|O_NONBLOCK) < 0){
		err = errno;
		close(sockfd);
		return -1;
	}
	if (::connect(sockfd, ai->ai_addr, ai->ai_addrlen) == 0){
		return sockfd;
	}
	if (errno != EINPROGRESS){
		err = errno;
		close(sockfd);
		return -1;
	}

	struct pollfd fds[1];
	fds[0].fd = sockfd;
	fds[0].events = POLLOUT;
	int ret = poll(fds, 1, timeout);
	if (ret == 0){
		err = ETIMEDOUT;
		close(sockfd);
		return -1;
	}else if (ret < 0){
		err = errno;
		close(sockfd);
		return -1;
	}

	int so_error = 0;
	socklen_t len = sizeof(so_error);
	if (getsockopt(sockfd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0){
		err = errno;
		close(sockfd);
		return -1;
	}
	if (so_error != 0){
		err = so_error;
		close(sockfd);
		return -1;
	}
	return sockfd;
}

static long long now_msec()
{
	struct timespec ts;
	clock_gettime(CLOCK_MONOTONIC, &ts);
	return ts.tv_sec*1000LL + ts.tv_nsec/1000000;
}

/* timeout is shared by all resolved addresses. getaddrinfo() itself is not bounded */
static int connect(const char* addr, int port, int timeout, std::string& why)
{
	struct addrinfo hints;
	struct addrinfo* result;
	char service[8];

	memset(&hints, 0, sizeof(hints));
	hints.ai_family = AF_UNSPEC;
	hints.ai_socktype = SOCK_STREAM;
	snprintf(service, sizeof(service), "%d", port);

	int rc = getaddrinfo(addr, service, &hints, &result);
	if (rc != 0){
		why = gai_strerror(rc);
		return -1;
	}

	int sockfd = -1;
	int err = EHOSTUNREACH;
	long long deadline = now_msec() + timeout;
	for (struct addrinfo* ai = result; ai != 0; ai = ai->ai_next){
		long long remaining = deadline - now_msec();
		if (remaining <= 0){
			err = ETIMEDOUT;
			break;
		}
		sockfd = connect(ai, (int)remaining, err);
		if (sockfd >= 0 || err == EINTR){
			break;
		}
	}
	freeaddrinfo(result);

	if (sockfd < 0){
		why = strerror(err);
	}
	return sockfd;
}


Netclient::Netclient(const char* _addr, int _port, int timeout_msec):
	addr(_addr), port(_port), skt(-1)
{
	skt = connect(_addr, _port, timeout_msec, why);
}

Netclient::~Netclient() {
	if (skt >= 0){
		close(skt);
	}
}


static volatile sig_atomic_t G_stop_signal = 0;

static void on_stop_signal(int signo)
{
	G_stop_signal = signo;
}

/* an inherited SIG_IGN is left alone, so the command inherits it across exec */
static int install_stop_handler(int signo)
{
	struct sigaction old;
	if (sigaction(signo, 0, &old) < 0){
		return -1;
	}
	if (old.sa_handler == SIG_IGN){
		return 0;
	}
	struct sigaction sa;
	memset(&sa, 0, sizeof(sa));
	sa.sa_handler = on_stop_signal;
	sigemptyset(&sa.sa_mask);
	sa.sa_flags = 0;		// no SA_RESTART: the pause must see EINTR
	return sigaction(signo, &sa, 0);
}

int install_stop_handlers()
{
	if (install_stop_handler(SIGINT) < 0 || install_stop_handler(SIGTERM) < 0){
		return -1;
	}
	return 0;
}

int stop_requested()
{
	return G_stop_signal;
}

void request_stop(int signo)
{
	G_stop_signal = signo;
}

void clear_stop()
{
	G_stop_signal = 0;
}

}	// namespace netgate
