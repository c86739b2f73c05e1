/*
 * netgate_wait_for_ready.cpp
 *
 *  Created on: 18 Oct 2026
 *
 *  netgate_wait_for_ready [OPTS] HOST:PORT -- COMMAND [ARGS]
 *  Where
 *  HOST:PORT               # service to wait for, split on the last ':'
 *  COMMAND                 # exec'd once HOST:PORT accepts a connection
 *  Where OPTS are:
 *  -i, --interval=MSEC     # between probes, default NETGATE_INTERVAL or 2000
 *  -v, --verbose=LEVEL     # default NETGATE_VERBOSE or 0
 *
 *  exit status is COMMAND's own, or
 *  1 usage, 126 not executable, 127 not found, 128+N stopped by signal N
 */


#include "netgate.h"
#include "netgate_inc.h"

#include <popt.h>

#define USAGE "USAGE: netgate_wait_for_ready [OPTS] HOST:PORT -- COMMAND [ARGS]\n"

namespace G {
	netgate::Config config;
	netgate::Target target;
	netgate::Command command;
}

struct poptOption opt_table[] = {
	{ "interval",  'i', POPT_ARG_INT, &G::config.interval, 0, "msec between probes", "MSEC" },
	{ "verbose",   'v', POPT_ARG_INT, &G::config.verbose,  0, "report probe failures", "LEVEL" },
	POPT_AUTOHELP
	POPT_TABLEEND
};

void usage_error(poptContext opt_context, const char* fmt, const char* arg)
{
	fprintf(stderr, "ERROR: ");
	fprintf(stderr, fmt, arg);
	fprintf(stderr, "\n" USAGE);
	poptFreeContext(opt_context);
	exit(netgate::EXIT_USAGE);
}

void ui(int argc, const char **argv) {
	int gate_argc = netgate::split_command_line(argc, argv, G::command);

	poptContext opt_context =
			poptGetContext(argv[0], gate_argc, argv, opt_table, 0);
	int rc;
	while ( (rc = poptGetNextOpt( opt_context )) >= 0 ){
		;
	}
	if (rc < -1){
		usage_error(opt_context, "%s", poptStrerror(rc));
	}
	const char* spec = poptGetArg(opt_context);
	if (!spec){
		usage_error(opt_context, "must provide %s", "HOST:PORT");
	}
	if (netgate::parse_target(spec, G::target) != 0){
		usage_error(opt_context, "bad target \"%s\", expected HOST:PORT", spec);
	}
	const char* extra = poptGetArg(opt_context);
	if (extra){
		usage_error(opt_context, "unexpected argument \"%s\", COMMAND must follow --", extra);
	}
	if (gate_argc == argc){
		usage_error(opt_context, "missing %s", "-- COMMAND");
	}
	if (G::command.empty()){
		usage_error(opt_context, "no COMMAND after %s", "--");
	}
	if (G::config.interval < 0){
		usage_error(opt_context, "bad interval %s", "(negative)");
	}
	poptFreeContext(opt_context);
}

int main(int argc, const char **argv) {
	ui(argc, argv);

	if (netgate::install_stop_handlers() != 0){
		perror("sigaction");
		exit(1);
	}
	netgate::Gate gate(G::target, G::config);
	return gate.run(G::command);
}
