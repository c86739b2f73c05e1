/*
 * netgate_inc.h
 *
 *  Created on: 18 Oct 2026
 *
 *  system includes shared by the netgate sources and apps
 */

#ifndef NETGATE_NETGATE_INC_H_
#define NETGATE_NETGATE_INC_H_

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <errno.h>
#include <unistd.h>
#include <signal.h>

#endif /* NETGATE_NETGATE_INC_H_ */
