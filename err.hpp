#pragma once

#include "types.hxx"

#include <cstdio>
#include <errno.h>
#include <string.h>

#ifndef SRC_FILE_NAME
#define SRC_FILE_NAME __FILE__
#endif

#define LVC_COLOR_BLUE		"\x1B[34m"
#define LVC_COLOR_DEFAULT	"\x1B[0m"
#define LVC_COLOR_GREEN		"\x1B[32m"
#define LVC_COLOR_RED		"\e[0;91m"
#define LVC_COLOR_YELLOW    "\e[93m"
#define LVC_COLOR_MAGENTA   "\e[35m"
#define LVC_BOLD_START      "\e[1m"
#define LVC_BOLD_END        "\033[0m"

#define lvc_info(fmt, args...) fprintf(stdout, \
	"%s[%s:%.3d %s]%s " fmt "\n", LVC_COLOR_BLUE, SRC_FILE_NAME, \
	__LINE__, __FUNCTION__, LVC_COLOR_DEFAULT, ##args)

#define lvc_warn(fmt, args...) fprintf(stdout, \
	"%s[%s:%.3d %s] " fmt "%s\n", LVC_COLOR_RED, SRC_FILE_NAME, \
	__LINE__, __FUNCTION__, ##args, LVC_COLOR_DEFAULT)

/// Highest severity, goes to stderr.
#define lvc_severe(fmt, args...) fprintf(stderr, \
	"%s%s[%s:%.3d %s] " fmt "%s\n", LVC_BOLD_START, LVC_COLOR_RED, \
	SRC_FILE_NAME, __LINE__, __FUNCTION__, ##args, LVC_BOLD_END)

#define lvc_trace(fmt, args...) fprintf(stdout, \
	"%s%s[%s:%.3d %s]%s%s " fmt "\n", LVC_BOLD_START, LVC_COLOR_MAGENTA, SRC_FILE_NAME, \
	__LINE__, __FUNCTION__, LVC_BOLD_END, LVC_COLOR_DEFAULT, ##args)

#define lvc_status(status) fprintf (stdout, "%s[%s %.3d] %s%s\n", \
	LVC_COLOR_RED, SRC_FILE_NAME, \
	__LINE__, strerror(status), LVC_COLOR_DEFAULT)

#define lvc_errno() lvc_status(errno)

#define lvc_printq2(msg, s) {\
	lvc_info("%s\"%s\"", msg, qPrintable(s));\
}

#define NO_ASSIGN_COPY_MOVE(TypeName)\
	TypeName(const TypeName&) = delete;\
	void operator=(const TypeName&) = delete;\
	TypeName(TypeName&&) = delete;

#define LVC_CHECK(flag) {\
	if (!(flag)) {\
		lvc_trace();\
		return false;\
	}\
}

#define LVC_CHECK_ARG(flag, ret) {\
	if (!(flag)) {\
		lvc_trace();\
		return ret;\
	}\
}
