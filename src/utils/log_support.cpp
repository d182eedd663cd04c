#include "log_support.hpp"

#include <cstdarg>
#include <cstdio>

#ifndef PSIWAVE_VERSION_STRING
#define PSIWAVE_VERSION_STRING "0.0.0"
#endif

const char *PSIWAVE_NAME = "psiwave";
const char *PSIWAVE_VERSION = PSIWAVE_VERSION_STRING;

void psi_log(int log_level, const char *format, ...)
{
	char template_buf[1024];
	std::snprintf(template_buf, sizeof(template_buf), "[%s] %s",
		PSIWAVE_NAME, format);

	va_list args;
	va_start(args, format);
	blogva(log_level, template_buf, args);
	va_end(args);
}
