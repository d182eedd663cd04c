#pragma once

#include <util/base.h>

extern const char *PSIWAVE_NAME;
extern const char *PSIWAVE_VERSION;

// printf-style logging routed through libobs' blog().
// Every line is prefixed with "[psiwave] ".
void psi_log(int log_level, const char *format, ...) PRINTFATTR(2, 3);
