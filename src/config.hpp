#pragma once

/*here you can choose how escape sequence support is decided*/

#define TERMCMD_ANSI_AUTO   0
#define TERMCMD_ANSI_ALWAYS 1
#define TERMCMD_ANSI_NEVER  2

#ifndef TERMCMD_ANSI_MODE
#define TERMCMD_ANSI_MODE TERMCMD_ANSI_AUTO
#endif

#if TERMCMD_ANSI_MODE == TERMCMD_ANSI_AUTO
#define TERMCMD_ANSI_MODE_NAME "auto"
#elif TERMCMD_ANSI_MODE == TERMCMD_ANSI_ALWAYS
#define TERMCMD_ANSI_MODE_NAME "always"
#elif TERMCMD_ANSI_MODE == TERMCMD_ANSI_NEVER
#define TERMCMD_ANSI_MODE_NAME "never"
#else
#error "TERMCMD_ANSI_MODE must be TERMCMD_ANSI_AUTO, TERMCMD_ANSI_ALWAYS or TERMCMD_ANSI_NEVER"
#endif

/*runtime override, read once per process*/
#ifndef TERMCMD_ANSI_ENV
#define TERMCMD_ANSI_ENV "TERMCMD_ANSI"
#endif

/*bytes FdSink buffers before draining to the descriptor*/
#ifndef TERMCMD_FD_SINK_CAPACITY
#define TERMCMD_FD_SINK_CAPACITY 4096
#endif
