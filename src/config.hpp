#pragma once

/*compile-time layout and I/O knobs*/

#ifndef TINYED_HELP_TEXT
#define TINYED_HELP_TEXT "^W save  ^Q quit"
#endif

#ifndef TINYED_RC_NAME
#define TINYED_RC_NAME ".tinyedrc"
#endif
