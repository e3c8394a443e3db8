#ifndef ANSI_H
#define ANSI_H

// ANSI Color codes
#define COLOR_RESET "\033[0m"
#define COLOR_RED "\033[31m"
#define COLOR_YELLOW "\033[33m"
#define COLOR_GREEN "\033[32m"
#define COLOR_MAGENTA "\033[35m"

#define COLOR_BRIGHT_RED "\033[91m"
#define COLOR_BRIGHT_BLUE "\033[94m"
#define COLOR_BRIGHT_MAGENTA "\033[95m"
#define COLOR_BRIGHT_CYAN "\033[96m"     // White discs
#define COLOR_BRIGHT_WHITE "\033[97m"    // Black discs
#define COLOR_BRIGHT_GREEN "\033[92m"

#define ESCAPE_CODE_BOLD "\033[1m"

#endif // ANSI_H
