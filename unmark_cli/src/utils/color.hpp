//
// Created on 24/10/26.
//

#ifndef UNMARK_COLOR_HPP
#define UNMARK_COLOR_HPP

// ANSI escape sequences for console output
#define RESET   "\033[0m"
#define RED     "\033[1;31m"
#define GREEN   "\033[1;32m"
#define YELLOW  "\033[1;33m"
#define CYAN    "\033[1;36m"

#endif // UNMARK_COLOR_HPP
