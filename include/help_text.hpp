#ifndef HELP_TEXT_HPP
#define HELP_TEXT_HPP
#include <iostream>

/** Print the command line help text. */
void print_help(const char* prog, std::ostream& os = std::cout);

#endif // HELP_TEXT_HPP
