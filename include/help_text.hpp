#ifndef HELP_TEXT_HPP
#define HELP_TEXT_HPP
#include <ostream>

/**
 * @brief Print usage information for the hook.
 *
 * @param prog Program name shown in the usage lines.
 * @param os   Stream receiving the text.
 */
void print_help(const char* prog, std::ostream& os);

#endif // HELP_TEXT_HPP
