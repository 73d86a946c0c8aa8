#ifndef HELP_TEXT_HPP
#define HELP_TEXT_HPP

namespace pathmon {

/** @brief Print usage and the option table to standard output. */
void print_help(const char* prog);

} // namespace pathmon

#endif // HELP_TEXT_HPP
