#ifndef CODE_TABLES_HPP
#define CODE_TABLES_HPP

#include <string>

// code to display name lookups, both are total and safe to call from anywhere once the process is running
namespace code_tables {

inline const std::string unknown_key_name = "UNKNOWN KEY";

/**
 * @brief display name of an evdev key code, or "UNKNOWN KEY" for anything outside the table (negative codes
 * included)
 */
std::string key_name(int key_code);

/**
 * @brief display name of a pointer button code, unrecognized buttons are shown by their raw code
 */
std::string button_name(int button_code);

} // namespace code_tables

#endif // CODE_TABLES_HPP
