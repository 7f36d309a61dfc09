#ifndef IDS_HPP
#define IDS_HPP

#include <string>

// Random 8-4-4-4-12 hex id for sessions created without one.
std::string generate_session_id();

// "auto_<last 6 digits of unix time>_<6 random [a-z0-9]>"
std::string generate_auto_group_id();

#endif
