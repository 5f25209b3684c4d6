#ifndef STACKNAV_VERSION_HPP
#define STACKNAV_VERSION_HPP

#include <string>

namespace stacknav {

const std::string STACKNAV_VERSION_STRING = "1.2.0";
const int STACKNAV_VERSION_MAJOR = 1;
const int STACKNAV_VERSION_MINOR = 2;
const int STACKNAV_VERSION_PATCH = 0;

} // namespace stacknav

#endif // STACKNAV_VERSION_HPP
