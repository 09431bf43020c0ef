#ifndef MIRRORUP_HPP
#define MIRRORUP_HPP

// Project version
#define MIRRORUP_VERSION_MAJOR 1
#define MIRRORUP_VERSION_MINOR 0
#define MIRRORUP_VERSION_PATCH 1

#define MIRRORUP_VERSION_STRING "1.0.1"

#endif
