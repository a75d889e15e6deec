#ifndef PARAFETCH_PARAFETCH_HPP
#define PARAFETCH_PARAFETCH_HPP

#include <parafetch/export.hpp>

// Project version
#define PARAFETCH_VERSION_MAJOR 0
#define PARAFETCH_VERSION_MINOR 1
#define PARAFETCH_VERSION_PATCH 0

// Binary version
#define PARAFETCH_BINARY_CURRENT 0
#define PARAFETCH_BINARY_REVISION 0
#define PARAFETCH_BINARY_AGE 1

namespace parafetch
{
    PARAFETCH_API const char* version();
}

#endif
