#pragma once

#include <iostream>

// Compile with -DCIRCLEPACK_DEBUG=1 to enable trace logging on stderr
#if CIRCLEPACK_DEBUG
    #define DBG(x) do { std::cerr << "[circlepack] " << x << std::endl; } while (0)
    #define DBG_CIRCLE(msg, c) DBG(msg << " (" << (c).x() << ", " << (c).y() << ") r=" << (c).r)
#else
    #define DBG(x) do {} while (0)
    #define DBG_CIRCLE(msg, c) do {} while (0)
#endif
