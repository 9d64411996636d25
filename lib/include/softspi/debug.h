#ifndef SOFTSPI_DEBUG_H
#define SOFTSPI_DEBUG_H

#include <cstdio>

#include "softspi/Error.h"

namespace softspi
{

#define _none(...)    do { if (0) { fprintf(stderr, ##__VA_ARGS__); } } while (0);
#define _error(...)   do { fprintf(stderr, "[E] %s ", LOCATION()); fprintf(stderr, ##__VA_ARGS__); } while(0);
#define _warning(...) do { fprintf(stderr, "[W] %s ", LOCATION()); fprintf(stderr, ##__VA_ARGS__); } while(0);
#define _info(...)    do { fprintf(stdout, "[I] %s ", LOCATION()); fprintf(stdout, ##__VA_ARGS__); } while(0);


#ifdef DEBUG_SPI_ERROR
    #define spi_error   _error
#else
    #define spi_error   _none
#endif

#ifdef DEBUG_SPI_WARNING
    #define spi_warning _warning
#else
    #define spi_warning _none
#endif

#ifdef DEBUG_SPI_INFO
    #define spi_info    _info
#else
    #define spi_info    _none
#endif


#ifdef DEBUG_GPIO_ERROR
    #define gpio_error   _error
#else
    #define gpio_error   _none
#endif

#ifdef DEBUG_GPIO_WARNING
    #define gpio_warning _warning
#else
    #define gpio_warning _none
#endif

#ifdef DEBUG_GPIO_INFO
    #define gpio_info    _info
#else
    #define gpio_info    _none
#endif

}

#endif
