#ifndef SOFTSPI_ERROR_H
#define SOFTSPI_ERROR_H

#include <cerrno>
#include <cstdint>
#include <exception>
#include <system_error>

#include "softspi/AbstractPin.h"

namespace softspi
{
    constexpr const char* strip_path(const char* path)
    {
        const char* file = path;
        while (*path)
        {
            if (*path++ == '/')
            {
                file = path;
            }
            if (*path == ':')
            {
                break;
            }
        }
        return file;
    }

    #define STR1(x) #x
    #define STR2(x) STR1(x)
    #define LOCATION(suffix) softspi::strip_path(__FILE__ ":" STR2(__LINE__) suffix)
    #define THROW_ERROR(msg)                                (throw softspi::Error{LOCATION(": " msg)})
    #define THROW_ERROR_UNSUPPORTED(msg, line)              (throw softspi::ErrorUnsupported{LOCATION(": " msg), line})
    #define THROW_ERROR_OUT_OF_RANGE(msg, bit_count, width) (throw softspi::ErrorOutOfRange{LOCATION(": " msg), bit_count, width})
    #define THROW_SYSTEM_ERROR_CODE(msg, code)              (throw std::system_error(code, std::generic_category(), LOCATION(": " msg)))
    #define THROW_SYSTEM_ERROR(msg)                         THROW_SYSTEM_ERROR_CODE(msg, errno)


    struct Error : public std::exception
    {
        Error(char const* message)
            : message_(message)
        { }

        char const* what() const noexcept override
        {
            return message_;
        }

    private:
        char const* message_;
    };

    /// Raised when an operation needs a line that was not given at construction.
    struct ErrorUnsupported : public Error
    {
        ErrorUnsupported(char const* message, Line line)
            : Error(message)
            , line_{line}
        { }

        Line line() const noexcept
        {
            return line_;
        }

    private:
        Line line_;
    };

    /// Raised when a bit count does not fit in the word it targets.
    struct ErrorOutOfRange : public Error
    {
        ErrorOutOfRange(char const* message, uint32_t bit_count, uint32_t width)
            : Error(message)
            , bit_count_{bit_count}
            , width_{width}
        { }

        uint32_t bitCount() const noexcept
        {
            return bit_count_;
        }

        uint32_t width() const noexcept
        {
            return width_;
        }

    private:
        uint32_t bit_count_;
        uint32_t width_;
    };
}

#endif
