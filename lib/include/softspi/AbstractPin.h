#ifndef SOFTSPI_ABSTRACT_PIN_H
#define SOFTSPI_ABSTRACT_PIN_H

namespace softspi
{
    /// Role of a line on the bus
    enum class Line
    {
        CLOCK,
        SELECT_SLAVE1,
        SELECT_SLAVE2,
        MISO,
        MOSI
    };

    constexpr char const* toString(Line line)
    {
        switch (line)
        {
            case Line::CLOCK:         { return "CLOCK";         }
            case Line::SELECT_SLAVE1: { return "SELECT_SLAVE1"; }
            case Line::SELECT_SLAVE2: { return "SELECT_SLAVE2"; }
            case Line::MISO:          { return "MISO";          }
            case Line::MOSI:          { return "MOSI";          }
            default:
            {
                return "Unknown";
            }
        }
    }


    class AbstractOutputPin
    {
    public:
        AbstractOutputPin() = default;
        virtual ~AbstractOutputPin() = default;

        /// Drive the line: true is high, false is low
        virtual void write(bool level) = 0;

        /// Release the line. No write is allowed afterwards.
        virtual void close() = 0;
    };


    class AbstractInputPin
    {
    public:
        AbstractInputPin() = default;
        virtual ~AbstractInputPin() = default;

        /// \return the current level of the line: true is high, false is low
        virtual bool read() = 0;

        /// Release the line. No read is allowed afterwards.
        virtual void close() = 0;
    };
}

#endif
