#ifndef SOFTSPI_RPI_GPIO_H
#define SOFTSPI_RPI_GPIO_H

#include "softspi/AbstractPin.h"

#include <cstdint>
#include <memory>
#include <bcm2835.h>

namespace softspi
{
namespace rpi
{
    enum class Pull
    {
        NONE,
        DOWN,
        UP
    };

    class OutputPin final : public AbstractOutputPin
    {
    public:
        OutputPin(uint8_t gpio);
        virtual ~OutputPin();

        void write(bool level) override;
        void close() override;

    private:
        uint8_t gpio_;
        bool is_open_;
    };


    class InputPin final : public AbstractInputPin
    {
    public:
        InputPin(uint8_t gpio, Pull pull = Pull::NONE);
        virtual ~InputPin();

        bool read() override;
        void close() override;

    private:
        uint8_t gpio_;
        bool is_open_;
    };


    /// Access to the BCM2835 GPIO block (needs root or /dev/gpiomem).
    /// Pins must be closed before the Gpio is destroyed.
    class Gpio
    {
    public:
        Gpio();
        ~Gpio();

        Gpio(Gpio const&) = delete;
        Gpio& operator=(Gpio const&) = delete;

        std::shared_ptr<OutputPin> output(uint8_t gpio);
        std::shared_ptr<InputPin>  input(uint8_t gpio, Pull pull = Pull::NONE);
    };
}
}

#endif
