#include "softspi/rpi/Gpio.h"
#include "softspi/Error.h"
#include "softspi/debug.h"

namespace softspi
{
namespace rpi
{
    OutputPin::OutputPin(uint8_t gpio)
        : gpio_{gpio}
        , is_open_{true}
    {
        bcm2835_gpio_fsel(gpio_, BCM2835_GPIO_FSEL_OUTP);
        gpio_info("GPIO %u configured as output\n", gpio_);
    }

    OutputPin::~OutputPin()
    {
        close();
    }

    void OutputPin::write(bool level)
    {
        bcm2835_gpio_write(gpio_, level ? HIGH : LOW);
    }

    void OutputPin::close()
    {
        if (not is_open_)
        {
            return;
        }

        // Back to high impedance
        bcm2835_gpio_fsel(gpio_, BCM2835_GPIO_FSEL_INPT);
        is_open_ = false;
        gpio_info("GPIO %u released\n", gpio_);
    }


    InputPin::InputPin(uint8_t gpio, Pull pull)
        : gpio_{gpio}
        , is_open_{true}
    {
        bcm2835_gpio_fsel(gpio_, BCM2835_GPIO_FSEL_INPT);
        switch (pull)
        {
            case Pull::NONE: { bcm2835_gpio_set_pud(gpio_, BCM2835_GPIO_PUD_OFF);  break; }
            case Pull::DOWN: { bcm2835_gpio_set_pud(gpio_, BCM2835_GPIO_PUD_DOWN); break; }
            case Pull::UP:   { bcm2835_gpio_set_pud(gpio_, BCM2835_GPIO_PUD_UP);   break; }
        }
        gpio_info("GPIO %u configured as input\n", gpio_);
    }

    InputPin::~InputPin()
    {
        close();
    }

    bool InputPin::read()
    {
        return bcm2835_gpio_lev(gpio_) == HIGH;
    }

    void InputPin::close()
    {
        if (not is_open_)
        {
            return;
        }

        bcm2835_gpio_set_pud(gpio_, BCM2835_GPIO_PUD_OFF);
        is_open_ = false;
        gpio_info("GPIO %u released\n", gpio_);
    }


    Gpio::Gpio()
    {
        if (not bcm2835_init())
        {
            THROW_SYSTEM_ERROR("bcm2835_init failed. Are you running as root?");
        }
    }

    Gpio::~Gpio()
    {
        if (not bcm2835_close())
        {
            gpio_error("bcm2835_close failed\n");
        }
    }

    std::shared_ptr<OutputPin> Gpio::output(uint8_t gpio)
    {
        return std::make_shared<OutputPin>(gpio);
    }

    std::shared_ptr<InputPin> Gpio::input(uint8_t gpio, Pull pull)
    {
        return std::make_shared<InputPin>(gpio, pull);
    }
}
}
