// Loopback check of the bit-banged SPI master on a Raspberry Pi.
// Wire MOSI to MISO before running (as root).

#include <cinttypes>
#include <cstdio>
#include <exception>

#include "softspi/SpiConnection.h"
#include "softspi/rpi/Gpio.h"

using namespace softspi;

// BCM numbering
constexpr uint8_t CLOCK_GPIO = 11;
constexpr uint8_t CS_GPIO    = 8;
constexpr uint8_t MISO_GPIO  = 9;
constexpr uint8_t MOSI_GPIO  = 10;

int main()
{
    try
    {
        rpi::Gpio gpio;

        SpiConnection spi(gpio.output(CLOCK_GPIO),
                          gpio.output(CS_GPIO),
                          gpio.input(MISO_GPIO, rpi::Pull::DOWN),
                          gpio.output(MOSI_GPIO),
                          Endianness::LittleEndian);

        uint8_t const pattern = 0xA5;
        uint64_t echo = 0;
        {
            SlaveSelection selection = spi.selectSlave1();
            // MOSI holds the last written bit: read it back after each write
            for (int32_t i = 7; i >= 0; --i)
            {
                bool bit = pattern & (1 << i);
                spi.write(bit);
                echo = (echo << 1) | (spi.read() ? 1 : 0);
            }
        }
        spi.close();

        printf("sent 0x%02x, received 0x%02" PRIx64 "\n", pattern, echo);
        return (echo == pattern) ? 0 : 1;
    }
    catch (std::exception const& e)
    {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }
}
