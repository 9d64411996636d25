#ifndef SOFTSPI_SPI_CONNECTION_H
#define SOFTSPI_SPI_CONNECTION_H

#include <cstdint>
#include <memory>

#include "softspi/AbstractPin.h"
#include "softspi/BitOrder.h"
#include "softspi/BusSynchronizer.h"
#include "softspi/SlaveSelection.h"

namespace softspi
{
    /// Bit-banged SPI master.
    /// The connection owns every line it is given and closes them on close().
    /// miso, mosi and select_slave2 are optional (nullptr): the read, write and
    /// selectSlave2() operations are then unsupported.
    /// Chip selects are active low.
    class SpiConnection
    {
        friend SlaveSelection;
    public:
        SpiConnection(std::shared_ptr<AbstractOutputPin> clock,
                      std::shared_ptr<AbstractOutputPin> select_slave,
                      std::shared_ptr<AbstractInputPin>  miso,
                      std::shared_ptr<AbstractOutputPin> mosi,
                      Endianness endianness = Endianness::LittleEndian,
                      nanoseconds sync_delay = SYNC_DELAY);

        SpiConnection(std::shared_ptr<AbstractOutputPin> clock,
                      std::shared_ptr<AbstractOutputPin> select_slave1,
                      std::shared_ptr<AbstractOutputPin> select_slave2,
                      std::shared_ptr<AbstractInputPin>  miso,
                      std::shared_ptr<AbstractOutputPin> mosi,
                      Endianness endianness = Endianness::LittleEndian,
                      nanoseconds sync_delay = SYNC_DELAY);

        ~SpiConnection();

        SpiConnection(SpiConnection const&) = delete;
        SpiConnection& operator=(SpiConnection const&) = delete;

        /// Close every line owned by the connection. The connection cannot be used afterwards.
        void close();
        bool isClosed() const { return closed_; }

        /// Assert the chip select of the slave and keep it asserted until the returned selection is released.
        SlaveSelection selectSlave1();
        SlaveSelection selectSlave2();

        /// Generate one clock pulse.
        void synchronize();

        /// Put one bit on MOSI then pulse the clock.
        void write(bool data);

        /// Send the bit_count lowest bits of data, one clock pulse per bit.
        /// \throw ErrorOutOfRange if bit_count is greater than the width of data
        void write(uint8_t  data, uint32_t bit_count);
        void write(uint16_t data, uint32_t bit_count);
        void write(uint32_t data, uint32_t bit_count);
        void write(uint64_t data, uint32_t bit_count);

        /// Pulse the clock then sample MISO.
        bool read();

        /// Receive bit_count bits, one clock pulse per bit.
        /// \throw ErrorOutOfRange if bit_count is greater than 64
        uint64_t read(uint32_t bit_count);

        Endianness endianness() const { return endianness_; }
        nanoseconds syncDelay() const { return synchronizer_.delay(); }
        bool hasSlave2() const { return select_slave2_ != nullptr; }
        bool canRead()   const { return miso_ != nullptr; }
        bool canWrite()  const { return mosi_ != nullptr; }

    private:
        void deselect(AbstractOutputPin& select_slave);
        SlaveSelection select(AbstractOutputPin& select_slave);

        void writeWord(uint64_t data, uint32_t bit_count, uint32_t width);

        void checkOpen() const;
        void checkWrite() const;
        void checkRead() const;

        std::shared_ptr<AbstractOutputPin> clock_;
        std::shared_ptr<AbstractOutputPin> select_slave1_;
        std::shared_ptr<AbstractOutputPin> select_slave2_;
        std::shared_ptr<AbstractInputPin>  miso_;
        std::shared_ptr<AbstractOutputPin> mosi_;

        Endianness endianness_;
        BusSynchronizer synchronizer_;

        int32_t selected_{0};   ///< number of selections not released yet
        bool closed_{false};
    };
}

#endif
