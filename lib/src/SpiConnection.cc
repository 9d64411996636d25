#include "softspi/SpiConnection.h"
#include "softspi/Error.h"
#include "softspi/debug.h"

namespace softspi
{
    SpiConnection::SpiConnection(std::shared_ptr<AbstractOutputPin> clock,
                                 std::shared_ptr<AbstractOutputPin> select_slave,
                                 std::shared_ptr<AbstractInputPin>  miso,
                                 std::shared_ptr<AbstractOutputPin> mosi,
                                 Endianness endianness,
                                 nanoseconds sync_delay)
        : SpiConnection(clock, select_slave, nullptr, miso, mosi, endianness, sync_delay)
    {
    }


    SpiConnection::SpiConnection(std::shared_ptr<AbstractOutputPin> clock,
                                 std::shared_ptr<AbstractOutputPin> select_slave1,
                                 std::shared_ptr<AbstractOutputPin> select_slave2,
                                 std::shared_ptr<AbstractInputPin>  miso,
                                 std::shared_ptr<AbstractOutputPin> mosi,
                                 Endianness endianness,
                                 nanoseconds sync_delay)
        : clock_(clock)
        , select_slave1_(select_slave1)
        , select_slave2_(select_slave2)
        , miso_(miso)
        , mosi_(mosi)
        , endianness_(endianness)
        , synchronizer_(clock, sync_delay)
    {
        if (clock_ == nullptr)
        {
            THROW_ERROR("a clock line is mandatory");
        }
        if (select_slave1_ == nullptr)
        {
            THROW_ERROR("a slave 1 select line is mandatory");
        }

        // Idle state: clock low, slaves not selected, MOSI low
        clock_->write(false);
        select_slave1_->write(true);
        if (select_slave2_)
        {
            select_slave2_->write(true);
        }
        if (mosi_)
        {
            mosi_->write(false);
        }

        spi_info("SPI connection ready: %s, slave2 %s, MISO %s, MOSI %s, sync delay %lld ns\n",
                 toString(endianness_),
                 hasSlave2() ? "yes" : "no",
                 canRead()   ? "yes" : "no",
                 canWrite()  ? "yes" : "no",
                 static_cast<long long>(sync_delay.count()));
    }


    SpiConnection::~SpiConnection()
    {
        if (not closed_)
        {
            close();
        }
    }


    void SpiConnection::close()
    {
        if (closed_)
        {
            spi_warning("SPI connection already closed\n");
            return;
        }
        closed_ = true;

        if (selected_ > 0)
        {
            spi_warning("Closing SPI connection with %d slave selection(s) still held\n", selected_);
        }

        clock_->close();
        select_slave1_->close();
        if (select_slave2_)
        {
            select_slave2_->close();
        }
        if (mosi_)
        {
            mosi_->close();
        }
        if (miso_)
        {
            miso_->close();
        }

        spi_info("SPI connection closed\n");
    }


    SlaveSelection SpiConnection::selectSlave1()
    {
        checkOpen();
        return select(*select_slave1_);
    }


    SlaveSelection SpiConnection::selectSlave2()
    {
        checkOpen();
        if (select_slave2_ == nullptr)
        {
            THROW_ERROR_UNSUPPORTED("no slave 2 select line has been provided", Line::SELECT_SLAVE2);
        }
        return select(*select_slave2_);
    }


    SlaveSelection SpiConnection::select(AbstractOutputPin& select_slave)
    {
        if (selected_ > 0)
        {
            spi_warning("Selecting a slave while another selection is still held\n");
        }

        select_slave.write(false);
        ++selected_;
        return SlaveSelection(*this, select_slave);
    }


    void SpiConnection::deselect(AbstractOutputPin& select_slave)
    {
        checkOpen();
        select_slave.write(true);
        --selected_;
    }


    void SpiConnection::synchronize()
    {
        checkOpen();
        synchronizer_.pulse();
    }


    void SpiConnection::write(bool data)
    {
        checkOpen();
        checkWrite();

        mosi_->write(data);
        synchronizer_.pulse();
    }


    void SpiConnection::write(uint8_t data, uint32_t bit_count)
    {
        writeWord(data, bit_count, 8);
    }


    void SpiConnection::write(uint16_t data, uint32_t bit_count)
    {
        writeWord(data, bit_count, 16);
    }


    void SpiConnection::write(uint32_t data, uint32_t bit_count)
    {
        writeWord(data, bit_count, 32);
    }


    void SpiConnection::write(uint64_t data, uint32_t bit_count)
    {
        writeWord(data, bit_count, 64);
    }


    void SpiConnection::writeWord(uint64_t data, uint32_t bit_count, uint32_t width)
    {
        checkOpen();
        checkBitCount(bit_count, width);
        checkWrite();

        for (uint32_t i = 0; i < bit_count; ++i)
        {
            uint32_t index = bitIndex(endianness_, bit_count, i);
            bool bit = data & (uint64_t{1} << index);

            mosi_->write(bit);
            synchronizer_.pulse();
        }
    }


    bool SpiConnection::read()
    {
        checkOpen();
        checkRead();

        synchronizer_.pulse();
        return miso_->read();
    }


    uint64_t SpiConnection::read(uint32_t bit_count)
    {
        checkOpen();
        checkBitCount(bit_count, MAX_BIT_COUNT);
        checkRead();

        uint64_t data = 0;
        for (uint32_t i = 0; i < bit_count; ++i)
        {
            uint32_t index = bitIndex(endianness_, bit_count, i);

            synchronizer_.pulse();
            if (miso_->read())
            {
                data |= (uint64_t{1} << index);
            }
        }

        return data;
    }


    void SpiConnection::checkOpen() const
    {
        if (closed_)
        {
            THROW_ERROR("SPI connection closed");
        }
    }


    void SpiConnection::checkWrite() const
    {
        if (mosi_ == nullptr)
        {
            THROW_ERROR_UNSUPPORTED("no MOSI line has been provided", Line::MOSI);
        }
    }


    void SpiConnection::checkRead() const
    {
        if (miso_ == nullptr)
        {
            THROW_ERROR_UNSUPPORTED("no MISO line has been provided", Line::MISO);
        }
    }
}
