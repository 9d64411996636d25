#ifndef SOFTSPI_SLAVE_SELECTION_H
#define SOFTSPI_SLAVE_SELECTION_H

#include "softspi/AbstractPin.h"

namespace softspi
{
    class SpiConnection;

    /// Keep a slave selected for the lifetime of the object.
    /// Only created by SpiConnection::selectSlave1() / selectSlave2(), once the chip select is asserted.
    /// The connection keeps the ownership of the chip select line and must outlive the selection.
    class SlaveSelection
    {
        friend SpiConnection;
    public:
        ~SlaveSelection();

        SlaveSelection(SlaveSelection&& other) noexcept;
        SlaveSelection& operator=(SlaveSelection&& other);

        SlaveSelection(SlaveSelection const&) = delete;
        SlaveSelection& operator=(SlaveSelection const&) = delete;

        /// Deassert the chip select. Does nothing if the selection was already released.
        void release();

        bool isActive() const { return connection_ != nullptr; }

    private:
        SlaveSelection(SpiConnection& connection, AbstractOutputPin& select_slave);

        SpiConnection* connection_;      ///< nullptr once released or moved from
        AbstractOutputPin* select_slave_;
    };
}

#endif
