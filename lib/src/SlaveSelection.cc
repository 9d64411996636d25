#include "softspi/SlaveSelection.h"
#include "softspi/SpiConnection.h"

namespace softspi
{
    SlaveSelection::SlaveSelection(SpiConnection& connection, AbstractOutputPin& select_slave)
        : connection_(&connection)
        , select_slave_(&select_slave)
    {
    }


    SlaveSelection::SlaveSelection(SlaveSelection&& other) noexcept
        : connection_(other.connection_)
        , select_slave_(other.select_slave_)
    {
        other.connection_ = nullptr;
        other.select_slave_ = nullptr;
    }


    SlaveSelection& SlaveSelection::operator=(SlaveSelection&& other)
    {
        if (this != &other)
        {
            release();
            connection_ = other.connection_;
            select_slave_ = other.select_slave_;
            other.connection_ = nullptr;
            other.select_slave_ = nullptr;
        }
        return *this;
    }


    SlaveSelection::~SlaveSelection()
    {
        // A closed connection has already released its lines.
        if (isActive() and not connection_->isClosed())
        {
            release();
        }
    }


    void SlaveSelection::release()
    {
        if (not isActive())
        {
            return;
        }

        SpiConnection* connection = connection_;
        connection_ = nullptr;
        connection->deselect(*select_slave_);
        select_slave_ = nullptr;
    }
}
