#ifndef SOFTSPI_UNIT_MOCKS_PINS_H
#define SOFTSPI_UNIT_MOCKS_PINS_H

#include <gmock/gmock.h>
#include <deque>
#include <vector>

#include "softspi/AbstractPin.h"

namespace softspi
{
    class MockOutputPin : public AbstractOutputPin
    {
    public:
        MockOutputPin() = default;
        virtual ~MockOutputPin() = default;

        MOCK_METHOD(void, write, (bool level), (override));
        MOCK_METHOD(void, close, (), (override));
    };

    class MockInputPin : public AbstractInputPin
    {
    public:
        MockInputPin() = default;
        virtual ~MockInputPin() = default;

        MOCK_METHOD(bool, read, (), (override));
        MOCK_METHOD(void, close, (), (override));
    };

    /// MOSI looped back to MISO through a slave that echoes every received bit:
    /// read() returns the written levels in the order they were written (low when nothing is pending).
    class LoopbackWire
    {
    public:
        class Out : public AbstractOutputPin
        {
        public:
            Out(LoopbackWire& wire) : wire_(wire) {}
            void write(bool level) override
            {
                wire_.pending_.push_back(level);
                wire_.history_.push_back(level);
            }
            void close() override { ++wire_.closed_; }
        private:
            LoopbackWire& wire_;
        };

        class In : public AbstractInputPin
        {
        public:
            In(LoopbackWire& wire) : wire_(wire) {}
            bool read() override
            {
                if (wire_.pending_.empty())
                {
                    return false;
                }
                bool level = wire_.pending_.front();
                wire_.pending_.pop_front();
                return level;
            }
            void close() override { ++wire_.closed_; }
        private:
            LoopbackWire& wire_;
        };

        std::vector<bool> const& history() const { return history_; }
        void clear()
        {
            pending_.clear();
            history_.clear();
        }
        int32_t closed() const { return closed_; }

    private:
        std::deque<bool> pending_;
        std::vector<bool> history_;
        int32_t closed_{0};
    };
}

#endif
