#pragma once

#include <cstddef>
#include <optional>

namespace PaperPerp::Utils::Queue
{
    template <typename T>
    class Channel {
    protected:
        bool closed_ = false;
    public:
        virtual ~Channel() = default;

        // Push a value; false once the channel is closed
        virtual bool Send(T value) = 0;
        // Block until a value arrives or the channel is closed and drained
        virtual std::optional<T> Receive() = 0;
        virtual std::size_t Size() = 0;
        virtual void Close() = 0;
        bool IsClosed() const { return closed_; }
    };
}
