#pragma once

#include <stdexcept>
#include <string>
#include <variant>

namespace PaperPerp::Infra::Exanges::PaperSimulator {
    enum class RejectionKind {
        InvalidRequest,
        InsufficientMargin,
        LeverageOutOfBounds,
        DuplicateOpen,
        MaxPositions,
        AlreadyClosed,
        UnknownPosition,
        Halted
    };

    std::string to_string(RejectionKind kind);

    // Expected refusal of a request; the ledger is left untouched.
    struct Rejection {
        RejectionKind kind;
        std::string   reason;
    };

    // Either the result of an accepted request or the Rejection explaining why not
    template <typename T>
    class Outcome {
    public:
        Outcome(T value) : value_(std::move(value)) {}
        Outcome(Rejection rejection) : value_(std::move(rejection)) {}

        bool ok() const { return std::holds_alternative<T>(value_); }
        explicit operator bool() const { return ok(); }

        const T& value() const {
            if (!ok()) {
                throw std::logic_error("Outcome rejected: " + std::get<Rejection>(value_).reason);
            }
            return std::get<T>(value_);
        }

        const Rejection& rejection() const {
            if (ok()) {
                throw std::logic_error("Outcome holds a value, not a rejection");
            }
            return std::get<Rejection>(value_);
        }

    private:
        std::variant<T, Rejection> value_;
    };
}
