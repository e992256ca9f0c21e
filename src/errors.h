#pragma once

#include <stdexcept>
#include <string>

// Error types raised by the library. All derive from the standard exception
// hierarchy so callers that only care about "something was wrong with the
// arguments" can catch std::invalid_argument.

// Bad port / pause / repeat count / host in a ControllerConfig.
struct InvalidConfig : std::invalid_argument {
    explicit InvalidConfig(const std::string& what) : std::invalid_argument(what) {}
};

// Group outside 1-4 (0 means "all groups" and is always valid).
struct InvalidGroup : std::invalid_argument {
    explicit InvalidGroup(const std::string& what) : std::invalid_argument(what) {}
};

struct InvalidBulbType : std::invalid_argument {
    explicit InvalidBulbType(const std::string& what) : std::invalid_argument(what) {}
};

struct UnknownCommand : std::invalid_argument {
    explicit UnknownCommand(const std::string& what) : std::invalid_argument(what) {}
};

struct UnknownColor : std::invalid_argument {
    explicit UnknownColor(const std::string& what) : std::invalid_argument(what) {}
};

struct IndexOutOfRange : std::out_of_range {
    explicit IndexOutOfRange(const std::string& what) : std::out_of_range(what) {}
};

// Socket creation, address resolution or sendto() failed.
struct TransportError : std::runtime_error {
    explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};
