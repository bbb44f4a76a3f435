#pragma once
#include <string>
#include <utility>

namespace fpack {

struct Result {
    bool ok{true};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(int e, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m)};
    }

    // Prefixes the message with context, keeping the code.
    Result& Wrap(const std::string& context) {
        if (!ok) msg = context + ": " + msg;
        return *this;
    }
};

} // namespace fpack
