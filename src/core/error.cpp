// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <sstream>

namespace scale::core {

// ---------------------------------------------------------------------------
// error_code_name: human-readable label for every ErrorCode variant
// ---------------------------------------------------------------------------
std::string_view error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NONE:                 return "NONE";

        // Decoding
        case ErrorCode::NOT_ENOUGH_DATA:      return "NOT_ENOUGH_DATA";
        case ErrorCode::INVALID_DISCRIMINANT: return "INVALID_DISCRIMINANT";
        case ErrorCode::OUT_OF_RANGE:         return "OUT_OF_RANGE";
        case ErrorCode::INVALID_VALUE:        return "INVALID_VALUE";
        case ErrorCode::TRAILING_DATA:        return "TRAILING_DATA";

        // Limits
        case ErrorCode::LENGTH_OVERFLOW:      return "LENGTH_OVERFLOW";
        case ErrorCode::DEPTH_LIMIT:          return "DEPTH_LIMIT";
        case ErrorCode::ALLOCATION_LIMIT:     return "ALLOCATION_LIMIT";

        // Internal
        case ErrorCode::INTERNAL_ERROR:       return "INTERNAL_ERROR";
    }

    return "UNKNOWN";
}

// ---------------------------------------------------------------------------
// Error::chain
// ---------------------------------------------------------------------------
Error Error::chain(std::string desc) const& {
    Error wrapped(code_, std::move(desc), location_);
    wrapped.cause_ = std::make_shared<const Error>(*this);
    return wrapped;
}

Error Error::chain(std::string desc) && {
    Error wrapped(code_, std::move(desc), location_);
    wrapped.cause_ = std::make_shared<const Error>(std::move(*this));
    return wrapped;
}

// ---------------------------------------------------------------------------
// Error::what / descriptions
// ---------------------------------------------------------------------------
std::string Error::what() const {
    std::string out;
    size_t indent = 0;
    for (const Error* e = this; e != nullptr; e = e->cause()) {
        out.append(indent, '\t');
        out += e->message_;
        out += e->cause() ? ":\n" : "\n";
        ++indent;
    }
    return out;
}

std::vector<std::string> Error::descriptions() const {
    std::vector<std::string> out;
    for (const Error* e = this; e != nullptr; e = e->cause()) {
        out.push_back(e->message_);
    }
    return {out.rbegin(), out.rend()};
}

// ---------------------------------------------------------------------------
// Error::format: build a diagnostic string including source location
// ---------------------------------------------------------------------------
std::string Error::format() const {
    if (code_ == ErrorCode::NONE) {
        return "no error";
    }

    std::ostringstream oss;
    oss << error_code_name(code_)
        << '(' << static_cast<uint16_t>(code_) << ')';

    if (!message_.empty()) {
        oss << ": " << message_;
    }
    for (const Error* e = cause(); e != nullptr; e = e->cause()) {
        oss << ": " << e->message_;
    }

    // Append source location when available (file name is non-empty).
    const char* file = location_.file_name();
    if (file && file[0] != '\0') {
        oss << " [" << file
            << ':' << location_.line()
            << ':' << location_.column() << ']';
    }

    return oss.str();
}

} // namespace scale::core
