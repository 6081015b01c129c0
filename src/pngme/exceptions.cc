//
// Created by igor on 14/08/2025.
//

#include <pngme/exceptions.hh>
#include <ostream>

namespace pngme {

    const char* to_string(error_kind kind) noexcept {
        switch (kind) {
            case error_kind::invalid_format:
                return "invalid_format";
            case error_kind::truncated:
                return "truncated";
            case error_kind::checksum_mismatch:
                return "checksum_mismatch";
            case error_kind::bad_signature:
                return "bad_signature";
            case error_kind::not_found:
                return "not_found";
            case error_kind::not_text:
                return "not_text";
            case error_kind::size_limit:
                return "size_limit";
            case error_kind::io:
                return "io";
        }
        // make compiler happy
        return "unknown";
    }

    std::ostream& operator<<(std::ostream& os, error_kind kind) {
        return os << to_string(kind);
    }

} // namespace pngme
