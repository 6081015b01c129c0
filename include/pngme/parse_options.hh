/**
 * @file parse_options.hh
 * @brief Decoding options and configuration for PNG chunk streams
 * @author Igor
 * @date 14/08/2025
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>
#include <limits>

namespace pngme {

    /**
     * @struct parse_options
     * @brief Configuration options for decoding chunks and PNG streams
     *
     * Controls strictness, size limits, and warning handling. Warnings
     * never change the result of a decode.
     */
    struct parse_options {
        /**
         * @brief Strict chunk type checking
         *
         * When true, chunk type bytes that are not ASCII letters fail the
         * decode with error_kind::invalid_format.
         * When false, they are reported through on_warning ("chunk_type").
         */
        bool strict = false;

        /**
         * @brief Maximum allowed chunk payload length in bytes
         *
         * Longer declared lengths fail with error_kind::size_limit.
         * The default accepts every u32 length, so a length running past
         * the end of the input is reported as error_kind::truncated.
         */
        std::uint32_t max_chunk_size = std::numeric_limits<std::uint32_t>::max();

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Input offset where the warning occurred
         * @param category Warning category ("chunk_type", "reserved_bit", "structure")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If set, will be called for non-fatal issues during decoding.
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngme
