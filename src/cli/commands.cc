//
// Created by igor on 15/08/2025.
//

#include "commands.hh"

#include <algorithm>
#include <cstddef>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>

#include <pngme/chunk.hh>
#include <pngme/chunk_type.hh>
#include <pngme/exceptions.hh>
#include <pngme/pngme_config.h>

namespace pngme::cli {

    namespace {
        constexpr int exit_ok = 0;
        constexpr int exit_failure = 1;
        constexpr int exit_usage = 2;

        struct usage_error : std::runtime_error {
            using std::runtime_error::runtime_error;
        };

        std::uint32_t parse_size(const std::string& text) {
            std::size_t pos = 0;
            unsigned long long value = 0;
            try {
                value = std::stoull(text, &pos);
            } catch (const std::exception&) {
                throw usage_error("Invalid size: " + text);
            }
            if (pos != text.size() || value > std::numeric_limits<std::uint32_t>::max()) {
                throw usage_error("Invalid size: " + text);
            }
            return static_cast<std::uint32_t>(value);
        }
    }

    command_runner::command_runner(std::ostream& out, std::ostream& err)
        : m_out(out), m_err(err) {}

    int command_runner::run(const std::vector<std::string>& args) {
        std::vector<std::string> positional;
        try {
            // Options come before the command, everything after it is an argument
            for (std::size_t i = 0; i < args.size(); ++i) {
                const std::string& arg = args[i];
                if (!positional.empty()) {
                    positional.push_back(arg);
                } else if (arg == "--") {
                    positional.insert(positional.end(), args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end());
                    break;
                } else if (arg == "--help" || arg == "-h") {
                    usage(m_out);
                    return exit_ok;
                } else if (arg == "--version") {
                    m_out << "pngme " << PNGME_VERSION_STRING << "\n";
                    return exit_ok;
                } else if (arg == "--strict") {
                    m_options.strict = true;
                } else if (arg == "--quiet" || arg == "-q") {
                    m_quiet = true;
                } else if (arg == "--max-chunk-size") {
                    if (i + 1 >= args.size()) {
                        throw usage_error("--max-chunk-size needs a value");
                    }
                    m_options.max_chunk_size = parse_size(args[++i]);
                } else if (arg.size() > 1 && arg[0] == '-') {
                    throw usage_error("Unknown option: " + arg);
                } else {
                    positional.push_back(arg);
                }
            }

            if (positional.empty()) {
                throw usage_error("Missing command");
            }

            const std::string& command = positional[0];
            const std::size_t count = positional.size() - 1;
            if (command == "encode" && (count == 3 || count == 4)) {
                std::optional<std::filesystem::path> output;
                if (count == 4) {
                    output = positional[4];
                }
                encode(positional[1], positional[2], positional[3], output);
            } else if (command == "decode" && count == 2) {
                decode(positional[1], positional[2]);
            } else if (command == "remove" && count == 2) {
                remove(positional[1], positional[2]);
            } else if (command == "print" && count == 1) {
                print(positional[1]);
            } else {
                throw usage_error("Invalid command line for '" + command + "'");
            }
        } catch (const usage_error& e) {
            m_err << "error: " << e.what() << "\n\n";
            usage(m_err);
            return exit_usage;
        } catch (const pngme_error& e) {
            m_err << "error: " << e.kind() << ": " << e.what() << "\n";
            return exit_failure;
        }
        return exit_ok;
    }

    void command_runner::encode(const std::filesystem::path& file, std::string_view type,
                                std::string_view message,
                                const std::optional<std::filesystem::path>& output) {
        // Validate the type before touching the file
        auto ct = chunk_type::from_text(type);
        png image = load(file);

        std::vector<std::byte> payload(message.size());
        std::transform(message.begin(), message.end(), payload.begin(),
                       [](char c) { return static_cast<std::byte>(c); });
        image.append_chunk(chunk(ct, std::move(payload)));

        store(image, output ? *output : file);
    }

    void command_runner::decode(const std::filesystem::path& file, std::string_view type) {
        png image = load(file);
        const chunk* c = image.chunk_by_type(type);
        if (!c) {
            PNGME_THROW(error_kind::not_found, "No chunk of type '", type, "' in ", file.string());
        }
        m_out << "Decoded Message: " << c->payload_as_text() << "\n";
    }

    void command_runner::remove(const std::filesystem::path& file, std::string_view type) {
        png image = load(file);
        chunk removed = image.remove_first_chunk(type);
        store(image, file);
        m_out << "Removed chunk " << removed.type() << " (" << removed.length() << " bytes)\n";
    }

    void command_runner::print(const std::filesystem::path& file) {
        m_out << load(file);
    }

    png command_runner::load(const std::filesystem::path& file) const {
        std::ifstream is(file, std::ios::binary);
        PNGME_THROW_IO_UNLESS(is, "Cannot open file '", file.string(), "'");

        parse_options opts = m_options;
        if (!opts.on_warning && !m_quiet) {
            std::ostream& err = m_err;
            opts.on_warning = [&err](std::uint64_t offset, std::string_view category, std::string_view message) {
                err << "warning: [" << category << "] offset " << offset << ": " << message << "\n";
            };
        }
        return png::read(is, opts);
    }

    void command_runner::store(const png& image, const std::filesystem::path& file) const {
        std::ofstream os(file, std::ios::binary | std::ios::trunc);
        PNGME_THROW_IO_UNLESS(os, "Cannot open file '", file.string(), "' for writing");
        image.write(os);
        os.flush();
        PNGME_THROW_IO_UNLESS(os, "Failed to write file '", file.string(), "'");
    }

    void command_runner::usage(std::ostream& os) const {
        os << "Usage: pngme [options] [--] <command> <args>\n";
        os << "\n";
        os << "Hide and read messages in PNG chunks.\n";
        os << "\n";
        os << "Commands:\n";
        os << "  encode <file> <chunk_type> <message> [output_file]\n";
        os << "        Append a chunk carrying message\n";
        os << "  decode <file> <chunk_type>\n";
        os << "        Print the message of the first chunk of that type\n";
        os << "  remove <file> <chunk_type>\n";
        os << "        Remove the first chunk of that type\n";
        os << "  print <file>\n";
        os << "        Print every chunk\n";
        os << "\n";
        os << "Options:\n";
        os << "  --strict               Reject chunk types that are not ASCII letters\n";
        os << "  --max-chunk-size <n>   Largest accepted chunk length in bytes\n";
        os << "  -q, --quiet            Do not print warnings\n";
        os << "  -h, --help             Show this help\n";
        os << "  --version              Show the version\n";
        os << "\n";
        os << "Options must come before the command. Arguments after the command\n";
        os << "are never read as options, so messages may start with '-'.\n";
    }

} // namespace pngme::cli
