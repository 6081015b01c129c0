/**
 * @file commands.hh
 * @brief The encode / decode / remove / print commands of the pngme tool
 * @author Igor
 * @date 15/08/2025
 */

#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <pngme/png.hh>
#include <pngme/parse_options.hh>

namespace pngme::cli {

    /**
     * @class command_runner
     * @brief Parses the tool's arguments and runs one command
     *
     * Output goes to the given streams so the commands can be driven from
     * tests. Library errors propagate out of the command methods; run()
     * turns them into an exit status.
     */
    class command_runner {
    public:
        command_runner(std::ostream& out, std::ostream& err);

        /**
         * @brief Run the command named by the arguments
         * @param args Arguments without the program name
         * @return 0 on success, 1 on failure, 2 on usage errors
         */
        int run(const std::vector<std::string>& args);

        // Append a chunk carrying message, write to output or back to file
        void encode(const std::filesystem::path& file, std::string_view type,
                    std::string_view message,
                    const std::optional<std::filesystem::path>& output = std::nullopt);

        // Print the text of the first chunk of type
        void decode(const std::filesystem::path& file, std::string_view type);

        // Remove the first chunk of type and write the file back
        void remove(const std::filesystem::path& file, std::string_view type);

        // Print every chunk, one per line
        void print(const std::filesystem::path& file);

        parse_options& options() { return m_options; }
        void set_quiet(bool quiet) { m_quiet = quiet; }

    private:
        png load(const std::filesystem::path& file) const;
        void store(const png& image, const std::filesystem::path& file) const;
        void usage(std::ostream& os) const;

        std::ostream& m_out;
        std::ostream& m_err;
        parse_options m_options;
        bool m_quiet = false;
    };

} // namespace pngme::cli
