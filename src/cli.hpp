#pragma once
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../metacat/link/include/address.hpp"
#include "../metacat/link/include/codec.hpp"
#include "../metacat/logger/logger.hpp"


namespace metacat::cli {

    // Exit statuses of metacat-link
    inline constexpr int kExitOk = 0;
    inline constexpr int kExitCodecError = 1;
    inline constexpr int kExitUsage = 2;


    struct CliOptions 
    {
        logger::LogLevel level{logger::LogLevel::warn};
        std::optional<std::string> logFile;
        link::LinkCodecConfig codec{};
        std::vector<std::string> args;   // command and its operands
    };


    /**
     * @brief Parse options out of argv (argv[0] is the program name).
     * Returns std::nullopt on a bad option after printing the reason to err.
     */
    std::optional<CliOptions> parseArgs(const std::vector<std::string>& argv, std::ostream& err);

    // JSON view of the address plus its canonical "link"
    nlohmann::json report(const link::LinkCodec& codec, const link::Address& a);

    // Runs one command; returns the process exit status
    int run(const std::vector<std::string>& argv, std::ostream& out, std::ostream& err);

} // namespace metacat::cli
