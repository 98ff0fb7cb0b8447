#ifndef PIIGUARD_UTIL_CONFIG_PARSER_HPP
#define PIIGUARD_UTIL_CONFIG_PARSER_HPP

#include <string>
#include <fstream>
#include <sstream>
#include <istream>
#include <stdexcept>
#include <cstdint>
#include <mutex>
#include "config/guard_config.hpp"
#include "util/logger.hpp"

/**
 * @file config_parser.hpp
 * @brief Parser for PII Guard's key=value configuration file.
 *
 * DESIGN GOALS:
 *   - Read a simple "key=value" style configuration file.
 *   - Populate piiguard::config::GuardConfig fields.
 *   - Header-only, no external libraries.
 *   - '#' starts a comment line; blank lines are skipped.
 *
 * USAGE:
 *   @code
 *   piiguard::config::GuardConfig guardConfig;
 *   piiguard::util::ConfigParser parser(guardConfig);
 *   parser.loadFromFile("piiguard.conf");
 *   @endcode
 *
 * NOTE:
 *   - The displayName value is personal data. It is never echoed to the log.
 */

namespace piiguard {
namespace util {

/**
 * @class ConfigParser
 * @brief Reads a plain text key=value config and updates GuardConfig fields.
 */
class ConfigParser
{
public:
    explicit ConfigParser(piiguard::config::GuardConfig &guardConfig)
        : guardConfig_(guardConfig)
    {
    }

    /**
     * @brief Read the given file, parse line by line.
     *        A missing file is not an error: defaults stay in place.
     * @throw std::runtime_error if a line is malformed or a value is invalid.
     */
    inline void loadFromFile(const std::string &filepath)
    {
        std::ifstream inFile(filepath);
        if (!inFile.is_open()) {
            piiguard::util::logger::warn("ConfigParser: File not found: " + filepath);
            return;
        }

        piiguard::util::logger::info("ConfigParser: Loading config from " + filepath);
        loadFromStream(inFile);
        piiguard::util::logger::info("ConfigParser: Config loaded.");
    }

    /**
     * @brief Parse key=value lines from any input stream.
     * @throw std::runtime_error if a line is malformed or a value is invalid.
     */
    inline void loadFromStream(std::istream &in)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::string line;
        while (std::getline(in, line)) {
            trim(line);

            if (line.empty() || line[0] == '#') {
                continue;
            }

            auto pos = line.find('=');
            if (pos == std::string::npos) {
                throw std::runtime_error("ConfigParser: invalid line (no '='): " + line);
            }
            std::string key = line.substr(0, pos);
            std::string val = line.substr(pos + 1);
            trim(key);
            trim(val);

            applyKeyValue(key, val);
        }
    }

private:
    piiguard::config::GuardConfig &guardConfig_;
    std::mutex mutex_;

    inline void applyKeyValue(const std::string &key, const std::string &val)
    {
        if (key == "logLevel") {
            // validate now so a typo fails at startup
            piiguard::util::logger::parseLogLevel(val);
            guardConfig_.logLevel = val;
            piiguard::util::logger::debug("ConfigParser: logLevel set to " + val);
        }
        else if (key == "logFile") {
            guardConfig_.logFile = val;
            piiguard::util::logger::debug("ConfigParser: logFile set to " + val);
        }
        else if (key == "displayName") {
            guardConfig_.displayName = val;
            piiguard::util::logger::debug("ConfigParser: displayName set ("
                                          + std::to_string(val.size()) + " bytes)");
        }
        else if (key == "maxJobChars") {
            guardConfig_.maxJobChars = parseUInt(val);
            piiguard::util::logger::debug("ConfigParser: maxJobChars set to " + std::to_string(guardConfig_.maxJobChars));
        }
        else if (key == "maxResumeChars") {
            guardConfig_.maxResumeChars = parseUInt(val);
            piiguard::util::logger::debug("ConfigParser: maxResumeChars set to " + std::to_string(guardConfig_.maxResumeChars));
        }
        else if (key == "maxAnswerChars") {
            guardConfig_.maxAnswerChars = parseUInt(val);
            piiguard::util::logger::debug("ConfigParser: maxAnswerChars set to " + std::to_string(guardConfig_.maxAnswerChars));
        }
        else {
            piiguard::util::logger::warn("ConfigParser: Unrecognized key '" + key + "'");
        }
    }

    /**
     * @brief Trim leading/trailing whitespace from a string.
     */
    inline void trim(std::string &s)
    {
        static const std::string whitespace = " \t\r\n";
        auto pos = s.find_first_not_of(whitespace);
        if (pos != std::string::npos) {
            s.erase(0, pos);
        }
        else {
            s.clear();
            return;
        }
        pos = s.find_last_not_of(whitespace);
        if (pos != std::string::npos) {
            s.erase(pos + 1);
        }
    }

    /**
     * @brief Parse a string into an unsigned integer. If invalid, throw.
     */
    inline uint64_t parseUInt(const std::string &val) const
    {
        if (val.empty() || val[0] == '-' || val[0] == '+') {
            throw std::runtime_error("ConfigParser: parseUInt failed on '" + val + "': not an unsigned number");
        }
        try {
            size_t idx = 0;
            uint64_t n = std::stoull(val, &idx, 10);
            if (idx != val.size()) {
                throw std::runtime_error("Non-numeric suffix");
            }
            return n;
        }
        catch (const std::exception &ex) {
            throw std::runtime_error("ConfigParser: parseUInt failed on '" + val + "': " + ex.what());
        }
    }
};

} // namespace util
} // namespace piiguard

#endif // PIIGUARD_UTIL_CONFIG_PARSER_HPP
