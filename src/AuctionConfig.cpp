#include "AuctionConfig.hpp"
#include "AuctionError.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace gavel {

    namespace {
        std::string trim(const std::string& s) {
            auto notSpace = [](unsigned char c) { return !std::isspace(c); };
            auto begin = std::find_if(s.begin(), s.end(), notSpace);
            auto end = std::find_if(s.rbegin(), s.rend(), notSpace).base();
            return begin < end ? std::string(begin, end) : std::string();
        }

        bool parseSeconds(const std::string& value, uint64_t& out) {
            if (value.empty() || !std::all_of(value.begin(), value.end(),
                    [](unsigned char c) { return std::isdigit(c); })) {
                return false;
            }
            try {
                out = std::stoull(value);
            } catch (const std::out_of_range&) {
                return false;
            }
            return true;
        }
    }

    void AuctionConfig::validate() const {
        if (durationSeconds < MIN_DURATION_SECONDS) {
            throw InvalidConfigurationError("duration must be at least " +
                std::to_string(MIN_DURATION_SECONDS) + " seconds, got " + std::to_string(durationSeconds));
        }

        if (durationSeconds > MAX_DURATION_SECONDS) {
            throw InvalidConfigurationError("duration must be at most " +
                std::to_string(MAX_DURATION_SECONDS) + " seconds, got " + std::to_string(durationSeconds));
        }

        if (extensionSeconds < MIN_EXTENSION_SECONDS) {
            throw InvalidConfigurationError("extension must be at least " +
                std::to_string(MIN_EXTENSION_SECONDS) + " seconds, got " + std::to_string(extensionSeconds));
        }

        if (extensionSeconds > MAX_EXTENSION_SECONDS) {
            throw InvalidConfigurationError("extension must be at most " +
                std::to_string(MAX_EXTENSION_SECONDS) + " seconds, got " + std::to_string(extensionSeconds));
        }

        if (owner.isNull()) {
            throw InvalidConfigurationError("owner cannot be null");
        }

        if (commissionRecipient.isNull()) {
            throw InvalidConfigurationError("commission recipient cannot be null");
        }

        if (proceedsRecipient.isNull()) {
            throw InvalidConfigurationError("proceeds recipient cannot be null");
        }
    }

    bool AuctionConfig::loadFromFile(const std::string& filename, AuctionConfig& out) {
        std::ifstream in(filename);

        if (!in) {
            std::cerr << "Error: Cannot open config file: " << filename << std::endl;
            return false;
        }

        std::string line;
        size_t lineNumber = 0;
        while (std::getline(in, line)) {
            ++lineNumber;

            const size_t comment = line.find('#');
            if (comment != std::string::npos) line.erase(comment);
            line = trim(line);
            if (line.empty()) continue;

            // formato key = value
            const size_t eq = line.find('=');
            if (eq == std::string::npos) {
                std::cerr << "Warning: " << filename << ":" << lineNumber << ": expected key = value" << std::endl;
                continue;
            }

            const std::string key = trim(line.substr(0, eq));
            const std::string value = trim(line.substr(eq + 1));

            if (value.empty()) {
                std::cerr << "Warning: " << filename << ":" << lineNumber << ": empty value for " << key << std::endl;
                continue;
            }

            if (key == "owner") {
                out.owner = Identity::parse(value);
            } else if (key == "commission_recipient") {
                out.commissionRecipient = Identity::parse(value);
            } else if (key == "proceeds_recipient") {
                out.proceedsRecipient = Identity::parse(value);
            } else if (key == "duration_seconds" || key == "extension_seconds" || key == "start_time") {
                uint64_t seconds = 0;
                if (!parseSeconds(value, seconds)) {
                    std::cerr << "Warning: " << filename << ":" << lineNumber << ": invalid number for " << key << std::endl;
                    continue;
                }
                if (key == "duration_seconds") out.durationSeconds = seconds;
                else if (key == "extension_seconds") out.extensionSeconds = seconds;
                else out.startTime = seconds;
            } else {
                std::cerr << "Warning: " << filename << ":" << lineNumber << ": unknown key " << key << std::endl;
            }
        }

        return true;
    }

} // namespace gavel
