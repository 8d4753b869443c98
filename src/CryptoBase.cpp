#include "CryptoBase.hpp"
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <iostream>

namespace gavel {

    namespace {
        bool isValidHexChar(char c) {
            return (c >= '0' && c <= '9') ||
                   (c >= 'a' && c <= 'f') ||
                   (c >= 'A' && c <= 'F');
        }
    }

    bool CryptoBase::initialize() {
        if (sodium_init() < 0) {
            std::cerr << "Error: Failed to initialize libsodium" << std::endl;
            return false;
        }

        return true;
    }

    std::vector<uint8_t> CryptoBase::sha256Bytes(const std::vector<uint8_t>& data) {
        std::vector<uint8_t> hash(crypto_hash_sha256_BYTES);

        if (crypto_hash_sha256(hash.data(), data.data(), data.size()) != 0) {
            throw std::runtime_error("SHA-256 computation failed");
        }

        return hash;
    }

    std::vector<uint8_t> CryptoBase::sha256Bytes(const std::string& data) {
        return sha256Bytes(std::vector<uint8_t>(data.begin(), data.end()));
    }

    std::string CryptoBase::sha256(const std::string& data) {
        return hexEncode(sha256Bytes(data));
    }

    std::string CryptoBase::hexEncode(const std::vector<uint8_t>& data) {
        std::stringstream hexStream;
        hexStream << std::hex << std::setfill('0');

        for (uint8_t byte : data) {
            hexStream << std::setw(2) << static_cast<int>(byte);
        }

        return hexStream.str();
    }

    std::vector<uint8_t> CryptoBase::hexDecode(const std::string& hexStr) {
        if (hexStr.empty()) {
            return {};
        }

        if (hexStr.length() % 2 != 0) {
            throw std::invalid_argument("Hex string must have even length");
        }

        if (!isHexString(hexStr)) {
            throw std::invalid_argument("Invalid hex string: " + hexStr);
        }

        std::vector<uint8_t> bytes;
        bytes.reserve(hexStr.length() / 2);

        for (size_t i = 0; i < hexStr.length(); i += 2) {
            bytes.push_back(static_cast<uint8_t>(std::stoul(hexStr.substr(i, 2), nullptr, 16)));
        }

        return bytes;
    }

    bool CryptoBase::isHexString(const std::string& str) {
        for (char c : str) {
            if (!isValidHexChar(c)) return false;
        }
        return true;
    }

} // namespace gavel
