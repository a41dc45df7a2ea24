#include "polypatch/file_io.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <string>
#include <vector>

#include "cryptlib.h"
#include "osrng.h"

namespace polypatch {

std::filesystem::path PathFromUtf8(const std::string& value) {
#ifdef _WIN32
    const auto* begin = reinterpret_cast<const char8_t*>(value.data());
    const auto* end = begin + value.size();
    return std::filesystem::path(std::u8string(begin, end));
#else
    return std::filesystem::path(value);
#endif
}

std::string Utf8FromPath(const std::filesystem::path& value) {
#ifdef _WIN32
    const std::u8string u8 = value.generic_u8string();
    return std::string(reinterpret_cast<const char*>(u8.data()), u8.size());
#else
    return value.generic_string();
#endif
}

PatchStatus FileIO::ReadAll(const std::filesystem::path& path, std::vector<std::uint8_t>& out_bytes) {
    out_bytes.clear();

    std::error_code ec;
    const std::uintmax_t size = std::filesystem::file_size(path, ec);
    if (ec) {
        return PatchStatus::IoError;
    }
    if (size > static_cast<std::uintmax_t>(std::numeric_limits<std::streamsize>::max())) {
        return PatchStatus::IoError;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return PatchStatus::IoError;
    }
    out_bytes.resize(static_cast<std::size_t>(size));
    if (!out_bytes.empty()) {
        in.read(reinterpret_cast<char*>(out_bytes.data()), static_cast<std::streamsize>(out_bytes.size()));
        if (static_cast<std::uintmax_t>(in.gcount()) != size) {
            out_bytes.clear();
            return PatchStatus::IoError;
        }
    }
    // The file must not have grown between file_size() and the read.
    if (in.peek() != std::ifstream::traits_type::eof()) {
        out_bytes.clear();
        return PatchStatus::IoError;
    }
    return PatchStatus::Ok;
}

PatchStatus FileIO::WriteReplace(const std::filesystem::path& path, const std::vector<std::uint8_t>& bytes) {
    std::filesystem::path temp;
    try {
        temp = path.parent_path() / ("." + Utf8FromPath(path.filename()) + "." + RandomHexName(8) + ".part");
    } catch (const CryptoPP::Exception&) {
        return PatchStatus::IoError;
    }

    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return PatchStatus::IoError;
        }
        if (!bytes.empty()) {
            out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        }
        out.flush();
        if (!out.good()) {
            out.close();
            std::error_code ignored;
            std::filesystem::remove(temp, ignored);
            return PatchStatus::IoError;
        }
    }

    std::error_code ec;
    const auto existing = std::filesystem::status(path, ec);
    if (!ec && std::filesystem::is_regular_file(existing)) {
        std::filesystem::permissions(temp, existing.permissions(), std::filesystem::perm_options::replace, ec);
    }

    ec.clear();
    std::filesystem::rename(temp, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp, ignored);
        return PatchStatus::IoError;
    }
    return PatchStatus::Ok;
}

std::string FileIO::RandomHexName(const std::size_t bytes) {
    static constexpr char kHex[] = "0123456789abcdef";
    CryptoPP::AutoSeededRandomPool rng;

    std::string name;
    name.reserve(bytes * 2);
    for (std::size_t i = 0; i < bytes; ++i) {
        std::uint8_t value = 0;
        rng.GenerateBlock(&value, 1);
        name.push_back(kHex[(value >> 4U) & 0x0FU]);
        name.push_back(kHex[value & 0x0FU]);
    }
    return name;
}

}  // namespace polypatch
