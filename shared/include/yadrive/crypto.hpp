/**
 * yadrive - SHA-256 content hashing built on libsodium.
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <span>
#include <string>
#include <string_view>

namespace yadrive::crypto
{

    void ensure_sodium_init();

    // Lowercase hex digests, the format the remote reports in its "sha256" field.
    std::string hash_bytes(std::span<const std::byte> data);

    std::string hash_string(std::string_view data);

    std::string hash_stream(std::istream &input);

    std::string hash_file(const std::filesystem::path &path);

} // namespace yadrive::crypto
