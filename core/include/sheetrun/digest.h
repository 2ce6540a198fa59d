#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace sheetrun {

// Incremental SHA-256. Used to fingerprint the job input so a success can be
// refused when user code rewrote it.
class Sha256 {
public:
    Sha256();

    void update(const uint8_t* data, size_t n);
    void update(const std::string& s) { update(reinterpret_cast<const uint8_t*>(s.data()), s.size()); }

    // Lowercase hex digest. The object must not be updated afterwards.
    std::string hex_digest();

private:
    void block(const uint8_t* p);

    uint32_t h_[8];
    uint8_t buf_[64];
    size_t buf_len_{0};
    uint64_t total_{0};
};

std::string sha256_hex(const std::string& s);

// Hex digest of a file's contents. Returns empty string on success.
std::string sha256_file(const std::filesystem::path& path, std::string* hex);

} // namespace sheetrun
