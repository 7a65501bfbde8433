// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace hookguard {

class Sha256 {
  public:
    Sha256();

    void update(const void* data, size_t len);
    void update(const std::string& data) { update(data.data(), data.size()); }
    std::array<uint8_t, 32> finish();

    static std::string hash_hex(const std::string& data);

  private:
    void transform(const uint8_t* block);

    std::array<uint32_t, 8> state_;
    std::array<uint8_t, 64> buffer_{};
    size_t buffer_len_ = 0;
    uint64_t total_len_ = 0;
};

std::string to_hex(const uint8_t* data, size_t len);

} // namespace hookguard
