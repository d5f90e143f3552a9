#include "nexus/core/digest.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include <array>
#include <fstream>
#include <memory>
#include <random>

namespace nexus::core {

namespace {

struct MdContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using MdContext = std::unique_ptr<EVP_MD_CTX, MdContextDeleter>;

} // namespace

std::string to_hex(const std::uint8_t* data, std::size_t len) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        out.push_back(kDigits[data[i] >> 4]);
        out.push_back(kDigits[data[i] & 0x0f]);
    }
    return out;
}

std::string to_hex(const std::vector<std::uint8_t>& data) {
    return to_hex(data.data(), data.size());
}

std::vector<std::uint8_t> sha256(const std::uint8_t* data, std::size_t len) {
    std::vector<std::uint8_t> digest(EVP_MAX_MD_SIZE);
    unsigned int digest_len = 0;
    EVP_Digest(data, len, digest.data(), &digest_len, EVP_sha256(), nullptr);
    digest.resize(digest_len);
    return digest;
}

std::vector<std::uint8_t> sha256(const std::string& data) {
    return sha256(reinterpret_cast<const std::uint8_t*>(data.data()), data.size());
}

std::string sha256_hex(const std::string& data) {
    return to_hex(sha256(data));
}

Result<std::string, Error> sha256_file(const std::filesystem::path& path, const std::atomic<bool>* cancel) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Fail<std::string>(ErrorCode::StorageFailure, "cannot open " + path.string());
    }

    MdContext ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return Fail<std::string>(ErrorCode::Internal, "EVP_DigestInit_ex failed");
    }

    std::array<char, 4096> buffer{};
    while (input.read(buffer.data(), buffer.size()) || input.gcount() > 0) {
        if (cancel && cancel->load()) {
            return Fail<std::string>(ErrorCode::Internal, "hashing cancelled");
        }
        EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(input.gcount()));
    }
    if (input.bad()) {
        return Fail<std::string>(ErrorCode::StorageFailure, "read error on " + path.string());
    }

    std::array<std::uint8_t, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;
    EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len);
    return Ok<std::string, Error>(to_hex(digest.data(), digest_len));
}

std::vector<std::uint8_t> hmac_sha256(const std::vector<std::uint8_t>& key, const std::string& data) {
    std::vector<std::uint8_t> result(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    HMAC(EVP_sha256(),
         key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(),
         result.data(), &len);
    result.resize(len);
    return result;
}

bool digest_equals(const std::string& lhs, const std::string& rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    return CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

std::string base64_encode(const std::string& data) {
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                        reinterpret_cast<const unsigned char*>(data.data()),
                                        static_cast<int>(data.size()));
    out.resize(static_cast<std::size_t>(written));
    return out;
}

std::optional<std::string> base64_decode(const std::string& text) {
    if (text.empty()) {
        return std::string();
    }
    if (text.size() % 4 != 0) {
        return std::nullopt;
    }
    std::string out(3 * (text.size() / 4) + 1, '\0');
    const int written = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                        reinterpret_cast<const unsigned char*>(text.data()),
                                        static_cast<int>(text.size()));
    if (written < 0) {
        return std::nullopt;
    }
    // EVP_DecodeBlock counts padding as zero bytes.
    std::size_t length = static_cast<std::size_t>(written);
    for (auto it = text.rbegin(); it != text.rend() && *it == '=' && length > 0; ++it) {
        --length;
    }
    out.resize(length);
    return out;
}

std::string random_hex_id(std::size_t bytes) {
    std::vector<std::uint8_t> raw(bytes);
    if (RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1) {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        std::uniform_int_distribution<int> dis(0, 255);
        for (auto& b : raw) {
            b = static_cast<std::uint8_t>(dis(gen));
        }
    }
    return to_hex(raw);
}

} // namespace nexus::core
