/*
 * integrity.cpp — SHA-256 fingerprints of generated artifacts
 */

#include "integrity.h"

#include <openssl/evp.h>

#include <array>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

static constexpr std::size_t kHashBlock      = 4096;
static constexpr std::size_t kLoggedHexChars = 16;
static constexpr const char* kHashError      = "ERROR";

struct MdCtxFree {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

std::optional<std::string> sha256_file(const std::string& path)
{
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
        return std::nullopt;

    std::unique_ptr<EVP_MD_CTX, MdCtxFree> ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
        return std::nullopt;

    std::array<char, kHashBlock> block{};
    while (ifs) {
        ifs.read(block.data(), block.size());
        const std::streamsize n = ifs.gcount();
        if (n > 0 &&
            EVP_DigestUpdate(ctx.get(), block.data(),
                             static_cast<std::size_t>(n)) != 1)
            return std::nullopt;
    }
    if (ifs.bad())
        return std::nullopt;

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != 1)
        return std::nullopt;

    std::ostringstream hex;
    hex << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digest_len; ++i)
        hex << std::setw(2) << static_cast<unsigned>(digest[i]);
    return hex.str();
}

bool write_hashes_csv(const std::vector<std::string>& files,
                      const std::string& csv_path,
                      ActionLog& log)
{
    log.log("Generating hashes.csv...");

    std::ofstream ofs(csv_path, std::ios::binary);
    if (!ofs) {
        log.log("Error generating hashes.csv: cannot open '" + csv_path + "'");
        return false;
    }

    ofs << "filename,sha256_hash\n";
    for (const auto& file : files) {
        std::error_code ec;
        if (!fs::exists(file, ec))
            continue;

        const std::string name = fs::path(file).filename().string();
        auto digest = sha256_file(file);
        if (!digest)
            log.log("Error calculating hash for " + file);

        const std::string value = digest ? *digest : kHashError;
        ofs << name << ',' << value << '\n';
        log.log("  - " + name + ": " + value.substr(0, kLoggedHexChars) + "...");
    }

    ofs.flush();
    if (!ofs) {
        log.log("Error generating hashes.csv: write to '" + csv_path + "' failed");
        return false;
    }
    log.log("Generated hashes.csv");
    return true;
}
