#include "kiln/fingerprint.hpp"

#include "kiln/console.hpp"
#include "kiln/file_resolver.hpp"
#include "kiln/mmap.hpp"

#include <algorithm>
#include <format>
#include <memory>
#include <openssl/evp.h>

namespace kiln {

namespace {

class Sha256 {
public:
    Sha256() : ctx_(EVP_MD_CTX_new(), &EVP_MD_CTX_free) {
        ok_ = ctx_ && EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) == 1;
    }

    void update(std::string_view bytes) {
        if (ok_ && !bytes.empty())
            ok_ = EVP_DigestUpdate(ctx_.get(), bytes.data(), bytes.size()) == 1;
    }

    Result<Digest> finish() {
        Digest digest{};
        unsigned int len = 0;
        if (!ok_ || EVP_DigestFinal_ex(ctx_.get(), digest.data(), &len) != 1 || len != digest.size()) {
            return fail(ErrorKind::File, "SHA-256 computation failed");
        }
        return digest;
    }

private:
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx_;
    bool ok_ = false;
};

} // namespace

Result<Digest> sha256(std::string_view bytes) {
    Sha256 hasher;
    hasher.update(bytes);
    return hasher.finish();
}

std::string to_hex(const Digest &digest) {
    static constexpr char HEX[] = "0123456789abcdef";
    std::string out;
    out.reserve(digest.size() * 2);
    for (unsigned char byte : digest) {
        out += HEX[byte >> 4];
        out += HEX[byte & 0x0f];
    }
    return out;
}

Result<std::string> Fingerprinter::fingerprint(const std::vector<std::string> &patterns) const {
    auto files = resolver_.resolve(patterns);
    if (!files) {
        return std::unexpected(files.error());
    }
    return fingerprint_files(std::move(*files));
}

Result<std::string> Fingerprinter::fingerprint_files(std::vector<std::filesystem::path> files) const {
    std::ranges::sort(files, {}, [](const std::filesystem::path &p) { return p.string(); });

    std::string combined;
    combined.reserve(files.size() * std::tuple_size_v<Digest>);

    for (const auto &file_path : files) {
        auto file = MappedFile::open(file_path);
        if (!file) {
            console_.warn("Could not read file '{}': {}", file_path.string(), file.error().message);
            continue;
        }

        const std::string path_str = file_path.string();
        Sha256 hasher;
        hasher.update(std::format("{}:{}", path_str.size(), path_str));
        hasher.update((*file)->content());

        auto digest = hasher.finish();
        if (!digest) {
            return std::unexpected(digest.error());
        }
        combined.append(reinterpret_cast<const char *>(digest->data()), digest->size());
    }

    auto final_digest = sha256(combined);
    if (!final_digest) {
        return std::unexpected(final_digest.error());
    }
    return to_hex(*final_digest);
}

} // namespace kiln
