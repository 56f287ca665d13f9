#include "FileHasher.h"

#include <cstdio>
#include <memory>

#ifdef __APPLE__
#include <CommonCrypto/CommonDigest.h>
#else
#include <openssl/evp.h>
#endif

namespace {

const size_t kDigestLength = 32;

struct FileCloser {
    void operator()(FILE* file) const {
        if (file) fclose(file);
    }
};

std::string ToHex(const unsigned char* digest, size_t length) {
    static const char kHexDigits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(length * 2);
    for (size_t i = 0; i < length; i++) {
        hex += kHexDigits[digest[i] >> 4];
        hex += kHexDigits[digest[i] & 0x0f];
    }
    return hex;
}

#ifdef __APPLE__

class Sha256Context {
public:
    Sha256Context() : ok_(CC_SHA256_Init(&ctx_) == 1) {}

    bool ok() const { return ok_; }

    bool Update(const unsigned char* data, size_t length) {
        return CC_SHA256_Update(&ctx_, data, static_cast<CC_LONG>(length)) == 1;
    }

    bool Final(unsigned char* digest) {
        return CC_SHA256_Final(digest, &ctx_) == 1;
    }

private:
    CC_SHA256_CTX ctx_;
    bool ok_;
};

#else

class Sha256Context {
public:
    Sha256Context() : ctx_(EVP_MD_CTX_new()), ok_(false) {
        ok_ = ctx_ && EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) == 1;
    }

    ~Sha256Context() {
        if (ctx_) EVP_MD_CTX_free(ctx_);
    }

    Sha256Context(const Sha256Context&) = delete;
    Sha256Context& operator=(const Sha256Context&) = delete;

    bool ok() const { return ok_; }

    bool Update(const unsigned char* data, size_t length) {
        return EVP_DigestUpdate(ctx_, data, length) == 1;
    }

    bool Final(unsigned char* digest) {
        unsigned int written = 0;
        return EVP_DigestFinal_ex(ctx_, digest, &written) == 1 && written == kDigestLength;
    }

private:
    EVP_MD_CTX* ctx_;
    bool ok_;
};

#endif

} // namespace

HashStatus FileHasher::Sha256(const std::string& path, std::string& hexDigest) {
    hexDigest.clear();

    if (path.empty()) {
        return HashStatus::FileNotReadable;
    }

    std::unique_ptr<FILE, FileCloser> file(fopen(path.c_str(), "rb"));
    if (!file) {
        return HashStatus::FileNotReadable;
    }

    Sha256Context context;
    if (!context.ok()) {
        return HashStatus::IOError;
    }

    unsigned char buffer[kChunkSize];
    size_t bytesRead;
    while ((bytesRead = fread(buffer, 1, sizeof(buffer), file.get())) > 0) {
        if (!context.Update(buffer, bytesRead)) {
            return HashStatus::IOError;
        }
    }

    // Directories open fine with fopen but fail on the first read
    if (ferror(file.get())) {
        return HashStatus::IOError;
    }

    unsigned char digest[kDigestLength];
    if (!context.Final(digest)) {
        return HashStatus::IOError;
    }

    hexDigest = ToHex(digest, kDigestLength);
    return HashStatus::Ok;
}
