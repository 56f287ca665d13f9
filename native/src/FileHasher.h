#ifndef FILE_HASHER_H
#define FILE_HASHER_H

#include <string>

enum class HashStatus {
    Ok = 0,
    FileNotReadable,
    IOError
};

class FileHasher {
public:
    // Streams the file in fixed-size chunks and writes the lowercase hex
    // SHA-256 digest to hexDigest. Holds no state between calls.
    static HashStatus Sha256(const std::string& path, std::string& hexDigest);

    static const size_t kChunkSize = 4096;
};

#endif // FILE_HASHER_H
