#include "digest.hpp"
#include "engine_error.hpp"
#include <openssl/sha.h>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

static std::string to_hex(const unsigned char* hash, std::size_t len) {
    std::ostringstream ss;
    for (std::size_t i = 0; i < len; ++i) ss << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
    return ss.str();
}

std::string sha1_hex(const std::string& data) {
    unsigned char hash[SHA_DIGEST_LENGTH];
    SHA_CTX ctx;
    SHA1_Init(&ctx);
    SHA1_Update(&ctx, data.data(), data.size());
    SHA1_Final(hash, &ctx);
    return to_hex(hash, SHA_DIGEST_LENGTH);
}

std::string sha1_file(const std::filesystem::path& path, std::size_t chunk_size) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw EngineError("cannot open " + path.string() + " for hashing");
    }
    unsigned char hash[SHA_DIGEST_LENGTH];
    SHA_CTX ctx;
    SHA1_Init(&ctx);
    std::vector<char> buf(chunk_size == 0 ? kHashChunkSize : chunk_size);
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        auto n = in.gcount();
        if (n > 0) SHA1_Update(&ctx, buf.data(), static_cast<std::size_t>(n));
    }
    if (in.bad()) {
        throw EngineError("read error while hashing " + path.string());
    }
    SHA1_Final(hash, &ctx);
    return to_hex(hash, SHA_DIGEST_LENGTH);
}
