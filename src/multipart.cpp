#include "multipart.hpp"
#include "digest.hpp"
#include "engine_error.hpp"
#include <random>
#include <vector>

MultipartWriter::MultipartWriter(const std::filesystem::path& spool, std::string boundary)
    : spool_(spool), boundary_(std::move(boundary)), out_(spool, std::ios::binary | std::ios::trunc) {
    check("open");
}

std::string MultipartWriter::random_boundary() {
    static const char hex[] = "0123456789abcdef";
    std::random_device rd;
    std::string b = "engine-";
    for (int i = 0; i < 32; ++i) b.push_back(hex[rd() % 16]);
    return b;
}

std::string MultipartWriter::quote_param(const std::string& value) {
    std::string q;
    q.reserve(value.size());
    for (char c : value) {
        switch (c) {
        case '"':  q += "%22"; break;
        case '\r': q += "%0D"; break;
        case '\n': q += "%0A"; break;
        default:   q.push_back(c);
        }
    }
    return q;
}

void MultipartWriter::add_file(const std::string& field, const std::string& filename,
                               const std::filesystem::path& source, const std::string& content_type) {
    out_ << "--" << boundary_ << "\r\n"
         << "Content-Disposition: form-data; name=\"" << quote_param(field)
         << "\"; filename=\"" << quote_param(filename) << "\"\r\n"
         << "Content-Type: " << content_type << "\r\n\r\n";

    std::ifstream in(source, std::ios::binary);
    if (!in) {
        throw EngineError("cannot open " + source.string() + " for upload");
    }
    std::vector<char> buf(kHashChunkSize);
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        out_.write(buf.data(), in.gcount());
    }
    if (in.bad()) {
        throw EngineError("read error on " + source.string());
    }
    out_ << "\r\n";
    check("write file part " + filename);
}

void MultipartWriter::add_field(const std::string& name, const std::string& value) {
    out_ << "--" << boundary_ << "\r\n"
         << "Content-Disposition: form-data; name=\"" << quote_param(name) << "\"\r\n\r\n"
         << value << "\r\n";
    check("write field " + name);
}

void MultipartWriter::finish() {
    out_ << "--" << boundary_ << "--\r\n";
    out_.flush();
    check("finish");
    out_.close();
}

void MultipartWriter::check(const std::string& what) {
    if (!out_) {
        throw EngineError("multipart spool " + spool_.string() + ": " + what + " failed");
    }
}
