#pragma once
#include <filesystem>
#include <fstream>
#include <string>

// Writes a multipart/form-data body to a spool file so large uploads are
// streamed from disk rather than held in memory.
class MultipartWriter {
public:
    explicit MultipartWriter(const std::filesystem::path& spool, std::string boundary = random_boundary());

    void add_file(const std::string& field, const std::string& filename,
                  const std::filesystem::path& source,
                  const std::string& content_type = "application/octet-stream");
    void add_field(const std::string& name, const std::string& value);
    // Writes the closing delimiter and flushes. No parts may follow.
    void finish();

    std::string content_type() const { return "multipart/form-data; boundary=" + boundary_; }
    const std::string& boundary() const { return boundary_; }
    const std::filesystem::path& path() const { return spool_; }

    static std::string random_boundary();
    // Percent-encodes '"', CR and LF for a quoted Content-Disposition parameter.
    static std::string quote_param(const std::string& value);

private:
    void check(const std::string& what);

    std::filesystem::path spool_;
    std::string boundary_;
    std::ofstream out_;
};
