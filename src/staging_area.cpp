#include "staging_area.hpp"
#include "engine_error.hpp"
#include "logger.hpp"
#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <string>
#include <vector>

StagingArea::StagingArea(const std::filesystem::path& parent) {
    std::string tmpl = (parent / "engine-XXXXXX").string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (mkdtemp(buf.data()) == nullptr) {
        throw EngineError("cannot create staging area under " + parent.string() + ": " + std::strerror(errno));
    }
    root_ = buf.data();

    try {
        std::filesystem::create_directories(input());
        std::filesystem::create_directories(output());
        std::filesystem::create_directories(meta() / "input");
        std::filesystem::create_directories(meta() / "output");
    } catch (const std::filesystem::filesystem_error&) {
        remove();
        throw;
    }
    LOG_DEBUG("[staging] working in " + root_.string());
}

StagingArea::~StagingArea() {
    remove();
}

void StagingArea::remove() noexcept {
    if (root_.empty()) return;
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
    if (ec) {
        LOG_ERROR("[staging] failed to remove " + root_.string() + ": " + ec.message());
    } else {
        LOG_DEBUG("[staging] removed " + root_.string());
    }
}
