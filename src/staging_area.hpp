#pragma once
#include <filesystem>

// Scoped working directory for one job:
//   <root>/input  <root>/output  <root>/meta/input  <root>/meta/output
// The whole tree is removed when the object goes out of scope.
class StagingArea {
public:
    explicit StagingArea(const std::filesystem::path& parent = std::filesystem::temp_directory_path());
    ~StagingArea();

    StagingArea(const StagingArea&) = delete;
    StagingArea& operator=(const StagingArea&) = delete;

    const std::filesystem::path& root() const { return root_; }
    std::filesystem::path input() const { return root_ / "input"; }
    std::filesystem::path output() const { return root_ / "output"; }
    std::filesystem::path meta() const { return root_ / "meta"; }

private:
    void remove() noexcept;

    std::filesystem::path root_;
};
