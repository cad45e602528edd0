#include "image_resolver.hpp"
#include "logger.hpp"
#include <algorithm>
#include <exception>

ImageResolver::ImageResolver(IContainerRuntime& runtime, ITransport& transport)
    : runtime_(runtime), transport_(transport) {}

std::optional<std::string> ImageResolver::resolve(const Job& job) {
    auto [name, tag] = split_app_id(job.app_id);
    const std::string reference = name + ":" + tag;
    LOG_DEBUG("[image] checking for existing docker image, " + reference);

    try {
        if (auto id = find_local(name, reference)) {
            LOG_DEBUG("[image] docker image found. uid " + *id);
            return id;
        }

        LOG_DEBUG("[image] docker image not found, requesting build context from API");
        if (!build_from_coordinator(reference)) {
            return std::nullopt;
        }
        auto id = find_local(name, reference);
        if (!id) {
            LOG_ERROR("[image] built " + reference + " but it is not listed locally");
        }
        return id;
    } catch (const std::exception& e) {
        LOG_ERROR("[image] could not resolve " + reference + ": " + e.what());
        return std::nullopt;
    }
}

std::optional<std::string> ImageResolver::find_local(const std::string& name, const std::string& reference) {
    for (const auto& image : runtime_.list_images(name)) {
        const auto& tags = image.repo_tags;
        if (std::find(tags.begin(), tags.end(), reference) != tags.end()) {
            return image.id;
        }
    }
    return std::nullopt;
}

bool ImageResolver::build_from_coordinator(const std::string& reference) {
    auto res = transport_.send(ITransport::verb::get, "apps", "");
    if (!res.ok()) {
        LOG_DEBUG("[image] download and build image not implemented (HTTP " + std::to_string(res.status) + ")");
        return false;
    }
    if (res.body.empty()) {
        LOG_DEBUG("[image] coordinator returned an empty build context for " + reference);
        return false;
    }
    LOG_INFO("[image] building " + reference + " from " + std::to_string(res.body.size()) + " byte context");
    return runtime_.build_image(reference, res.body);
}
